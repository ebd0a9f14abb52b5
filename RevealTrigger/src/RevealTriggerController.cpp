#include <RevealTrigger/RevealTriggerController.hpp>
#include <Diagnostics/Logging.hpp>
#include <ReachTrigger/Errors.hpp>

#include <algorithm>

namespace reachtrigger::trigger
{
    RevealTriggerController::RevealTriggerController(const config::RevealConfig &config,
                                                     HardwareInterface &hardware,
                                                     time::Clock &clock,
                                                     std::shared_ptr<spdlog::logger> logger)
        : m_config(config), m_hardware(hardware), m_clock(clock),
          m_log(diagnostics::resolveLogger(std::move(logger), "trigger")) {}

    void RevealTriggerController::arm(TrialPhase phase)
    {
        m_phase = phase;
        m_fired = false;
        m_armed = false;

        if (phase == TrialPhase::PreReveal && m_config.occludeOnArm)
        {
            int attempts = 0;
            const auto status = sendWithRetry(OcclusionState::Closed, attempts);
            if (status != SendStatus::Acknowledged)
            {
                throw TrialError("goggles could not be occluded on " + m_hardware.describe() +
                                 " (" + toString(status) + " after " + std::to_string(attempts) + " attempt(s))");
            }
        }

        m_armed = true;
    }

    void RevealTriggerController::disarm() noexcept
    {
        m_armed = false;
    }

    std::optional<TriggerEvent> RevealTriggerController::onOnset(const detection::OnsetNotification &onset)
    {
        if (!m_armed || m_phase != TrialPhase::PreReveal)
            return std::nullopt;

        if (m_fired)
        {
            m_log->debug("duplicate onset suppressed, reveal already issued");
            return std::nullopt;
        }
        m_fired = true; // claimed before sending: a failed reveal is not retried by a later onset

        const auto detectedAt = m_clock.now();
        int attempts = 0;
        const auto status = sendWithRetry(OcclusionState::Open, attempts);
        const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(m_clock.now() - detectedAt);

        if (status != SendStatus::Acknowledged)
        {
            throw TrialError("reveal not delivered to " + m_hardware.describe() + " (" + toString(status) +
                             " after " + std::to_string(attempts) + " attempt(s))");
        }

        ++m_revealsIssued;

        if (latency > m_config.latencyBudget)
        {
            m_log->warn("reveal latency {} us exceeds budget of {} us", latency.count(), m_config.latencyBudget.count());
        }
        else
        {
            m_log->info("reveal issued, latency {} us, {} attempt(s)", latency.count(), attempts);
        }

        TriggerEvent ev{};
        ev.timestamp = onset.timestamp;
        ev.kind = TriggerEventKind::Reveal;
        ev.issueLatency = latency;
        ev.attempts = attempts;
        ev.detail = "onset_metric=" + std::to_string(onset.metric);
        return ev;
    }

    SendStatus RevealTriggerController::sendWithRetry(OcclusionState state, int &attempts)
    {
        time::Clock::Duration backoff = m_config.initialBackoff;
        SendStatus status = SendStatus::Failed;

        for (attempts = 1; attempts <= m_config.maxRetries + 1; ++attempts)
        {
            status = m_hardware.setOcclusionState(state);
            if (status == SendStatus::Acknowledged)
                return status;

            m_log->warn("{} command attempt {} failed: {}", toString(state), attempts, toString(status));
            if (attempts <= m_config.maxRetries)
            {
                m_clock.sleepFor(backoff);
                backoff = std::min<time::Clock::Duration>(backoff * 2, m_config.maxBackoff);
            }
        }

        attempts = m_config.maxRetries + 1;
        return status;
    }
} // namespace reachtrigger::trigger
