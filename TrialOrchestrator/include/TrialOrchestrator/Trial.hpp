#pragma once

#include <TrialConfig/TrialConfig.hpp>
#include <ReachTrigger/Messages.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace reachtrigger::trial
{
    enum class TrialState
    {
        Configuring,
        Armed,
        Active,
        Completed,
        Aborted,
        Errored
    };

    enum class OutcomeReason
    {
        None,
        MovementTimeout,
        ReachTimeout,
        ExperimenterAbort,
        StreamLost,
        StreamFault,
        DataLoss,
        HardwareFault
    };

    const char *toString(TrialState s) noexcept;
    const char *toString(OutcomeReason r) noexcept;

    [[nodiscard]] inline bool isTerminal(TrialState s) noexcept
    {
        return s == TrialState::Completed || s == TrialState::Aborted || s == TrialState::Errored;
    }

    // Everything recorded for one trial. Mutated by the orchestrator while the trial runs;
    // read-only once sealed.
    class Trial
    {
    public:
        explicit Trial(config::TrialConfig config);

        void setState(TrialState state);
        void appendFrame(const Frame &frame);
        void appendEvent(const TriggerEvent &event);
        void markTerminal(const TriggerEvent &entry);

        // Records the outcome and freezes the trial.
        void seal(TrialState state, OutcomeReason reason, std::string message = {});

        [[nodiscard]] int id() const noexcept { return m_config.id; }
        [[nodiscard]] TrialPhase phase() const noexcept { return m_config.phase; }
        [[nodiscard]] const config::TrialConfig &config() const noexcept { return m_config; }
        [[nodiscard]] TrialState state() const noexcept { return m_state; }
        [[nodiscard]] OutcomeReason reason() const noexcept { return m_reason; }
        [[nodiscard]] const std::string &message() const noexcept { return m_message; }
        [[nodiscard]] bool sealed() const noexcept { return m_sealed; }

        [[nodiscard]] const std::vector<Frame> &frames() const noexcept { return m_frames; }
        [[nodiscard]] const std::vector<TriggerEvent> &events() const noexcept { return m_events; }
        [[nodiscard]] std::size_t countEvents(TriggerEventKind kind) const;
        [[nodiscard]] std::optional<TriggerEvent> firstEvent(TriggerEventKind kind) const;

        // Derived measures. Each is empty when the trial never reached the events involved.
        [[nodiscard]] std::optional<std::chrono::microseconds> responseTime() const; // first frame -> onset
        [[nodiscard]] std::optional<std::chrono::microseconds> movementTime() const; // onset -> terminal entry
        [[nodiscard]] std::optional<std::chrono::microseconds> revealTime() const;   // first frame -> reveal
        [[nodiscard]] std::optional<ZoneLabel> graspedZone() const;
        [[nodiscard]] std::optional<std::chrono::microseconds> revealLatency() const;

    private:
        void requireOpen(const char *what) const;

        config::TrialConfig m_config;
        TrialState m_state{TrialState::Configuring};
        OutcomeReason m_reason{OutcomeReason::None};
        std::string m_message;
        bool m_sealed{false};

        std::vector<Frame> m_frames;
        std::vector<TriggerEvent> m_events;
        std::optional<TriggerEvent> m_terminal;
    };
} // namespace reachtrigger::trial
