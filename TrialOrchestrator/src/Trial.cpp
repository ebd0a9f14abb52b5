#include <TrialOrchestrator/Trial.hpp>

#include <algorithm>
#include <stdexcept>

namespace reachtrigger::trial
{
    namespace
    {
        std::chrono::microseconds between(TimePoint from, TimePoint to)
        {
            return std::chrono::duration_cast<std::chrono::microseconds>(to - from);
        }
    } // namespace

    const char *toString(TrialState s) noexcept
    {
        switch (s)
        {
        case TrialState::Configuring:
            return "Configuring";
        case TrialState::Armed:
            return "Armed";
        case TrialState::Active:
            return "Active";
        case TrialState::Completed:
            return "Completed";
        case TrialState::Aborted:
            return "Aborted";
        case TrialState::Errored:
            return "Errored";
        }
        return "?";
    }

    const char *toString(OutcomeReason r) noexcept
    {
        switch (r)
        {
        case OutcomeReason::None:
            return "None";
        case OutcomeReason::MovementTimeout:
            return "MovementTimeout";
        case OutcomeReason::ReachTimeout:
            return "ReachTimeout";
        case OutcomeReason::ExperimenterAbort:
            return "ExperimenterAbort";
        case OutcomeReason::StreamLost:
            return "StreamLost";
        case OutcomeReason::StreamFault:
            return "StreamFault";
        case OutcomeReason::DataLoss:
            return "DataLoss";
        case OutcomeReason::HardwareFault:
            return "HardwareFault";
        }
        return "?";
    }

    Trial::Trial(config::TrialConfig config) : m_config(std::move(config)) {}

    void Trial::requireOpen(const char *what) const
    {
        if (m_sealed)
            throw std::logic_error(std::string("trial ") + std::to_string(m_config.id) + " is sealed: cannot " + what);
    }

    void Trial::setState(TrialState state)
    {
        requireOpen("change state");
        m_state = state;
    }

    void Trial::appendFrame(const Frame &frame)
    {
        requireOpen("append frame");
        m_frames.push_back(frame);
    }

    void Trial::appendEvent(const TriggerEvent &event)
    {
        requireOpen("append event");
        m_events.push_back(event);
    }

    void Trial::markTerminal(const TriggerEvent &entry)
    {
        requireOpen("mark terminal entry");
        if (!m_terminal)
            m_terminal = entry;
    }

    void Trial::seal(TrialState state, OutcomeReason reason, std::string message)
    {
        requireOpen("seal");
        m_state = state;
        m_reason = reason;
        m_message = std::move(message);
        m_sealed = true;
    }

    std::size_t Trial::countEvents(TriggerEventKind kind) const
    {
        return static_cast<std::size_t>(std::count_if(m_events.begin(), m_events.end(), [&](const TriggerEvent &e)
                                                      { return e.kind == kind; }));
    }

    std::optional<TriggerEvent> Trial::firstEvent(TriggerEventKind kind) const
    {
        auto it = std::find_if(m_events.begin(), m_events.end(), [&](const TriggerEvent &e)
                               { return e.kind == kind; });
        if (it == m_events.end())
            return std::nullopt;
        return *it;
    }

    std::optional<std::chrono::microseconds> Trial::responseTime() const
    {
        const auto onset = firstEvent(TriggerEventKind::MovementOnset);
        if (!onset || m_frames.empty())
            return std::nullopt;
        return between(m_frames.front().timestamp, onset->timestamp);
    }

    std::optional<std::chrono::microseconds> Trial::movementTime() const
    {
        const auto onset = firstEvent(TriggerEventKind::MovementOnset);
        if (!onset || !m_terminal)
            return std::nullopt;
        return between(onset->timestamp, m_terminal->timestamp);
    }

    std::optional<std::chrono::microseconds> Trial::revealTime() const
    {
        const auto reveal = firstEvent(TriggerEventKind::Reveal);
        if (!reveal || m_frames.empty())
            return std::nullopt;
        return between(m_frames.front().timestamp, reveal->timestamp);
    }

    std::optional<ZoneLabel> Trial::graspedZone() const
    {
        if (!m_terminal)
            return std::nullopt;
        return m_terminal->zone;
    }

    std::optional<std::chrono::microseconds> Trial::revealLatency() const
    {
        const auto reveal = firstEvent(TriggerEventKind::Reveal);
        if (!reveal)
            return std::nullopt;
        return reveal->issueLatency;
    }
} // namespace reachtrigger::trial
