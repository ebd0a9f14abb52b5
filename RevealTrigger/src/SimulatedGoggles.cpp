#include <RevealTrigger/SimulatedGoggles.hpp>
#include <algorithm>

namespace reachtrigger::trigger
{
    SimulatedGoggles::SimulatedGoggles(time::Clock &clock, time::Clock::Duration roundTrip)
        : m_clock(clock), m_roundTrip(roundTrip) {}

    void SimulatedGoggles::scriptStatuses(std::vector<SendStatus> statuses)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.assign(statuses.begin(), statuses.end());
    }

    void SimulatedGoggles::setConnected(bool connected)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connected = connected;
    }

    void SimulatedGoggles::onSend(std::function<void(OcclusionState)> hook)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hook = std::move(hook);
    }

    SendStatus SimulatedGoggles::setOcclusionState(OcclusionState state)
    {
        std::function<void(OcclusionState)> hook;
        SendStatus status = SendStatus::Acknowledged;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_connected)
            {
                status = SendStatus::Failed;
            }
            else if (!m_script.empty())
            {
                status = m_script.front();
                m_script.pop_front();
            }
            hook = m_hook;
        }

        if (hook)
            hook(state);

        m_clock.sleepFor(m_roundTrip);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_commands.push_back({m_clock.now(), state, status});
        if (status == SendStatus::Acknowledged)
            m_state = state;
        return status;
    }

    bool SimulatedGoggles::isConnected() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_connected;
    }

    std::string SimulatedGoggles::describe() const
    {
        return "simulated";
    }

    std::vector<SimulatedGoggles::Command> SimulatedGoggles::commands() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_commands;
    }

    std::size_t SimulatedGoggles::acknowledgedCount(OcclusionState state) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(std::count_if(m_commands.begin(), m_commands.end(), [&](const Command &c)
                                                      { return c.state == state && c.status == SendStatus::Acknowledged; }));
    }

    OcclusionState SimulatedGoggles::currentState() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }
} // namespace reachtrigger::trigger
