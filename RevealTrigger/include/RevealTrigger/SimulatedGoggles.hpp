#pragma once

#include <RevealTrigger/HardwareInterface.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace reachtrigger::trigger
{
    // Stand-in goggle controller for dry runs and tests. Every send is recorded; scripted
    // statuses are consumed first, after which sends are acknowledged.
    class SimulatedGoggles final : public HardwareInterface
    {
    public:
        struct Command
        {
            time::Clock::TimePoint at;
            OcclusionState state;
            SendStatus status;
        };

        explicit SimulatedGoggles(time::Clock &clock,
                                  time::Clock::Duration roundTrip = time::Clock::Duration::zero());

        void scriptStatuses(std::vector<SendStatus> statuses);
        void setConnected(bool connected);

        // Called on every send before the status is returned.
        void onSend(std::function<void(OcclusionState)> hook);

        SendStatus setOcclusionState(OcclusionState state) override;
        [[nodiscard]] bool isConnected() const override;
        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] std::vector<Command> commands() const;
        [[nodiscard]] std::size_t acknowledgedCount(OcclusionState state) const;
        [[nodiscard]] OcclusionState currentState() const;

    private:
        time::Clock &m_clock;
        time::Clock::Duration m_roundTrip;

        mutable std::mutex m_mutex;
        std::deque<SendStatus> m_script;
        std::vector<Command> m_commands;
        std::function<void(OcclusionState)> m_hook;
        bool m_connected{true};
        OcclusionState m_state{OcclusionState::Closed};
    };
} // namespace reachtrigger::trigger
