#pragma once

#include <CaptureStream/CaptureSource.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <deque>
#include <mutex>
#include <variant>

namespace reachtrigger::capture
{
    // In-memory capture source driven by a script of frames, silent gaps and disconnects.
    // Used for deterministic replays in tests and for dry runs without a capture system.
    class ScriptedCaptureSource final : public CaptureSource
    {
    public:
        enum class EndBehavior
        {
            Idle,      // keep timing out once the script is exhausted
            Disconnect // report Disconnected once the script is exhausted
        };

        explicit ScriptedCaptureSource(time::Clock &clock, EndBehavior end = EndBehavior::Idle);

        void pushFrame(Frame frame);
        void pushStall(Duration gap);
        void pushDisconnect();

        void setReconnectResult(bool ok);
        [[nodiscard]] std::size_t reconnectAttempts() const;
        [[nodiscard]] std::size_t pending() const;

        ReadResult read(std::chrono::milliseconds timeout) override;
        bool reconnect() override;
        [[nodiscard]] std::string describe() const override;

    private:
        struct Stall
        {
            Duration remaining;
        };
        struct Disconnect
        {
        };
        using Step = std::variant<Frame, Stall, Disconnect>;

        time::Clock &m_clock;
        EndBehavior m_end;

        mutable std::mutex m_mutex;
        std::deque<Step> m_script;
        bool m_connected{true};
        bool m_reconnectOk{true};
        std::size_t m_reconnectAttempts{0};
    };
} // namespace reachtrigger::capture
