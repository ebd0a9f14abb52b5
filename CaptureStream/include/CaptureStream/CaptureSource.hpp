#pragma once

#include <ReachTrigger/Messages.hpp>
#include <chrono>
#include <string>

namespace reachtrigger::capture
{
    enum class ReadStatus
    {
        Frame,
        Timeout,
        Disconnected
    };

    struct ReadResult
    {
        ReadStatus status{ReadStatus::Timeout};
        Frame frame{}; // valid only when status == Frame
    };

    // Boundary to the external capture system. Implementations deliver frames with
    // already-resolved marker identities; read() must return within the timeout.
    class CaptureSource
    {
    public:
        virtual ~CaptureSource() = default;

        virtual ReadResult read(std::chrono::milliseconds timeout) = 0;

        // Attempts to re-establish the stream after a stall or disconnect.
        virtual bool reconnect() = 0;

        [[nodiscard]] virtual std::string describe() const = 0;
    };
} // namespace reachtrigger::capture
