#pragma once

#include <string>

namespace reachtrigger::trigger
{
    enum class OcclusionState
    {
        Open,  // lenses clear, target visible
        Closed // lenses opaque
    };

    enum class SendStatus
    {
        Acknowledged,
        Timeout,
        Failed
    };

    // Occlusion goggles (or any device that can hide/reveal the target). Sends are
    // synchronous and bounded; a non-Acknowledged status means the state is unknown.
    class HardwareInterface
    {
    public:
        virtual ~HardwareInterface() = default;

        virtual SendStatus setOcclusionState(OcclusionState state) = 0;

        [[nodiscard]] virtual bool isConnected() const = 0;
        [[nodiscard]] virtual std::string describe() const = 0;
    };

    inline const char *toString(OcclusionState s) noexcept
    {
        return s == OcclusionState::Open ? "Open" : "Closed";
    }

    inline const char *toString(SendStatus s) noexcept
    {
        switch (s)
        {
        case SendStatus::Acknowledged:
            return "Acknowledged";
        case SendStatus::Timeout:
            return "Timeout";
        case SendStatus::Failed:
            return "Failed";
        }
        return "?";
    }
} // namespace reachtrigger::trigger
