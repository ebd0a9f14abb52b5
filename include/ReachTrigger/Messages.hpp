#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace reachtrigger
{
    // Capture-clock timestamps. The capture system's clock is monotonic; we carry it in a
    // steady_clock time_point so that chrono arithmetic works across the whole pipeline.
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    // One resolved rigid body / marker as reported by the capture system.
    struct MarkerSample
    {
        int id{0};
        Eigen::Vector3f position{Eigen::Vector3f::Zero()}; // meters
        std::optional<Eigen::Quaternionf> orientation;
        bool valid{false};
    };

    // A single capture frame. Treated as immutable once it leaves the ingest adapter.
    struct Frame
    {
        TimePoint timestamp;
        std::uint64_t frameNumber{0};
        std::vector<MarkerSample> markers;

        [[nodiscard]] const MarkerSample *find(int id) const noexcept
        {
            for (const auto &m : markers)
            {
                if (m.id == id)
                    return &m;
            }
            return nullptr;
        }
    };

    enum class SampleQuality
    {
        Fresh,
        Stale,
        DataLoss
    };

    // Kinematic estimate for the tracked effector at one frame.
    struct VelocitySample
    {
        TimePoint timestamp;
        float speed{0.0f}; // m/s, NaN on DataLoss
        Eigen::Vector3f velocity{Eigen::Vector3f::Zero()};
        float acceleration{0.0f}; // m/s^2, rate of change of speed
        float displacement{0.0f}; // m, from the trial's reach start position
        Eigen::Vector3f position{Eigen::Vector3f::Zero()};
        SampleQuality quality{SampleQuality::Fresh};
    };

    enum class MotionKind
    {
        Static,
        Moving
    };

    enum class ZoneLabel
    {
        Target,
        Distractor,
        Home
    };

    enum class TrialPhase
    {
        PreReveal,
        FullKnowledge
    };

    enum class TriggerEventKind
    {
        Reveal,
        EndZoneEntry,
        TrialTimeout,
        MovementOnset,
        MovementOffset,
        StreamStall,
        DataLoss,
        DataRecovered,
        Aborted
    };

    // Append-only record of something that happened during a trial.
    struct TriggerEvent
    {
        TimePoint timestamp;
        TriggerEventKind kind{TriggerEventKind::Reveal};
        std::optional<ZoneLabel> zone;
        std::string detail;

        // Reveal only: detection to hardware acknowledgment, and send attempts used.
        std::chrono::microseconds issueLatency{0};
        int attempts{0};
    };

    inline const char *toString(SampleQuality q) noexcept
    {
        switch (q)
        {
        case SampleQuality::Fresh:
            return "Fresh";
        case SampleQuality::Stale:
            return "Stale";
        case SampleQuality::DataLoss:
            return "DataLoss";
        }
        return "?";
    }

    inline const char *toString(MotionKind k) noexcept
    {
        return k == MotionKind::Static ? "Static" : "Moving";
    }

    inline const char *toString(ZoneLabel l) noexcept
    {
        switch (l)
        {
        case ZoneLabel::Target:
            return "Target";
        case ZoneLabel::Distractor:
            return "Distractor";
        case ZoneLabel::Home:
            return "Home";
        }
        return "?";
    }

    inline const char *toString(TrialPhase p) noexcept
    {
        return p == TrialPhase::PreReveal ? "PreReveal" : "FullKnowledge";
    }

    inline const char *toString(TriggerEventKind k) noexcept
    {
        switch (k)
        {
        case TriggerEventKind::Reveal:
            return "Reveal";
        case TriggerEventKind::EndZoneEntry:
            return "EndZoneEntry";
        case TriggerEventKind::TrialTimeout:
            return "TrialTimeout";
        case TriggerEventKind::MovementOnset:
            return "MovementOnset";
        case TriggerEventKind::MovementOffset:
            return "MovementOffset";
        case TriggerEventKind::StreamStall:
            return "StreamStall";
        case TriggerEventKind::DataLoss:
            return "DataLoss";
        case TriggerEventKind::DataRecovered:
            return "DataRecovered";
        case TriggerEventKind::Aborted:
            return "Aborted";
        }
        return "?";
    }

    // Microseconds since the capture clock epoch, used by every persisted record.
    inline std::int64_t toMicros(TimePoint t) noexcept
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
    }
} // namespace reachtrigger
