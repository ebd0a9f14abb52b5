#pragma once

#include <MotionDetector/MotionStateMachine.hpp>
#include <optional>

namespace reachtrigger::detection
{
    struct OnsetNotification
    {
        TimePoint timestamp; // timestamp of the sample that completed the sustain window
        float metric{0.0f};
    };

    struct DetectorOutput
    {
        MotionTransition transition{MotionTransition::None};
        std::optional<OnsetNotification> onset;
        bool fault{false}; // DetectorFault: DataLoss from the estimator, state frozen
    };

    // Feeds estimator samples through the motion state machine for one trial.
    class OnsetDetector
    {
    public:
        explicit OnsetDetector(const config::ThresholdConfig &thresholds);

        DetectorOutput update(const VelocitySample &sample);

        void reset();

        [[nodiscard]] MotionKind state() const noexcept { return kindOf(m_state); }
        [[nodiscard]] bool faulted() const noexcept { return m_faulted; }
        [[nodiscard]] std::size_t onsetCount() const noexcept { return m_onsetCount; }

    private:
        [[nodiscard]] float metricOf(const VelocitySample &sample) const noexcept;

        config::ThresholdConfig m_thresholds;
        MotionState m_state{Static{}};
        bool m_onsetPending{false}; // notified and not yet back to Static
        bool m_faulted{false};
        std::size_t m_onsetCount{0};
    };
} // namespace reachtrigger::detection
