#pragma once

#include <ReachTrigger/Messages.hpp>
#include <TrialConfig/TrialConfig.hpp>
#include <cstddef>
#include <variant>

namespace reachtrigger::detection
{
    // Each state carries the run of consecutive samples that currently argue for leaving it.
    struct Static
    {
        std::size_t aboveCount{0};
        TimePoint runStart{};
    };

    struct Moving
    {
        std::size_t belowCount{0};
        TimePoint runStart{};
    };

    using MotionState = std::variant<Static, Moving>;

    enum class MotionTransition
    {
        None,
        Onset, // Static -> Moving
        Offset // Moving -> Static
    };

    struct StepResult
    {
        MotionState next;
        MotionTransition transition{MotionTransition::None};
    };

    [[nodiscard]] MotionKind kindOf(const MotionState &state) noexcept;

    // Pure hysteretic transition. Enter Moving once metric >= threshold holds for the
    // sustain window; return to Static once metric < threshold - margin holds for the
    // same window. Any sample outside the condition restarts the run.
    [[nodiscard]] StepResult step(const MotionState &state,
                                  const config::ThresholdConfig &thresholds,
                                  float metric,
                                  TimePoint timestamp) noexcept;
} // namespace reachtrigger::detection
