#include <MotionDetector/MotionStateMachine.hpp>
#include <algorithm>

namespace reachtrigger::detection
{
    namespace
    {
        bool sustained(std::size_t count, TimePoint runStart, TimePoint now,
                       const config::ThresholdConfig &cfg) noexcept
        {
            const std::size_t needed = std::max<std::size_t>(1, cfg.minSustainedSamples);
            return count >= needed && (now - runStart) >= cfg.minSustainedDuration;
        }

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;
    } // namespace

    MotionKind kindOf(const MotionState &state) noexcept
    {
        return std::holds_alternative<Static>(state) ? MotionKind::Static : MotionKind::Moving;
    }

    StepResult step(const MotionState &state,
                    const config::ThresholdConfig &cfg,
                    float metric,
                    TimePoint t) noexcept
    {
        return std::visit(overloaded{
                              [&](const Static &s) -> StepResult
                              {
                                  if (!(metric >= cfg.velocityOnsetThreshold))
                                      return {Static{}, MotionTransition::None};

                                  Static run = s;
                                  if (run.aboveCount == 0)
                                      run.runStart = t;
                                  ++run.aboveCount;

                                  if (sustained(run.aboveCount, run.runStart, t, cfg))
                                      return {Moving{}, MotionTransition::Onset};
                                  return {run, MotionTransition::None};
                              },
                              [&](const Moving &m) -> StepResult
                              {
                                  const float lower = cfg.velocityOnsetThreshold - cfg.hysteresisMargin;
                                  if (!(metric < lower))
                                      return {Moving{}, MotionTransition::None};

                                  Moving run = m;
                                  if (run.belowCount == 0)
                                      run.runStart = t;
                                  ++run.belowCount;

                                  if (sustained(run.belowCount, run.runStart, t, cfg))
                                      return {Static{}, MotionTransition::Offset};
                                  return {run, MotionTransition::None};
                              }},
                          state);
    }
} // namespace reachtrigger::detection
