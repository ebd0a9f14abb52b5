#include <TrialOrchestrator/TrialOrchestrator.hpp>
#include <Diagnostics/Logging.hpp>
#include <EndZoneDetector/EndZoneDetector.hpp>
#include <KinematicEstimator/KinematicEstimator.hpp>
#include <MotionDetector/OnsetDetector.hpp>
#include <RevealTrigger/RevealTriggerController.hpp>
#include <ReachTrigger/Errors.hpp>

#include <type_traits>
#include <variant>

namespace reachtrigger::trial
{
    struct TrialOrchestrator::Context
    {
        Context(const config::TrialConfig &config, trigger::HardwareInterface &hardware, time::Clock &clock)
            : cfg(config),
              estimator(config.estimator),
              zones(config.zones, config.thresholds.endZoneRadius),
              controller(config.reveal, hardware, clock)
        {
            if (config.phase == TrialPhase::PreReveal)
                onset.emplace(config.thresholds);
        }

        const config::TrialConfig &cfg;
        estimation::KinematicEstimator estimator;
        std::optional<detection::OnsetDetector> onset; // PreReveal only
        detection::EndZoneDetector zones;
        trigger::RevealTriggerController controller;

        // Capture clock
        std::optional<TimePoint> firstFrame;
        std::optional<TimePoint> lastFrame;
        std::optional<TimePoint> onsetAt;
        std::optional<TimePoint> terminalAt;
        std::optional<TimePoint> lossStart;

        // Session clock, for streams that go quiet without a stall
        time::Clock::TimePoint lastProgress{};
    };

    TrialOrchestrator::TrialOrchestrator(const OrchestratorConfig &config,
                                         capture::StreamIngestAdapter &ingest,
                                         trigger::HardwareInterface &hardware,
                                         logging::LogChannel &channel,
                                         time::Clock &clock,
                                         std::shared_ptr<spdlog::logger> logger)
        : m_config(config), m_ingest(ingest), m_hardware(hardware), m_channel(channel), m_clock(clock),
          m_log(diagnostics::resolveLogger(std::move(logger), "orchestrator")) {}

    void TrialOrchestrator::requestAbort() noexcept
    {
        m_abortRequested = true;
    }

    void TrialOrchestrator::enter(Trial &trial, TrialState state)
    {
        trial.setState(state);
        m_state = state;
        m_log->debug("trial {} -> {}", trial.id(), toString(state));
    }

    void TrialOrchestrator::record(Trial &trial, const TriggerEvent &event)
    {
        trial.appendEvent(event);
        m_channel.publish(event);
    }

    Trial TrialOrchestrator::runTrial(const config::TrialConfig &cfg)
    {
        m_state = TrialState::Configuring;
        config::validateOrThrow(cfg);

        m_abortRequested = false;
        Trial trial(cfg);

        m_droppedAtStart = m_channel.droppedFrames();
        m_channel.publish(logging::TrialHeader{cfg.id, cfg.phase, cfg.tag, config::describe(cfg)});

        Context ctx(trial.config(), m_hardware, m_clock);
        try
        {
            ctx.controller.arm(cfg.phase);
        }
        catch (const TrialError &e)
        {
            return finish(&ctx, trial, {TrialState::Errored, OutcomeReason::HardwareFault, e.what()});
        }
        enter(trial, TrialState::Armed);

        const auto stale = m_ingest.discardPending();
        if (stale > 0)
            m_log->debug("discarded {} item(s) queued before trial {}", stale, cfg.id);

        enter(trial, TrialState::Active);
        ctx.lastProgress = m_clock.now();
        m_log->info("trial {} active ({}{}{})", cfg.id, toString(cfg.phase), cfg.tag.empty() ? "" : ", ", cfg.tag);

        for (;;)
        {
            if (m_abortRequested.exchange(false))
            {
                TriggerEvent ev{};
                ev.timestamp = ctx.lastFrame.value_or(TimePoint{});
                ev.kind = TriggerEventKind::Aborted;
                ev.detail = "experimenter";
                record(trial, ev);
                return finish(&ctx, trial, {TrialState::Aborted, OutcomeReason::ExperimenterAbort, "aborted by experimenter"});
            }

            auto item = m_ingest.next(m_config.pollInterval);
            if (!item)
            {
                if (auto outcome = checkIdle(ctx))
                    return finish(&ctx, trial, *outcome);
                continue;
            }

            std::optional<Outcome> outcome;
            try
            {
                outcome = std::visit([&](auto &value) -> std::optional<Outcome>
                                     {
                    using T = std::decay_t<decltype(value)>;
                    if constexpr (std::is_same_v<T, Frame>)
                    {
                        return processFrame(ctx, trial, value);
                    }
                    else if constexpr (std::is_same_v<T, capture::StreamStall>)
                    {
                        const auto gapMs = std::chrono::duration_cast<std::chrono::milliseconds>(value.gap).count();
                        m_log->warn("trial {}: capture stream stalled for {} ms", trial.id(), gapMs);
                        TriggerEvent ev{};
                        ev.timestamp = ctx.lastFrame.value_or(TimePoint{});
                        ev.kind = TriggerEventKind::StreamStall;
                        ev.detail = "gap_ms=" + std::to_string(gapMs);
                        record(trial, ev);
                        return std::nullopt;
                    }
                    else if constexpr (std::is_same_v<T, capture::StreamLost>)
                    {
                        return Outcome{TrialState::Errored, OutcomeReason::StreamLost, value.reason};
                    }
                    else
                    {
                        return Outcome{TrialState::Errored, OutcomeReason::StreamFault,
                                       "out-of-order frame " + std::to_string(value.frameNumber)};
                    } },
                                     *item);
            }
            catch (const TrialError &e)
            {
                outcome = Outcome{TrialState::Errored, OutcomeReason::HardwareFault, e.what()};
            }

            if (outcome)
                return finish(&ctx, trial, *outcome);
        }
    }

    std::optional<TrialOrchestrator::Outcome> TrialOrchestrator::processFrame(Context &ctx, Trial &trial, const Frame &frame)
    {
        const auto &cfg = ctx.cfg;
        const auto t = frame.timestamp;

        // Persist first: a detector failure never costs a frame its log row.
        trial.appendFrame(frame);
        m_channel.publish(frame);
        ++m_framesProcessed;

        if (!ctx.firstFrame)
            ctx.firstFrame = t;
        ctx.lastFrame = t;
        ctx.lastProgress = m_clock.now();

        if (auto sample = ctx.estimator.update(frame))
        {
            if (sample->quality == SampleQuality::DataLoss)
            {
                if (!ctx.lossStart)
                {
                    ctx.lossStart = t;
                    m_log->warn("trial {}: effector lost (data loss)", trial.id());
                    record(trial, TriggerEvent{t, TriggerEventKind::DataLoss, std::nullopt, {}, {}, 0});
                }
                else if (t - *ctx.lossStart >= cfg.dataLossLimit)
                {
                    return Outcome{TrialState::Errored, OutcomeReason::DataLoss,
                                   "effector not visible for " + std::to_string(cfg.dataLossLimit.count()) + " ms"};
                }
            }
            else if (sample->quality == SampleQuality::Fresh && ctx.lossStart)
            {
                const auto lostMs = std::chrono::duration_cast<std::chrono::milliseconds>(t - *ctx.lossStart).count();
                m_log->info("trial {}: effector recovered after {} ms", trial.id(), lostMs);
                record(trial, TriggerEvent{t, TriggerEventKind::DataRecovered, std::nullopt, "lost_ms=" + std::to_string(lostMs), {}, 0});
                ctx.lossStart.reset();
            }

            if (ctx.onset)
            {
                const auto out = ctx.onset->update(*sample);
                if (out.transition == detection::MotionTransition::Onset && out.onset)
                {
                    if (!ctx.onsetAt)
                        ctx.onsetAt = out.onset->timestamp;
                    record(trial, TriggerEvent{out.onset->timestamp, TriggerEventKind::MovementOnset, std::nullopt,
                                               "metric=" + std::to_string(out.onset->metric), {}, 0});

                    if (auto reveal = ctx.controller.onOnset(*out.onset))
                    {
                        for (const auto &ev : trial.events())
                        {
                            if (ev.kind == TriggerEventKind::EndZoneEntry && ev.zone != ZoneLabel::Home &&
                                ev.timestamp < reveal->timestamp)
                            {
                                m_log->warn("trial {}: reveal at {} us follows end-zone entry at {} us",
                                            trial.id(), toMicros(reveal->timestamp), toMicros(ev.timestamp));
                                break;
                            }
                        }
                        record(trial, *reveal);
                    }
                }
                else if (out.transition == detection::MotionTransition::Offset)
                {
                    record(trial, TriggerEvent{t, TriggerEventKind::MovementOffset, std::nullopt, {}, {}, 0});
                }
            }
        }

        const auto position = estimation::KinematicEstimator::effectorPosition(frame, cfg.estimator.effectorIds);
        for (const auto &entry : ctx.zones.update(t, position))
        {
            TriggerEvent ev{entry.timestamp, TriggerEventKind::EndZoneEntry, entry.label,
                            "zone=" + std::to_string(entry.zoneIndex), {}, 0};
            record(trial, ev);

            if (entry.label == ZoneLabel::Home || ctx.terminalAt)
                continue;

            if (cfg.phase == TrialPhase::FullKnowledge || ctx.controller.fired())
            {
                ctx.terminalAt = entry.timestamp;
                trial.markTerminal(ev);
                m_log->info("trial {}: reached {} zone {}", trial.id(), toString(entry.label), entry.zoneIndex);
            }
            else
            {
                m_log->warn("trial {}: {} zone {} entered before the reveal", trial.id(), toString(entry.label), entry.zoneIndex);
            }
        }

        if (ctx.terminalAt)
        {
            if (t - *ctx.terminalAt >= cfg.settleWindow)
                return Outcome{TrialState::Completed, OutcomeReason::None, {}};
            return std::nullopt;
        }

        const bool awaitingOnset = cfg.phase == TrialPhase::FullKnowledge || !ctx.onsetAt;
        if (awaitingOnset && t - *ctx.firstFrame >= cfg.thresholds.movementTimeout)
        {
            return Outcome{TrialState::Aborted, OutcomeReason::MovementTimeout,
                           "no movement within " + std::to_string(cfg.thresholds.movementTimeout.count()) + " ms"};
        }

        const auto reachTimeout = config::effectiveReachTimeout(cfg);
        if (ctx.onsetAt && t - *ctx.onsetAt >= reachTimeout)
        {
            record(trial, TriggerEvent{t, TriggerEventKind::TrialTimeout, std::nullopt, "reach_timeout", {}, 0});
            return Outcome{TrialState::Aborted, OutcomeReason::ReachTimeout,
                           "no end zone reached within " + std::to_string(reachTimeout.count()) + " ms of onset"};
        }

        return std::nullopt;
    }

    std::optional<TrialOrchestrator::Outcome> TrialOrchestrator::checkIdle(Context &ctx)
    {
        const auto &cfg = ctx.cfg;
        const auto quiet = m_clock.now() - ctx.lastProgress;

        if (ctx.terminalAt)
        {
            if (quiet >= cfg.settleWindow)
                return Outcome{TrialState::Completed, OutcomeReason::None, "settled without further frames"};
            return std::nullopt;
        }

        const bool awaitingOnset = cfg.phase == TrialPhase::FullKnowledge || !ctx.onsetAt;
        if (awaitingOnset && quiet >= cfg.thresholds.movementTimeout)
            return Outcome{TrialState::Aborted, OutcomeReason::MovementTimeout, "no frames and no movement"};

        if (!awaitingOnset && quiet >= config::effectiveReachTimeout(cfg))
            return Outcome{TrialState::Aborted, OutcomeReason::ReachTimeout, "no frames after onset"};

        return std::nullopt;
    }

    Trial TrialOrchestrator::finish(Context *ctx, Trial &trial, const Outcome &outcome)
    {
        if (ctx)
            ctx->controller.disarm();

        trial.seal(outcome.state, outcome.reason, outcome.message);
        m_state = outcome.state;

        const auto dropped = m_channel.droppedFrames() - m_droppedAtStart;
        m_channel.publish(logging::TrialFooter{trial.id(), toString(outcome.state), toString(outcome.reason),
                                               trial.frames().size(), dropped});
        if (!m_channel.flush(m_config.logFlushTimeout))
            m_log->warn("trial {}: kinematic record not fully persisted within {} ms", trial.id(), m_config.logFlushTimeout.count());

        switch (outcome.state)
        {
        case TrialState::Completed:
            m_log->info("trial {} completed, {} frame(s)", trial.id(), trial.frames().size());
            break;
        case TrialState::Aborted:
            m_log->warn("trial {} aborted ({}): {}", trial.id(), toString(outcome.reason), outcome.message);
            break;
        default:
            m_log->error("trial {} errored ({}): {}", trial.id(), toString(outcome.reason), outcome.message);
            break;
        }

        return std::move(trial);
    }
} // namespace reachtrigger::trial
