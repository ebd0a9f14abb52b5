#include <TrialOrchestrator/SessionRunner.hpp>
#include <Diagnostics/Logging.hpp>
#include <ReachTrigger/Errors.hpp>

namespace reachtrigger::trial
{
    SessionRunner::SessionRunner(const config::SessionConfig &config,
                                 capture::StreamIngestAdapter &ingest,
                                 trigger::HardwareInterface &hardware,
                                 logging::LogChannel &channel,
                                 time::Clock &clock,
                                 PauseHandler pause,
                                 std::shared_ptr<spdlog::logger> logger)
        : m_config(config), m_ingest(ingest), m_hardware(hardware), m_channel(channel),
          m_pause(std::move(pause)),
          m_log(diagnostics::resolveLogger(std::move(logger), "session")),
          m_records(logging::KinematicLoggerConfig{config.session.outputDir}, channel),
          m_summary(config.session.outputDir),
          m_orchestrator(OrchestratorConfig{}, ingest, hardware, channel, clock) {}

    void SessionRunner::requestStop() noexcept
    {
        m_stopRequested = true;
        m_orchestrator.requestAbort();
    }

    logging::TrialSummaryRow SessionRunner::summarize(const Trial &trial)
    {
        logging::TrialSummaryRow row;
        row.trialId = trial.id();
        row.phase = trial.phase();
        row.tag = trial.config().tag;
        row.state = toString(trial.state());
        row.reason = toString(trial.reason());
        row.frameCount = trial.frames().size();
        row.responseTime = trial.responseTime();
        row.movementTime = trial.movementTime();
        row.revealTime = trial.revealTime();
        row.graspedZone = trial.graspedZone();
        row.revealLatency = trial.revealLatency();
        return row;
    }

    void SessionRunner::handleStreamLoss(const Trial &trial)
    {
        m_log->error("capture system lost during trial {}: {}", trial.id(), trial.message());

        if (!m_config.session.pauseOnStreamLoss || !m_pause)
            throw SessionError("capture system lost: " + trial.message());

        if (!m_pause(trial.message()))
            throw SessionError("capture system lost and session not resumed");

        if (!m_ingest.restart())
            throw SessionError("capture system could not be restarted");

        m_log->info("capture system restarted, resuming session");
    }

    void SessionRunner::shutdown()
    {
        m_ingest.stop();
        m_channel.stop();
        m_records.stop();
    }

    SessionSummary SessionRunner::run()
    {
        SessionSummary summary;

        if (!m_hardware.isConnected())
        {
            m_log->critical("reveal hardware {} is not reachable", m_hardware.describe());
            throw SessionError("reveal hardware " + m_hardware.describe() + " is not reachable");
        }

        m_records.start();
        m_channel.start();
        m_ingest.start();

        m_log->info("session started: participant '{}', {} trial(s), output in {}",
                    m_config.session.participant, m_config.trials.size(), m_config.session.outputDir);

        try
        {
            for (const auto &cfg : m_config.trials)
            {
                if (m_stopRequested)
                {
                    summary.stoppedEarly = true;
                    break;
                }

                try
                {
                    m_trials.push_back(m_orchestrator.runTrial(cfg));
                }
                catch (const ConfigError &e)
                {
                    ++summary.rejected;
                    m_log->error("{}", e.what());

                    logging::TrialSummaryRow row;
                    row.trialId = cfg.id;
                    row.phase = cfg.phase;
                    row.tag = cfg.tag;
                    row.state = "Rejected";
                    row.reason = "ConfigError";
                    if (!m_summary.append(row))
                        m_log->error("cannot write {}", m_summary.path().string());
                    continue;
                }

                const Trial &trial = m_trials.back();
                if (!m_summary.append(summarize(trial)))
                    m_log->error("cannot write {}", m_summary.path().string());

                switch (trial.state())
                {
                case TrialState::Completed:
                    ++summary.completed;
                    break;
                case TrialState::Aborted:
                    ++summary.aborted;
                    break;
                default:
                    ++summary.errored;
                    break;
                }

                if (m_channel.droppedFrames() > 0)
                    m_log->warn("{} frame(s) could not be persisted so far", m_channel.droppedFrames());

                if (trial.reason() == OutcomeReason::StreamLost && !m_stopRequested)
                    handleStreamLoss(trial);
            }
        }
        catch (const SessionError &e)
        {
            m_log->critical("{}", e.what());
            shutdown();
            throw;
        }

        if (m_stopRequested)
            summary.stoppedEarly = true;

        shutdown();
        m_log->info("session finished: {} completed, {} aborted, {} errored, {} rejected",
                    summary.completed, summary.aborted, summary.errored, summary.rejected);
        return summary;
    }
} // namespace reachtrigger::trial
