#pragma once

#include <TrialOrchestrator/TrialOrchestrator.hpp>
#include <KinematicLogger/KinematicLogger.hpp>
#include <KinematicLogger/TrialSummaryWriter.hpp>
#include <SessionConfig/SessionConfig.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace reachtrigger::trial
{
    // Asked when the capture system is lost; return true once the experimenter has fixed it.
    using PauseHandler = std::function<bool(const std::string &reason)>;

    struct SessionSummary
    {
        std::size_t completed = 0;
        std::size_t aborted = 0;
        std::size_t errored = 0;
        std::size_t rejected = 0; // invalid configuration, never started
        bool stoppedEarly = false;
    };

    // Runs every configured trial in order over shared ingest, hardware and logging.
    // Trial-level faults are recorded and the session moves on; infrastructure faults throw
    // SessionError.
    class SessionRunner
    {
    public:
        SessionRunner(const config::SessionConfig &config,
                      capture::StreamIngestAdapter &ingest,
                      trigger::HardwareInterface &hardware,
                      logging::LogChannel &channel,
                      time::Clock &clock,
                      PauseHandler pause,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

        SessionSummary run();

        // Aborts the running trial and ends the session after it. Only touches atomics.
        void requestStop() noexcept;

        // State of the trial currently running, or of the last one run.
        [[nodiscard]] TrialState trialState() const noexcept { return m_orchestrator.state(); }

        [[nodiscard]] const std::vector<Trial> &trials() const noexcept { return m_trials; }
        [[nodiscard]] const logging::KinematicLogger &recordWriter() const noexcept { return m_records; }

        static logging::TrialSummaryRow summarize(const Trial &trial);

    private:
        void handleStreamLoss(const Trial &trial);
        void shutdown();

        config::SessionConfig m_config;
        capture::StreamIngestAdapter &m_ingest;
        trigger::HardwareInterface &m_hardware;
        logging::LogChannel &m_channel;
        PauseHandler m_pause;
        std::shared_ptr<spdlog::logger> m_log;

        logging::KinematicLogger m_records;
        logging::TrialSummaryWriter m_summary;
        TrialOrchestrator m_orchestrator;

        std::vector<Trial> m_trials;
        std::atomic<bool> m_stopRequested{false};
    };
} // namespace reachtrigger::trial
