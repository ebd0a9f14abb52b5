#pragma once

#include <TrialOrchestrator/Trial.hpp>
#include <CaptureStream/StreamIngestAdapter.hpp>
#include <KinematicLogger/LogChannel.hpp>
#include <RevealTrigger/HardwareInterface.hpp>
#include <TrialConfig/TrialConfig.hpp>
#include <VirtualTime/VirtualClock.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace reachtrigger::trial
{
    struct OrchestratorConfig
    {
        std::chrono::milliseconds pollInterval{10};
        std::chrono::milliseconds logFlushTimeout{2000};
    };

    // Runs one trial at a time on the calling thread: ingest -> estimator -> onset detector
    // -> reveal controller, plus the end-zone detector, timeouts and the per-trial record.
    class TrialOrchestrator
    {
    public:
        TrialOrchestrator(const OrchestratorConfig &config,
                          capture::StreamIngestAdapter &ingest,
                          trigger::HardwareInterface &hardware,
                          logging::LogChannel &channel,
                          time::Clock &clock,
                          std::shared_ptr<spdlog::logger> logger = nullptr);

        // Executes the trial to a terminal state and returns the sealed record.
        // Throws ConfigError, before anything is armed or logged, for an invalid configuration.
        Trial runTrial(const config::TrialConfig &cfg);

        // Thread-safe. The running trial ends as Aborted(ExperimenterAbort) at its next step.
        void requestAbort() noexcept;

        [[nodiscard]] TrialState state() const noexcept { return m_state.load(); }
        [[nodiscard]] std::size_t framesProcessed() const noexcept { return m_framesProcessed.load(); }

    private:
        struct Outcome
        {
            TrialState state;
            OutcomeReason reason;
            std::string message;
        };

        struct Context;

        std::optional<Outcome> processFrame(Context &ctx, Trial &trial, const Frame &frame);
        std::optional<Outcome> checkIdle(Context &ctx);
        void record(Trial &trial, const TriggerEvent &event);
        void enter(Trial &trial, TrialState state);
        Trial finish(Context *ctx, Trial &trial, const Outcome &outcome);

        OrchestratorConfig m_config;
        capture::StreamIngestAdapter &m_ingest;
        trigger::HardwareInterface &m_hardware;
        logging::LogChannel &m_channel;
        time::Clock &m_clock;
        std::shared_ptr<spdlog::logger> m_log;

        std::atomic<bool> m_abortRequested{false};
        std::atomic<TrialState> m_state{TrialState::Configuring};
        std::atomic<std::size_t> m_framesProcessed{0};
        std::size_t m_droppedAtStart{0};
    };
} // namespace reachtrigger::trial
