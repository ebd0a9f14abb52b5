#pragma once

#include <KinematicLogger/LogChannel.hpp>
#include <ReachTrigger/Messages.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace reachtrigger::logging
{
    inline constexpr const char *kKinematicSchema = "reachtrigger-kinematics/1";

    struct KinematicLoggerConfig
    {
        std::string outputDir = "data";
    };

    // Writes one CSV record per trial from the records arriving on a LogChannel.
    //
    // A TrialHeader opens trial_<id>_<phase>[_<tag>].csv, frames and events are appended
    // as they arrive, and the TrialFooter writes the end row and finalizes the file. All
    // writes happen on the channel's consumer thread.
    class KinematicLogger
    {
    public:
        KinematicLogger(const KinematicLoggerConfig &config,
                        LogChannel &channel,
                        std::shared_ptr<spdlog::logger> logger = nullptr);
        ~KinematicLogger();

        void start(); // subscribes; call before the channel starts
        void stop();  // closes an open record without marking it complete

        // Marks the open record complete, flushes and closes it. No-op when nothing is open.
        void finalize();

        static std::string fileNameFor(int trialId, TrialPhase phase, const std::string &tag);

        [[nodiscard]] std::filesystem::path currentPath() const;
        [[nodiscard]] std::size_t framesWritten() const;
        [[nodiscard]] std::size_t completedRecords() const;
        [[nodiscard]] std::size_t writeErrors() const;

    private:
        void handleRecord(const LogRecord &record, bool lastInBatch);
        void handleHeader(std::uint64_t seq, const TrialHeader &header);
        void handleFrame(std::uint64_t seq, const Frame &frame);
        void handleEvent(std::uint64_t seq, const TriggerEvent &event);
        void handleFooter(std::uint64_t seq, const TrialFooter &footer);
        void closeLocked(bool complete);

    private:
        KinematicLoggerConfig m_config;
        LogChannel &m_channel;
        std::shared_ptr<spdlog::logger> m_log;

        std::ofstream m_file;
        std::filesystem::path m_path;
        mutable std::mutex m_mutex;

        std::size_t m_framesWritten = 0;
        std::size_t m_completed = 0;
        std::size_t m_writeErrors = 0;
        bool m_running = false;
    };
} // namespace reachtrigger::logging
