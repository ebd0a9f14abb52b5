#pragma once

#include <ReachTrigger/Messages.hpp>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace reachtrigger::logging
{
    // One line of trials.csv. Durations are empty when the trial never reached them.
    struct TrialSummaryRow
    {
        int trialId{0};
        TrialPhase phase{TrialPhase::PreReveal};
        std::string tag;
        std::string state;
        std::string reason;
        std::size_t frameCount{0};
        std::optional<std::chrono::microseconds> responseTime;
        std::optional<std::chrono::microseconds> movementTime;
        std::optional<std::chrono::microseconds> revealTime;
        std::optional<ZoneLabel> graspedZone;
        std::optional<std::chrono::microseconds> revealLatency;
    };

    // Appends per-trial summary rows to <outputDir>/trials.csv, writing the column header
    // when the file is new.
    class TrialSummaryWriter
    {
    public:
        explicit TrialSummaryWriter(const std::string &outputDir);

        // Returns false when the row could not be written.
        bool append(const TrialSummaryRow &row);

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

    private:
        std::filesystem::path m_path;
        std::mutex m_mutex;
    };
} // namespace reachtrigger::logging
