#pragma once

#include <CaptureStream/CaptureSource.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <optional>
#include <string>
#include <vector>

namespace reachtrigger::capture
{
    struct ReplayConfig
    {
        std::string path;
        double sampleRateHz = 120.0; // used when the file has no timestamp column
        bool realtime = false;       // pace frames at their recorded intervals
    };

    // Replays a recorded marker CSV. Required columns: frame,pos_x,pos_y,pos_z (meters).
    // Optional columns: timestamp (seconds), id, valid. Consecutive rows sharing a frame
    // number form one Frame; without an id column markers are numbered 1..n in row order.
    class ReplayCaptureSource final : public CaptureSource
    {
    public:
        // Throws ConfigError when the file is missing or malformed.
        ReplayCaptureSource(const ReplayConfig &config, time::Clock &clock);

        ReadResult read(std::chrono::milliseconds timeout) override;
        bool reconnect() override;
        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] std::size_t frameCount() const noexcept { return m_frames.size(); }
        void rewind() noexcept;

    private:
        void load();

        ReplayConfig m_config;
        time::Clock &m_clock;

        std::vector<Frame> m_frames;
        std::size_t m_next{0};
        std::optional<time::Clock::TimePoint> m_wallStart;
    };
} // namespace reachtrigger::capture
