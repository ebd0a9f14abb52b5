#pragma once

#include <CaptureStream/CaptureSource.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <ReachTrigger/Messages.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <spdlog/spdlog.h>

namespace reachtrigger::capture
{
    enum class OverflowPolicy
    {
        DropOldest,
        Block // wait up to readTimeout for space, then drop the oldest
    };

    struct IngestConfig
    {
        std::size_t queueCapacity = 256;
        OverflowPolicy overflowPolicy = OverflowPolicy::DropOldest;
        std::chrono::milliseconds readTimeout{5};
        std::chrono::milliseconds missedFrameTimeout{50};
        std::chrono::milliseconds reconnectBudget{2000};
        std::chrono::milliseconds reconnectBackoff{100};
    };

    // No frame for longer than missedFrameTimeout. Emitted once per stall episode.
    struct StreamStall
    {
        time::Clock::Duration gap{};
    };

    // The capture system disconnected or could not be recovered. The producer has stopped.
    struct StreamLost
    {
        std::string reason;
    };

    // A frame arrived with a timestamp not after its predecessor and was discarded.
    struct StreamFault
    {
        TimePoint timestamp;
        TimePoint previous;
        std::uint64_t frameNumber{0};
    };

    using IngestItem = std::variant<Frame, StreamStall, StreamLost, StreamFault>;

    // Runs the capture source on its own producer thread and hands frames and stream
    // conditions to the consumer through a bounded queue.
    class StreamIngestAdapter
    {
    public:
        StreamIngestAdapter(const IngestConfig &config,
                            CaptureSource &source,
                            time::Clock &clock,
                            std::shared_ptr<spdlog::logger> logger = nullptr);
        ~StreamIngestAdapter();

        StreamIngestAdapter(const StreamIngestAdapter &) = delete;
        StreamIngestAdapter &operator=(const StreamIngestAdapter &) = delete;

        void start();
        void stop();

        // Reconnects the source and restarts the producer after a StreamLost.
        bool restart();

        // Next item, or nullopt if nothing arrived within the timeout.
        std::optional<IngestItem> next(std::chrono::milliseconds timeout);

        // Drops everything queued so far; returns how many items were discarded.
        std::size_t discardPending();

        [[nodiscard]] bool producing() const noexcept { return m_producing.load(); }
        [[nodiscard]] std::size_t delivered() const noexcept { return m_delivered.load(); }
        [[nodiscard]] std::size_t droppedOnOverflow() const noexcept { return m_dropped.load(); }
        [[nodiscard]] std::size_t outOfOrder() const noexcept { return m_outOfOrder.load(); }

    private:
        void workerLoop(std::stop_token st);
        void push(IngestItem item, const std::stop_token &st);
        bool recover(const std::stop_token &st);

        IngestConfig m_config;
        CaptureSource &m_source;
        time::Clock &m_clock;
        std::shared_ptr<spdlog::logger> m_log;

        std::deque<IngestItem> m_queue;
        std::mutex m_mutex;
        std::condition_variable m_itemCv;
        std::condition_variable m_spaceCv;

        std::optional<TimePoint> m_lastTimestamp; // capture clock, producer thread only

        std::atomic<bool> m_running{false};
        std::atomic<bool> m_producing{false};
        std::atomic<std::size_t> m_delivered{0};
        std::atomic<std::size_t> m_dropped{0};
        std::atomic<std::size_t> m_outOfOrder{0};
        std::jthread m_worker;
    };
} // namespace reachtrigger::capture
