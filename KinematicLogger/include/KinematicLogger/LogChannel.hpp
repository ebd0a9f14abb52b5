#pragma once

#include <ReachTrigger/Messages.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <boost/lockfree/spsc_queue.hpp>
#include <spdlog/spdlog.h>

namespace reachtrigger::logging
{
    struct TrialHeader
    {
        int trialId{0};
        TrialPhase phase{TrialPhase::PreReveal};
        std::string tag;
        std::vector<std::string> configLines;
    };

    struct TrialFooter
    {
        int trialId{0};
        std::string state;
        std::string reason;
        std::size_t frameCount{0};
        // Frames of this trial dropped past the spill limit. Non-zero leaves the record incomplete.
        std::size_t droppedFrames{0};
    };

    using LogPayload = std::variant<TrialHeader, Frame, TriggerEvent, TrialFooter>;

    struct LogRecord
    {
        std::uint64_t sequence{0};
        LogPayload payload;
    };

    struct LogChannelConfig
    {
        std::size_t frameCapacity = 4096;
        std::size_t controlCapacity = 256;
        std::size_t spillLimit = 65536; // frames held on the producer side while degraded
        std::chrono::milliseconds idleSleep{1};
    };

    // Single-producer channel from the critical path to the logging thread.
    //
    // publish() never blocks. Frames and control records (headers, events, footers) use
    // separate lock-free queues so events keep flowing when frames back up; the consumer
    // merges them by sequence number. A full frame queue puts the channel in degraded mode:
    // frames wait in a bounded spill buffer and are retried on later publishes and on
    // flush(); past the spill limit they are dropped and counted.
    class LogChannel
    {
    public:
        using RecordHandler = std::function<void(const LogRecord &record, bool lastInBatch)>;

        explicit LogChannel(const LogChannelConfig &config = {},
                            std::shared_ptr<spdlog::logger> logger = nullptr);
        ~LogChannel();

        LogChannel(const LogChannel &) = delete;
        LogChannel &operator=(const LogChannel &) = delete;

        void start();
        void stop(); // drains pending records first

        // Subscription API - call before start()
        void subscribe(RecordHandler handler);

        // Publish API - producer thread only
        void publish(const Frame &frame);
        void publish(const TriggerEvent &event);
        void publish(const TrialHeader &header);
        void publish(const TrialFooter &footer);

        // Moves spilled records into the queues and waits until the consumer has handled
        // everything published so far. Returns false on timeout. Producer thread only.
        bool flush(std::chrono::milliseconds timeout = std::chrono::seconds(5));

        [[nodiscard]] bool degraded() const noexcept { return m_degraded.load(); }
        [[nodiscard]] std::size_t droppedFrames() const noexcept { return m_droppedFrames.load(); }
        [[nodiscard]] std::size_t backpressureEpisodes() const noexcept { return m_episodes.load(); }

    private:
        using Queue = boost::lockfree::spsc_queue<LogRecord>;

        void publishControl(LogPayload payload);
        void drainSpill(Queue &queue, std::deque<LogRecord> &spill);
        void markVisible(std::uint64_t sequence);
        void workerLoop(std::stop_token st);
        std::size_t consumeAvailable();

        LogChannelConfig m_config;
        std::shared_ptr<spdlog::logger> m_log;

        Queue m_frames;
        Queue m_control;

        // Producer side
        std::uint64_t m_nextSequence{1};
        std::deque<LogRecord> m_frameSpill;
        std::deque<LogRecord> m_controlSpill;

        std::vector<RecordHandler> m_handlers;
        std::mutex m_handlerMutex;

        std::atomic<std::uint64_t> m_visibleSequence{0};
        std::atomic<std::uint64_t> m_enqueued{0};
        std::atomic<std::uint64_t> m_consumed{0};
        std::atomic<std::size_t> m_droppedFrames{0};
        std::atomic<std::size_t> m_episodes{0};
        std::atomic<bool> m_degraded{false};

        std::atomic<bool> m_running{false};
        std::jthread m_worker;
    };
} // namespace reachtrigger::logging
