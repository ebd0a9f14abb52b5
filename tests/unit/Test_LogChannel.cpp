#include <catch2/catch_test_macros.hpp>
#include <KinematicLogger/LogChannel.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>
#include <spdlog/sinks/null_sink.h>

using namespace reachtrigger;
using namespace std::chrono_literals;

namespace
{
    bool waitFor(const std::function<bool()> &predicate, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
                return true;
            std::this_thread::sleep_for(1ms);
        }
        return predicate();
    }

    std::shared_ptr<spdlog::logger> quietLogger()
    {
        return std::make_shared<spdlog::logger>("logchannel_test", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    Frame frameAt(std::uint64_t n)
    {
        Frame f;
        f.timestamp = TimePoint{} + std::chrono::milliseconds(n * 8);
        f.frameNumber = n;
        return f;
    }

    struct Collected
    {
        std::mutex mutex;
        std::vector<std::uint64_t> sequences;
        std::size_t frames = 0;
        std::size_t events = 0;
        std::size_t batches = 0;

        logging::LogChannel::RecordHandler handler()
        {
            return [this](const logging::LogRecord &r, bool lastInBatch)
            {
                std::lock_guard<std::mutex> lock(mutex);
                sequences.push_back(r.sequence);
                if (std::holds_alternative<Frame>(r.payload))
                    ++frames;
                if (std::holds_alternative<TriggerEvent>(r.payload))
                    ++events;
                if (lastInBatch)
                    ++batches;
            };
        }
    };
} // namespace

TEST_CASE("LogChannel delivers frames and control records in publish order", "[LogChannel]")
{
    logging::LogChannel channel({}, quietLogger());
    Collected got;
    channel.subscribe(got.handler());
    channel.start();

    channel.publish(logging::TrialHeader{1, TrialPhase::PreReveal, "", {}});
    for (std::uint64_t i = 0; i < 50; ++i)
    {
        channel.publish(frameAt(i));
        if (i == 20)
            channel.publish(TriggerEvent{TimePoint{} + 160ms, TriggerEventKind::Reveal, std::nullopt, {}, {}, 1});
    }
    channel.publish(logging::TrialFooter{1, "Completed", "None", 50});

    REQUIRE(channel.flush(2s));
    channel.stop();

    std::lock_guard<std::mutex> lock(got.mutex);
    REQUIRE(got.sequences.size() == 53);
    for (std::size_t i = 1; i < got.sequences.size(); ++i)
        REQUIRE(got.sequences[i] == got.sequences[i - 1] + 1);
    REQUIRE(got.frames == 50);
    REQUIRE(got.events == 1);
    REQUIRE(got.batches >= 1);
    REQUIRE_FALSE(channel.degraded());
}

TEST_CASE("A stalled consumer puts the channel in degraded mode without blocking the producer", "[LogChannel]")
{
    logging::LogChannelConfig cfg;
    cfg.frameCapacity = 4;
    cfg.spillLimit = 8;
    logging::LogChannel channel(cfg, quietLogger());

    std::atomic<bool> release{false};
    Collected got;
    auto record = got.handler();
    channel.subscribe([&](const logging::LogRecord &r, bool last)
                      {
                          while (!release.load())
                              std::this_thread::sleep_for(1ms);
                          record(r, last);
                      });
    channel.start();

    const auto before = std::chrono::steady_clock::now();
    for (std::uint64_t i = 0; i < 20; ++i)
        channel.publish(frameAt(i));
    channel.publish(TriggerEvent{TimePoint{} + 1s, TriggerEventKind::EndZoneEntry, ZoneLabel::Target, {}, {}, 0});
    const auto publishTime = std::chrono::steady_clock::now() - before;

    REQUIRE(publishTime < 500ms);
    REQUIRE(channel.degraded());
    REQUIRE(channel.backpressureEpisodes() == 1);
    REQUIRE(channel.droppedFrames() > 0);

    release = true;
    REQUIRE(channel.flush(2s));
    REQUIRE_FALSE(channel.degraded());
    channel.stop();

    std::lock_guard<std::mutex> lock(got.mutex);
    // Events survive backpressure; frames are either persisted or counted as dropped.
    REQUIRE(got.events == 1);
    REQUIRE(got.frames + channel.droppedFrames() == 20);
}

TEST_CASE("flush reports failure when no consumer is running", "[LogChannel]")
{
    logging::LogChannel channel({}, quietLogger());
    Collected got;
    channel.subscribe(got.handler());

    channel.publish(frameAt(1));
    REQUIRE_FALSE(channel.flush(50ms));

    channel.start();
    REQUIRE(channel.flush(2s));
    channel.stop();
    REQUIRE(got.frames == 1);
}

TEST_CASE("stop drains everything published before it", "[LogChannel]")
{
    logging::LogChannel channel({}, quietLogger());
    Collected got;
    channel.subscribe(got.handler());
    channel.start();

    for (std::uint64_t i = 0; i < 500; ++i)
        channel.publish(frameAt(i));
    channel.stop();

    REQUIRE(got.frames == 500);
    REQUIRE(waitFor([&]
                    { return got.sequences.size() == 500; },
                    100ms));
}
