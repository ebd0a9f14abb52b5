#include <catch2/catch_test_macros.hpp>
#include <CaptureStream/ScriptedCaptureSource.hpp>
#include <CaptureStream/StreamIngestAdapter.hpp>
#include <KinematicLogger/KinematicLogger.hpp>
#include <KinematicLogger/LogChannel.hpp>
#include <RevealTrigger/SimulatedGoggles.hpp>
#include <TrialOrchestrator/TrialOrchestrator.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <ReachTrigger/Errors.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <vector>
#include <spdlog/sinks/null_sink.h>

using namespace reachtrigger;
using namespace std::chrono_literals;
using trial::OutcomeReason;
using trial::TrialState;
using trigger::OcclusionState;

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
        return std::make_shared<spdlog::logger>("orchestrator_test", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    constexpr auto kFramePeriod = 10ms;

    TimePoint frameTime(std::uint64_t n)
    {
        return TimePoint{} + 1s + static_cast<int>(n) * kFramePeriod;
    }

    Frame frameAt(std::uint64_t n, float x, bool valid = true)
    {
        Frame f;
        f.timestamp = frameTime(n);
        f.frameNumber = n;
        f.markers.push_back(MarkerSample{1, Eigen::Vector3f(x, 0.0f, 0.0f), std::nullopt, valid});
        return f;
    }

    config::Zone sphere(ZoneLabel label, const Eigen::Vector3f &center, float radius)
    {
        config::Zone z;
        z.label = label;
        z.shape = config::ZoneShape::Sphere;
        z.center = center;
        z.radius = radius;
        return z;
    }

    // Hand rests at the origin, a Target sits 30 cm along x and a Distractor 30 cm along y.
    config::TrialConfig reachConfig(TrialPhase phase)
    {
        config::TrialConfig cfg;
        cfg.id = 1;
        cfg.phase = phase;
        cfg.thresholds.velocityOnsetThreshold = 0.3f;
        cfg.thresholds.hysteresisMargin = 0.1f;
        cfg.thresholds.minSustainedSamples = 3;
        cfg.thresholds.movementTimeout = 2000ms;
        cfg.thresholds.endZoneRadius = 0.035f;
        cfg.zones = {sphere(ZoneLabel::Home, Eigen::Vector3f::Zero(), 0.02f),
                     sphere(ZoneLabel::Target, Eigen::Vector3f(0.30f, 0.0f, 0.0f), 0.0f),
                     sphere(ZoneLabel::Distractor, Eigen::Vector3f(0.0f, 0.30f, 0.0f), 0.0f)};
        cfg.settleWindow = 50ms;
        cfg.dataLossLimit = 100ms;
        return cfg;
    }

    // Ten frames at rest, then 1 m/s along x until stopX, then at rest.
    // With stopX = 0.30 the speed crosses the threshold at frame 10, onset is
    // confirmed at frame 12 and the Target is entered at frame 36.
    void pushReach(capture::ScriptedCaptureSource &source, float stopX, std::uint64_t lastFrame)
    {
        for (std::uint64_t n = 0; n <= lastFrame; ++n)
        {
            const float x = n < 10 ? 0.0f : std::min(0.01f * static_cast<float>(n - 9), stopX);
            source.pushFrame(frameAt(n, x));
        }
    }

    void pushStill(capture::ScriptedCaptureSource &source, std::uint64_t first, std::uint64_t last)
    {
        for (std::uint64_t n = first; n <= last; ++n)
            source.pushFrame(frameAt(n, 0.0f));
    }

    capture::IngestConfig ingestConfig()
    {
        capture::IngestConfig cfg;
        cfg.queueCapacity = 4096;
        cfg.overflowPolicy = capture::OverflowPolicy::Block;
        cfg.readTimeout = 2ms;
        cfg.missedFrameTimeout = 10s;
        return cfg;
    }

    std::filesystem::path scratchDir()
    {
        return std::filesystem::temp_directory_path() /
               ("reachtrigger_orchestrator_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    }

    struct Rig
    {
        Rig()
            : dir(scratchDir()),
              source(clock),
              ingest(ingestConfig(), source, clock, quietLogger()),
              channel({}, quietLogger()),
              goggles(clock),
              records({dir.string()}, channel, quietLogger()),
              orchestrator({5ms, 2000ms}, ingest, goggles, channel, clock, quietLogger())
        {
            records.start();
            channel.start();
            ingest.start();
        }

        ~Rig()
        {
            ingest.stop();
            channel.stop();
            records.stop();
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
        }

        // Runs the trial on a worker thread and feeds the script once the trial is active.
        trial::Trial run(const config::TrialConfig &cfg, const std::function<void(capture::ScriptedCaptureSource &)> &script)
        {
            auto pending = std::async(std::launch::async, [&]
                                      { return orchestrator.runTrial(cfg); });
            REQUIRE(waitFor([&]
                            { return orchestrator.state() == TrialState::Active; },
                            2s));
            script(source);
            return pending.get();
        }

        std::filesystem::path dir;
        time::SteadyClock clock;
        capture::ScriptedCaptureSource source;
        capture::StreamIngestAdapter ingest;
        logging::LogChannel channel;
        trigger::SimulatedGoggles goggles;
        logging::KinematicLogger records;
        trial::TrialOrchestrator orchestrator;
    };

    // The record is closed complete and holds each processed frame once, in capture order.
    void requireCompleteRecord(Rig &rig, const trial::Trial &t)
    {
        REQUIRE(rig.records.completedRecords() == 1);
        REQUIRE(rig.records.framesWritten() == t.frames().size());

        std::vector<long long> stamps;
        std::ifstream in(rig.records.currentPath());
        std::string line;
        while (std::getline(in, line))
        {
            if (line.rfind("frame,", 0) != 0)
                continue;
            std::istringstream row(line);
            std::string field;
            for (int column = 0; column <= 2; ++column)
                std::getline(row, field, ',');
            stamps.push_back(std::stoll(field));
        }

        REQUIRE(stamps.size() == t.frames().size());
        for (std::size_t i = 1; i < stamps.size(); ++i)
            REQUIRE(stamps[i] > stamps[i - 1]);
    }
} // namespace

TEST_CASE("A PreReveal reach reveals once at onset and completes in the Target", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::PreReveal);

    auto t = rig.run(cfg, [](auto &source)
                     { pushReach(source, 0.30f, 70); });

    REQUIRE(t.sealed());
    REQUIRE(t.state() == TrialState::Completed);
    REQUIRE(t.reason() == OutcomeReason::None);

    REQUIRE(t.countEvents(TriggerEventKind::Reveal) == 1);
    REQUIRE(t.countEvents(TriggerEventKind::MovementOnset) == 1);
    REQUIRE(t.countEvents(TriggerEventKind::EndZoneEntry) == 1);
    REQUIRE(t.events().size() == 3);

    const auto reveal = t.firstEvent(TriggerEventKind::Reveal);
    REQUIRE(reveal->timestamp == frameTime(12));
    REQUIRE(reveal->timestamp == t.firstEvent(TriggerEventKind::MovementOnset)->timestamp);
    REQUIRE(reveal->attempts == 1);

    // Confirmed within two frames of the first supra-threshold sample.
    REQUIRE(reveal->timestamp - frameTime(10) <= 2 * kFramePeriod);

    REQUIRE(t.graspedZone() == ZoneLabel::Target);
    REQUIRE(t.firstEvent(TriggerEventKind::EndZoneEntry)->timestamp == frameTime(36));
    REQUIRE(t.responseTime() == std::chrono::microseconds(120ms));
    REQUIRE(t.movementTime() == std::chrono::microseconds(240ms));

    // Settled 50 ms after entering the Target.
    REQUIRE(t.frames().size() == 42);
    REQUIRE(t.frames().back().timestamp == frameTime(41));

    REQUIRE(rig.goggles.acknowledgedCount(OcclusionState::Closed) == 1);
    REQUIRE(rig.goggles.acknowledgedCount(OcclusionState::Open) == 1);

    SECTION("every processed frame is in the trial record")
    {
        REQUIRE(rig.records.currentPath() == rig.dir / "trial_1_PreReveal.csv");
        requireCompleteRecord(rig, t);
    }
}

TEST_CASE("The same capture stream produces the same trial", "[TrialOrchestrator]")
{
    const auto cfg = reachConfig(TrialPhase::PreReveal);
    const auto script = [](capture::ScriptedCaptureSource &source)
    { pushReach(source, 0.30f, 70); };

    using Summary = std::vector<std::tuple<TriggerEventKind, TimePoint, std::optional<ZoneLabel>>>;
    const auto summarize = [](const trial::Trial &t)
    {
        Summary out;
        for (const auto &ev : t.events())
            out.emplace_back(ev.kind, ev.timestamp, ev.zone);
        return out;
    };

    Rig first;
    auto a = first.run(cfg, script);
    Rig second;
    auto b = second.run(cfg, script);

    REQUIRE(a.state() == b.state());
    REQUIRE(a.frames().size() == b.frames().size());
    REQUIRE(summarize(a) == summarize(b));
}

TEST_CASE("FullKnowledge trials complete without touching the goggles", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::FullKnowledge);

    auto t = rig.run(cfg, [](auto &source)
                     { pushReach(source, 0.30f, 70); });

    REQUIRE(t.state() == TrialState::Completed);
    REQUIRE(t.graspedZone() == ZoneLabel::Target);
    REQUIRE(t.countEvents(TriggerEventKind::Reveal) == 0);
    REQUIRE(t.countEvents(TriggerEventKind::MovementOnset) == 0);
    REQUIRE(rig.goggles.commands().empty());
    REQUIRE(rig.records.currentPath() == rig.dir / "trial_1_FullKnowledge.csv");
}

TEST_CASE("A hand that never moves ends the trial at the movement timeout", "[TrialOrchestrator]")
{
    Rig rig;
    auto cfg = reachConfig(TrialPhase::PreReveal);
    cfg.thresholds.movementTimeout = 200ms;

    SECTION("on the capture clock")
    {
        auto t = rig.run(cfg, [](auto &source)
                         { pushStill(source, 0, 40); });

        REQUIRE(t.state() == TrialState::Aborted);
        REQUIRE(t.reason() == OutcomeReason::MovementTimeout);
        REQUIRE(t.events().empty());
        REQUIRE(t.frames().size() == 21);
        REQUIRE(rig.goggles.acknowledgedCount(OcclusionState::Open) == 0);
        requireCompleteRecord(rig, t);
    }

    SECTION("on the session clock when no frames arrive")
    {
        cfg.thresholds.movementTimeout = 100ms;
        auto t = rig.run(cfg, [](auto &) {});

        REQUIRE(t.state() == TrialState::Aborted);
        REQUIRE(t.reason() == OutcomeReason::MovementTimeout);
        REQUIRE(t.frames().empty());
        REQUIRE(t.events().empty());
        requireCompleteRecord(rig, t);
    }
}

TEST_CASE("Onset without reaching an end zone ends at the reach timeout", "[TrialOrchestrator]")
{
    Rig rig;
    auto cfg = reachConfig(TrialPhase::PreReveal);
    cfg.reachTimeout = 100ms;

    auto t = rig.run(cfg, [](auto &source)
                     { pushReach(source, 0.15f, 60); });

    REQUIRE(t.state() == TrialState::Aborted);
    REQUIRE(t.reason() == OutcomeReason::ReachTimeout);
    REQUIRE(t.countEvents(TriggerEventKind::Reveal) == 1);
    REQUIRE(t.countEvents(TriggerEventKind::TrialTimeout) == 1);
    REQUIRE(t.firstEvent(TriggerEventKind::TrialTimeout)->timestamp == frameTime(22));
    REQUIRE_FALSE(t.graspedZone());
    requireCompleteRecord(rig, t);
}

TEST_CASE("Without an explicit reach timeout the movement timeout bounds the reach", "[TrialOrchestrator]")
{
    Rig rig;
    auto cfg = reachConfig(TrialPhase::PreReveal);
    cfg.thresholds.movementTimeout = 200ms;
    REQUIRE(cfg.reachTimeout == 0ms);
    REQUIRE(config::effectiveReachTimeout(cfg) == 200ms);

    SECTION("on the capture clock")
    {
        auto t = rig.run(cfg, [](auto &source)
                         { pushReach(source, 0.15f, 60); });

        REQUIRE(t.state() == TrialState::Aborted);
        REQUIRE(t.reason() == OutcomeReason::ReachTimeout);
        REQUIRE(t.countEvents(TriggerEventKind::Reveal) == 1);
        REQUIRE(t.firstEvent(TriggerEventKind::TrialTimeout)->timestamp == frameTime(32));
        requireCompleteRecord(rig, t);
    }

    SECTION("on the session clock when frames stop after onset")
    {
        cfg.thresholds.movementTimeout = 150ms;
        auto t = rig.run(cfg, [](auto &source)
                         { pushReach(source, 0.15f, 20); });

        REQUIRE(t.state() == TrialState::Aborted);
        REQUIRE(t.reason() == OutcomeReason::ReachTimeout);
        REQUIRE(t.countEvents(TriggerEventKind::MovementOnset) == 1);
        REQUIRE(t.frames().size() == 21);
        requireCompleteRecord(rig, t);
    }
}

TEST_CASE("A trial settles on the session clock when frames stop inside the end zone", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::PreReveal);

    auto t = rig.run(cfg, [](auto &source)
                     { pushReach(source, 0.30f, 36); });

    REQUIRE(t.state() == TrialState::Completed);
    REQUIRE(t.graspedZone() == ZoneLabel::Target);
    REQUIRE(t.frames().size() == 37);
}

TEST_CASE("Capture stream failures end the trial as Errored", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::PreReveal);

    SECTION("disconnect")
    {
        auto t = rig.run(cfg, [](capture::ScriptedCaptureSource &source)
                         {
                             pushStill(source, 0, 4);
                             source.pushDisconnect(); });

        REQUIRE(t.state() == TrialState::Errored);
        REQUIRE(t.reason() == OutcomeReason::StreamLost);
        REQUIRE(t.frames().size() == 5);
        requireCompleteRecord(rig, t);
    }

    SECTION("out-of-order frame")
    {
        auto t = rig.run(cfg, [](capture::ScriptedCaptureSource &source)
                         {
                             pushStill(source, 0, 4);
                             Frame late = frameAt(5, 0.0f);
                             late.timestamp = frameTime(2);
                             source.pushFrame(late);
                             pushStill(source, 6, 20); });

        REQUIRE(t.state() == TrialState::Errored);
        REQUIRE(t.reason() == OutcomeReason::StreamFault);
        REQUIRE(t.frames().size() == 5);
        requireCompleteRecord(rig, t);
    }
}

TEST_CASE("Losing the effector longer than the data-loss limit errors the trial", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::PreReveal);

    SECTION("occlusion outlasts the limit")
    {
        auto t = rig.run(cfg, [](capture::ScriptedCaptureSource &source)
                         {
                             pushStill(source, 0, 4);
                             for (std::uint64_t n = 5; n <= 40; ++n)
                                 source.pushFrame(frameAt(n, 0.0f, false)); });

        // Data loss is declared after the seventh missing sample (frame 11)
        // and the trial errors once it has lasted 100 ms.
        REQUIRE(t.state() == TrialState::Errored);
        REQUIRE(t.reason() == OutcomeReason::DataLoss);
        REQUIRE(t.countEvents(TriggerEventKind::DataLoss) == 1);
        REQUIRE(t.firstEvent(TriggerEventKind::DataLoss)->timestamp == frameTime(11));
        REQUIRE(t.frames().back().timestamp == frameTime(21));
        requireCompleteRecord(rig, t);
    }

    SECTION("a short occlusion recovers")
    {
        auto shortTimeout = cfg;
        shortTimeout.thresholds.movementTimeout = 300ms;
        auto t = rig.run(shortTimeout, [](capture::ScriptedCaptureSource &source)
                         {
                             pushStill(source, 0, 4);
                             for (std::uint64_t n = 5; n <= 14; ++n)
                                 source.pushFrame(frameAt(n, 0.0f, false));
                             pushStill(source, 15, 40); });

        REQUIRE(t.reason() == OutcomeReason::MovementTimeout);
        REQUIRE(t.countEvents(TriggerEventKind::DataLoss) == 1);
        REQUIRE(t.countEvents(TriggerEventKind::DataRecovered) == 1);
        REQUIRE(t.firstEvent(TriggerEventKind::DataRecovered)->timestamp == frameTime(16));
        requireCompleteRecord(rig, t);
    }
}

TEST_CASE("Goggle failures end the trial as a hardware fault", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::PreReveal);

    SECTION("reveal never acknowledged")
    {
        rig.goggles.scriptStatuses({trigger::SendStatus::Acknowledged, trigger::SendStatus::Failed,
                                    trigger::SendStatus::Failed, trigger::SendStatus::Failed});
        auto t = rig.run(cfg, [](auto &source)
                         { pushReach(source, 0.30f, 70); });

        REQUIRE(t.state() == TrialState::Errored);
        REQUIRE(t.reason() == OutcomeReason::HardwareFault);
        REQUIRE(t.countEvents(TriggerEventKind::MovementOnset) == 1);
        REQUIRE(t.countEvents(TriggerEventKind::Reveal) == 0);
        REQUIRE(t.frames().back().timestamp == frameTime(12));
        requireCompleteRecord(rig, t);
    }

    SECTION("occlusion fails on arm")
    {
        rig.goggles.setConnected(false);
        auto t = rig.orchestrator.runTrial(cfg);

        REQUIRE(t.state() == TrialState::Errored);
        REQUIRE(t.reason() == OutcomeReason::HardwareFault);
        REQUIRE(t.frames().empty());
        REQUIRE(rig.goggles.acknowledgedCount(OcclusionState::Closed) == 0);
        requireCompleteRecord(rig, t);
    }
}

TEST_CASE("An experimenter abort ends the running trial", "[TrialOrchestrator]")
{
    Rig rig;
    const auto cfg = reachConfig(TrialPhase::PreReveal);

    auto t = rig.run(cfg, [&](auto &)
                     { rig.orchestrator.requestAbort(); });

    REQUIRE(t.state() == TrialState::Aborted);
    REQUIRE(t.reason() == OutcomeReason::ExperimenterAbort);
    REQUIRE(t.countEvents(TriggerEventKind::Aborted) == 1);
    requireCompleteRecord(rig, t);
}

TEST_CASE("An invalid trial configuration is rejected before anything is armed", "[TrialOrchestrator]")
{
    Rig rig;
    config::TrialConfig invalid;
    invalid.id = 9;

    REQUIRE_THROWS_AS(rig.orchestrator.runTrial(invalid), ConfigError);
    REQUIRE(rig.goggles.commands().empty());
    REQUIRE(rig.orchestrator.framesProcessed() == 0);
}
