#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <MotionDetector/OnsetDetector.hpp>

#include <chrono>
#include <limits>
#include <vector>

using namespace reachtrigger;
using namespace std::chrono_literals;
using Catch::Approx;

namespace
{
    config::ThresholdConfig thresholds()
    {
        config::ThresholdConfig cfg;
        cfg.velocityOnsetThreshold = 0.05f;
        cfg.hysteresisMargin = 0.01f;
        cfg.minSustainedSamples = 2;
        cfg.movementTimeout = 2s;
        cfg.endZoneRadius = 0.03f;
        return cfg;
    }

    VelocitySample sample(int index, float speed, SampleQuality quality = SampleQuality::Fresh)
    {
        VelocitySample s{};
        s.timestamp = TimePoint{} + std::chrono::milliseconds(index * 10);
        s.speed = quality == SampleQuality::DataLoss ? std::numeric_limits<float>::quiet_NaN() : speed;
        s.quality = quality;
        return s;
    }
} // namespace

TEST_CASE("Onset fires on the 4th sample of the reference sequence", "[OnsetDetector]")
{
    detection::OnsetDetector detector(thresholds());
    const std::vector<float> speeds{0.01f, 0.02f, 0.06f, 0.07f, 0.08f};

    std::vector<detection::OnsetNotification> onsets;
    std::size_t onsetIndex = 0;
    for (std::size_t i = 0; i < speeds.size(); ++i)
    {
        auto out = detector.update(sample(static_cast<int>(i), speeds[i]));
        if (out.onset)
        {
            onsets.push_back(*out.onset);
            onsetIndex = i;
        }
    }

    REQUIRE(onsets.size() == 1);
    REQUIRE(onsetIndex == 3);
    REQUIRE(onsets[0].metric == Approx(0.07f));
    REQUIRE(onsets[0].timestamp == TimePoint{} + 30ms);
    REQUIRE(detector.state() == MotionKind::Moving);
}

TEST_CASE("Rise, dip into the hysteresis band and rise again gives one onset", "[OnsetDetector]")
{
    detection::OnsetDetector detector(thresholds());
    const float threshold = 0.05f;
    const std::vector<float> speeds{0.0f, 1.5f * threshold, 1.5f * threshold, 0.9f * threshold, 0.9f * threshold,
                                    0.9f * threshold, 1.5f * threshold, 1.5f * threshold, 1.5f * threshold};

    std::size_t onsets = 0;
    std::size_t offsets = 0;
    for (std::size_t i = 0; i < speeds.size(); ++i)
    {
        auto out = detector.update(sample(static_cast<int>(i), speeds[i]));
        if (out.onset)
            ++onsets;
        if (out.transition == detection::MotionTransition::Offset)
            ++offsets;
    }

    REQUIRE(onsets == 1);
    REQUIRE(offsets == 0);
    REQUIRE(detector.onsetCount() == 1);
}

TEST_CASE("A new onset is reported only after returning to Static", "[OnsetDetector]")
{
    detection::OnsetDetector detector(thresholds());
    const std::vector<float> speeds{0.1f, 0.1f, 0.0f, 0.0f, 0.1f, 0.1f};

    std::vector<detection::MotionTransition> transitions;
    std::size_t onsets = 0;
    for (std::size_t i = 0; i < speeds.size(); ++i)
    {
        auto out = detector.update(sample(static_cast<int>(i), speeds[i]));
        transitions.push_back(out.transition);
        if (out.onset)
            ++onsets;
    }

    REQUIRE(transitions[1] == detection::MotionTransition::Onset);
    REQUIRE(transitions[3] == detection::MotionTransition::Offset);
    REQUIRE(transitions[5] == detection::MotionTransition::Onset);
    REQUIRE(onsets == 2);
}

TEST_CASE("Stale samples hold the state and DataLoss raises a fault", "[OnsetDetector]")
{
    detection::OnsetDetector detector(thresholds());

    REQUIRE_FALSE(detector.update(sample(0, 0.06f)).onset);

    SECTION("stale samples neither advance nor break the run")
    {
        auto stale = detector.update(sample(1, 0.5f, SampleQuality::Stale));
        REQUIRE(stale.transition == detection::MotionTransition::None);
        REQUIRE_FALSE(stale.fault);

        auto fresh = detector.update(sample(2, 0.06f));
        REQUIRE(fresh.onset);
    }

    SECTION("data loss freezes the detector until fresh data returns")
    {
        auto lost = detector.update(sample(1, 0.0f, SampleQuality::DataLoss));
        REQUIRE(lost.fault);
        REQUIRE(detector.faulted());
        REQUIRE(detector.state() == MotionKind::Static);

        auto fresh = detector.update(sample(2, 0.06f));
        REQUIRE_FALSE(fresh.fault);
        REQUIRE_FALSE(detector.faulted());
        REQUIRE(fresh.onset);
    }
}

TEST_CASE("Displacement metric compares distance from the start position", "[OnsetDetector]")
{
    auto cfg = thresholds();
    cfg.onsetMetric = config::OnsetMetric::Displacement;
    cfg.velocityOnsetThreshold = 0.02f; // 2 cm
    cfg.hysteresisMargin = 0.005f;
    cfg.minSustainedSamples = 1;
    detection::OnsetDetector detector(cfg);

    auto s = sample(0, 5.0f); // fast but not far
    s.displacement = 0.01f;
    REQUIRE_FALSE(detector.update(s).onset);

    s = sample(1, 0.0f);
    s.displacement = 0.025f;
    auto out = detector.update(s);
    REQUIRE(out.onset);
    REQUIRE(out.onset->metric == Approx(0.025f));
}
