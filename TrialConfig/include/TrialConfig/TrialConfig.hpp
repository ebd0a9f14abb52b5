#pragma once

#include <ReachTrigger/Messages.hpp>
#include <Eigen/Core>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace reachtrigger::config
{
    // Quantity compared against the onset threshold.
    enum class OnsetMetric
    {
        Speed,       // m/s
        Displacement // m from the reach start position
    };

    // Calibrated per participant/paradigm; there are no built-in threshold values, so a
    // default-constructed ThresholdConfig does not validate.
    struct ThresholdConfig
    {
        float velocityOnsetThreshold = 0.0f;
        float hysteresisMargin = 0.0f;
        std::size_t minSustainedSamples = 1;
        std::chrono::microseconds minSustainedDuration{0};
        std::chrono::milliseconds movementTimeout{0};
        float endZoneRadius = 0.0f; // default radius for spherical zones without their own
        OnsetMetric onsetMetric = OnsetMetric::Speed;
    };

    enum class ZoneShape
    {
        Sphere,
        Box
    };

    struct Zone
    {
        ZoneLabel label{ZoneLabel::Target};
        ZoneShape shape{ZoneShape::Sphere};
        Eigen::Vector3f center{Eigen::Vector3f::Zero()};
        float radius = 0.0f; // <= 0 means ThresholdConfig::endZoneRadius
        Eigen::Vector3f halfExtents{Eigen::Vector3f::Zero()};

        [[nodiscard]] bool contains(const Eigen::Vector3f &p, float defaultRadius) const;
    };

    struct EstimatorConfig
    {
        std::size_t windowSize = 2;
        std::size_t staleLimit = 6;
        // Marker / rigid body ids whose centroid is the effector.
        std::vector<int> effectorIds{1};
    };

    struct RevealConfig
    {
        int maxRetries = 2;
        std::chrono::milliseconds initialBackoff{2};
        std::chrono::milliseconds maxBackoff{10};
        std::chrono::microseconds latencyBudget{16667}; // two frames at 120 Hz
        bool occludeOnArm = true;
    };

    struct TrialConfig
    {
        int id = 0;
        TrialPhase phase{TrialPhase::PreReveal};
        std::string tag; // free-form condition label carried into the record file name
        ThresholdConfig thresholds;
        std::vector<Zone> zones;
        EstimatorConfig estimator;
        RevealConfig reveal;
        std::chrono::milliseconds reachTimeout{0};    // 0 means thresholds.movementTimeout
        std::chrono::milliseconds settleWindow{300};
        std::chrono::milliseconds dataLossLimit{100};
    };

    // Every violation found, empty when the configuration is usable.
    [[nodiscard]] std::vector<std::string> validate(const ThresholdConfig &cfg);
    [[nodiscard]] std::vector<std::string> validate(const TrialConfig &cfg);

    // Throws ConfigError listing all violations.
    void validateOrThrow(const TrialConfig &cfg);

    // Limit from onset to the terminal end-zone entry. A trial always has one.
    [[nodiscard]] std::chrono::milliseconds effectiveReachTimeout(const TrialConfig &cfg) noexcept;

    // key=value lines for the header of the trial's kinematic record.
    std::vector<std::string> describe(const TrialConfig &cfg);

    const char *toString(OnsetMetric m) noexcept;
    const char *toString(ZoneShape s) noexcept;
} // namespace reachtrigger::config
