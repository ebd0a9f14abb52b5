#pragma once

#include <ReachTrigger/Messages.hpp>
#include <TrialConfig/TrialConfig.hpp>
#include <Eigen/Core>
#include <deque>
#include <optional>
#include <vector>

namespace reachtrigger::estimation
{
    // Online velocity estimate of the effector from the raw frame stream.
    //
    // Velocity is the finite difference of the two most recent valid effector positions.
    // Occluded frames repeat the last estimate marked Stale; after staleLimit of them the
    // output becomes DataLoss, and the window is rebuilt from scratch once the effector
    // is visible again so no velocity spans the occlusion.
    class KinematicEstimator
    {
    public:
        explicit KinematicEstimator(const config::EstimatorConfig &config);

        // One sample per frame once the window is full; nullopt while warming up.
        std::optional<VelocitySample> update(const Frame &frame);

        void reset();

        [[nodiscard]] std::size_t consecutiveStale() const noexcept { return m_staleCount; }
        [[nodiscard]] bool inDataLoss() const noexcept { return m_dataLoss; }
        [[nodiscard]] const std::optional<Eigen::Vector3f> &startPosition() const noexcept { return m_start; }

        // Centroid of the given marker ids; nullopt unless every id is present and valid.
        static std::optional<Eigen::Vector3f> effectorPosition(const Frame &frame, const std::vector<int> &ids);

    private:
        struct PositionSample
        {
            TimePoint timestamp;
            Eigen::Vector3f position;
        };

        config::EstimatorConfig m_config;

        std::deque<PositionSample> m_window;
        std::optional<VelocitySample> m_lastValid;
        std::optional<Eigen::Vector3f> m_start;
        std::size_t m_staleCount{0};
        bool m_dataLoss{false};
    };
} // namespace reachtrigger::estimation
