#include <KinematicEstimator/KinematicEstimator.hpp>
#include <limits>

namespace reachtrigger::estimation
{
    KinematicEstimator::KinematicEstimator(const config::EstimatorConfig &config)
        : m_config(config)
    {
        if (m_config.windowSize < 2)
            m_config.windowSize = 2;
    }

    void KinematicEstimator::reset()
    {
        m_window.clear();
        m_lastValid.reset();
        m_start.reset();
        m_staleCount = 0;
        m_dataLoss = false;
    }

    std::optional<Eigen::Vector3f> KinematicEstimator::effectorPosition(const Frame &frame, const std::vector<int> &ids)
    {
        if (ids.empty())
            return std::nullopt;

        Eigen::Vector3f sum = Eigen::Vector3f::Zero();
        for (int id : ids)
        {
            const MarkerSample *m = frame.find(id);
            if (!m || !m->valid || !m->position.allFinite())
                return std::nullopt;
            sum += m->position;
        }
        return Eigen::Vector3f(sum / static_cast<float>(ids.size()));
    }

    std::optional<VelocitySample> KinematicEstimator::update(const Frame &frame)
    {
        const auto pos = effectorPosition(frame, m_config.effectorIds);

        if (!pos)
        {
            ++m_staleCount;

            if (m_staleCount > m_config.staleLimit)
            {
                m_dataLoss = true;

                VelocitySample lost{};
                lost.timestamp = frame.timestamp;
                lost.speed = std::numeric_limits<float>::quiet_NaN();
                lost.acceleration = std::numeric_limits<float>::quiet_NaN();
                lost.displacement = std::numeric_limits<float>::quiet_NaN();
                if (m_lastValid)
                    lost.position = m_lastValid->position;
                lost.quality = SampleQuality::DataLoss;
                return lost;
            }

            if (!m_lastValid)
                return std::nullopt;

            VelocitySample held = *m_lastValid;
            held.timestamp = frame.timestamp;
            held.quality = SampleQuality::Stale;
            return held;
        }

        if (m_dataLoss)
        {
            // Do not bridge the occlusion gap with a single finite difference.
            m_window.clear();
            m_lastValid.reset();
            m_dataLoss = false;
        }
        m_staleCount = 0;

        if (!m_start)
            m_start = *pos;

        m_window.push_back({frame.timestamp, *pos});
        while (m_window.size() > m_config.windowSize)
            m_window.pop_front();

        if (m_window.size() < m_config.windowSize)
            return std::nullopt;

        const auto &prev = m_window[m_window.size() - 2];
        const auto &curr = m_window.back();
        const float dt = std::chrono::duration<float>(curr.timestamp - prev.timestamp).count();
        if (dt <= 0.0f)
            return std::nullopt;

        VelocitySample s{};
        s.timestamp = frame.timestamp;
        s.velocity = (curr.position - prev.position) / dt;
        s.speed = s.velocity.norm();
        s.position = curr.position;
        s.displacement = (curr.position - *m_start).norm();
        s.quality = SampleQuality::Fresh;

        if (m_lastValid)
        {
            const float dtSpeed = std::chrono::duration<float>(s.timestamp - m_lastValid->timestamp).count();
            s.acceleration = dtSpeed > 0.0f ? (s.speed - m_lastValid->speed) / dtSpeed : 0.0f;
        }

        m_lastValid = s;
        return s;
    }
} // namespace reachtrigger::estimation
