#include <MotionDetector/OnsetDetector.hpp>

namespace reachtrigger::detection
{
    OnsetDetector::OnsetDetector(const config::ThresholdConfig &thresholds)
        : m_thresholds(thresholds) {}

    void OnsetDetector::reset()
    {
        m_state = Static{};
        m_onsetPending = false;
        m_faulted = false;
        m_onsetCount = 0;
    }

    float OnsetDetector::metricOf(const VelocitySample &sample) const noexcept
    {
        return m_thresholds.onsetMetric == config::OnsetMetric::Displacement ? sample.displacement : sample.speed;
    }

    DetectorOutput OnsetDetector::update(const VelocitySample &sample)
    {
        DetectorOutput out{};

        switch (sample.quality)
        {
        case SampleQuality::DataLoss:
            m_faulted = true;
            out.fault = true;
            return out;
        case SampleQuality::Stale:
            return out; // hold state and run counters
        case SampleQuality::Fresh:
            m_faulted = false;
            break;
        }

        const float metric = metricOf(sample);
        auto result = step(m_state, m_thresholds, metric, sample.timestamp);
        m_state = result.next;
        out.transition = result.transition;

        if (result.transition == MotionTransition::Onset && !m_onsetPending)
        {
            m_onsetPending = true;
            ++m_onsetCount;
            out.onset = OnsetNotification{sample.timestamp, metric};
        }
        else if (result.transition == MotionTransition::Offset)
        {
            m_onsetPending = false;
        }

        return out;
    }
} // namespace reachtrigger::detection
