#include <EndZoneDetector/EndZoneDetector.hpp>
#include <algorithm>

namespace reachtrigger::detection
{
    EndZoneDetector::EndZoneDetector(std::vector<config::Zone> zones, float defaultRadius)
        : m_zones(std::move(zones)), m_defaultRadius(defaultRadius),
          m_inside(m_zones.size(), false), m_entered(m_zones.size(), false) {}

    void EndZoneDetector::reset()
    {
        std::fill(m_inside.begin(), m_inside.end(), false);
        std::fill(m_entered.begin(), m_entered.end(), false);
        m_primed = false;
    }

    std::vector<ZoneEntry> EndZoneDetector::update(TimePoint timestamp, const std::optional<Eigen::Vector3f> &position)
    {
        std::vector<ZoneEntry> entries;
        if (!position)
            return entries;

        for (std::size_t i = 0; i < m_zones.size(); ++i)
        {
            const bool nowInside = m_zones[i].contains(*position, m_defaultRadius);

            if (m_primed && nowInside && !m_inside[i] && !m_entered[i])
            {
                m_entered[i] = true;
                entries.push_back({timestamp, i, m_zones[i].label});
            }
            m_inside[i] = nowInside;
        }

        m_primed = true;
        return entries;
    }
} // namespace reachtrigger::detection
