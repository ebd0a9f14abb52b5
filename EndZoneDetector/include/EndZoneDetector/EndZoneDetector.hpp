#pragma once

#include <ReachTrigger/Messages.hpp>
#include <TrialConfig/TrialConfig.hpp>
#include <Eigen/Core>
#include <optional>
#include <vector>

namespace reachtrigger::detection
{
    struct ZoneEntry
    {
        TimePoint timestamp;
        std::size_t zoneIndex{0};
        ZoneLabel label{ZoneLabel::Target};
    };

    // Spatial end-of-movement criterion. Reports the first outside-to-inside transition of
    // each zone per trial; whatever zones the hand already occupies at its first valid
    // position (typically Home) do not count as entries.
    class EndZoneDetector
    {
    public:
        EndZoneDetector(std::vector<config::Zone> zones, float defaultRadius);

        // position is nullopt for frames where the effector is not visible; such frames
        // neither enter nor leave any zone.
        std::vector<ZoneEntry> update(TimePoint timestamp, const std::optional<Eigen::Vector3f> &position);

        void reset();

        [[nodiscard]] const std::vector<config::Zone> &zones() const noexcept { return m_zones; }
        [[nodiscard]] bool entered(std::size_t zoneIndex) const { return m_entered.at(zoneIndex); }
        [[nodiscard]] bool inside(std::size_t zoneIndex) const { return m_inside.at(zoneIndex); }

    private:
        std::vector<config::Zone> m_zones;
        float m_defaultRadius;

        std::vector<bool> m_inside;
        std::vector<bool> m_entered;
        bool m_primed{false};
    };
} // namespace reachtrigger::detection
