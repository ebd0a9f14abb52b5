#include <TrialConfig/TrialConfig.hpp>
#include <ReachTrigger/Errors.hpp>

#include <Eigen/Geometry>
#include <cmath>
#include <sstream>

namespace reachtrigger::config
{
    bool Zone::contains(const Eigen::Vector3f &p, float defaultRadius) const
    {
        if (shape == ZoneShape::Box)
        {
            const Eigen::AlignedBox3f box(center - halfExtents, center + halfExtents);
            return box.contains(p);
        }

        const float r = radius > 0.0f ? radius : defaultRadius;
        return (p - center).squaredNorm() <= r * r;
    }

    std::vector<std::string> validate(const ThresholdConfig &cfg)
    {
        std::vector<std::string> errors;

        if (!(cfg.velocityOnsetThreshold > 0.0f) || !std::isfinite(cfg.velocityOnsetThreshold))
            errors.emplace_back("velocity_onset_threshold must be > 0");

        if (!(cfg.hysteresisMargin >= 0.0f) || !std::isfinite(cfg.hysteresisMargin))
            errors.emplace_back("hysteresis_margin must be >= 0");
        else if (cfg.hysteresisMargin >= cfg.velocityOnsetThreshold)
            errors.emplace_back("hysteresis_margin must be smaller than velocity_onset_threshold");

        if (cfg.minSustainedDuration.count() < 0)
            errors.emplace_back("min_sustained_duration must be >= 0");

        if (cfg.movementTimeout.count() <= 0)
            errors.emplace_back("movement_timeout must be > 0");

        if (!(cfg.endZoneRadius > 0.0f) || !std::isfinite(cfg.endZoneRadius))
            errors.emplace_back("end_zone_radius must be > 0");

        return errors;
    }

    std::vector<std::string> validate(const TrialConfig &cfg)
    {
        auto errors = validate(cfg.thresholds);

        bool hasEndZone = false;
        for (std::size_t i = 0; i < cfg.zones.size(); ++i)
        {
            const auto &z = cfg.zones[i];
            const std::string prefix = "zone[" + std::to_string(i) + "] ";

            if (!z.center.allFinite())
                errors.push_back(prefix + "center must be finite");

            if (z.shape == ZoneShape::Sphere)
            {
                if (z.radius < 0.0f || !std::isfinite(z.radius))
                    errors.push_back(prefix + "radius must be >= 0");
            }
            else if (!z.halfExtents.allFinite() || (z.halfExtents.array() <= 0.0f).any())
            {
                errors.push_back(prefix + "box half extents must be > 0");
            }

            if (z.label != ZoneLabel::Home)
                hasEndZone = true;
        }
        if (!hasEndZone)
            errors.emplace_back("at least one Target or Distractor zone is required");

        if (cfg.estimator.windowSize < 2)
            errors.emplace_back("estimator window_size must be >= 2");
        if (cfg.estimator.staleLimit < 1)
            errors.emplace_back("estimator stale_limit must be >= 1");
        if (cfg.estimator.effectorIds.empty())
            errors.emplace_back("at least one effector marker id is required");

        if (cfg.reveal.maxRetries < 0)
            errors.emplace_back("reveal max_retries must be >= 0");
        if (cfg.reveal.initialBackoff.count() < 0 || cfg.reveal.maxBackoff < cfg.reveal.initialBackoff)
            errors.emplace_back("reveal backoff must satisfy 0 <= initial <= max");

        if (cfg.reachTimeout.count() < 0)
            errors.emplace_back("reach_timeout must be >= 0");
        if (cfg.settleWindow.count() < 0)
            errors.emplace_back("settle_window must be >= 0");
        if (cfg.dataLossLimit.count() < 0)
            errors.emplace_back("data_loss_limit must be >= 0");

        return errors;
    }

    void validateOrThrow(const TrialConfig &cfg)
    {
        const auto errors = validate(cfg);
        if (errors.empty())
            return;

        std::ostringstream oss;
        oss << "trial " << cfg.id << " rejected:";
        for (const auto &e : errors)
            oss << "\n  - " << e;
        throw ConfigError(oss.str());
    }

    std::chrono::milliseconds effectiveReachTimeout(const TrialConfig &cfg) noexcept
    {
        return cfg.reachTimeout.count() > 0 ? cfg.reachTimeout : cfg.thresholds.movementTimeout;
    }

    const char *toString(OnsetMetric m) noexcept
    {
        return m == OnsetMetric::Speed ? "speed" : "displacement";
    }

    const char *toString(ZoneShape s) noexcept
    {
        return s == ZoneShape::Sphere ? "sphere" : "box";
    }

    std::vector<std::string> describe(const TrialConfig &cfg)
    {
        std::vector<std::string> lines;
        const auto &t = cfg.thresholds;

        lines.push_back("velocity_onset_threshold=" + std::to_string(t.velocityOnsetThreshold));
        lines.push_back("hysteresis_margin=" + std::to_string(t.hysteresisMargin));
        lines.push_back("min_sustained_samples=" + std::to_string(t.minSustainedSamples));
        lines.push_back("min_sustained_duration_us=" + std::to_string(t.minSustainedDuration.count()));
        lines.push_back("movement_timeout_ms=" + std::to_string(t.movementTimeout.count()));
        lines.push_back("end_zone_radius=" + std::to_string(t.endZoneRadius));
        lines.push_back(std::string("onset_metric=") + toString(t.onsetMetric));
        lines.push_back("reach_timeout_ms=" + std::to_string(effectiveReachTimeout(cfg).count()));
        lines.push_back("settle_window_ms=" + std::to_string(cfg.settleWindow.count()));
        lines.push_back("data_loss_limit_ms=" + std::to_string(cfg.dataLossLimit.count()));
        lines.push_back("estimator_window=" + std::to_string(cfg.estimator.windowSize));
        lines.push_back("estimator_stale_limit=" + std::to_string(cfg.estimator.staleLimit));

        std::ostringstream ids;
        for (std::size_t i = 0; i < cfg.estimator.effectorIds.size(); ++i)
            ids << (i ? " " : "") << cfg.estimator.effectorIds[i];
        lines.push_back("effector_ids=" + ids.str());

        for (std::size_t i = 0; i < cfg.zones.size(); ++i)
        {
            const auto &z = cfg.zones[i];
            std::ostringstream oss;
            oss << "zone[" << i << "]=" << reachtrigger::toString(z.label) << " " << toString(z.shape) << " center "
                << z.center.x() << " " << z.center.y() << " " << z.center.z();
            if (z.shape == ZoneShape::Sphere)
                oss << " radius " << (z.radius > 0.0f ? z.radius : t.endZoneRadius);
            else
                oss << " half_extents " << z.halfExtents.x() << " " << z.halfExtents.y() << " " << z.halfExtents.z();
            lines.push_back(oss.str());
        }
        return lines;
    }
} // namespace reachtrigger::config
