#include <SessionConfig/SessionConfig.hpp>
#include <ReachTrigger/Errors.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <string>

namespace pt = boost::property_tree;

namespace reachtrigger::config
{
    namespace
    {
        template <typename T>
        void readIf(const pt::ptree &node, const char *key, T &out)
        {
            if (auto v = node.get_optional<T>(key))
                out = *v;
        }

        // Counts and capacities: read signed so a negative value is reported, not wrapped.
        void readCountIf(const pt::ptree &node, const char *key, std::size_t &out)
        {
            if (auto v = node.get_optional<long long>(key))
            {
                if (*v < 0)
                    throw ConfigError(std::string(key) + " must be >= 0, got " + std::to_string(*v));
                out = static_cast<std::size_t>(*v);
            }
        }

        template <typename Rep, typename Period>
        void readDurationIf(const pt::ptree &node, const char *key, std::chrono::duration<Rep, Period> &out)
        {
            if (auto v = node.get_optional<Rep>(key))
                out = std::chrono::duration<Rep, Period>(*v);
        }

        Eigen::Vector3f readVector(const pt::ptree &node, const std::string &what)
        {
            std::vector<float> values;
            for (const auto &child : node)
                values.push_back(child.second.get_value<float>());

            if (values.size() != 3)
                throw ConfigError(what + " must have exactly 3 components");
            return {values[0], values[1], values[2]};
        }

        TrialPhase parsePhase(const std::string &s)
        {
            if (s == "PreReveal" || s == "pre_reveal")
                return TrialPhase::PreReveal;
            if (s == "FullKnowledge" || s == "full_knowledge")
                return TrialPhase::FullKnowledge;
            throw ConfigError("unknown trial phase '" + s + "'");
        }

        ZoneLabel parseLabel(const std::string &s)
        {
            if (s == "Target" || s == "target")
                return ZoneLabel::Target;
            if (s == "Distractor" || s == "distractor")
                return ZoneLabel::Distractor;
            if (s == "Home" || s == "home")
                return ZoneLabel::Home;
            throw ConfigError("unknown zone label '" + s + "'");
        }

        OnsetMetric parseMetric(const std::string &s)
        {
            if (s == "speed")
                return OnsetMetric::Speed;
            if (s == "displacement")
                return OnsetMetric::Displacement;
            throw ConfigError("unknown onset_metric '" + s + "'");
        }

        capture::OverflowPolicy parseOverflow(const std::string &s)
        {
            if (s == "drop_oldest")
                return capture::OverflowPolicy::DropOldest;
            if (s == "block")
                return capture::OverflowPolicy::Block;
            throw ConfigError("unknown ingest overflow policy '" + s + "'");
        }

        void applyThresholds(const pt::ptree &node, ThresholdConfig &t)
        {
            readIf(node, "velocity_onset_threshold", t.velocityOnsetThreshold);
            readIf(node, "hysteresis_margin", t.hysteresisMargin);
            readCountIf(node, "min_sustained_samples", t.minSustainedSamples);
            readDurationIf(node, "min_sustained_duration_us", t.minSustainedDuration);
            readDurationIf(node, "movement_timeout_ms", t.movementTimeout);
            readIf(node, "end_zone_radius", t.endZoneRadius);
            if (auto m = node.get_optional<std::string>("onset_metric"))
                t.onsetMetric = parseMetric(*m);
        }

        void applyEstimator(const pt::ptree &node, EstimatorConfig &e)
        {
            readCountIf(node, "window_size", e.windowSize);
            readCountIf(node, "stale_limit", e.staleLimit);
            if (auto ids = node.get_child_optional("effector_ids"))
            {
                e.effectorIds.clear();
                for (const auto &child : *ids)
                    e.effectorIds.push_back(child.second.get_value<int>());
            }
        }

        void applyReveal(const pt::ptree &node, RevealConfig &r)
        {
            readIf(node, "max_retries", r.maxRetries);
            readDurationIf(node, "initial_backoff_ms", r.initialBackoff);
            readDurationIf(node, "max_backoff_ms", r.maxBackoff);
            readDurationIf(node, "latency_budget_us", r.latencyBudget);
            readIf(node, "occlude_on_arm", r.occludeOnArm);
        }

        std::vector<Zone> parseZones(const pt::ptree &node)
        {
            std::vector<Zone> zones;
            for (const auto &child : node)
            {
                const auto &z = child.second;
                Zone zone;
                zone.label = parseLabel(z.get<std::string>("label"));
                zone.center = readVector(z.get_child("center"), "zone center");

                if (auto half = z.get_child_optional("half_extents"))
                {
                    zone.shape = ZoneShape::Box;
                    zone.halfExtents = readVector(*half, "zone half_extents");
                }
                else
                {
                    zone.shape = ZoneShape::Sphere;
                    readIf(z, "radius", zone.radius);
                }
                zones.push_back(zone);
            }
            return zones;
        }

        // Fields shared by the defaults block and each trial entry.
        void applyTrialFields(const pt::ptree &node, TrialConfig &cfg)
        {
            if (auto n = node.get_child_optional("thresholds"))
                applyThresholds(*n, cfg.thresholds);
            if (auto n = node.get_child_optional("estimator"))
                applyEstimator(*n, cfg.estimator);
            if (auto n = node.get_child_optional("reveal"))
                applyReveal(*n, cfg.reveal);
            if (auto n = node.get_child_optional("zones"))
                cfg.zones = parseZones(*n);

            readDurationIf(node, "reach_timeout_ms", cfg.reachTimeout);
            readDurationIf(node, "settle_window_ms", cfg.settleWindow);
            readDurationIf(node, "data_loss_limit_ms", cfg.dataLossLimit);
        }

        SessionConfig build(const pt::ptree &root, const std::filesystem::path &baseDir)
        {
            SessionConfig out;

            if (auto s = root.get_child_optional("session"))
            {
                readIf(*s, "participant", out.session.participant);
                readIf(*s, "output_dir", out.session.outputDir);
                readIf(*s, "log_level", out.session.logLevel);
                readIf(*s, "pause_on_stream_loss", out.session.pauseOnStreamLoss);
            }

            TrialConfig defaults;

            const auto &capture = root.get_child("capture");
            std::filesystem::path replay = capture.get<std::string>("replay_path");
            if (replay.is_relative())
                replay = baseDir / replay;
            out.capture.path = replay.string();
            out.capture.realtime = true;
            readIf(capture, "sample_rate_hz", out.capture.sampleRateHz);
            readIf(capture, "realtime", out.capture.realtime);
            applyEstimator(capture, defaults.estimator);

            if (auto n = root.get_child_optional("ingest"))
            {
                readCountIf(*n, "queue_capacity", out.ingest.queueCapacity);
                if (auto p = n->get_optional<std::string>("overflow"))
                    out.ingest.overflowPolicy = parseOverflow(*p);
                readDurationIf(*n, "read_timeout_ms", out.ingest.readTimeout);
                readDurationIf(*n, "missed_frame_timeout_ms", out.ingest.missedFrameTimeout);
                readDurationIf(*n, "reconnect_budget_ms", out.ingest.reconnectBudget);
                readDurationIf(*n, "reconnect_backoff_ms", out.ingest.reconnectBackoff);
            }

            if (auto n = root.get_child_optional("logger"))
            {
                readCountIf(*n, "frame_capacity", out.logChannel.frameCapacity);
                readCountIf(*n, "control_capacity", out.logChannel.controlCapacity);
                readCountIf(*n, "spill_limit", out.logChannel.spillLimit);
            }

            if (auto n = root.get_child_optional("hardware"))
            {
                const auto type = n->get<std::string>("type", "serial");
                if (type == "serial")
                    out.hardware.kind = HardwareKind::Serial;
                else if (type == "simulated")
                    out.hardware.kind = HardwareKind::Simulated;
                else
                    throw ConfigError("unknown hardware type '" + type + "'");

                auto &serial = out.hardware.serial;
                readIf(*n, "device", serial.device);
                readIf(*n, "baud", serial.baud);
                readIf(*n, "open_command", serial.openCommand);
                readIf(*n, "close_command", serial.closeCommand);
                readDurationIf(*n, "write_timeout_ms", serial.writeTimeout);
                readIf(*n, "expect_ack", serial.expectAck);
                readDurationIf(*n, "ack_timeout_ms", serial.ackTimeout);
                readDurationIf(*n, "round_trip_us", out.hardware.simulatedRoundTrip);
            }

            if (auto n = root.get_child_optional("defaults"))
                applyTrialFields(*n, defaults);

            std::set<int> ids;
            for (const auto &child : root.get_child("trials"))
            {
                const auto &node = child.second;
                TrialConfig trial = defaults;
                trial.id = node.get<int>("id");
                trial.phase = parsePhase(node.get<std::string>("phase"));
                readIf(node, "tag", trial.tag);
                applyTrialFields(node, trial);

                if (!ids.insert(trial.id).second)
                    throw ConfigError("duplicate trial id " + std::to_string(trial.id));
                out.trials.push_back(std::move(trial));
            }

            if (out.trials.empty())
                throw ConfigError("session has no trials");

            return out;
        }
    } // namespace

    SessionConfig parseSessionConfig(std::istream &in, const std::string &baseDir)
    {
        pt::ptree root;
        try
        {
            pt::read_json(in, root);
            return build(root, baseDir);
        }
        catch (const pt::ptree_error &e)
        {
            throw ConfigError(std::string("session configuration: ") + e.what());
        }
    }

    SessionConfig loadSessionConfig(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
            throw ConfigError("cannot open session configuration " + path);

        const auto baseDir = std::filesystem::path(path).parent_path();
        return parseSessionConfig(in, baseDir.empty() ? std::string(".") : baseDir.string());
    }
} // namespace reachtrigger::config
