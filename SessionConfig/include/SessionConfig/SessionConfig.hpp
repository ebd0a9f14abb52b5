#pragma once

#include <CaptureStream/ReplayCaptureSource.hpp>
#include <CaptureStream/StreamIngestAdapter.hpp>
#include <KinematicLogger/LogChannel.hpp>
#include <RevealTrigger/SerialGoggles.hpp>
#include <TrialConfig/TrialConfig.hpp>

#include <chrono>
#include <istream>
#include <string>
#include <vector>

namespace reachtrigger::config
{
    struct SessionSettings
    {
        std::string participant;
        std::string outputDir = "data";
        std::string logLevel = "info";
        bool pauseOnStreamLoss = true; // ask the experimenter before giving up on the capture system
    };

    enum class HardwareKind
    {
        Serial,
        Simulated
    };

    struct HardwareConfig
    {
        HardwareKind kind = HardwareKind::Serial;
        trigger::SerialConfig serial;
        std::chrono::microseconds simulatedRoundTrip{0};
    };

    struct SessionConfig
    {
        SessionSettings session;
        capture::ReplayConfig capture;
        capture::IngestConfig ingest;
        logging::LogChannelConfig logChannel;
        HardwareConfig hardware;
        std::vector<TrialConfig> trials; // in run order, defaults already applied
    };

    // Reads a JSON session file. Relative replay paths resolve against the file's directory.
    // Throws ConfigError on unreadable files, malformed JSON, unknown enum names or
    // structural problems (no trials, duplicate ids). Per-trial threshold checks are left
    // to validate(TrialConfig) so one bad trial does not reject the session.
    SessionConfig loadSessionConfig(const std::string &path);
    SessionConfig parseSessionConfig(std::istream &in, const std::string &baseDir = ".");
} // namespace reachtrigger::config
