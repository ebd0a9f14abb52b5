#include <CaptureStream/ReplayCaptureSource.hpp>
#include <CaptureStream/StreamIngestAdapter.hpp>
#include <Diagnostics/Logging.hpp>
#include <KinematicLogger/LogChannel.hpp>
#include <RevealTrigger/SerialGoggles.hpp>
#include <RevealTrigger/SimulatedGoggles.hpp>
#include <SessionConfig/SessionConfig.hpp>
#include <TrialOrchestrator/SessionRunner.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <ReachTrigger/Errors.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace reachtrigger;

namespace
{
    std::atomic<trial::SessionRunner *> g_runner{nullptr};

    void onInterrupt(int)
    {
        if (auto *runner = g_runner.load())
            runner->requestStop();
    }

    bool askToResume(const std::string &reason)
    {
        std::cout << "\nCapture system lost (" << reason << ").\n"
                  << "Fix the capture system, then type 'r' to resume or 'q' to end the session: " << std::flush;

        std::string answer;
        while (std::getline(std::cin, answer))
        {
            if (answer == "r" || answer == "R")
                return true;
            if (answer == "q" || answer == "Q")
                return false;
            std::cout << "Type 'r' or 'q': " << std::flush;
        }
        return false;
    }
} // namespace

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        std::cerr << "usage: " << argv[0] << " <session.json>\n";
        return 2;
    }

    auto log = diagnostics::getLogger("session");

    try
    {
        const auto cfg = config::loadSessionConfig(argv[1]);

        if (!diagnostics::setGlobalLevel(cfg.session.logLevel))
            log->warn("ignoring unknown log level '{}'", cfg.session.logLevel);
        diagnostics::applyEnvironmentLevel();

        time::SteadyClock clock;

        // Hardware first: unreachable goggles end the session before any trial starts.
        std::unique_ptr<trigger::HardwareInterface> hardware;
        if (cfg.hardware.kind == config::HardwareKind::Serial)
        {
            auto serial = std::make_unique<trigger::SerialGoggles>(cfg.hardware.serial);
            if (!serial->connect())
                throw SessionError("cannot open goggle controller on " + cfg.hardware.serial.device);
            hardware = std::move(serial);
        }
        else
        {
            log->warn("running with simulated goggles, no occlusion hardware is driven");
            hardware = std::make_unique<trigger::SimulatedGoggles>(clock, cfg.hardware.simulatedRoundTrip);
        }

        capture::ReplayCaptureSource source(cfg.capture, clock);
        capture::StreamIngestAdapter ingest(cfg.ingest, source, clock);
        logging::LogChannel channel(cfg.logChannel);

        trial::SessionRunner runner(cfg, ingest, *hardware, channel, clock, askToResume);
        g_runner = &runner;
        std::signal(SIGINT, onInterrupt);

        const auto summary = runner.run();

        std::signal(SIGINT, SIG_DFL);
        g_runner = nullptr;

        std::cout << "Session complete: " << summary.completed << " completed, " << summary.aborted << " aborted, "
                  << summary.errored << " errored, " << summary.rejected << " rejected"
                  << (summary.stoppedEarly ? " (stopped early)" : "") << "\n";
        return 0;
    }
    catch (const ConfigError &e)
    {
        g_runner = nullptr;
        log->critical("configuration error: {}", e.what());
        return 2;
    }
    catch (const SessionError &e)
    {
        g_runner = nullptr;
        log->critical("session aborted: {}", e.what());
        return 1;
    }
}
