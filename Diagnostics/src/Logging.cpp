#include <Diagnostics/Logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace reachtrigger::diagnostics
{
    namespace
    {
        std::mutex g_createMutex;
    }

    std::shared_ptr<spdlog::logger> getLogger(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(g_createMutex);
        if (auto existing = spdlog::get(name))
            return existing;

        try
        {
            auto logger = spdlog::stdout_color_mt(name);
            logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            logger->set_level(spdlog::get_level());
            return logger;
        }
        catch (const spdlog::spdlog_ex &e)
        {
            std::cerr << "Logger initialization failed: " << e.what() << std::endl;
            return spdlog::default_logger();
        }
    }

    std::shared_ptr<spdlog::logger> resolveLogger(std::shared_ptr<spdlog::logger> injected,
                                                  const std::string &name)
    {
        if (injected)
            return injected;
        return getLogger(name);
    }

    bool setGlobalLevel(const std::string &levelName)
    {
        const auto level = spdlog::level::from_str(levelName);
        // from_str maps unknown strings to "off"; only accept "off" when asked for it.
        if (level == spdlog::level::off && levelName != "off")
            return false;

        spdlog::set_level(level);
        return true;
    }

    void applyEnvironmentLevel()
    {
        const char *env = std::getenv("REACHTRIGGER_LOG_LEVEL");
        if (env && *env && !setGlobalLevel(env))
            getLogger("session")->warn("ignoring unknown REACHTRIGGER_LOG_LEVEL '{}'", env);
    }
} // namespace reachtrigger::diagnostics
