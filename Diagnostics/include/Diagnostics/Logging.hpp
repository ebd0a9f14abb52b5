#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace reachtrigger::diagnostics
{
    // Returns the process-wide logger with this name, creating a colour stdout logger on
    // first use. Components take an optional injected logger and fall back to this one.
    std::shared_ptr<spdlog::logger> getLogger(const std::string &name);

    // Picks the injected logger when present, the named default otherwise.
    std::shared_ptr<spdlog::logger> resolveLogger(std::shared_ptr<spdlog::logger> injected,
                                                  const std::string &name);

    // Applies a level name ("trace" ... "off") to every registered logger and to loggers
    // created later. Unknown names are rejected and leave the level unchanged.
    bool setGlobalLevel(const std::string &levelName);

    // Honours REACHTRIGGER_LOG_LEVEL when set.
    void applyEnvironmentLevel();
} // namespace reachtrigger::diagnostics
