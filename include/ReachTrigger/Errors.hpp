#pragma once

#include <stdexcept>
#include <string>

namespace reachtrigger
{
    // Invalid trial or session configuration. The trial never leaves Configuring.
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Fault that invalidates the current trial only (e.g. reveal could not be delivered).
    class TrialError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Fault in shared infrastructure; the session cannot continue.
    class SessionError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace reachtrigger
