#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tl::log
{
Level parse_level(const std::string &name)
{
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (value == "debug")
    {
        return Level::Debug;
    }
    if (value == "info")
    {
        return Level::Info;
    }
    if (value == "warn" || value == "warning")
    {
        return Level::Warn;
    }
    if (value == "error")
    {
        return Level::Error;
    }
    if (value == "fatal" || value == "critical")
    {
        return Level::Fatal;
    }

    throw std::invalid_argument("Unsupported log level: " + name + " (supported: debug, info, warn, error, fatal)");
}

const char *level_name(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Fatal:
        return "FATAL";
    }

    return "UNKNOWN";
}
} // namespace tl::log
