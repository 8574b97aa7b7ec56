#pragma once

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace tl::log
{
enum class Level
{
    Debug = 0,
    Info,
    Warn,
    Error,
    Fatal
};

inline std::atomic<Level> &threshold()
{
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline void set_level(Level level)
{
    threshold().store(level);
}

inline bool enabled(Level level)
{
    return level >= threshold().load();
}

Level parse_level(const std::string &name);
const char *level_name(Level level);

namespace detail
{
inline std::mutex &output_mutex()
{
    static std::mutex mutex;
    return mutex;
}

inline std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream stream;
    stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return stream.str();
}

inline void write(Level level, const std::string &line)
{
    std::lock_guard<std::mutex> lock(output_mutex());
    std::ostream &out = (level >= Level::Warn) ? std::cerr : std::cout;
    out << line << std::endl;
}
} // namespace detail

inline void message(Level level, const std::string &text)
{
    if (!enabled(level))
    {
        return;
    }

    std::ostringstream line;
    line << detail::timestamp() << " [" << level_name(level) << "] [pid " << ::getpid() << "] " << text;
    detail::write(level, line.str());
}

inline void debug(const std::string &text)
{
    message(Level::Debug, text);
}

inline void info(const std::string &text)
{
    message(Level::Info, text);
}

inline void warn(const std::string &text)
{
    message(Level::Warn, text);
}

inline void error(const std::string &text)
{
    message(Level::Error, text);
}

inline void fatal(const std::string &text)
{
    message(Level::Fatal, text);
}

// One JSON object per line, for collectors that parse structured records.
inline void event(Level level, const std::string &name, nlohmann::json fields = nlohmann::json::object())
{
    if (!enabled(level))
    {
        return;
    }

    fields["ts"] = detail::timestamp();
    fields["level"] = level_name(level);
    fields["event"] = name;
    fields["pid"] = static_cast<long>(::getpid());
    detail::write(level, fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}
} // namespace tl::log
