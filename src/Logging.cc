#include "Logging.hh"

#include <algorithm>
#include <array>
#include <atomic>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Uno {

namespace {

using namespace std::string_view_literals;

// The stream is guarded by Impl::logMutex()
auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = std::atomic<LogLevel> {LogLevel::WARNING};

constexpr auto LEVEL_NAMES = std::array {
    std::pair { LogLevel::NONE,    "none"sv },
    std::pair { LogLevel::FATAL,   "fatal"sv },
    std::pair { LogLevel::ERROR,   "error"sv },
    std::pair { LogLevel::WARNING, "warning"sv },
    std::pair { LogLevel::INFO,    "info"sv },
    std::pair { LogLevel::DEBUG,   "debug"sv },
};

std::string_view levelTag(const LogLevel level)
{
    switch (level) {
    case LogLevel::FATAL:
        return "FATAL   "sv;
    case LogLevel::ERROR:
        return "ERROR   "sv;
    case LogLevel::WARNING:
        return "WARNING "sv;
    case LogLevel::INFO:
        return "INFO    "sv;
    case LogLevel::DEBUG:
        return "DEBUG   "sv;
    case LogLevel::NONE:
        break;
    }
    return "        "sv;
}

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    return level != LogLevel::NONE && level <= globalLoggingLevel.load();
}

std::mutex& logMutex()
{
    static auto mutex = std::mutex {};
    return mutex;
}

std::ostream& beginMessage(const LogLevel level)
{
    const auto time = std::time(nullptr);
    auto local_time = std::tm {};
    localtime_r(&time, &local_time);
    auto& os = globalLoggingStream.get();
    return os << std::put_time(&local_time, "%c ") << levelTag(level);
}

}

LogLevel getLogLevel(const int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

std::optional<LogLevel> logLevelFromString(const std::string_view name)
{
    const auto iter = std::find_if(
        LEVEL_NAMES.begin(), LEVEL_NAMES.end(),
        [name](const auto& entry) { return entry.second == name; });
    if (iter != LEVEL_NAMES.end()) {
        return iter->first;
    }
    return std::nullopt;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    const auto lock = std::scoped_lock {Impl::logMutex()};
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

}
