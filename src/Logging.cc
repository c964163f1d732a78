#include "Logging.hh"

#include <array>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace Wizard {

using namespace std::string_view_literals;

namespace {

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

constexpr auto LOG_LEVEL_NAMES = std::array {
    std::pair {LogLevel::NONE,    "none"sv},
    std::pair {LogLevel::FATAL,   "fatal"sv},
    std::pair {LogLevel::ERROR,   "error"sv},
    std::pair {LogLevel::WARNING, "warning"sv},
    std::pair {LogLevel::INFO,    "info"sv},
    std::pair {LogLevel::DEBUG,   "debug"sv},
};

}

std::ostream& operator<<(std::ostream& os, const LogLevel level)
{
    for (const auto& [l, name] : LOG_LEVEL_NAMES) {
        if (l == level) {
            return os << name;
        }
    }
    return os << "unknown";
}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    if (level == LogLevel::NONE || level > globalLoggingLevel) {
        return false;
    }
    const auto time = std::time(nullptr);
    auto& os = logStream();
    os << std::put_time(std::localtime(&time), "%F %T ");
    auto label = std::ostringstream {};
    label << level;
    os << std::left << std::setw(8) << label.str() << std::right;
    return true;
}

std::ostream& logStream()
{
    return globalLoggingStream;
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

void setupLogging(const LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

}
