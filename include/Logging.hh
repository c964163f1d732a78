/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <optional>
#include <ostream>
#include <string_view>

#include "IoUtility.hh"

namespace Wizard {

/** \brief Log level
 *
 * The levels are ordered from the least verbose to the most verbose. A
 * message is output if its level is at most the level given to
 * setupLogging().
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< The server cannot continue
    ERROR,    ///< A request or a callback failed
    WARNING,  ///< Something unexpected happened but was handled
    INFO,     ///< Lifecycle of the server and the matches
    DEBUG     ///< Every action processed by a room
};

/** \brief Output the name of a log level
 */
std::ostream& operator<<(std::ostream& os, LogLevel level);

/// \cond DOXYGEN_IGNORE

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    std::copy(first, last, std::ostreambuf_iterator<char> {logStream()});
}

template<typename FormatIterator, typename First, typename... Rest>
void log(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        log(first, iter);
        return;
    }
    log(first, iter);
    {
        // Bring the stream operators of the Wizard namespace (optional,
        // variant) into consideration for the argument
        using Wizard::operator<<;
        logStream() << arg;
    }
    log(std::next(iter, 2), last, rest...);
}

}

/// \endcond

/** \brief Log a message
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * Each placeholder in \p format consists of a percent sign and exactly one
 * following character, which is ignored. The corresponding value from \p ts
 * is streamed in its place using \c operator<<. Surplus arguments are
 * dropped.
 *
 * \note Logging is not thread safe. Only the thread running the message loop
 * should log.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename... Ts>
void log(LogLevel level, std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::log(format.begin(), format.end(), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Map the number of -v flags to a log level
 *
 * \param verbosity the number of times the verbosity flag was given
 *
 * \return LogLevel::WARNING for zero, LogLevel::INFO for one and
 * LogLevel::DEBUG for anything higher
 */
LogLevel getLogLevel(int verbosity);

/** \brief Setup logging
 *
 * Sets the global minimum logging level and the stream the log is written
 * to. Until this is called, the level is LogLevel::WARNING and the stream is
 * \c std::cerr.
 *
 * The caller must keep \p stream alive until logging is set up again with
 * another stream.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
