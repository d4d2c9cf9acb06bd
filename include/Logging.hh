/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include "IoUtility.hh"

#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace Uno {

/** \brief Severity of a log message
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE

namespace Impl {

bool shouldLog(LogLevel level);
std::mutex& logMutex();
std::ostream& beginMessage(LogLevel level);

inline void format(std::ostream& os, const std::string_view text)
{
    os << text;
}

template<typename Arg, typename... Args>
void format(
    std::ostream& os, const std::string_view text, const Arg& arg,
    const Args&... args)
{
    const auto pos = text.find('%');
    os << text.substr(0, pos);
    if (pos == std::string_view::npos || pos + 1 == text.size()) {
        return;
    }
    {
        // Needed for the stream operators of optionals and vectors
        using Uno::operator<<;
        os << arg;
    }
    format(os, text.substr(pos + 2), args...);
}

}

/// \endcond

/** \brief Write a log message
 *
 * The message is written if \p level is enabled by setupLogging(). Each \c %
 * in \p format, together with the character following it, is replaced by the
 * next argument streamed with \c operator<<. Placeholders without arguments
 * are written as is, and arguments without placeholders are dropped.
 *
 * \code{.cc}
 * log(LogLevel::INFO, "Game %s: %s played %s", state.id, player, card);
 * \endcode
 *
 * Messages from different threads are written whole, one line at a time.
 */
template<typename... Ts>
void log(const LogLevel level, const std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        const auto lock = std::scoped_lock {Impl::logMutex()};
        auto& os = Impl::beginMessage(level);
        Impl::format(os, format, ts...);
        os << '\n';
    }
}

/** \brief Map the number of \c -v flags to a logging level
 *
 * Zero maps to LogLevel::WARNING, one to LogLevel::INFO and anything greater
 * to LogLevel::DEBUG.
 */
LogLevel getLogLevel(int verbosity);

/** \brief Parse logging level from its name
 *
 * The recognized names are “none”, “fatal”, “error”, “warning”, “info” and
 * “debug”.
 *
 * \param name the name of the level
 *
 * \return the logging level, or none if \p name is not recognized
 */
std::optional<LogLevel> logLevelFromString(std::string_view name);

/** \brief Set the global logging level and stream
 *
 * Messages up to and including \p level are written to \p stream.
 * LogLevel::NONE disables logging. Until this is called, warnings and more
 * severe messages go to \c std::cerr.
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
