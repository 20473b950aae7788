#ifndef TINYTHIS_LOG_SINK_HPP
#define TINYTHIS_LOG_SINK_HPP

#include <string_view>

namespace tinythis {

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from most to least verbose. Sinks compare against a threshold,
 * so None silences a sink completely.
 */
enum class LogLevel {
    Debug,   ///< Encoder command lines, locator probing, queue transitions
    Info,    ///< Job start/finish, configuration picked up
    Warning, ///< Recoverable problems (cleanup failed, option file unreadable)
    Error,   ///< Job failures and fatal front-end errors
    None     ///< Threshold only: nothing is emitted
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message goes (console, file, UI banner).
 * The Logger facade delegates to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "queue").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace tinythis

#endif // TINYTHIS_LOG_SINK_HPP
