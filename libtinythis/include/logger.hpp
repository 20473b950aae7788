/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger::log with a short
 * component tag. The front-end decides where messages end up by
 * installing ILogSink implementations.
 */

#ifndef TINYTHIS_LOGGER_HPP
#define TINYTHIS_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinythis {

/**
 * @brief Static logging facade for tinythis.
 *
 * Messages are fanned out to all registered sinks. Logging is safe from
 * the encoder worker thread as well as from the UI loop.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "tinythis").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "tinythis");

    /**
     * @brief Converts a LogLevel to its fixed-width display string.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parses a level name, case-insensitively.
     * Accepts "WARN" and "WARNING" for LogLevel::Warning.
     * @return The level, or std::nullopt for an unknown name.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace tinythis

#endif // TINYTHIS_LOGGER_HPP
