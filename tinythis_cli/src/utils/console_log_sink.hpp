#ifndef TINYTHIS_CONSOLE_LOG_SINK_HPP
#define TINYTHIS_CONSOLE_LOG_SINK_HPP

#include "../../../libtinythis/include/log_sink.hpp"
#include "../../../libtinythis/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above log_level to the console.
 *
 * Warnings and errors go to stderr, the rest to stdout. Only installed in
 * batch mode; the TUI owns the screen.
 */
class ConsoleLogSink final : public tinythis::ILogSink {
public:
    tinythis::LogLevel log_level = tinythis::LogLevel::Info;
    bool use_colors = false;

    void log(const tinythis::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (log_level == tinythis::LogLevel::None || level < log_level) {
            return;
        }
        std::lock_guard lock(mtx_);
        switch (level) {
            case tinythis::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case tinythis::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case tinythis::LogLevel::Warning:
                std::cerr << (use_colors ? YELLOW : "") << "[WARN ][" << tag << "] " << message
                          << (use_colors ? RESET : "") << std::endl;
                break;
            case tinythis::LogLevel::Error:
                std::cerr << (use_colors ? RED : "") << "[ERROR][" << tag << "] " << message
                          << (use_colors ? RESET : "") << std::endl;
                break;
            case tinythis::LogLevel::None:
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // TINYTHIS_CONSOLE_LOG_SINK_HPP
