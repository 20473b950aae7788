#ifndef TINYTHIS_PROGRESS_PRINTER_HPP
#define TINYTHIS_PROGRESS_PRINTER_HPP

#include "../../../libtinythis/include/cli_runner.hpp"
#include "../../../libtinythis/include/event_bus.hpp"
#include <chrono>
#include <vector>

/**
 * @brief Get the current terminal width.
 * @return Width in columns (80 if unknown).
 */
unsigned get_terminal_width();

/**
 * @brief Console output of a batch run.
 *
 * Subscribes to the queue events on @p bus and prints one header line per
 * job, a progress bar while it runs and its outcome when it ends. All
 * output goes to stderr so stdout stays free for log lines.
 */
class ProgressPrinter {
public:
    ProgressPrinter(tinythis::EventBus& bus, bool use_colors);
    ~ProgressPrinter();

    ProgressPrinter(const ProgressPrinter&) = delete;
    ProgressPrinter& operator=(const ProgressPrinter&) = delete;

private:
    void print_bar(double fraction);

    tinythis::EventBus& bus_;
    std::vector<tinythis::SubscriptionId> subscriptions_;
    bool use_colors_;
    bool bar_open_ = false;
    std::chrono::steady_clock::time_point job_start_;
};

/**
 * @brief Prints a per-file result table and the totals of @p report.
 */
void print_run_summary(const tinythis::RunReport& report, bool use_colors);

#endif // TINYTHIS_PROGRESS_PRINTER_HPP
