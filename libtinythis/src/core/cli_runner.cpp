#include "../../include/cli_runner.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <string>

namespace tinythis {

RunReport CliRunner::run(const RunRequest& request) {
    if (request.inputs.empty()) {
        throw ValidationError(ValidationError::Reason::EmptyFileList, {}, "no input files given");
    }

    RunReport report;
    JobQueue queue(locator_, bus_, options_);

    for (const auto& input : request.inputs) {
        try {
            queue.enqueue(input, request.preset, request.accelerator);
            ++report.accepted;
        } catch (const ValidationError& e) {
            ++report.rejected;
            Logger::log(LogLevel::Error, e.what(), "cli");
        }
    }

    if (report.accepted == 0) {
        Logger::log(LogLevel::Error, "no valid input files", "cli");
        report.exit_code = kExitUsage;
        return report;
    }

    Logger::log(LogLevel::Info,
                "compressing " + std::to_string(report.accepted) + " file(s) with preset " +
                std::string(to_string(request.preset)) + " (" + std::string(to_string(request.accelerator)) + ")",
                "cli");

    bool no_encoder = false;
    while (true) {
        if (stop_requested()) {
            queue.cancel_running();
            report.interrupted = true;
            break;
        }
        if (!queue.has_running()) {
            if (!queue.has_pending()) {
                break;
            }
            try {
                queue.run_next();
            } catch (const ResourceUnavailable& e) {
                Logger::log(LogLevel::Error, e.what(), "cli");
                no_encoder = true;
                break;
            }
            continue;
        }
        queue.poll(kPollInterval);
    }

    report.summary = queue.summary();
    report.jobs = queue.snapshot();

    if (report.interrupted) {
        report.exit_code = kExitInterrupted;
    } else if (no_encoder) {
        report.exit_code = kExitNoEncoder;
    } else if (report.rejected > 0 || report.summary.succeeded != report.accepted) {
        report.exit_code = kExitFailure;
    } else {
        report.exit_code = kExitSuccess;
    }
    return report;
}

} // namespace tinythis
