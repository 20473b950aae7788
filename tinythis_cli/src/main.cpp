#include <iostream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <clocale>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/progress_printer.hpp"
#include "tui/tui_app.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libtinythis/include/app_paths.hpp"
#include "../../libtinythis/include/cli_runner.hpp"
#include "../../libtinythis/include/encoder_locator.hpp"
#include "../../libtinythis/include/errors.hpp"
#include "../../libtinythis/include/event_bus.hpp"
#include "../../libtinythis/include/logger.hpp"

using namespace tinythis;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static CliRunner* g_runner = nullptr;

// handle ctrl+c or termination signals
extern "C" void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (g_runner) {
            g_runner->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void install_log_sinks(const Settings& settings, const LogLevel level) {
    Logger::clear_sinks();

    // the TUI owns the screen, so it always logs to a file
    fs::path log_file = settings.log_file;
    if (log_file.empty() && settings.interactive()) {
        if (const auto def = default_log_path()) {
            std::error_code ec;
            fs::create_directories(def->parent_path(), ec);
            if (!ec) log_file = *def;
        }
    }
    if (!log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(log_file);
        if (!file_sink->is_open()) {
            std::cerr << YELLOW << "Warning: can't open log file " << log_file.string() << RESET << std::endl;
        } else {
            file_sink->log_level = level;
            Logger::add_sink(std::move(file_sink));
        }
    }

    if (!settings.interactive() && !settings.quiet) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = level;
        console_sink->use_colors = isatty(STDERR_FILENO) != 0;
        Logger::add_sink(std::move(console_sink));
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"tinythis: preset-driven video compression on top of ffmpeg."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    const LogLevel level = Logger::string_to_level(settings.log_level).value_or(LogLevel::Info);
    install_log_sinks(settings, level);
    init_utf8_locale();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const SearchEncoderLocator locator(settings.ffmpeg.empty()
                                           ? std::nullopt
                                           : std::optional<fs::path>(settings.ffmpeg));
    const bool use_colors = isatty(STDERR_FILENO) != 0;

    if (settings.interactive()) {
        TuiOptions options;
        options.preset = settings.preset;
        options.accelerator = settings.accelerator();
        if (!settings.config_path.empty()) {
            options.options_file = settings.config_path;
        }
        options.use_colors = use_colors;
        try {
            return run_tui(locator, options, interrupted);
        } catch (const std::system_error& e) {
            Logger::log(LogLevel::Error, e.what(), "main");
            std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
            return kExitFailure;
        }
    }

    EventBus bus;
    std::unique_ptr<ProgressPrinter> printer;
    if (!settings.quiet) {
        printer = std::make_unique<ProgressPrinter>(bus, use_colors);
    }

    CliRunner runner(locator, bus);
    g_runner = &runner;
    if (interrupted.load()) {
        runner.request_stop();
    }

    RunReport report;
    try {
        report = runner.run(RunRequest{settings.preset, settings.accelerator(), settings.inputs});
    } catch (const ValidationError& e) {
        g_runner = nullptr;
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return kExitUsage;
    }
    g_runner = nullptr;

    if (!settings.quiet) {
        print_run_summary(report, use_colors);
    }
    if (report.exit_code == kExitNoEncoder) {
        std::cerr << RED << "Error: no encoder available; install ffmpeg or pass --ffmpeg <path>" << RESET << std::endl;
    }
    return report.exit_code;
}
