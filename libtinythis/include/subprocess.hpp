/**
 * @file subprocess.hpp
 * @brief Owned handle to a child process with piped stdout and stderr.
 */

#ifndef TINYTHIS_SUBPROCESS_HPP
#define TINYTHIS_SUBPROCESS_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace tinythis {

/**
 * @brief How a child process ended.
 */
struct ExitStatus {
    bool exited = false;  ///< Normal exit (code is valid)
    int code = -1;
    int signal = 0;       ///< Terminating signal when !exited

    [[nodiscard]] bool success() const noexcept { return exited && code == 0; }

    /// "exit code 1" or "killed by signal 9".
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Which pipe a line came from.
 */
enum class OutputChannel {
    Stdout,
    Stderr
};

/**
 * @brief A spawned child process.
 *
 * @details The child runs in its own process group with stdin on
 * /dev/null, so signals sent by terminate() reach any helpers the encoder
 * forks and terminal signals aimed at the front-end do not reach it.
 *
 * The handle is move-only. Destroying a handle whose child has not been
 * reaped kills the process group and reaps it, so a child never outlives
 * its owner.
 */
class Subprocess {
public:
    using LineHandler = std::function<void(OutputChannel, std::string_view)>;

    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;

    /**
     * @brief Starts @p program with @p args (argv[0] is added).
     * @throws std::system_error if pipes cannot be created, fork fails,
     *         or the program cannot be executed.
     */
    [[nodiscard]] static Subprocess spawn(const std::filesystem::path& program,
                                          const std::vector<std::string>& args);

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool valid() const noexcept { return pid_ > 0; }

    /**
     * @brief Waits up to @p timeout for output and hands every complete line
     * to @p on_line. Lines end at '\n' or '\r'.
     * @return false once both pipes have reached end-of-file.
     */
    bool read_lines(std::chrono::milliseconds timeout, const LineHandler& on_line);

    /// True while at least one pipe is still open.
    [[nodiscard]] bool has_open_pipes() const noexcept { return out_fd_ >= 0 || err_fd_ >= 0; }

    /// Non-blocking reap. Returns the status once the child has exited.
    std::optional<ExitStatus> try_wait();

    /// Blocking reap.
    ExitStatus wait();

    /**
     * @brief SIGTERM to the process group, then SIGKILL if it is still
     * alive after @p grace. Always reaps.
     */
    ExitStatus terminate(std::chrono::milliseconds grace);

private:
    struct LineBuffer {
        std::string pending;
    };

    void close_pipes() noexcept;
    void kill_and_reap() noexcept;
    /// True once the child has exited, without reaping it.
    [[nodiscard]] bool leader_exited() const noexcept;
    bool drain(int& fd, LineBuffer& buffer, OutputChannel channel, const LineHandler& on_line);

    pid_t pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    LineBuffer out_buf_;
    LineBuffer err_buf_;
    std::optional<ExitStatus> status_;  ///< Set once reaped
};

} // namespace tinythis

#endif // TINYTHIS_SUBPROCESS_HPP
