#include "../../include/subprocess.hpp"
#include "../../include/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tinythis {

namespace {

    ExitStatus decode_status(const int raw) {
        ExitStatus st;
        if (WIFEXITED(raw)) {
            st.exited = true;
            st.code = WEXITSTATUS(raw);
        } else if (WIFSIGNALED(raw)) {
            st.exited = false;
            st.signal = WTERMSIG(raw);
        }
        return st;
    }

    void close_fd(int& fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    struct PipePair {
        int fds[2] = {-1, -1};
        ~PipePair() {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    void make_pipe(PipePair& p) {
        if (::pipe2(p.fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
    }

    void set_nonblocking(const int fd) {
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }

} // namespace

std::string ExitStatus::describe() const {
    if (exited) {
        return "exit code " + std::to_string(code);
    }
    return "killed by signal " + std::to_string(signal);
}

Subprocess::~Subprocess() {
    kill_and_reap();
    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(other.pid_),
      out_fd_(other.out_fd_),
      err_fd_(other.err_fd_),
      out_buf_(std::move(other.out_buf_)),
      err_buf_(std::move(other.err_buf_)),
      status_(other.status_) {
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
    other.status_.reset();
}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        kill_and_reap();
        close_pipes();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        out_buf_ = std::move(other.out_buf_);
        err_buf_ = std::move(other.err_buf_);
        status_ = other.status_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
        other.status_.reset();
    }
    return *this;
}

Subprocess Subprocess::spawn(const std::filesystem::path& program,
                             const std::vector<std::string>& args) {
    PipePair out_pipe;
    PipePair err_pipe;
    PipePair exec_pipe;
    make_pipe(out_pipe);
    make_pipe(err_pipe);
    make_pipe(exec_pipe);

    // argv must be built before fork: the child may only make async-signal-safe calls
    const std::string program_str = program.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program_str.c_str()));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(devnull);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe.fds[1], STDOUT_FILENO);
        ::dup2(err_pipe.fds[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execv(argv[0], argv.data());
        const int err = errno;
        [[maybe_unused]] const auto n = ::write(exec_pipe.fds[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(devnull);
    ::setpgid(pid, pid); // may race with the child's own call; either wins
    close_fd(out_pipe.fds[1]);
    close_fd(err_pipe.fds[1]);
    close_fd(exec_pipe.fds[1]);

    // exec_pipe is close-on-exec: EOF means exec succeeded
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {}
        throw std::system_error(child_errno, std::generic_category(), "exec " + program_str);
    }

    Subprocess proc;
    proc.pid_ = pid;
    proc.out_fd_ = out_pipe.fds[0];
    proc.err_fd_ = err_pipe.fds[0];
    out_pipe.fds[0] = -1;
    err_pipe.fds[0] = -1;
    set_nonblocking(proc.out_fd_);
    set_nonblocking(proc.err_fd_);

    Logger::log(LogLevel::Debug, "Spawned " + program_str + " (pid " + std::to_string(pid) + ")", "subprocess");
    return proc;
}

bool Subprocess::drain(int& fd, LineBuffer& buffer, const OutputChannel channel, const LineHandler& on_line) {
    std::array<char, 4096> chunk{};
    for (;;) {
        const ssize_t n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.pending.append(chunk.data(), static_cast<size_t>(n));
            size_t start = 0;
            for (size_t i = 0; i < buffer.pending.size(); ++i) {
                const char c = buffer.pending[i];
                if (c == '\n' || c == '\r') {
                    if (i > start && on_line) {
                        on_line(channel, std::string_view(buffer.pending).substr(start, i - start));
                    }
                    start = i + 1;
                }
            }
            buffer.pending.erase(0, start);
            continue;
        }
        if (n == 0) {
            if (!buffer.pending.empty() && on_line) {
                on_line(channel, buffer.pending);
            }
            buffer.pending.clear();
            close_fd(fd);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        Logger::log(LogLevel::Warning, std::string("read from child failed: ") + std::strerror(errno), "subprocess");
        close_fd(fd);
        return false;
    }
}

bool Subprocess::read_lines(const std::chrono::milliseconds timeout, const LineHandler& on_line) {
    if (!has_open_pipes()) {
        return false;
    }

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out_fd_ >= 0) fds[count++] = pollfd{out_fd_, POLLIN, 0};
    if (err_fd_ >= 0) fds[count++] = pollfd{err_fd_, POLLIN, 0};

    const int rc = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return true;
        }
        throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (rc == 0) {
        return true;
    }

    for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }
        if (fds[i].fd == out_fd_) {
            drain(out_fd_, out_buf_, OutputChannel::Stdout, on_line);
        } else if (fds[i].fd == err_fd_) {
            drain(err_fd_, err_buf_, OutputChannel::Stderr, on_line);
        }
    }
    return has_open_pipes();
}

std::optional<ExitStatus> Subprocess::try_wait() {
    if (status_ || pid_ <= 0) {
        return status_;
    }
    int raw = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &raw, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        status_ = decode_status(raw);
    } else if (r < 0) {
        // ECHILD: someone else reaped it; report as abnormal
        status_ = ExitStatus{};
    }
    return status_;
}

bool Subprocess::leader_exited() const noexcept {
    siginfo_t info{};
    int r;
    do {
        r = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (r < 0 && errno == EINTR);
    // ECHILD: already gone, wait() reports it
    return r < 0 || info.si_pid == pid_;
}

ExitStatus Subprocess::wait() {
    if (status_ || pid_ <= 0) {
        return status_.value_or(ExitStatus{});
    }
    int raw = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &raw, 0);
    } while (r < 0 && errno == EINTR);
    status_ = r == pid_ ? decode_status(raw) : ExitStatus{};
    return *status_;
}

ExitStatus Subprocess::terminate(const std::chrono::milliseconds grace) {
    if (pid_ <= 0) {
        return ExitStatus{};
    }
    if (try_wait()) {
        return *status_;
    }

    ::kill(-pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (leader_exited()) {
            Logger::log(LogLevel::Debug, "pid " + std::to_string(pid_) + " exited after SIGTERM", "subprocess");
            // the unreaped leader keeps the group id reserved
            ::kill(-pid_, SIGKILL);
            return wait();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    Logger::log(LogLevel::Warning, "pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL", "subprocess");
    ::kill(-pid_, SIGKILL);
    return wait();
}

void Subprocess::kill_and_reap() noexcept {
    if (pid_ > 0 && !status_) {
        ::kill(-pid_, SIGKILL);
        int raw = 0;
        while (::waitpid(pid_, &raw, 0) < 0 && errno == EINTR) {}
        status_ = decode_status(raw);
    }
}

void Subprocess::close_pipes() noexcept {
    close_fd(out_fd_);
    close_fd(err_fd_);
}

} // namespace tinythis
