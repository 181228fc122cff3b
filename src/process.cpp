#include "langbridge/process.hpp"

#include "langbridge/format.hpp"
#include "langbridge/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <ctime>
#include <thread>

extern char** environ;

using namespace langbridge::literals;

namespace langbridge {

    namespace detail {

        enum class spawn_stage : int { chdir = 1, exec = 2 };

        struct spawn_failure {
            spawn_stage stage;
            int error;
        };

        static void close_fd(int& fd) noexcept {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static void close_pair(int (&fds)[2]) noexcept {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        // Blocks SIGPIPE on the calling thread so a write to a dead child fails with EPIPE instead of
        // killing the process; a SIGPIPE raised meanwhile is consumed before the old mask returns.
        class sigpipe_guard {
          public:
            sigpipe_guard() {
                sigemptyset(&pipe_set_);
                sigaddset(&pipe_set_, SIGPIPE);
                sigset_t pending{};
                sigpending(&pending);
                was_pending_ = sigismember(&pending, SIGPIPE) == 1;
                ::pthread_sigmask(SIG_BLOCK, &pipe_set_, &previous_);
            }

            ~sigpipe_guard() {
                if (!was_pending_) {
                    timespec zero{};
                    sigset_t pending{};
                    sigpending(&pending);
                    if (sigismember(&pending, SIGPIPE) == 1) {
                        while (::sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {}
                    }
                }
                ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
            }

            sigpipe_guard(const sigpipe_guard&) = delete;
            sigpipe_guard& operator=(const sigpipe_guard&) = delete;

          private:
            sigset_t pipe_set_{};
            sigset_t previous_{};
            bool was_pending_{false};
        };

        static std::vector<std::string> build_environment(
                const std::vector<std::pair<std::string, std::string>>& overrides) {
            std::vector<std::string> env{};
            for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
                std::string_view kv{*entry};
                auto key = kv.substr(0, kv.find('='));
                bool replaced = false;
                for (const auto& [name, value] : overrides) {
                    if (name == key) {
                        replaced = true;
                        break;
                    }
                }
                if (!replaced) {
                    env.emplace_back(kv);
                }
            }
            for (const auto& [name, value] : overrides) {
                env.push_back("{}={}"_format(name, value));
            }
            return env;
        }

        static std::vector<char*> to_cstrings(std::vector<std::string>& values) {
            std::vector<char*> out{};
            out.reserve(values.size() + 1);
            for (auto& value : values) {
                out.push_back(value.data());
            }
            out.push_back(nullptr);
            return out;
        }

        [[noreturn]] static void report_and_exit(int status_fd, spawn_stage stage) {
            spawn_failure failure{stage, errno};
            auto ignored = ::write(status_fd, &failure, sizeof(failure));
            (void)ignored;
            ::_exit(127);
        }

    }  // namespace detail

    child_process child_process::spawn(const spawn_options& opts) {
        if (opts.argv.empty() || opts.argv.front().empty()) {
            throw process_error{"empty command line"};
        }

        // everything the child touches between fork and exec is prepared here
        auto args = opts.argv;
        auto argv = detail::to_cstrings(args);
        auto env = detail::build_environment(opts.environment);
        auto envp = detail::to_cstrings(env);
        auto cwd = opts.working_directory.string();

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
            ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
            auto err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(status_pipe);
            throw process_error{"pipe() failed: {}"_format(std::strerror(err))};
        }

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(status_pipe);
            throw process_error{"fork() failed: {}"_format(std::strerror(err))};
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            ::signal(SIGPIPE, SIG_DFL);
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                detail::report_and_exit(status_pipe[1], detail::spawn_stage::chdir);
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            detail::report_and_exit(status_pipe[1], detail::spawn_stage::exec);
        }

        // parent; also set here so no signal can race the child's own setpgid
        ::setpgid(pid, pid);
        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::close(status_pipe[1]);

        child_process child{};
        child.pid_ = pid;
        child.stdin_fd_ = in_pipe[1];
        auto flags = ::fcntl(child.stdin_fd_, F_GETFL);
        if (flags < 0 || ::fcntl(child.stdin_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            warn_log("cannot make child stdin non-blocking: ", std::strerror(errno));
        }
        child.stdout_fd_ = out_pipe[0];
        child.stderr_fd_ = err_pipe[0];

        // EOF on the status pipe means exec succeeded and closed it
        detail::spawn_failure failure{};
        ssize_t n{};
        do {
            n = ::read(status_pipe[0], &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        ::close(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(failure))) {
            child.reap(true);
            auto what = failure.stage == detail::spawn_stage::chdir
                              ? "cannot enter working directory '{}': {}"_format(cwd, std::strerror(failure.error))
                              : "cannot execute '{}': {}"_format(opts.argv.front(), std::strerror(failure.error));
            throw process_error{what};
        }

        debug_log("spawned '", utils::join_with_separator(opts.argv, " "), "' as pid ", pid);
        return child;
    }

    child_process::child_process(child_process&& other) noexcept
            : pid_{std::exchange(other.pid_, -1)},
              stdin_fd_{std::exchange(other.stdin_fd_, -1)},
              stdout_fd_{std::exchange(other.stdout_fd_, -1)},
              stderr_fd_{std::exchange(other.stderr_fd_, -1)},
              exit_status_{std::exchange(other.exit_status_, std::nullopt)} {}

    child_process& child_process::operator=(child_process&& other) noexcept {
        if (this != &other) {
            release();
            pid_ = std::exchange(other.pid_, -1);
            stdin_fd_ = std::exchange(other.stdin_fd_, -1);
            stdout_fd_ = std::exchange(other.stdout_fd_, -1);
            stderr_fd_ = std::exchange(other.stderr_fd_, -1);
            exit_status_ = std::exchange(other.exit_status_, std::nullopt);
        }
        return *this;
    }

    child_process::~child_process() {
        release();
    }

    void child_process::write_all(
            std::string_view data, std::optional<std::chrono::steady_clock::time_point> deadline) {
        if (stdin_fd_ < 0) {
            throw process_error{"child stdin is closed"};
        }
        detail::sigpipe_guard guard{};
        const char* p = data.data();
        auto remaining = data.size();
        while (remaining > 0) {
            auto n = ::write(stdin_fd_, p, remaining);
            if (n >= 0) {
                p += n;
                remaining -= static_cast<std::size_t>(n);
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                throw process_error{"write to child stdin failed: {}"_format(std::strerror(errno))};
            }

            // pipe is full: wait for the child to read, or for its end to close
            int wait_ms = -1;
            if (deadline) {
                auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0) {
                    auto written = data.size() - remaining;
                    throw write_timeout_error{
                            written,
                            "child stopped reading its stdin ({} of {} bytes written)"_format(written, data.size())};
                }
                wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(left.count(), INT_MAX));
            }
            pollfd pfd{.fd = stdin_fd_, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, wait_ms) < 0 && errno != EINTR) {
                throw process_error{"poll on child stdin failed: {}"_format(std::strerror(errno))};
            }
        }
    }

    void child_process::close_stdin() noexcept {
        detail::close_fd(stdin_fd_);
    }

    bool child_process::reap(bool block) {
        if (pid_ <= 0 || exit_status_) {
            return true;
        }
        int status = 0;
        pid_t rc{};
        do {
            rc = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            return false;
        }
        if (rc < 0) {
            // already reaped elsewhere; nothing left to wait for
            exit_status_ = -1;
            return true;
        }
        if (WIFEXITED(status)) {
            exit_status_ = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            exit_status_ = 128 + WTERMSIG(status);
        }
        else {
            exit_status_ = -1;
        }
        return true;
    }

    bool child_process::running() {
        return pid_ > 0 && !reap(false);
    }

    std::optional<int> child_process::wait_for_exit(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            if (reap(false)) {
                return exit_status_;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
    }

    // The group outlives a reaped leader while any member holds on, so it is signalled even after exit.
    void child_process::signal_group(int sig) noexcept {
        if (pid_ <= 0) {
            return;
        }
        if (::kill(-pid_, sig) != 0 && !exit_status_) {
            ::kill(pid_, sig);
        }
    }

    void child_process::terminate() noexcept {
        signal_group(SIGTERM);
    }

    void child_process::kill() noexcept {
        signal_group(SIGKILL);
    }

    void child_process::close_fds() noexcept {
        detail::close_fd(stdin_fd_);
        detail::close_fd(stdout_fd_);
        detail::close_fd(stderr_fd_);
    }

    void child_process::release() noexcept {
        if (pid_ > 0 && !exit_status_) {
            kill();
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
        else if (pid_ > 0) {
            signal_group(SIGKILL);
        }
        close_fds();
        pid_ = -1;
        exit_status_.reset();
    }

}  // namespace langbridge
