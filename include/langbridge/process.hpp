#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace langbridge {

    class process_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // a bounded write ran out of time; `written()` bytes of the data already reached the pipe
    class write_timeout_error : public process_error {
      public:
        write_timeout_error(std::size_t written, const std::string& what) : process_error{what}, written_{written} {}

        std::size_t written() const noexcept { return written_; }

      private:
        std::size_t written_{};
    };

    struct spawn_options {
        std::vector<std::string> argv{};
        std::filesystem::path working_directory{};
        // added to (or replacing entries of) the parent environment
        std::vector<std::pair<std::string, std::string>> environment{};
    };

    /*
     * Owner of one forked child with pipes on its stdin, stdout and stderr. Exec and chdir failures in the
     * child are reported back through a close-on-exec status pipe, so `spawn` either returns a running
     * process or throws process_error. The child leads its own process group and signals go to the whole group,
     * so helpers a wrapper script leaves behind die with it. Destruction kills and reaps a child that is still
     * running.
     */
    class child_process {
      public:
        static child_process spawn(const spawn_options& opts);

        child_process() = default;
        child_process(const child_process&) = delete;
        child_process& operator=(const child_process&) = delete;
        child_process(child_process&& other) noexcept;
        child_process& operator=(child_process&& other) noexcept;
        ~child_process();

        pid_t pid() const noexcept { return pid_; }
        int stdin_fd() const noexcept { return stdin_fd_; }
        int stdout_fd() const noexcept { return stdout_fd_; }
        int stderr_fd() const noexcept { return stderr_fd_; }

        // Writes every byte of `data` to the child's stdin; throws process_error on EPIPE or a closed pipe and
        // write_timeout_error when a child that stopped reading keeps the pipe full past `deadline`.
        void write_all(
                std::string_view data, std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

        void close_stdin() noexcept;

        bool running();

        // Exit status (128 + signal for signalled children) once the child has exited, nullopt on timeout.
        std::optional<int> wait_for_exit(std::chrono::milliseconds timeout);

        void terminate() noexcept;
        void kill() noexcept;

        std::optional<int> exit_status() const noexcept { return exit_status_; }

      private:
        pid_t pid_{-1};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};
        std::optional<int> exit_status_{};

        bool reap(bool block);
        void signal_group(int sig) noexcept;
        void close_fds() noexcept;
        void release() noexcept;
    };

}  // namespace langbridge
