#pragma once

#include "dispatch.hpp"
#include "framing.hpp"
#include "pending.hpp"
#include "protocol.hpp"

#include "langbridge/process.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace langbridge::lsp {

    enum class bridge_state : uint8_t { not_started, starting, ready, restarting, terminated };

    inline constexpr std::string_view to_string(bridge_state state) {
        switch (state) {
            case bridge_state::not_started:
                return "not_started"sv;
            case bridge_state::starting:
                return "starting"sv;
            case bridge_state::ready:
                return "ready"sv;
            case bridge_state::restarting:
                return "restarting"sv;
            case bridge_state::terminated:
                return "terminated"sv;
        }
        return "terminated"sv;
    }

    struct bridge_options {
        std::vector<std::string> command{};
        std::chrono::milliseconds request_timeout{60'000};
        std::chrono::milliseconds startup_timeout{30'000};
        std::chrono::milliseconds shutdown_grace{2'000};
        bool auto_restart{false};
        int max_restarts{3};
        std::string client_name{"langbridge"};
        std::string client_version{"0.1.0"};
        std::size_t max_frame_bytes{default_max_frame_bytes};
        std::vector<std::pair<std::string, std::string>> environment{{"PYTHONUNBUFFERED", "1"}};
    };

    // Handle to one outstanding request. Dropping it abandons interest; the table entry stays until resolved.
    struct pending_call {
        std::int64_t id{};
        std::future<std::string> result{};

        std::string get() { return result.get(); }
    };

    /*
     * Owns one language server child process and the JSON-RPC session over its stdio.
     *
     * Requests are correlated by id only: responses may arrive in any order and each caller receives exactly
     * its own result or one typed failure (remote_error, timeout_error, process_terminated_error). Server
     * notifications and server-initiated requests are handed to a dispatcher thread so handlers never stall
     * the read loop. All member functions are thread-safe; start, restart and shutdown are serialized.
     *
     * Writes are bounded too: a server that stops draining its stdin fails the writer with timeout_error once
     * its deadline passes, and restart or shutdown kill it rather than wait on the blocked pipe.
     */
    class bridge_client {
      public:
        explicit bridge_client(bridge_options opts);
        ~bridge_client();

        bridge_client(const bridge_client&) = delete;
        bridge_client& operator=(const bridge_client&) = delete;

        // Launches the server in `working_directory` and completes the initialize handshake.
        // `capabilities` and `initialization_options` are raw JSON; empty means `{}` and omitted respectively.
        void start(
                const std::filesystem::path& working_directory,
                std::string capabilities = {},
                std::string initialization_options = {});

        std::string call(
                std::string_view method,
                std::string params = {},
                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        pending_call call_async(
                std::string_view method,
                std::string params = {},
                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        void notify(std::string_view method, std::string params = {});

        void on_notification(std::string method, notification_handler handler);
        void on_request(std::string method, request_handler handler);

        // runs after every successful handshake, including those of restarts
        void on_ready(std::function<void()> listener);

        void restart();
        void shutdown();

        bridge_state state() const;
        bool wait_for_state(bridge_state wanted, std::chrono::milliseconds timeout) const;

        std::size_t pending_count() const { return pending_.size(); }
        int restart_count() const { return restart_count_.load(); }
        std::optional<pid_t> pid() const;

        // raw JSON `capabilities` object from the last initialize result
        std::string server_capabilities() const;

        const bridge_options& options() const { return options_; }

      private:
        struct session {
            explicit session(child_process proc) : process{std::move(proc)} {}

            child_process process;
            std::timed_mutex write_mutex{};
            std::thread reader{};
            std::thread stderr_drain{};
            std::atomic<bool> closing{false};
            std::atomic<bool> ended{false};
            std::atomic<bool> drained{false};
            // a write cut off mid-frame; nothing more can be framed on this stdin
            std::atomic<bool> input_broken{false};
        };

        bridge_options options_;

        std::filesystem::path working_directory_{};
        std::string capabilities_{};
        std::string initialization_options_{};
        bool configured_{false};
        bool shutdown_requested_{false};
        int auto_restarts_{0};
        std::atomic<int> restart_count_{0};

        std::mutex lifecycle_mutex_{};

        mutable std::mutex state_mutex_{};
        mutable std::condition_variable_any state_cv_{};
        bridge_state state_{bridge_state::not_started};
        std::shared_ptr<session> session_{};
        std::string server_capabilities_{"{}"};
        bool crashed_{false};

        std::mutex listeners_mutex_{};
        std::vector<std::function<void()>> ready_listeners_{};

        pending_table pending_{};
        dispatcher dispatcher_;
        std::jthread recovery_{};

        void set_state(bridge_state next);
        std::shared_ptr<session> current_session() const;
        std::shared_ptr<session> detach_session();

        void launch();
        void teardown(session& sess, bool graceful);
        void recover();
        void recovery_loop(std::stop_token stop);

        pending_call send_request(
                session& sess, std::string_view method, std::string params, std::chrono::milliseconds timeout);
        void send(session& sess, const message& msg, std::chrono::milliseconds timeout);
        void write_frame(session& sess, std::string_view frame, std::chrono::steady_clock::time_point deadline);

        void read_loop(session* sess);
        void drain_stderr(session* sess);
        void route(message msg);
        void handle_stream_end(session* sess);

        std::string initialize_params() const;
    };

}  // namespace langbridge::lsp
