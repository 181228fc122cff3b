#include "langbridge/lsp/client.hpp"

#include "langbridge/format.hpp"
#include "langbridge/lsp/uri.hpp"

#include <glaze/glaze.hpp>

#include <unistd.h>

#include <algorithm>
#include <cerrno>

using namespace langbridge::literals;
using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace langbridge::lsp {

    namespace detail {

        // ── Handshake payloads ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct workspace_folder {
            std::string uri{};
            std::string name{};
            struct glaze {
                using T = workspace_folder;
                static constexpr auto value = glz::object(&T::uri, &T::name);
            };
        };

        struct initialize_params {
            std::int64_t processId{};
            client_info clientInfo{};
            std::string rootUri{};
            std::string rootPath{};
            std::vector<workspace_folder> workspaceFolders{};
            glz::raw_json capabilities{"{}"};
            std::optional<glz::raw_json> initializationOptions{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value = glz::object(
                        "processId",
                        &T::processId,
                        "clientInfo",
                        &T::clientInfo,
                        "rootUri",
                        &T::rootUri,
                        "rootPath",
                        &T::rootPath,
                        "workspaceFolders",
                        &T::workspaceFolders,
                        "capabilities",
                        &T::capabilities,
                        "initializationOptions",
                        &T::initializationOptions);
            };
        };

        struct initialize_result {
            glz::raw_json capabilities{"{}"};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(&T::capabilities);
            };
        };

        static std::string folder_name(const fs::path& root) {
            auto name = root.filename().string();
            if (name.empty()) {
                name = root.parent_path().filename().string();
            }
            return name.empty() ? std::string{"root"} : name;
        }

        template <typename Done>
        static bool poll_until(Done done, std::chrono::milliseconds timeout) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (!done()) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
            return true;
        }

        static void log_server_line(std::string_view line) {
            line = utils::trim_ascii(line);
            if (line.empty()) {
                return;
            }
            if (utils::str_case_contains(line, "error"sv) || utils::str_case_contains(line, "panic"sv)) {
                warn_log("[server] ", line);
            }
            else {
                debug_log("[server] ", line);
            }
        }

    }  // namespace detail

    bridge_client::bridge_client(bridge_options opts)
            : options_{std::move(opts)}, dispatcher_{[this](const response& reply) {
                  auto sess = current_session();
                  if (!sess) {
                      throw process_terminated_error{"language server is not running"};
                  }
                  send(*sess, reply, options_.request_timeout);
              }} {
        if (options_.auto_restart) {
            recovery_ = std::jthread{[this](std::stop_token stop) { recovery_loop(std::move(stop)); }};
        }
    }

    bridge_client::~bridge_client() {
        if (recovery_.joinable()) {
            recovery_.request_stop();
            recovery_.join();
        }
        try {
            shutdown();
        } catch (const std::exception& e) {
            warn_log("language server shutdown failed: ", e.what());
        }
    }

    // ── State ───────────────────────────────────────────────────────

    void bridge_client::set_state(bridge_state next) {
        bridge_state previous{};
        {
            std::lock_guard lock{state_mutex_};
            previous = std::exchange(state_, next);
        }
        state_cv_.notify_all();
        if (previous != next) {
            debug_log("bridge state: {} -> {}"_format(previous, next));
        }
    }

    bridge_state bridge_client::state() const {
        std::lock_guard lock{state_mutex_};
        return state_;
    }

    bool bridge_client::wait_for_state(bridge_state wanted, std::chrono::milliseconds timeout) const {
        std::unique_lock lock{state_mutex_};
        return state_cv_.wait_for(lock, timeout, [this, wanted] { return state_ == wanted; });
    }

    std::optional<pid_t> bridge_client::pid() const {
        std::lock_guard lock{state_mutex_};
        if (!session_ || session_->process.pid() <= 0) {
            return std::nullopt;
        }
        return session_->process.pid();
    }

    std::string bridge_client::server_capabilities() const {
        std::lock_guard lock{state_mutex_};
        return server_capabilities_;
    }

    std::shared_ptr<bridge_client::session> bridge_client::current_session() const {
        std::lock_guard lock{state_mutex_};
        return session_;
    }

    std::shared_ptr<bridge_client::session> bridge_client::detach_session() {
        std::lock_guard lock{state_mutex_};
        return std::exchange(session_, nullptr);
    }

    // ── Lifecycle ───────────────────────────────────────────────────

    void bridge_client::start(
            const fs::path& working_directory, std::string capabilities, std::string initialization_options) {
        std::lock_guard lifecycle{lifecycle_mutex_};
        {
            std::lock_guard lock{state_mutex_};
            if (state_ == bridge_state::ready || state_ == bridge_state::starting) {
                throw bridge_error{"language server is already running"};
            }
            shutdown_requested_ = false;
            crashed_ = false;
        }
        if (auto stale = detach_session()) {
            teardown(*stale, false);
        }

        working_directory_ = working_directory;
        capabilities_ = capabilities.empty() ? std::string{"{}"} : std::move(capabilities);
        initialization_options_ = std::move(initialization_options);
        configured_ = true;

        launch();
    }

    void bridge_client::launch() {
        set_state(bridge_state::starting);

        std::shared_ptr<session> sess{};
        try {
            sess = std::make_shared<session>(child_process::spawn(
                    spawn_options{
                            .argv = options_.command,
                            .working_directory = working_directory_,
                            .environment = options_.environment}));
        } catch (const process_error& e) {
            set_state(bridge_state::terminated);
            throw startup_error{"failed to launch language server: {}"_format(e.what())};
        }

        sess->reader = std::thread{[this, s = sess.get()] { read_loop(s); }};
        sess->stderr_drain = std::thread{[this, s = sess.get()] { drain_stderr(s); }};
        {
            std::lock_guard lock{state_mutex_};
            session_ = sess;
        }

        std::string capabilities{"{}"};
        try {
            auto handshake = send_request(*sess, "initialize"sv, initialize_params(), options_.startup_timeout);
            auto result = handshake.get();

            detail::initialize_result parsed{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(parsed, result); !ec) {
                capabilities = parsed.capabilities.str;
            }
            send(*sess, notification{.method = "initialized", .params = "{}"}, options_.startup_timeout);
        } catch (const bridge_error& e) {
            detach_session();
            teardown(*sess, false);
            set_state(bridge_state::terminated);
            throw startup_error{"language server handshake failed: {}"_format(e.what())};
        }

        {
            std::lock_guard lock{state_mutex_};
            server_capabilities_ = std::move(capabilities);
        }

        std::vector<std::function<void()>> listeners{};
        {
            std::lock_guard lock{listeners_mutex_};
            listeners = ready_listeners_;
        }
        for (const auto& listener : listeners) {
            listener();
        }

        set_state(bridge_state::ready);
        info_log("language server ready (pid ", sess->process.pid(), ")");
    }

    void bridge_client::teardown(session& sess, bool graceful) {
        sess.closing = true;

        if (graceful && sess.process.running()) {
            try {
                auto reply = send_request(sess, "shutdown"sv, {}, options_.shutdown_grace);
                reply.get();
                send(sess, notification{.method = "exit"}, options_.shutdown_grace);
            } catch (const bridge_error& e) {
                debug_log("shutdown handshake skipped: ", e.what());
            }
        }

        {
            std::unique_lock lock{sess.write_mutex, std::defer_lock};
            if (!lock.try_lock_for(options_.shutdown_grace)) {
                // the holder is stuck on a full pipe; killing the reader end fails its write with EPIPE
                warn_log("language server stopped reading its input; killing pid ", sess.process.pid());
                sess.process.kill();
                lock.lock();
            }
            sess.process.close_stdin();
        }

        auto grace = graceful ? options_.shutdown_grace : std::chrono::milliseconds{0};
        if (!sess.process.wait_for_exit(grace)) {
            sess.process.terminate();
            if (!sess.process.wait_for_exit(options_.shutdown_grace)) {
                warn_log("language server ignored SIGTERM; killing pid ", sess.process.pid());
                sess.process.kill();
                if (!sess.process.wait_for_exit(std::chrono::milliseconds{5'000})) {
                    error_log("language server pid ", sess.process.pid(), " did not exit after SIGKILL");
                }
            }
        }

        // descendants of a wrapper command can keep the pipes open after the direct child is gone
        if (!detail::poll_until([&sess] { return sess.ended && sess.drained; }, options_.shutdown_grace)) {
            warn_log("language server output still open after exit; killing process group ", sess.process.pid());
            sess.process.kill();
        }

        if (sess.reader.joinable()) {
            sess.reader.join();
        }
        if (sess.stderr_drain.joinable()) {
            sess.stderr_drain.join();
        }

        if (auto status = sess.process.exit_status()) {
            debug_log("language server exited with status ", *status);
        }
    }

    void bridge_client::restart() {
        std::lock_guard lifecycle{lifecycle_mutex_};
        if (!configured_) {
            throw bridge_error{"restart requested before the language server was started"};
        }

        info_log("restarting language server");
        set_state(bridge_state::restarting);

        auto failed = pending_.fail_all("language server restarting");
        if (failed > 0) {
            debug_log("failed ", failed, " pending requests for restart");
        }
        if (auto sess = detach_session()) {
            teardown(*sess, true);
        }
        {
            std::lock_guard lock{state_mutex_};
            crashed_ = false;
            shutdown_requested_ = false;
        }

        ++restart_count_;
        launch();
    }

    void bridge_client::shutdown() {
        std::lock_guard lifecycle{lifecycle_mutex_};
        {
            std::lock_guard lock{state_mutex_};
            shutdown_requested_ = true;
            crashed_ = false;
            if (!session_) {
                if (state_ != bridge_state::terminated) {
                    state_ = bridge_state::terminated;
                    state_cv_.notify_all();
                }
                return;
            }
        }

        if (auto sess = detach_session()) {
            info_log("shutting down language server");
            teardown(*sess, true);
        }
        pending_.fail_all("language server shut down");
        // handlers queued before the reader stopped still run against live subscribers
        dispatcher_.drain();
        set_state(bridge_state::terminated);
    }

    // ── Crash recovery ──────────────────────────────────────────────

    void bridge_client::recovery_loop(std::stop_token stop) {
        std::unique_lock lock{state_mutex_};
        for (;;) {
            if (!state_cv_.wait(lock, stop, [this] { return crashed_; })) {
                return;
            }
            crashed_ = false;
            lock.unlock();
            recover();
            lock.lock();
        }
    }

    void bridge_client::recover() {
        std::lock_guard lifecycle{lifecycle_mutex_};
        {
            std::lock_guard lock{state_mutex_};
            if (shutdown_requested_ || state_ != bridge_state::terminated) {
                return;
            }
        }
        if (auto_restarts_ >= options_.max_restarts) {
            error_log("language server exited; restart limit of ", options_.max_restarts, " reached");
            return;
        }

        ++auto_restarts_;
        warn_log("language server exited unexpectedly; restarting (", auto_restarts_, "/", options_.max_restarts, ")");
        set_state(bridge_state::restarting);
        if (auto sess = detach_session()) {
            teardown(*sess, false);
        }

        ++restart_count_;
        try {
            launch();
        } catch (const startup_error& e) {
            error_log("language server restart failed: ", e.what());
        }
    }

    // ── Requests ────────────────────────────────────────────────────

    void bridge_client::write_frame(
            session& sess, std::string_view frame, std::chrono::steady_clock::time_point deadline) {
        if (sess.input_broken) {
            throw process_terminated_error{"language server input is unusable after an interrupted write"};
        }
        try {
            sess.process.write_all(frame, deadline);
        } catch (const write_timeout_error& e) {
            if (e.written() > 0) {
                sess.input_broken = true;
            }
            throw timeout_error{"write to language server timed out: {}"_format(e.what())};
        } catch (const process_error& e) {
            throw process_terminated_error{e.what()};
        }
    }

    void bridge_client::send(session& sess, const message& msg, std::chrono::milliseconds timeout) {
        auto frame = encode(msg);
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock lock{sess.write_mutex, deadline};
        if (!lock.owns_lock()) {
            throw timeout_error{"timed out waiting to write to the language server"};
        }
        write_frame(sess, frame, deadline);
    }

    pending_call bridge_client::send_request(
            session& sess, std::string_view method, std::string params, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        // id allocation and the write share one lock so ids reach the wire in ascending order
        std::unique_lock lock{sess.write_mutex, deadline};
        if (!lock.owns_lock()) {
            std::promise<std::string> unsent{};
            unsent.set_exception(std::make_exception_ptr(
                    timeout_error{"request '{}' timed out waiting to be sent"_format(method)}));
            return pending_call{.id = 0, .result = unsent.get_future()};
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        auto reg = pending_.add(std::string{method}, std::max(left, std::chrono::milliseconds{0}));
        pending_call handle{.id = reg.id, .result = std::move(reg.result)};
        if (sess.ended) {
            pending_.reject(
                    reg.id,
                    std::make_exception_ptr(
                            process_terminated_error{"request '{}' not sent: language server exited"_format(method)}));
            return handle;
        }
        try {
            write_frame(sess, encode(request{.id = reg.id, .method = std::string{method}, .params = std::move(params)}),
                        deadline);
        } catch (const bridge_error&) {
            pending_.reject(reg.id, std::current_exception());
        }
        return handle;
    }

    pending_call bridge_client::call_async(
            std::string_view method, std::string params, std::optional<std::chrono::milliseconds> timeout) {
        std::shared_ptr<session> sess{};
        bridge_state current{};
        {
            std::lock_guard lock{state_mutex_};
            sess = session_;
            current = state_;
        }
        if (!sess || current != bridge_state::ready) {
            throw process_terminated_error{"language server is not running (state: {})"_format(current)};
        }
        return send_request(*sess, method, std::move(params), timeout.value_or(options_.request_timeout));
    }

    std::string bridge_client::call(
            std::string_view method, std::string params, std::optional<std::chrono::milliseconds> timeout) {
        auto handle = call_async(method, std::move(params), timeout);
        return handle.get();
    }

    void bridge_client::notify(std::string_view method, std::string params) {
        std::shared_ptr<session> sess{};
        bridge_state current{};
        {
            std::lock_guard lock{state_mutex_};
            sess = session_;
            current = state_;
        }
        if (!sess || current != bridge_state::ready) {
            throw process_terminated_error{"language server is not running (state: {})"_format(current)};
        }
        send(*sess, notification{.method = std::string{method}, .params = std::move(params)}, options_.request_timeout);
    }

    void bridge_client::on_notification(std::string method, notification_handler handler) {
        dispatcher_.on_notification(std::move(method), std::move(handler));
    }

    void bridge_client::on_request(std::string method, request_handler handler) {
        dispatcher_.on_request(std::move(method), std::move(handler));
    }

    void bridge_client::on_ready(std::function<void()> listener) {
        std::lock_guard lock{listeners_mutex_};
        ready_listeners_.push_back(std::move(listener));
    }

    // ── Read side ───────────────────────────────────────────────────

    void bridge_client::read_loop(session* sess) {
        frame_reader reader{sess->process.stdout_fd(), options_.max_frame_bytes};
        try {
            for (;;) {
                auto frame = reader.next();
                if (!frame) {
                    warn_log("skipping malformed frame: ", frame.error().what());
                    continue;
                }
                route(std::move(*frame));
            }
        } catch (const stream_closed& e) {
            if (e.truncated()) {
                warn_log("language server output ended inside a frame");
            }
            else {
                debug_log("language server closed its output");
            }
        }
        sess->ended = true;
        handle_stream_end(sess);
    }

    void bridge_client::route(message msg) {
        if (auto* resp = std::get_if<response>(&msg)) {
            if (!pending_.complete(*resp)) {
                debug_log("discarding response for unknown request id ", to_string(resp->id));
            }
            return;
        }
        if (auto* n = std::get_if<notification>(&msg)) {
            dispatcher_.post(std::move(*n));
            return;
        }
        dispatcher_.post(std::get<request>(std::move(msg)));
    }

    void bridge_client::handle_stream_end(session* sess) {
        if (sess->closing) {
            return;
        }

        {
            std::lock_guard lock{state_mutex_};
            if (session_.get() != sess) {
                return;
            }
        }

        auto failed = pending_.fail_all("language server exited");
        bool crashed = false;
        {
            std::lock_guard lock{state_mutex_};
            if (state_ == bridge_state::ready) {
                state_ = bridge_state::terminated;
                crashed = true;
                crashed_ = options_.auto_restart && !shutdown_requested_;
            }
        }
        state_cv_.notify_all();

        if (crashed) {
            warn_log("language server exited unexpectedly; ", failed, " pending requests failed");
        }
    }

    void bridge_client::drain_stderr(session* sess) {
        auto fd = sess->process.stderr_fd();
        std::string buffer{};
        char chunk[4096]{};
        for (;;) {
            auto n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<size_t>(n));
            for (auto pos = buffer.find('\n'); pos != std::string::npos; pos = buffer.find('\n')) {
                detail::log_server_line(std::string_view{buffer}.substr(0, pos));
                buffer.erase(0, pos + 1);
            }
        }
        detail::log_server_line(buffer);
        sess->drained = true;
    }

    std::string bridge_client::initialize_params() const {
        auto root = fs::absolute(working_directory_).lexically_normal();
        auto root_uri = to_file_uri(root.string());

        detail::initialize_params params{};
        params.processId = static_cast<std::int64_t>(::getpid());
        params.clientInfo = detail::client_info{.name = options_.client_name, .version = options_.client_version};
        params.rootUri = root_uri;
        params.rootPath = root.string();
        params.workspaceFolders.push_back(
                detail::workspace_folder{.uri = root_uri, .name = detail::folder_name(root)});
        params.capabilities = glz::raw_json{capabilities_};
        if (!initialization_options_.empty()) {
            params.initializationOptions = glz::raw_json{initialization_options_};
        }

        std::string json{};
        if (auto ec = glz::write_json(params, json); ec) {
            throw startup_error{"failed to serialize initialize params: {}"_format(glz::format_error(ec, json))};
        }
        return json;
    }

}  // namespace langbridge::lsp
