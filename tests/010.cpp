#include "utils.hpp"

namespace langbridge::test {
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    namespace detail {
        // bridge, workspace and toolbox wired like the MCP server, driven through handle_message
        struct mcp_fixture {
            temp_dir temp{"langbridge_mcp"};
            lsp::bridge_client bridge{fake_options()};
            std::unique_ptr<workspace> ws{};
            std::unique_ptr<tools::toolbox> box{};

            ~mcp_fixture() { bridge.shutdown(); }

            mcp_fixture() {
                write_file(temp.path / "main.py", "import os\n");
                ws = std::make_unique<workspace>(bridge, temp.path);
                ws->start();
                box = std::make_unique<tools::toolbox>(bridge, *ws);
            }

            glz::generic send(std::string_view line) {
                auto reply = mcp::handle_message(line, *box);
                INFO("request: " << line);
                REQUIRE(reply);
                return parse_json(*reply);
            }
        };

        static double error_code_of(const glz::generic& reply) {
            return json::number_or(json::find_path(reply, {"error"sv, "code"sv}));
        }

        struct mcp_process {
            pid_t pid{-1};
            int stdin_fd{-1};
            int stdout_fd{-1};
            int stderr_fd{-1};
            std::string read_buf{};

            mcp_process(const mcp_process&) = delete;
            mcp_process& operator=(const mcp_process&) = delete;

            explicit mcp_process(const fs::path& project_root) {
                int in_pipe[2]{};
                int out_pipe[2]{};
                int err_pipe[2]{};
                REQUIRE(::pipe(in_pipe) == 0);
                REQUIRE(::pipe(out_pipe) == 0);
                REQUIRE(::pipe(err_pipe) == 0);

                pid = ::fork();
                REQUIRE(pid >= 0);

                if (pid == 0) {
                    ::close(in_pipe[1]);
                    ::close(out_pipe[0]);
                    ::close(err_pipe[0]);
                    ::dup2(in_pipe[0], STDIN_FILENO);
                    ::dup2(out_pipe[1], STDOUT_FILENO);
                    ::dup2(err_pipe[1], STDERR_FILENO);
                    ::close(in_pipe[0]);
                    ::close(out_pipe[1]);
                    ::close(err_pipe[1]);

                    auto root_str = project_root.string();
                    const char* argv[] = {
                            LANGBRIDGE_CLI_PATH,
                            "--server",
                            LANGBRIDGE_FAKE_SERVER_PATH,
                            "--project-root",
                            root_str.c_str(),
                            "--log-level",
                            "error",
                            nullptr,
                    };
                    ::execvp(argv[0], const_cast<char* const*>(argv));
                    _exit(127);
                }

                ::close(in_pipe[0]);
                ::close(out_pipe[1]);
                ::close(err_pipe[1]);
                stdin_fd = in_pipe[1];
                stdout_fd = out_pipe[0];
                stderr_fd = err_pipe[0];
            }

            ~mcp_process() {
                close_stdin();
                if (pid > 0) {
                    ::kill(pid, SIGTERM);
                    ::waitpid(pid, nullptr, 0);
                }
                if (stdout_fd >= 0)
                    ::close(stdout_fd);
                if (stderr_fd >= 0)
                    ::close(stderr_fd);
            }

            void close_stdin() {
                if (stdin_fd >= 0) {
                    ::close(stdin_fd);
                    stdin_fd = -1;
                }
            }

            void send_line(std::string_view line) {
                std::string msg{line};
                msg.push_back('\n');
                auto written = ::write(stdin_fd, msg.data(), msg.size());
                REQUIRE(written == static_cast<ssize_t>(msg.size()));
            }

            std::string recv_line(int timeout_ms = 15000) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

                for (;;) {
                    auto pos = read_buf.find('\n');
                    if (pos != std::string::npos) {
                        auto line = read_buf.substr(0, pos);
                        read_buf.erase(0, pos + 1);
                        return line;
                    }

                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                             deadline - std::chrono::steady_clock::now())
                                             .count();
                    if (remaining <= 0) {
                        FAIL("mcp recv_line timed out after " << timeout_ms << "ms");
                    }

                    int poll_ms = remaining > 1000 ? 1000 : static_cast<int>(remaining);
                    pollfd pfd{.fd = stdout_fd, .events = POLLIN, .revents = 0};
                    int ret = ::poll(&pfd, 1, poll_ms);
                    if (ret < 0 && errno == EINTR)
                        continue;
                    if (ret == 0)
                        continue;
                    REQUIRE(ret > 0);

                    char chunk[4096]{};
                    auto n = ::read(stdout_fd, chunk, sizeof(chunk));
                    REQUIRE(n > 0);
                    read_buf.append(chunk, static_cast<size_t>(n));
                }
            }

            std::optional<int> wait_exit(std::chrono::milliseconds timeout) {
                auto deadline = std::chrono::steady_clock::now() + timeout;
                while (std::chrono::steady_clock::now() < deadline) {
                    int status = 0;
                    auto r = ::waitpid(pid, &status, WNOHANG);
                    if (r == pid) {
                        pid = -1;
                        return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
                    }
                    std::this_thread::sleep_for(20ms);
                }
                return std::nullopt;
            }

            std::string handshake() {
                send_line(
                        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}}})");
                auto resp = recv_line();
                send_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
                return resp;
            }
        };
    }  // namespace detail

    TEST_CASE("010: initialize reports protocol version and server info", "[010][mcp]") {
        detail::mcp_fixture f{};
        auto reply = f.send(
                R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}}})");

        CHECK(json::number_or(json::find(reply, "id"sv)) == 1.0);
        CHECK(json::string_or(json::find_path(reply, {"result"sv, "protocolVersion"sv})) == "2024-11-05");
        CHECK(json::string_or(json::find_path(reply, {"result"sv, "serverInfo"sv, "name"sv})) == "langbridge");
        CHECK(json::string_or(json::find_path(reply, {"result"sv, "serverInfo"sv, "version"sv})) == "0.1.0");
        CHECK(json::find_path(reply, {"result"sv, "capabilities"sv, "tools"sv}) != nullptr);
    }

    TEST_CASE("010: notifications get no reply", "[010][mcp]") {
        detail::mcp_fixture f{};
        CHECK_FALSE(mcp::handle_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", *f.box));
        CHECK_FALSE(mcp::handle_message(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{}})", *f.box));
    }

    TEST_CASE("010: protocol errors", "[010][mcp][errors]") {
        detail::mcp_fixture f{};

        auto parse = f.send("{not json");
        CHECK(detail::error_code_of(parse) == -32700.0);
        CHECK(json::string_or(json::find_path(parse, {"error"sv, "message"sv})) == "JSON parse error");

        auto unknown = f.send(R"({"jsonrpc":"2.0","id":"u1","method":"resources/list"})");
        CHECK(detail::error_code_of(unknown) == -32601.0);
        CHECK(json::string_or(json::find_path(unknown, {"error"sv, "message"sv})) == "Unknown method: resources/list");
        CHECK(json::string_or(json::find(unknown, "id"sv)) == "u1");

        auto ping = f.send(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
        REQUIRE(json::find(ping, "result"sv));
        CHECK(json::find(ping, "result"sv)->is_object());
        CHECK(json::find(ping, "error"sv) == nullptr);
    }

    TEST_CASE("010: tools/list exposes the catalog", "[010][mcp][tools]") {
        detail::mcp_fixture f{};
        auto reply = f.send(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");

        const auto* tools = json::find_path(reply, {"result"sv, "tools"sv});
        REQUIRE(tools);
        REQUIRE(tools->is_array());
        CHECK(tools->get_array().size() == tools::catalog().size());
        for (const auto& tool : tools->get_array()) {
            CHECK_FALSE(json::string_or(json::find(tool, "name"sv)).empty());
            CHECK(json::find_path(tool, {"inputSchema"sv, "type"sv}) != nullptr);
        }
    }

    TEST_CASE("010: tools/call wraps tool output in text content", "[010][mcp][tools]") {
        detail::mcp_fixture f{};

        auto reply = f.send(
                R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"hover","arguments":{"file_path":"main.py","line":0,"character":7}}})");
        const auto* content = json::find_path(reply, {"result"sv, "content"sv});
        REQUIRE(content);
        REQUIRE(content->get_array().size() == 1U);
        CHECK(json::string_or(json::find(content->get_array().front(), "type"sv)) == "text");
        auto text = json::string_or(json::find(content->get_array().front(), "text"sv));
        CHECK(text.find("fake hover at 0:7") != std::string::npos);
        CHECK_FALSE(json::find_path(reply, {"result"sv, "isError"sv})->get<bool>());

        auto failed = f.send(
                R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"hover","arguments":{"file_path":"nope.py","line":0,"character":0}}})");
        CHECK(json::find_path(failed, {"result"sv, "isError"sv})->get<bool>());
    }

    TEST_CASE("010: tools/call rejects bad calls as invalid params", "[010][mcp][tools][errors]") {
        detail::mcp_fixture f{};

        auto unknown_tool = f.send(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"nope","arguments":{}}})");
        CHECK(detail::error_code_of(unknown_tool) == -32602.0);
        CHECK(json::string_or(json::find_path(unknown_tool, {"error"sv, "message"sv})) == "Unknown tool: nope");

        auto bad_args = f.send(
                R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"hover","arguments":{"file_path":"main.py"}}})");
        CHECK(detail::error_code_of(bad_args) == -32602.0);

        auto no_name = f.send(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"arguments":{}}})");
        CHECK(detail::error_code_of(no_name) == -32602.0);
    }

    TEST_CASE("010: bridge options follow the startup config", "[010][mcp][config]") {
        startup_config cfg{};
        cfg.server_command = {"srv", "--stdio"};
        cfg.request_timeout_ms = 1'500;
        cfg.auto_restart = false;
        cfg.max_restarts = 7;

        auto opts = mcp::bridge_options_for(cfg);
        CHECK(opts.command == cfg.server_command);
        CHECK(opts.request_timeout == 1'500ms);
        CHECK_FALSE(opts.auto_restart);
        CHECK(opts.max_restarts == 7);
        CHECK(opts.client_name == "langbridge");
    }

    TEST_CASE("010: the server binary speaks MCP over stdio", "[010][mcp][process]") {
        detail::temp_dir temp{"langbridge_mcp_process"};
        detail::write_file(temp.path / "main.py", "import os\nprint(undefined_name)\n");
        detail::mcp_process mcp{temp.path};

        auto init = mcp.handshake();
        CHECK(init.find("\"protocolVersion\":\"2024-11-05\"") != std::string::npos);
        CHECK(init.find("\"name\":\"langbridge\"") != std::string::npos);

        mcp.send_line(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
        auto list = mcp.recv_line();
        CHECK(list.find("\"name\":\"hover\"") != std::string::npos);
        CHECK(list.find("\"inputSchema\"") != std::string::npos);

        mcp.send_line(
                R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"hover","arguments":{"file_path":"main.py","line":1,"character":2}}})");
        auto hover = mcp.recv_line();
        CHECK(hover.find("fake hover at 1:2") != std::string::npos);
        CHECK(hover.find("\"isError\":false") != std::string::npos);

        mcp.send_line("");
        mcp.send_line(R"({"jsonrpc":"2.0","id":4,"method":"ping"})");
        auto ping = mcp.recv_line();
        CHECK(ping.find("\"id\":4") != std::string::npos);

        // closing stdin shuts the bridge and the language server down
        mcp.close_stdin();
        auto status = mcp.wait_exit(10s);
        REQUIRE(status);
        CHECK(*status == 0);
    }

}  // namespace langbridge::test
