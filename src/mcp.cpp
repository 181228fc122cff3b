#include "langbridge/mcp.hpp"

#include "langbridge/format.hpp"
#include "langbridge/workspace.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace langbridge::literals;
using namespace std::string_view_literals;

namespace langbridge::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct empty_object {
            struct glaze {
                using T = empty_object;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            empty_object tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Response helpers ────────────────────────────────────────────

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            if (auto ec = glz::write_json(resp, json); ec) {
                error_log("failed to serialize error response: ", glz::format_error(ec, json));
                return R"json({"jsonrpc":"2.0","error":{"code":-32603,"message":"Internal error"},"id":null})json";
            }
            return json;
        }

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            if (auto ec = glz::write_json(resp, json); ec) {
                error_log("failed to serialize response: ", glz::format_error(ec, json));
                return make_error_response(id, glz::rpc::error_e::internal, "Failed to serialize result");
            }
            return json;
        }

        static void send(const std::string& json) {
            std::cout << json << '\n';
            std::cout.flush();
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str); ec) {
                debug_log("ignoring unreadable initialize params");
            }
            else if (!params.clientInfo.name.empty()) {
                info_log("MCP client: ", params.clientInfo.name, " ", params.clientInfo.version);
            }

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.serverInfo = server_info{.name = std::string{server_name}, .version = std::string{server_version}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            for (const auto& spec : tools::catalog()) {
                result.tools.push_back(
                        tool_definition{
                                .name = std::string{spec.name},
                                .description = std::string{spec.description},
                                .inputSchema = glz::raw_json{spec.input_schema},
                        });
            }
            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, tools::toolbox& box) {
            tool_call_params params{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str); ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }
            if (params.name.empty()) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Tool call without a name");
            }

            try {
                auto output = box.invoke(params.name, params.arguments.str);

                tool_call_result result{};
                result.content.push_back(text_content{.text = std::move(output.text)});
                result.isError = output.is_error;
                return make_response(id, std::move(result));
            } catch (const tools::tool_error& e) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, e.what());
            } catch (const std::exception& e) {
                error_log("tool '", params.name, "' failed: ", e.what());
                return make_error_response(id, glz::rpc::error_e::internal, e.what());
            }
        }

    }  // namespace detail

    lsp::bridge_options bridge_options_for(const startup_config& cfg) {
        lsp::bridge_options opts{};
        opts.command = cfg.server_command;
        opts.request_timeout = std::chrono::milliseconds{cfg.request_timeout_ms};
        opts.startup_timeout = std::chrono::milliseconds{cfg.startup_timeout_ms};
        opts.shutdown_grace = std::chrono::milliseconds{cfg.shutdown_grace_ms};
        opts.auto_restart = cfg.auto_restart;
        opts.max_restarts = cfg.max_restarts;
        opts.client_name = std::string{server_name};
        opts.client_version = std::string{server_version};
        opts.max_frame_bytes = cfg.max_frame_bytes;
        return opts;
    }

    std::optional<std::string> handle_message(std::string_view line, tools::toolbox& box) {
        glz::rpc::generic_request_t request{};
        if (auto ec = glz::read_json(request, line); ec) {
            debug_log("unparseable MCP message: ", glz::format_error(ec, line));
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "notifications/initialized"sv) {
            debug_log("MCP client initialized");
            return std::nullopt;
        }
        if (is_notification) {
            debug_log("ignoring MCP notification: ", request.method);
            return std::nullopt;
        }
        if (request.method == "ping"sv) {
            return detail::make_response(request.id, detail::empty_object{});
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, box);
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    // ── Server entry point ──────────────────────────────────────────

    int run_mcp_server(startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        lsp::bridge_client bridge{bridge_options_for(cfg)};
        workspace ws{bridge, cfg.project_root, cfg.language_id};
        tools::toolbox box{bridge, ws, cfg.page_size};

        try {
            ws.start();
            info_log("language server ready (pid ", bridge.pid().value_or(-1), ")");
        } catch (const lsp::startup_error& e) {
            // tools report the dead server; restart_server can retry
            error_log("language server failed to start: ", e.what());
        }

        std::string line{};
        while (std::getline(std::cin, line)) {
            if (utils::trim_ascii(line).empty()) {
                continue;
            }
            if (auto reply = handle_message(line, box)) {
                detail::send(*reply);
            }
        }

        info_log("stdin closed, shutting down");
        bridge.shutdown();
        return 0;
    }

}  // namespace langbridge::mcp
