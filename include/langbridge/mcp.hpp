#pragma once

#include "config.hpp"
#include "tools.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace langbridge::mcp {

    inline constexpr auto protocol_version = "2024-11-05"sv;
    inline constexpr auto server_name = "langbridge"sv;
    inline constexpr auto server_version = "0.1.0"sv;

    lsp::bridge_options bridge_options_for(const startup_config& cfg);

    // Handles one newline-delimited JSON-RPC message; nullopt when no reply is due (notifications).
    std::optional<std::string> handle_message(std::string_view line, tools::toolbox& box);

    // Serves MCP over stdin/stdout until stdin closes, then shuts the language server down.
    int run_mcp_server(startup_config& cfg);

}  // namespace langbridge::mcp
