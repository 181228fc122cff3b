#pragma once

#include "pagination.hpp"
#include "workspace.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace langbridge::tools {

    // invalid or missing tool arguments, reported to the MCP client as -32602
    class tool_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    struct tool_spec {
        std::string_view name;
        std::string_view description;
        std::string_view input_schema;
    };

    std::span<const tool_spec> catalog();

    struct tool_output {
        std::string text{};
        bool is_error{false};
    };

    /*
     * Maps each MCP tool onto one bridge call. Bridge and workspace failures become error outputs so the MCP
     * loop keeps serving; only malformed arguments and unknown tool names throw tool_error.
     */
    class toolbox {
      public:
        toolbox(lsp::bridge_client& bridge, workspace& ws, std::int64_t page_size = default_page_size);

        tool_output invoke(std::string_view name, std::string_view arguments);

      private:
        lsp::bridge_client& bridge_;
        workspace& workspace_;
        std::int64_t page_size_;

        std::string run(std::string_view name, std::string_view arguments);

        std::string hover(std::string_view arguments);
        std::string completion(std::string_view arguments);
        std::string locate(std::string_view method, std::string_view arguments);
        std::string references(std::string_view arguments);
        std::string document_symbols(std::string_view arguments);
        std::string workspace_symbols(std::string_view arguments);
        std::string diagnostics(std::string_view arguments);
        std::string code_actions(std::string_view arguments);
        std::string rename(std::string_view arguments);
        std::string semantic_tokens(std::string_view arguments);
        std::string format_document(std::string_view arguments);
        std::string format_range(std::string_view arguments);
        std::string organize_imports(std::string_view arguments);
        std::string add_import(std::string_view arguments);
        std::string create_config();
        std::string restart_server();

        page_request page(std::optional<std::int64_t> offset, std::optional<std::int64_t> limit) const;
    };

}  // namespace langbridge::tools
