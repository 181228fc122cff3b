#include "langbridge/tools.hpp"

#include "langbridge/format.hpp"
#include "langbridge/json.hpp"

#include <algorithm>
#include <array>
#include <tuple>

using namespace langbridge::literals;
using namespace std::string_view_literals;

namespace langbridge::tools {

    namespace detail {

        // a well-formed request the server could not satisfy; surfaces as an error result
        class tool_failure : public std::runtime_error {
          public:
            using std::runtime_error::runtime_error;
        };

        // ── Tool catalog ────────────────────────────────────────────────

        static constexpr auto position_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string","description":"Path to the Python file (absolute, relative to the project root, or a file:// URI)"},"line":{"type":"integer","minimum":0,"description":"Zero-based line number"},"character":{"type":"integer","minimum":0,"description":"Zero-based character offset in the line"}},"required":["file_path","line","character"]})json"sv;

        static constexpr auto completion_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"line":{"type":"integer","minimum":0},"character":{"type":"integer","minimum":0},"limit":{"type":"integer","minimum":1,"description":"Maximum items to return (default 50)"},"offset":{"type":"integer","minimum":0,"description":"Items to skip (default 0)"}},"required":["file_path","line","character"]})json"sv;

        static constexpr auto references_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"line":{"type":"integer","minimum":0},"character":{"type":"integer","minimum":0},"include_declaration":{"type":"boolean","default":true},"limit":{"type":"integer","minimum":1},"offset":{"type":"integer","minimum":0}},"required":["file_path","line","character"]})json"sv;

        static constexpr auto document_symbols_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"limit":{"type":"integer","minimum":1},"offset":{"type":"integer","minimum":0}},"required":["file_path"]})json"sv;

        static constexpr auto workspace_symbols_schema =
                R"json({"type":"object","properties":{"query":{"type":"string","description":"Search query, may be a partial name"},"limit":{"type":"integer","minimum":1},"offset":{"type":"integer","minimum":0}},"required":["query"]})json"sv;

        static constexpr auto diagnostics_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string","description":"Restrict to one file; all known files when omitted"},"limit":{"type":"integer","minimum":1},"offset":{"type":"integer","minimum":0}}})json"sv;

        static constexpr auto range_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"start_line":{"type":"integer","minimum":0},"start_char":{"type":"integer","minimum":0},"end_line":{"type":"integer","minimum":0},"end_char":{"type":"integer","minimum":0}},"required":["file_path","start_line","start_char","end_line","end_char"]})json"sv;

        static constexpr auto rename_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"line":{"type":"integer","minimum":0},"character":{"type":"integer","minimum":0},"new_name":{"type":"string"}},"required":["file_path","line","character","new_name"]})json"sv;

        static constexpr auto file_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"}},"required":["file_path"]})json"sv;

        static constexpr auto format_document_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"tab_size":{"type":"integer","minimum":1,"default":4},"insert_spaces":{"type":"boolean","default":true}},"required":["file_path"]})json"sv;

        static constexpr auto format_range_schema =
                R"json({"type":"object","properties":{"file_path":{"type":"string"},"start_line":{"type":"integer","minimum":0},"start_char":{"type":"integer","minimum":0},"end_line":{"type":"integer","minimum":0},"end_char":{"type":"integer","minimum":0},"tab_size":{"type":"integer","minimum":1,"default":4},"insert_spaces":{"type":"boolean","default":true}},"required":["file_path","start_line","start_char","end_line","end_char"]})json"sv;

        static constexpr auto empty_schema = R"json({"type":"object","properties":{}})json"sv;

        static constexpr std::array tool_table{
                tool_spec{"hover", "Get hover information (type, documentation) at a position in a Python file.", position_schema},
                tool_spec{"completion", "Get code completions at a position, sorted and paginated.", completion_schema},
                tool_spec{"definition", "Go to the definition of the symbol at a position.", position_schema},
                tool_spec{"type_definition", "Go to the type definition of the symbol at a position.", position_schema},
                tool_spec{"implementation", "Find implementations of the class or protocol at a position.", position_schema},
                tool_spec{"references", "Find all references to the symbol at a position, paginated.", references_schema},
                tool_spec{"document_symbols", "List the symbols of a document, flattened and paginated.", document_symbols_schema},
                tool_spec{"workspace_symbols", "Search symbols across the workspace, paginated.", workspace_symbols_schema},
                tool_spec{"diagnostics", "Current diagnostics (errors, warnings) for one file or all files, paginated.", diagnostics_schema},
                tool_spec{"code_actions", "Available code actions (fixes, refactorings) for a range.", range_schema},
                tool_spec{"rename", "Rename the symbol at a position and all its references.", rename_schema},
                tool_spec{"semantic_tokens", "Semantic tokens of a document.", file_schema},
                tool_spec{"signature_help", "Signature help for the call at a position.", position_schema},
                tool_spec{"format_document", "Text edits that format a whole document.", format_document_schema},
                tool_spec{"format_range", "Text edits that format a range of a document.", format_range_schema},
                tool_spec{"organize_imports", "Text edits that sort and clean up the imports of a file.", file_schema},
                tool_spec{"add_import", "Workspace edit adding the missing import for the symbol at a position.", position_schema},
                tool_spec{"create_config", "Create a starter pyrightconfig.json in the project root.", empty_schema},
                tool_spec{"restart_server", "Restart the language server.", empty_schema},
        };

        // ── Tool arguments ──────────────────────────────────────────────

        struct position_args {
            std::string file_path{};
            std::int64_t line{};
            std::int64_t character{};
            struct glaze {
                using T = position_args;
                static constexpr auto value = glz::object(&T::file_path, &T::line, &T::character);
            };
        };

        struct completion_args {
            std::string file_path{};
            std::int64_t line{};
            std::int64_t character{};
            std::optional<std::int64_t> limit{};
            std::optional<std::int64_t> offset{};
            struct glaze {
                using T = completion_args;
                static constexpr auto value =
                        glz::object(&T::file_path, &T::line, &T::character, &T::limit, &T::offset);
            };
        };

        struct references_args {
            std::string file_path{};
            std::int64_t line{};
            std::int64_t character{};
            std::optional<bool> include_declaration{};
            std::optional<std::int64_t> limit{};
            std::optional<std::int64_t> offset{};
            struct glaze {
                using T = references_args;
                static constexpr auto value = glz::object(
                        &T::file_path, &T::line, &T::character, &T::include_declaration, &T::limit, &T::offset);
            };
        };

        struct document_symbols_args {
            std::string file_path{};
            std::optional<std::int64_t> limit{};
            std::optional<std::int64_t> offset{};
            struct glaze {
                using T = document_symbols_args;
                static constexpr auto value = glz::object(&T::file_path, &T::limit, &T::offset);
            };
        };

        struct workspace_symbols_args {
            std::string query{};
            std::optional<std::int64_t> limit{};
            std::optional<std::int64_t> offset{};
            struct glaze {
                using T = workspace_symbols_args;
                static constexpr auto value = glz::object(&T::query, &T::limit, &T::offset);
            };
        };

        struct diagnostics_args {
            std::optional<std::string> file_path{};
            std::optional<std::int64_t> limit{};
            std::optional<std::int64_t> offset{};
            struct glaze {
                using T = diagnostics_args;
                static constexpr auto value = glz::object(&T::file_path, &T::limit, &T::offset);
            };
        };

        struct range_args {
            std::string file_path{};
            std::int64_t start_line{};
            std::int64_t start_char{};
            std::int64_t end_line{};
            std::int64_t end_char{};
            struct glaze {
                using T = range_args;
                static constexpr auto value =
                        glz::object(&T::file_path, &T::start_line, &T::start_char, &T::end_line, &T::end_char);
            };
        };

        struct rename_args {
            std::string file_path{};
            std::int64_t line{};
            std::int64_t character{};
            std::string new_name{};
            struct glaze {
                using T = rename_args;
                static constexpr auto value = glz::object(&T::file_path, &T::line, &T::character, &T::new_name);
            };
        };

        struct file_args {
            std::string file_path{};
            struct glaze {
                using T = file_args;
                static constexpr auto value = glz::object(&T::file_path);
            };
        };

        struct format_document_args {
            std::string file_path{};
            std::optional<std::int64_t> tab_size{};
            std::optional<bool> insert_spaces{};
            struct glaze {
                using T = format_document_args;
                static constexpr auto value = glz::object(&T::file_path, &T::tab_size, &T::insert_spaces);
            };
        };

        struct format_range_args {
            std::string file_path{};
            std::int64_t start_line{};
            std::int64_t start_char{};
            std::int64_t end_line{};
            std::int64_t end_char{};
            std::optional<std::int64_t> tab_size{};
            std::optional<bool> insert_spaces{};
            struct glaze {
                using T = format_range_args;
                static constexpr auto value = glz::object(
                        &T::file_path,
                        &T::start_line,
                        &T::start_char,
                        &T::end_line,
                        &T::end_char,
                        &T::tab_size,
                        &T::insert_spaces);
            };
        };

        // ── LSP request params ──────────────────────────────────────────

        struct text_document_id {
            std::string uri{};
            struct glaze {
                using T = text_document_id;
                static constexpr auto value = glz::object(&T::uri);
            };
        };

        struct lsp_position {
            std::int64_t line{};
            std::int64_t character{};
            struct glaze {
                using T = lsp_position;
                static constexpr auto value = glz::object(&T::line, &T::character);
            };
        };

        struct lsp_range {
            lsp_position start{};
            lsp_position end{};
            struct glaze {
                using T = lsp_range;
                static constexpr auto value = glz::object(&T::start, &T::end);
            };
        };

        struct text_document_position_params {
            text_document_id textDocument{};
            lsp_position position{};
            struct glaze {
                using T = text_document_position_params;
                static constexpr auto value = glz::object(&T::textDocument, &T::position);
            };
        };

        struct reference_context {
            bool includeDeclaration{true};
            struct glaze {
                using T = reference_context;
                static constexpr auto value = glz::object(&T::includeDeclaration);
            };
        };

        struct reference_params {
            text_document_id textDocument{};
            lsp_position position{};
            reference_context context{};
            struct glaze {
                using T = reference_params;
                static constexpr auto value = glz::object(&T::textDocument, &T::position, &T::context);
            };
        };

        struct document_params {
            text_document_id textDocument{};
            struct glaze {
                using T = document_params;
                static constexpr auto value = glz::object(&T::textDocument);
            };
        };

        struct workspace_symbol_params {
            std::string query{};
            struct glaze {
                using T = workspace_symbol_params;
                static constexpr auto value = glz::object(&T::query);
            };
        };

        struct code_action_context {
            glz::raw_json diagnostics{"[]"};
            struct glaze {
                using T = code_action_context;
                static constexpr auto value = glz::object(&T::diagnostics);
            };
        };

        struct code_action_params {
            text_document_id textDocument{};
            lsp_range range{};
            code_action_context context{};
            struct glaze {
                using T = code_action_params;
                static constexpr auto value = glz::object(&T::textDocument, &T::range, &T::context);
            };
        };

        struct rename_params {
            text_document_id textDocument{};
            lsp_position position{};
            std::string newName{};
            struct glaze {
                using T = rename_params;
                static constexpr auto value = glz::object(&T::textDocument, &T::position, &T::newName);
            };
        };

        struct formatting_options {
            std::int64_t tabSize{4};
            bool insertSpaces{true};
            struct glaze {
                using T = formatting_options;
                static constexpr auto value = glz::object(&T::tabSize, &T::insertSpaces);
            };
        };

        struct document_formatting_params {
            text_document_id textDocument{};
            formatting_options options{};
            struct glaze {
                using T = document_formatting_params;
                static constexpr auto value = glz::object(&T::textDocument, &T::options);
            };
        };

        struct range_formatting_params {
            text_document_id textDocument{};
            lsp_range range{};
            formatting_options options{};
            struct glaze {
                using T = range_formatting_params;
                static constexpr auto value = glz::object(&T::textDocument, &T::range, &T::options);
            };
        };

        struct execute_command_params {
            std::string command{};
            std::vector<std::string> arguments{};
            struct glaze {
                using T = execute_command_params;
                static constexpr auto value = glz::object(&T::command, &T::arguments);
            };
        };

        // ── Helpers ─────────────────────────────────────────────────────

        static constexpr auto no_hover = R"json({"contents":"No hover information available"})json"sv;

        template <typename T>
        static T parse_args(std::string_view tool, std::string_view arguments) {
            if (utils::trim_ascii(arguments).empty() || utils::trim_ascii(arguments) == "null"sv) {
                arguments = "{}"sv;
            }
            T args{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false, .error_on_missing_keys = true}>(
                        args, arguments);
                ec) {
                throw tool_error{"invalid arguments for {}: {}"_format(tool, glz::format_error(ec, arguments))};
            }
            return args;
        }

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            if (auto ec = glz::write_json(value, json); ec) {
                throw std::runtime_error{"failed to serialize request: {}"_format(glz::format_error(ec, json))};
            }
            return json;
        }

        static void require_non_negative(std::string_view name, std::int64_t value) {
            if (value < 0) {
                throw tool_error{"{} must not be negative (got {})"_format(name, value)};
            }
        }

        static lsp_position position_of(std::int64_t line, std::int64_t character) {
            require_non_negative("line"sv, line);
            require_non_negative("character"sv, character);
            return {.line = line, .character = character};
        }

        static lsp_range range_of(const auto& args) {
            require_non_negative("start_line"sv, args.start_line);
            require_non_negative("start_char"sv, args.start_char);
            require_non_negative("end_line"sv, args.end_line);
            require_non_negative("end_char"sv, args.end_char);
            return {.start = {.line = args.start_line, .character = args.start_char},
                    .end = {.line = args.end_line, .character = args.end_char}};
        }

        static formatting_options formatting_of(const auto& args) {
            formatting_options options{};
            if (args.tab_size) {
                if (*args.tab_size <= 0) {
                    throw tool_error{"tab_size must be positive (got {})"_format(*args.tab_size)};
                }
                options.tabSize = *args.tab_size;
            }
            options.insertSpaces = args.insert_spaces.value_or(true);
            return options;
        }

        static bool is_null_result(std::string_view result) {
            auto trimmed = utils::trim_ascii(result);
            return trimmed.empty() || trimmed == "null"sv;
        }

        static glz::generic parse_result(std::string_view method, std::string_view result) {
            glz::generic value{};
            if (is_null_result(result)) {
                return value;
            }
            if (auto ec = glz::read_json(value, result); ec) {
                throw tool_failure{"malformed {} response: {}"_format(method, glz::format_error(ec, result))};
            }
            return value;
        }

        static std::vector<glz::generic> take_array(glz::generic& value) {
            if (!value.is_array()) {
                return {};
            }
            return std::move(value.get_array());
        }

        static std::tuple<double, double> start_of(const glz::generic& item) {
            const auto* start = json::find_path(item, {"range"sv, "start"sv});
            if (start == nullptr) {
                start = json::find_path(item, {"location"sv, "range"sv, "start"sv});
            }
            if (start == nullptr) {
                return {0.0, 0.0};
            }
            return {json::number_or(json::find(*start, "line"sv)), json::number_or(json::find(*start, "character"sv))};
        }

        static void sort_completions(std::vector<glz::generic>& items) {
            auto key = [](const glz::generic& item) {
                auto label = json::string_or(json::find(item, "label"sv));
                auto sort_text = json::string_or(json::find(item, "sortText"sv), label);
                return std::make_tuple(std::move(sort_text), std::move(label));
            };
            std::ranges::stable_sort(items, [&](const auto& a, const auto& b) { return key(a) < key(b); });
        }

        static void sort_locations(std::vector<glz::generic>& items) {
            auto key = [](const glz::generic& item) {
                auto [line, character] = start_of(item);
                return std::make_tuple(json::string_or(json::find(item, "uri"sv)), line, character);
            };
            std::ranges::stable_sort(items, [&](const auto& a, const auto& b) { return key(a) < key(b); });
        }

        static void flatten_symbols(
                std::vector<glz::generic>& symbols, const std::string& parent, std::vector<glz::generic>& out) {
            for (auto& symbol : symbols) {
                auto name = json::string_or(json::find(symbol, "name"sv));
                if (!parent.empty() && symbol.is_object()) {
                    symbol["containerName"] = parent;
                }
                out.push_back(symbol);
                if (symbol.is_object() && symbol.contains("children") && symbol["children"].is_array()) {
                    flatten_symbols(symbol["children"].get_array(), name, out);
                }
            }
        }

        static void sort_by_start(std::vector<glz::generic>& items) {
            std::ranges::stable_sort(items, [](const auto& a, const auto& b) { return start_of(a) < start_of(b); });
        }

        static void sort_workspace_symbols(std::vector<glz::generic>& items) {
            auto key = [](const glz::generic& item) {
                return std::make_tuple(
                        json::string_or(json::find(item, "name"sv)),
                        json::string_or(json::find_path(item, {"location"sv, "uri"sv})),
                        json::number_or(json::find_path(item, {"location"sv, "range"sv, "start"sv, "line"sv})));
            };
            std::ranges::stable_sort(items, [&](const auto& a, const auto& b) { return key(a) < key(b); });
        }

        static void sort_diagnostics(std::vector<glz::generic>& items) {
            auto key = [](const glz::generic& item) {
                auto [line, character] = start_of(item);
                return std::make_tuple(
                        json::string_or(json::find(item, "uri"sv)),
                        json::number_or(json::find(item, "severity"sv)),
                        line,
                        character);
            };
            std::ranges::stable_sort(items, [&](const auto& a, const auto& b) { return key(a) < key(b); });
        }

        static void append_diagnostics(const std::string& uri, std::string_view raw, std::vector<glz::generic>& out) {
            auto parsed = parse_result("textDocument/publishDiagnostics"sv, raw);
            for (auto& diagnostic : take_array(parsed)) {
                if (diagnostic.is_object()) {
                    diagnostic["uri"] = uri;
                }
                out.push_back(std::move(diagnostic));
            }
        }

    }  // namespace detail

    std::span<const tool_spec> catalog() {
        return detail::tool_table;
    }

    toolbox::toolbox(lsp::bridge_client& bridge, workspace& ws, std::int64_t page_size)
            : bridge_{bridge}, workspace_{ws}, page_size_{page_size > 0 ? page_size : default_page_size} {}

    tool_output toolbox::invoke(std::string_view name, std::string_view arguments) {
        try {
            return tool_output{.text = run(name, arguments)};
        } catch (const tool_error&) {
            throw;
        } catch (const std::invalid_argument& e) {
            throw tool_error{e.what()};
        } catch (const detail::tool_failure& e) {
            return tool_output{.text = e.what(), .is_error = true};
        } catch (const lsp::timeout_error& e) {
            return tool_output{
                    .text = "Request timed out ({}). The file might be too large or the language server is still "
                            "analyzing; please try again."_format(e.what()),
                    .is_error = true};
        } catch (const lsp::remote_error& e) {
            return tool_output{.text = "LSP error: {} (code: {})"_format(e.message(), e.code()), .is_error = true};
        } catch (const lsp::bridge_error& e) {
            return tool_output{.text = "Language server error: {}"_format(e.what()), .is_error = true};
        } catch (const workspace_error& e) {
            return tool_output{.text = e.what(), .is_error = true};
        }
    }

    page_request toolbox::page(std::optional<std::int64_t> offset, std::optional<std::int64_t> limit) const {
        return page_request{.offset = offset.value_or(0), .limit = limit.value_or(page_size_)};
    }

    std::string toolbox::run(std::string_view name, std::string_view arguments) {
        debug_log("tool call: ", name);

        if (name == "hover"sv) {
            return hover(arguments);
        }
        if (name == "completion"sv) {
            return completion(arguments);
        }
        if (name == "definition"sv) {
            return locate("textDocument/definition"sv, arguments);
        }
        if (name == "type_definition"sv) {
            return locate("textDocument/typeDefinition"sv, arguments);
        }
        if (name == "implementation"sv) {
            return locate("textDocument/implementation"sv, arguments);
        }
        if (name == "signature_help"sv) {
            return locate("textDocument/signatureHelp"sv, arguments);
        }
        if (name == "references"sv) {
            return references(arguments);
        }
        if (name == "document_symbols"sv) {
            return document_symbols(arguments);
        }
        if (name == "workspace_symbols"sv) {
            return workspace_symbols(arguments);
        }
        if (name == "diagnostics"sv) {
            return diagnostics(arguments);
        }
        if (name == "code_actions"sv) {
            return code_actions(arguments);
        }
        if (name == "rename"sv) {
            return rename(arguments);
        }
        if (name == "semantic_tokens"sv) {
            return semantic_tokens(arguments);
        }
        if (name == "format_document"sv) {
            return format_document(arguments);
        }
        if (name == "format_range"sv) {
            return format_range(arguments);
        }
        if (name == "organize_imports"sv) {
            return organize_imports(arguments);
        }
        if (name == "add_import"sv) {
            return add_import(arguments);
        }
        if (name == "create_config"sv) {
            return create_config();
        }
        if (name == "restart_server"sv) {
            return restart_server();
        }
        throw tool_error{"Unknown tool: {}"_format(name)};
    }

    // ── Navigation ──────────────────────────────────────────────────

    std::string toolbox::hover(std::string_view arguments) {
        auto args = detail::parse_args<detail::position_args>("hover"sv, arguments);
        auto position = detail::position_of(args.line, args.character);
        auto uri = workspace_.ensure_open(args.file_path);

        auto result = bridge_.call(
                "textDocument/hover",
                detail::to_json(detail::text_document_position_params{.textDocument = {uri}, .position = position}));
        if (detail::is_null_result(result)) {
            return std::string{detail::no_hover};
        }
        return result;
    }

    std::string toolbox::locate(std::string_view method, std::string_view arguments) {
        auto args = detail::parse_args<detail::position_args>(method, arguments);
        auto position = detail::position_of(args.line, args.character);
        auto uri = workspace_.ensure_open(args.file_path);

        return bridge_.call(
                method,
                detail::to_json(detail::text_document_position_params{.textDocument = {uri}, .position = position}));
    }

    std::string toolbox::completion(std::string_view arguments) {
        auto args = detail::parse_args<detail::completion_args>("completion"sv, arguments);
        auto position = detail::position_of(args.line, args.character);
        auto uri = workspace_.ensure_open(args.file_path);

        auto result = bridge_.call(
                "textDocument/completion",
                detail::to_json(detail::text_document_position_params{.textDocument = {uri}, .position = position}));

        // CompletionList or CompletionItem[]
        auto parsed = detail::parse_result("textDocument/completion"sv, result);
        std::vector<glz::generic> items{};
        if (parsed.is_object() && parsed.contains("items")) {
            items = detail::take_array(parsed["items"]);
        }
        else {
            items = detail::take_array(parsed);
        }

        detail::sort_completions(items);
        return paginate(std::move(items), page(args.offset, args.limit));
    }

    std::string toolbox::references(std::string_view arguments) {
        auto args = detail::parse_args<detail::references_args>("references"sv, arguments);
        auto position = detail::position_of(args.line, args.character);
        auto uri = workspace_.ensure_open(args.file_path);

        detail::reference_params params{
                .textDocument = {uri},
                .position = position,
                .context = {.includeDeclaration = args.include_declaration.value_or(true)}};
        auto result = bridge_.call("textDocument/references", detail::to_json(params));

        auto parsed = detail::parse_result("textDocument/references"sv, result);
        auto items = detail::take_array(parsed);
        detail::sort_locations(items);
        return paginate(std::move(items), page(args.offset, args.limit));
    }

    std::string toolbox::document_symbols(std::string_view arguments) {
        auto args = detail::parse_args<detail::document_symbols_args>("document_symbols"sv, arguments);
        auto uri = workspace_.ensure_open(args.file_path);

        auto result = bridge_.call(
                "textDocument/documentSymbol", detail::to_json(detail::document_params{.textDocument = {uri}}));

        auto parsed = detail::parse_result("textDocument/documentSymbol"sv, result);
        auto symbols = detail::take_array(parsed);

        // DocumentSymbol trees are flattened; SymbolInformation lists (they carry a location) already are flat
        if (!symbols.empty() && symbols.front().is_object() && !symbols.front().contains("location")) {
            std::vector<glz::generic> flat{};
            detail::flatten_symbols(symbols, {}, flat);
            symbols = std::move(flat);
        }

        detail::sort_by_start(symbols);
        return paginate(std::move(symbols), page(args.offset, args.limit));
    }

    std::string toolbox::workspace_symbols(std::string_view arguments) {
        auto args = detail::parse_args<detail::workspace_symbols_args>("workspace_symbols"sv, arguments);

        auto result =
                bridge_.call("workspace/symbol", detail::to_json(detail::workspace_symbol_params{.query = args.query}));

        auto parsed = detail::parse_result("workspace/symbol"sv, result);
        auto symbols = detail::take_array(parsed);
        detail::sort_workspace_symbols(symbols);
        return paginate(std::move(symbols), page(args.offset, args.limit));
    }

    std::string toolbox::diagnostics(std::string_view arguments) {
        auto args = detail::parse_args<detail::diagnostics_args>("diagnostics"sv, arguments);

        std::vector<glz::generic> items{};
        if (args.file_path) {
            auto uri = workspace_.ensure_open(*args.file_path);
            if (auto raw = workspace_.diagnostics_for(uri)) {
                detail::append_diagnostics(uri, *raw, items);
            }
        }
        else {
            for (const auto& [uri, raw] : workspace_.all_diagnostics()) {
                detail::append_diagnostics(uri, raw, items);
            }
        }

        detail::sort_diagnostics(items);
        return paginate(std::move(items), page(args.offset, args.limit));
    }

    // ── Code intelligence ───────────────────────────────────────────

    std::string toolbox::code_actions(std::string_view arguments) {
        auto args = detail::parse_args<detail::range_args>("code_actions"sv, arguments);
        auto range = detail::range_of(args);
        auto uri = workspace_.ensure_open(args.file_path);

        detail::code_action_params params{
                .textDocument = {uri},
                .range = range,
                .context = {.diagnostics = glz::raw_json{workspace_.diagnostics_for(uri).value_or("[]")}}};
        return bridge_.call("textDocument/codeAction", detail::to_json(params));
    }

    std::string toolbox::rename(std::string_view arguments) {
        auto args = detail::parse_args<detail::rename_args>("rename"sv, arguments);
        auto position = detail::position_of(args.line, args.character);
        if (args.new_name.empty()) {
            throw tool_error{"new_name must not be empty"};
        }
        auto uri = workspace_.ensure_open(args.file_path);

        auto prepared = bridge_.call(
                "textDocument/prepareRename",
                detail::to_json(detail::text_document_position_params{.textDocument = {uri}, .position = position}));
        if (detail::is_null_result(prepared)) {
            throw detail::tool_failure{"Cannot rename at this position"};
        }

        return bridge_.call(
                "textDocument/rename",
                detail::to_json(
                        detail::rename_params{.textDocument = {uri}, .position = position, .newName = args.new_name}));
    }

    std::string toolbox::semantic_tokens(std::string_view arguments) {
        auto args = detail::parse_args<detail::file_args>("semantic_tokens"sv, arguments);
        auto uri = workspace_.ensure_open(args.file_path);
        return bridge_.call(
                "textDocument/semanticTokens/full", detail::to_json(detail::document_params{.textDocument = {uri}}));
    }

    // ── Formatting ──────────────────────────────────────────────────

    std::string toolbox::format_document(std::string_view arguments) {
        auto args = detail::parse_args<detail::format_document_args>("format_document"sv, arguments);
        auto options = detail::formatting_of(args);
        auto uri = workspace_.ensure_open(args.file_path);

        return bridge_.call(
                "textDocument/formatting",
                detail::to_json(detail::document_formatting_params{.textDocument = {uri}, .options = options}));
    }

    std::string toolbox::format_range(std::string_view arguments) {
        auto args = detail::parse_args<detail::format_range_args>("format_range"sv, arguments);
        auto range = detail::range_of(args);
        auto options = detail::formatting_of(args);
        auto uri = workspace_.ensure_open(args.file_path);

        return bridge_.call(
                "textDocument/rangeFormatting",
                detail::to_json(
                        detail::range_formatting_params{.textDocument = {uri}, .range = range, .options = options}));
    }

    // ── Imports ─────────────────────────────────────────────────────

    std::string toolbox::organize_imports(std::string_view arguments) {
        auto args = detail::parse_args<detail::file_args>("organize_imports"sv, arguments);
        auto uri = workspace_.ensure_open(args.file_path);
        (void)workspace_.take_applied_edit();

        auto result = bridge_.call(
                "workspace/executeCommand",
                detail::to_json(detail::execute_command_params{.command = "pyright.organizeimports", .arguments = {uri}}));

        // TextEdit[] directly, a WorkspaceEdit, or an edit pushed through workspace/applyEdit
        auto parsed = detail::parse_result("workspace/executeCommand"sv, result);
        if (parsed.is_array()) {
            return json::dump(parsed);
        }
        if (const auto* edits = json::find_path(parsed, {"changes"sv, uri})) {
            return json::dump(*edits);
        }
        if (auto pushed = workspace_.take_applied_edit()) {
            auto edit = detail::parse_result("workspace/applyEdit"sv, *pushed);
            if (const auto* edits = json::find_path(edit, {"changes"sv, uri})) {
                return json::dump(*edits);
            }
        }
        return "[]";
    }

    std::string toolbox::add_import(std::string_view arguments) {
        auto args = detail::parse_args<detail::position_args>("add_import"sv, arguments);
        auto position = detail::position_of(args.line, args.character);
        auto uri = workspace_.ensure_open(args.file_path);

        detail::code_action_params params{
                .textDocument = {uri},
                .range = {.start = position, .end = position},
                .context = {.diagnostics = glz::raw_json{workspace_.diagnostics_for(uri).value_or("[]")}}};
        auto result = bridge_.call("textDocument/codeAction", detail::to_json(params));

        auto parsed = detail::parse_result("textDocument/codeAction"sv, result);
        for (const auto& action : detail::take_array(parsed)) {
            if (json::string_or(json::find(action, "kind"sv)) != "quickfix"sv) {
                continue;
            }
            if (!utils::str_case_contains(json::string_or(json::find(action, "title"sv)), "import"sv)) {
                continue;
            }
            if (const auto* edit = json::find(action, "edit"sv)) {
                return json::dump(*edit);
            }
        }
        throw detail::tool_failure{"No import action available"};
    }

    // ── Project ─────────────────────────────────────────────────────

    std::string toolbox::create_config() {
        if (!write_default_project_config(workspace_.root())) {
            return "{} already exists"_format(project_config_name);
        }
        workspace_.reload_config();
        info_log("created ", (workspace_.root() / project_config_name).string());
        return "Created {}"_format(project_config_name);
    }

    std::string toolbox::restart_server() {
        bridge_.restart();
        return "language server restarted successfully";
    }

}  // namespace langbridge::tools
