#include "langbridge/workspace.hpp"

#include "langbridge/format.hpp"
#include "langbridge/json.hpp"
#include "langbridge/lsp/uri.hpp"

#include <array>
#include <fstream>
#include <iterator>
#include <utility>

using namespace langbridge::literals;
using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace langbridge {

    namespace detail {

        // ── Initialization options ──────────────────────────────────────

        struct analysis_options {
            std::string typeCheckingMode{"basic"};
            bool autoSearchPaths{true};
            bool useLibraryCodeForTypes{true};
            std::string diagnosticMode{"workspace"};
            std::optional<std::vector<std::string>> extraPaths{};
            struct glaze {
                using T = analysis_options;
                static constexpr auto value = glz::object(
                        &T::typeCheckingMode,
                        &T::autoSearchPaths,
                        &T::useLibraryCodeForTypes,
                        &T::diagnosticMode,
                        &T::extraPaths);
            };
        };

        struct python_options {
            analysis_options analysis{};
            std::optional<std::string> pythonPath{};
            std::optional<std::string> pythonVersion{};
            std::optional<std::string> pythonPlatform{};
            struct glaze {
                using T = python_options;
                static constexpr auto value =
                        glz::object(&T::analysis, &T::pythonPath, &T::pythonVersion, &T::pythonPlatform);
            };
        };

        struct initialization_options {
            python_options python{};
            struct glaze {
                using T = initialization_options;
                static constexpr auto value = glz::object(&T::python);
            };
        };

        // ── workspace/configuration ─────────────────────────────────────

        struct configuration_item {
            std::optional<std::string> scopeUri{};
            std::optional<std::string> section{};
            struct glaze {
                using T = configuration_item;
                static constexpr auto value = glz::object(&T::scopeUri, &T::section);
            };
        };

        struct configuration_params {
            std::vector<configuration_item> items{};
            struct glaze {
                using T = configuration_params;
                static constexpr auto value = glz::object(&T::items);
            };
        };

        struct python_section {
            std::optional<std::string> defaultInterpreterPath{};
            std::optional<std::string> pythonPath{};
            struct glaze {
                using T = python_section;
                static constexpr auto value = glz::object(&T::defaultInterpreterPath, &T::pythonPath);
            };
        };

        struct analysis_section {
            std::optional<std::vector<std::string>> extraPaths{};
            std::optional<std::string> typeCheckingMode{};
            struct glaze {
                using T = analysis_section;
                static constexpr auto value = glz::object(&T::extraPaths, &T::typeCheckingMode);
            };
        };

        // ── Notifications ───────────────────────────────────────────────

        struct publish_diagnostics_params {
            std::string uri{};
            glz::raw_json diagnostics{"[]"};
            struct glaze {
                using T = publish_diagnostics_params;
                static constexpr auto value = glz::object(&T::uri, &T::diagnostics);
            };
        };

        struct apply_edit_params {
            std::optional<std::string> label{};
            glz::raw_json edit{"{}"};
            struct glaze {
                using T = apply_edit_params;
                static constexpr auto value = glz::object(&T::label, &T::edit);
            };
        };

        // edits are handed back to the tool caller; the bridge never touches files
        static constexpr auto apply_edit_reply =
                R"json({"applied":false,"failureReason":"edits are returned to the caller"})json"sv;

        struct log_message_params {
            int type{4};
            std::string message{};
            struct glaze {
                using T = log_message_params;
                static constexpr auto value = glz::object(&T::type, &T::message);
            };
        };

        struct text_document_item {
            std::string uri{};
            std::string languageId{};
            int version{1};
            std::string text{};
            struct glaze {
                using T = text_document_item;
                static constexpr auto value = glz::object(&T::uri, &T::languageId, &T::version, &T::text);
            };
        };

        struct did_open_params {
            text_document_item textDocument{};
            struct glaze {
                using T = did_open_params;
                static constexpr auto value = glz::object(&T::textDocument);
            };
        };

        // ── Starter config ──────────────────────────────────────────────

        struct define_constants {
            bool debug{true};
            struct glaze {
                using T = define_constants;
                static constexpr auto value = glz::object("DEBUG", &T::debug);
            };
        };

        struct execution_environment {
            std::string root{"."};
            struct glaze {
                using T = execution_environment;
                static constexpr auto value = glz::object(&T::root);
            };
        };

        struct starter_config {
            std::vector<std::string> include{"**/*.py"};
            std::vector<std::string> exclude{"**/node_modules", "**/__pycache__", "**/.*"};
            define_constants defineConstant{};
            std::string typeCheckingMode{"basic"};
            std::string pythonVersion{"3.10"};
            std::string pythonPlatform{"Linux"};
            std::vector<execution_environment> executionEnvironments{execution_environment{}};
            struct glaze {
                using T = starter_config;
                static constexpr auto value = glz::object(
                        &T::include,
                        &T::exclude,
                        &T::defineConstant,
                        &T::typeCheckingMode,
                        &T::pythonVersion,
                        &T::pythonPlatform,
                        &T::executionEnvironments);
            };
        };

        static constexpr std::array project_markers{
                "setup.py"sv, "pyproject.toml"sv, "requirements.txt"sv, "pyrightconfig.json"sv};

        static constexpr std::array venv_directories{".venv"sv, "venv"sv, ".pixi/envs/default"sv, ".pixi/envs/dev"sv};

        static constexpr std::array interpreter_names{
                "bin/python"sv, "bin/python3"sv, "Scripts/python.exe"sv, "Scripts/python3.exe"sv};

        static constexpr auto client_capabilities =
                R"json({"textDocument":{"hover":{"contentFormat":["plaintext","markdown"]},"completion":{"completionItem":{"snippetSupport":true,"resolveSupport":{"properties":["documentation","detail","additionalTextEdits"]}}},"signatureHelp":{"signatureInformation":{"documentationFormat":["plaintext","markdown"],"parameterInformation":{"labelOffsetSupport":true}}},"definition":{"linkSupport":true},"typeDefinition":{"linkSupport":true},"implementation":{"linkSupport":true},"references":{},"documentHighlight":{},"documentSymbol":{"hierarchicalDocumentSymbolSupport":true},"formatting":{},"rangeFormatting":{},"rename":{"prepareSupport":true},"codeAction":{"codeActionLiteralSupport":{"codeActionKind":{"valueSet":["quickfix","refactor","refactor.extract","refactor.inline","refactor.rewrite","source","source.organizeImports"]}},"resolveSupport":{"properties":["edit"]}},"publishDiagnostics":{"relatedInformation":true},"callHierarchy":{},"semanticTokens":{"requests":{"full":true,"range":true},"tokenTypes":[],"tokenModifiers":[],"formats":["relative"]}},"workspace":{"applyEdit":true,"symbol":{},"executeCommand":{},"workspaceFolders":true,"configuration":true}})json"sv;

        static fs::path resolve_against(const fs::path& root, const fs::path& path) {
            return path.is_absolute() ? path : root / path;
        }

        static std::optional<fs::path> probe_interpreter(const fs::path& env_dir) {
            std::error_code ec{};
            for (auto name : interpreter_names) {
                auto candidate = env_dir / name;
                if (fs::exists(candidate, ec)) {
                    return candidate;
                }
            }
            return std::nullopt;
        }

        template <typename T>
        static std::string write_or_throw(const T& value) {
            std::string json{};
            if (auto ec = glz::write_json(value, json); ec) {
                throw workspace_error{"failed to serialize JSON: {}"_format(glz::format_error(ec, json))};
            }
            return json;
        }

    }  // namespace detail

    // ── Project configuration ───────────────────────────────────────

    bool looks_like_python_project(const fs::path& root) {
        std::error_code ec{};
        for (auto marker : detail::project_markers) {
            if (fs::exists(root / marker, ec)) {
                return true;
            }
        }
        return false;
    }

    project_config load_project_config(const fs::path& root) {
        project_config config{};
        auto path = root / project_config_name;

        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            return config;
        }

        std::ifstream in{path, std::ios::binary};
        if (!in) {
            warn_log("failed to read ", path.string());
            return config;
        }
        std::string text{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

        glz::generic document{};
        if (auto err = glz::read_json(document, text); err || !document.is_object()) {
            warn_log("ignoring invalid ", path.string(), ": ", err ? glz::format_error(err, text) : "not an object");
            return config;
        }

        pyright_settings settings{};
        if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(settings, text); err) {
            warn_log("ignoring malformed settings in ", path.string(), ": ", glz::format_error(err, text));
            return config;
        }

        config.settings = std::move(settings);
        config.raw = json::dump(document);
        config.loaded = true;
        info_log("loaded ", path.string());
        return config;
    }

    bool write_default_project_config(const fs::path& root) {
        auto path = root / project_config_name;
        std::error_code ec{};
        if (fs::exists(path, ec)) {
            return false;
        }

        std::string json{};
        if (auto err = glz::write<glz::opts{.prettify = true}>(detail::starter_config{}, json); err) {
            throw workspace_error{"failed to serialize {}: {}"_format(project_config_name, glz::format_error(err, json))};
        }

        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw workspace_error{"cannot write {}"_format(path.string())};
        }
        out << json << '\n';
        if (!out) {
            throw workspace_error{"failed writing {}"_format(path.string())};
        }
        return true;
    }

    std::optional<fs::path> find_python_interpreter(const fs::path& root, const pyright_settings& settings) {
        std::error_code ec{};

        if (settings.pythonPath) {
            auto path = detail::resolve_against(root, *settings.pythonPath);
            if (fs::exists(path, ec)) {
                return path;
            }
            warn_log("configured pythonPath not found: ", path.string());
        }

        if (settings.venv) {
            auto base = settings.venvPath ? detail::resolve_against(root, *settings.venvPath) : root;
            auto env_dir = detail::resolve_against(base, *settings.venv);
            if (auto found = detail::probe_interpreter(env_dir)) {
                return found;
            }
            warn_log("no Python interpreter in configured venv: ", env_dir.string());
        }

        for (auto dir : detail::venv_directories) {
            auto env_dir = root / dir;
            if (!fs::exists(env_dir, ec)) {
                continue;
            }
            if (auto found = detail::probe_interpreter(env_dir)) {
                return found;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> absolute_extra_paths(const fs::path& root, const pyright_settings& settings) {
        std::vector<std::string> paths{};
        if (!settings.extraPaths) {
            return paths;
        }
        for (const auto& path : *settings.extraPaths) {
            paths.push_back(detail::resolve_against(root, path).string());
        }
        return paths;
    }

    std::string build_initialization_options(const fs::path& root, const project_config& config) {
        const auto& settings = config.settings;

        detail::initialization_options options{};
        if (settings.typeCheckingMode) {
            options.python.analysis.typeCheckingMode = *settings.typeCheckingMode;
        }
        if (settings.extraPaths) {
            options.python.analysis.extraPaths = absolute_extra_paths(root, settings);
        }
        if (auto interpreter = find_python_interpreter(root, settings)) {
            info_log("using Python interpreter ", interpreter->string());
            options.python.pythonPath = interpreter->string();
        }
        options.python.pythonVersion = settings.pythonVersion;
        options.python.pythonPlatform = settings.pythonPlatform;

        return detail::write_or_throw(options);
    }

    std::string answer_configuration_request(
            const fs::path& root, const project_config& config, std::string_view params) {
        detail::configuration_params request{};
        if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, params); err) {
            throw lsp::remote_error{lsp::response_error{
                    .code = lsp::error_code::invalid_params,
                    .message = "invalid workspace/configuration params: {}"_format(glz::format_error(err, params))}};
        }

        std::vector<std::string> sections{};
        for (const auto& item : request.items) {
            auto section = item.section.value_or("");
            if (section == "python"sv) {
                detail::python_section answer{};
                if (auto interpreter = find_python_interpreter(root, config.settings)) {
                    answer.defaultInterpreterPath = interpreter->string();
                    answer.pythonPath = interpreter->string();
                }
                sections.push_back(detail::write_or_throw(answer));
            }
            else if (section == "python.analysis"sv) {
                detail::analysis_section answer{};
                if (config.settings.extraPaths) {
                    answer.extraPaths = absolute_extra_paths(root, config.settings);
                }
                answer.typeCheckingMode = config.settings.typeCheckingMode;
                sections.push_back(detail::write_or_throw(answer));
            }
            else if (section == "pyright"sv) {
                sections.push_back(config.raw);
            }
            else {
                sections.emplace_back("{}");
            }
        }

        return "[{}]"_format(utils::join_with_separator(sections, ","));
    }

    std::string default_client_capabilities() {
        return std::string{detail::client_capabilities};
    }

    // ── workspace ───────────────────────────────────────────────────

    workspace::workspace(lsp::bridge_client& bridge, fs::path root, std::string language_id)
            : bridge_{bridge}, root_{fs::absolute(root).lexically_normal()}, language_id_{std::move(language_id)} {
        if (!looks_like_python_project(root_)) {
            warn_log("no Python project files in ", root_.string(), "; consider creating ", project_config_name);
        }
        config_ = load_project_config(root_);

        bridge_.on_notification(
                "textDocument/publishDiagnostics", [this](const lsp::notification& n) { on_publish_diagnostics(n); });
        bridge_.on_notification("window/logMessage", [this](const lsp::notification& n) { on_log_message(n); });
        bridge_.on_notification("window/showMessage", [this](const lsp::notification& n) { on_log_message(n); });

        bridge_.on_request("workspace/configuration", [this](const lsp::request& r) {
            return answer_configuration_request(root_, config(), r.params);
        });
        bridge_.on_request("window/workDoneProgress/create", [](const lsp::request&) { return std::string{"null"}; });
        bridge_.on_request("client/registerCapability", [](const lsp::request&) { return std::string{"null"}; });
        bridge_.on_request("workspace/applyEdit", [this](const lsp::request& r) { return on_apply_edit(r); });

        // a new server instance has seen none of our documents
        bridge_.on_ready([this] {
            std::lock_guard lock{mutex_};
            opened_.clear();
            ++server_generation_;
        });
    }

    workspace::~workspace() {
        try {
            bridge_.shutdown();
        } catch (const std::exception& e) {
            warn_log("language server shutdown failed: ", e.what());
        }
    }

    project_config workspace::config() const {
        std::lock_guard lock{mutex_};
        return config_;
    }

    void workspace::reload_config() {
        auto fresh = load_project_config(root_);
        std::lock_guard lock{mutex_};
        config_ = std::move(fresh);
    }

    void workspace::start() {
        info_log("starting language server in ", root_.string());
        bridge_.start(root_, default_client_capabilities(), build_initialization_options(root_, config()));
    }

    std::string workspace::document_uri(std::string_view path) const {
        if (path.starts_with("file://"sv)) {
            return std::string{path};
        }
        return lsp::to_file_uri(detail::resolve_against(root_, fs::path{path}).string());
    }

    std::string workspace::ensure_open(std::string_view path) {
        auto uri = document_uri(path);
        std::uint64_t generation{};
        {
            std::lock_guard lock{mutex_};
            if (opened_.contains(uri)) {
                return uri;
            }
            generation = server_generation_;
        }

        auto file = lsp::from_file_uri(uri);
        std::ifstream in{file, std::ios::binary};
        if (!in) {
            throw workspace_error{"cannot read {}"_format(file.string())};
        }
        std::string text{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

        detail::did_open_params params{
                .textDocument = {.uri = uri, .languageId = language_id_, .version = 1, .text = std::move(text)}};
        bridge_.notify("textDocument/didOpen", detail::write_or_throw(params));

        // a restart since the generation was read means the notify may have reached the old server
        std::lock_guard lock{mutex_};
        if (server_generation_ == generation) {
            opened_.insert(uri);
        }
        return uri;
    }

    bool workspace::is_open(std::string_view uri) const {
        std::lock_guard lock{mutex_};
        return opened_.contains(uri);
    }

    std::optional<std::string> workspace::diagnostics_for(std::string_view uri) const {
        std::lock_guard lock{mutex_};
        if (auto it = diagnostics_.find(uri); it != diagnostics_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::map<std::string, std::string> workspace::all_diagnostics() const {
        std::lock_guard lock{mutex_};
        return {diagnostics_.begin(), diagnostics_.end()};
    }

    void workspace::on_publish_diagnostics(const lsp::notification& n) {
        detail::publish_diagnostics_params params{};
        if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, n.params); err) {
            warn_log("malformed publishDiagnostics: ", glz::format_error(err, n.params));
            return;
        }
        debug_log("diagnostics updated for ", params.uri);
        std::lock_guard lock{mutex_};
        diagnostics_[params.uri] = std::move(params.diagnostics.str);
    }

    std::optional<std::string> workspace::take_applied_edit() {
        std::lock_guard lock{mutex_};
        return std::exchange(applied_edit_, std::nullopt);
    }

    std::string workspace::on_apply_edit(const lsp::request& r) {
        detail::apply_edit_params params{};
        if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, r.params); err) {
            throw lsp::remote_error{lsp::response_error{
                    .code = lsp::error_code::invalid_params,
                    .message = "invalid workspace/applyEdit params: {}"_format(glz::format_error(err, r.params))}};
        }
        debug_log("server pushed an edit: ", params.label.value_or("(unlabeled)"));
        std::lock_guard lock{mutex_};
        applied_edit_ = std::move(params.edit.str);
        return std::string{detail::apply_edit_reply};
    }

    void workspace::on_log_message(const lsp::notification& n) {
        detail::log_message_params params{};
        if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, n.params); err) {
            debug_log("malformed ", n.method, ": ", glz::format_error(err, n.params));
            return;
        }
        switch (params.type) {
            case 1:
                error_log("[server] ", params.message);
                break;
            case 2:
                warn_log("[server] ", params.message);
                break;
            case 3:
                info_log("[server] ", params.message);
                break;
            default:
                debug_log("[server] ", params.message);
                break;
        }
    }

}  // namespace langbridge
