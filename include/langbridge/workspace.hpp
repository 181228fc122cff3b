#pragma once

#include "lsp/client.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace langbridge {

    class workspace_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    inline constexpr auto project_config_name = "pyrightconfig.json"sv;

    // Keys of pyrightconfig.json the bridge itself reads; the full document is kept as raw JSON.
    struct pyright_settings {
        std::optional<std::string> pythonPath{};
        std::optional<std::string> venvPath{};
        std::optional<std::string> venv{};
        std::optional<std::string> typeCheckingMode{};
        std::optional<std::string> pythonVersion{};
        std::optional<std::string> pythonPlatform{};
        std::optional<std::vector<std::string>> extraPaths{};
        struct glaze {
            using T = pyright_settings;
            static constexpr auto value = glz::object(
                    &T::pythonPath,
                    &T::venvPath,
                    &T::venv,
                    &T::typeCheckingMode,
                    &T::pythonVersion,
                    &T::pythonPlatform,
                    &T::extraPaths);
        };
    };

    struct project_config {
        pyright_settings settings{};
        std::string raw{"{}"};
        bool loaded{false};
    };

    // Reads `<root>/pyrightconfig.json`. A missing file yields defaults; invalid JSON is logged and ignored.
    project_config load_project_config(const std::filesystem::path& root);

    // Writes a starter pyrightconfig.json; false when one already exists.
    bool write_default_project_config(const std::filesystem::path& root);

    bool looks_like_python_project(const std::filesystem::path& root);

    /*
     * Interpreter lookup order: `pythonPath` from the config (relative to root), then `venvPath`/`venv`, then the
     * conventional `.venv`, `venv`, `.pixi/envs/default` and `.pixi/envs/dev` directories.
     */
    std::optional<std::filesystem::path> find_python_interpreter(
            const std::filesystem::path& root, const pyright_settings& settings);

    std::vector<std::string> absolute_extra_paths(
            const std::filesystem::path& root, const pyright_settings& settings);

    std::string build_initialization_options(const std::filesystem::path& root, const project_config& config);

    // Result array for a `workspace/configuration` request, one object per requested item.
    std::string answer_configuration_request(
            const std::filesystem::path& root, const project_config& config, std::string_view params);

    std::string default_client_capabilities();

    /*
     * Project-side collaborator of the bridge: owns the project root and its configuration, keeps track of the
     * documents the current server instance has seen, and stores the latest diagnostics per document.
     *
     * The handlers it registers on the bridge refer to the workspace and are never removed, so destruction shuts
     * the bridge down. The bridge must not be started or restarted again once its workspace is gone.
     */
    class workspace {
      public:
        workspace(lsp::bridge_client& bridge, std::filesystem::path root, std::string language_id = "python");
        ~workspace();

        workspace(const workspace&) = delete;
        workspace& operator=(const workspace&) = delete;

        const std::filesystem::path& root() const { return root_; }
        project_config config() const;
        void reload_config();

        // Starts the bridge in the project root with this workspace's capabilities and options.
        void start();

        // `file://` URI for `path`; relative paths resolve against the project root.
        std::string document_uri(std::string_view path) const;

        // Sends textDocument/didOpen once per document and server instance; returns the document URI.
        std::string ensure_open(std::string_view path);

        bool is_open(std::string_view uri) const;

        // raw JSON diagnostics array last published for `uri`
        std::optional<std::string> diagnostics_for(std::string_view uri) const;
        std::map<std::string, std::string> all_diagnostics() const;

        // WorkspaceEdit from the latest workspace/applyEdit request, cleared by the call
        std::optional<std::string> take_applied_edit();

      private:
        lsp::bridge_client& bridge_;
        std::filesystem::path root_;
        std::string language_id_;

        mutable std::mutex mutex_{};
        project_config config_{};
        std::set<std::string, std::less<>> opened_{};
        // bumped for every server instance that completes its handshake
        std::uint64_t server_generation_{0};
        std::map<std::string, std::string, std::less<>> diagnostics_{};
        std::optional<std::string> applied_edit_{};

        void on_publish_diagnostics(const lsp::notification& n);
        void on_log_message(const lsp::notification& n);
        std::string on_apply_edit(const lsp::request& r);
    };

}  // namespace langbridge
