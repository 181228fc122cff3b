#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace langbridge {

    using namespace std::string_view_literals;

    /*
     * langbridge Startup Config Options
     *
     * Language server
     * - server_command: argv of the language server, run in stdio mode.
     *   PYRIGHT_PATH overrides it (whitespace split); --server overrides both.
     * - project_root: Working directory of the language server and root of the analyzed project.
     * - language_id: languageId sent with textDocument/didOpen.
     *
     * Bridge timing
     * - request_timeout_ms: Default per-call timeout. PYRIGHT_TIMEOUT (seconds) overrides it.
     * - startup_timeout_ms: Bound on the initialize handshake.
     * - shutdown_grace_ms: Time the server gets to exit on its own after shutdown/exit.
     * - max_frame_bytes: Largest accepted message body from the server.
     *
     * Recovery
     * - auto_restart: Restart the server when it exits unexpectedly.
     * - max_restarts: Upper bound on automatic restarts over the bridge lifetime.
     *
     * Front end
     * - page_size: Default `limit` for list-returning tools.
     *
     * Logging
     * - log: Minimum level written to stderr. LOG_LEVEL overrides the default.
     * - quiet/verbose: Shorthands for ERROR and DEBUG.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    inline constexpr auto default_server_command = "pyright-langserver --stdio"sv;
    inline constexpr auto server_path_env = "PYRIGHT_PATH"sv;
    inline constexpr auto request_timeout_env = "PYRIGHT_TIMEOUT"sv;
    inline constexpr auto log_level_env = "LOG_LEVEL"sv;

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warning"sv) || utils::str_case_eq(text, "warn"sv)) {
            out = log_level::warning;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv) || utils::str_case_eq(text, "critical"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv) || utils::str_case_eq(text, "none"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    // seconds, as PYRIGHT_TIMEOUT spells it ("60", "12.5")
    inline std::optional<int> parse_timeout_seconds(std::string_view text) {
        auto seconds = utils::parse_arithmetic<double>(utils::trim_ascii(text));
        if (!seconds || *seconds <= 0.0 || *seconds > 86'400.0) {
            return std::nullopt;
        }
        return static_cast<int>(*seconds * 1000.0);
    }

    struct startup_config {
        std::vector<std::string> server_command{utils::split_whitespace(default_server_command)};
        std::filesystem::path project_root{"."};
        std::string language_id{"python"};

        int request_timeout_ms{60'000};
        int startup_timeout_ms{30'000};
        int shutdown_grace_ms{2'000};
        std::size_t max_frame_bytes{64U << 20U};

        bool auto_restart{true};
        int max_restarts{3};

        int page_size{50};

        log_level log{log_level::info};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

    // Applies PYRIGHT_PATH, PYRIGHT_TIMEOUT and LOG_LEVEL. Invalid values are reported and ignored.
    void apply_environment(startup_config& cfg);

}  // namespace langbridge
