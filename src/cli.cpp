#include "langbridge/cli.hpp"

#include "langbridge/format.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace langbridge::literals;

namespace langbridge {

    namespace detail {

        static std::optional<std::string_view> read_env(std::string_view name) {
            const char* value = std::getenv(std::string{name}.c_str());
            if (value == nullptr || utils::trim_ascii(value).empty()) {
                return std::nullopt;
            }
            return utils::trim_ascii(value);
        }

    }  // namespace detail

    void apply_environment(startup_config& cfg) {
        if (auto path = detail::read_env(server_path_env)) {
            cfg.server_command = utils::split_whitespace(*path);
        }

        if (auto timeout = detail::read_env(request_timeout_env)) {
            if (auto ms = parse_timeout_seconds(*timeout)) {
                cfg.request_timeout_ms = *ms;
            }
            else {
                warn_log("ignoring invalid {}={} (expected seconds)"_format(request_timeout_env, *timeout));
            }
        }

        if (auto level = detail::read_env(log_level_env)) {
            if (!try_parse_log_level(*level, cfg.log)) {
                warn_log("ignoring invalid {}={} (expected DEBUG|INFO|WARNING|ERROR)"_format(log_level_env, *level));
            }
        }
    }

    namespace cli {

        void print_config(const startup_config& cfg, std::ostream& os) {
            os << "server=" << utils::join_with_separator(cfg.server_command, " "sv) << '\n';
            os << "project_root=" << cfg.project_root.string() << '\n';
            os << "language_id=" << cfg.language_id << '\n';
            os << "request_timeout_ms=" << cfg.request_timeout_ms << '\n';
            os << "startup_timeout_ms=" << cfg.startup_timeout_ms << '\n';
            os << "shutdown_grace_ms=" << cfg.shutdown_grace_ms << '\n';
            os << "max_frame_bytes=" << cfg.max_frame_bytes << '\n';
            os << "auto_restart=" << (cfg.auto_restart ? "true" : "false") << '\n';
            os << "max_restarts=" << cfg.max_restarts << '\n';
            os << "page_size=" << cfg.page_size << '\n';
            os << "log_level=" << to_string(cfg.log) << '\n';
        }

        std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
            CLI::App app{"langbridge - language server tools over MCP"};
            app.name("langbridge-mcp");

            bool show_version = false;
            bool no_auto_restart = false;
            std::string server_arg{};
            std::string root_arg{cfg.project_root.string()};
            std::string log_arg{std::string{to_string(cfg.log)}};
            double timeout_arg = cfg.request_timeout_ms / 1000.0;

            app.add_flag("--version", show_version, "Print version and exit");
            app.add_option("--server", server_arg, "Language server command line (default: pyright-langserver --stdio)");
            app.add_option("-p,--project-root", root_arg, "Project root, also the server working directory");
            app.add_option("--language-id", cfg.language_id, "languageId sent with didOpen");
            app.add_option("-t,--timeout", timeout_arg, "Default per-request timeout in seconds");
            app.add_option("--startup-timeout", cfg.startup_timeout_ms, "Initialize handshake timeout in milliseconds");
            app.add_option("--shutdown-grace", cfg.shutdown_grace_ms, "Grace period for server exit in milliseconds");
            app.add_option("--max-frame-bytes", cfg.max_frame_bytes, "Largest accepted message body in bytes");
            app.add_flag("--no-auto-restart", no_auto_restart, "Do not restart the server after a crash");
            app.add_option("--max-restarts", cfg.max_restarts, "Bound on automatic restarts");
            app.add_option("--page-size", cfg.page_size, "Default page size for list results");
            app.add_option("--log-level", log_arg, "Log level: DEBUG|INFO|WARNING|ERROR|OFF");
            app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
            app.add_flag("-q,--quiet", cfg.quiet, "Only log errors");
            app.add_flag("-v,--verbose", cfg.verbose, "Log debug output");

            try {
                app.parse(argc, argv);
            } catch (const CLI::ParseError& e) {
                return std::optional<int>{app.exit(e)};
            }

            if (show_version) {
                std::cout << "langbridge 0.1.0\n";
                return std::optional<int>{0};
            }

            if (cfg.quiet && cfg.verbose) {
                std::cerr << "--quiet and --verbose are mutually exclusive\n";
                return std::optional<int>{2};
            }

            if (!try_parse_log_level(log_arg, cfg.log)) {
                std::cerr << "invalid --log-level value: " << log_arg << " (expected DEBUG|INFO|WARNING|ERROR|OFF)\n";
                return std::optional<int>{2};
            }
            if (cfg.quiet) {
                cfg.log = log_level::error;
            }
            if (cfg.verbose) {
                cfg.log = log_level::debug;
            }

            if (app.count("--timeout") > 0U) {
                if (timeout_arg <= 0.0 || timeout_arg > 86'400.0) {
                    std::cerr << "invalid --timeout value: " << timeout_arg << " (expected 0 < seconds <= 86400)\n";
                    return std::optional<int>{2};
                }
                cfg.request_timeout_ms = static_cast<int>(timeout_arg * 1000.0);
            }
            if (cfg.startup_timeout_ms <= 0 || cfg.shutdown_grace_ms < 0) {
                std::cerr << "timeouts must be positive\n";
                return std::optional<int>{2};
            }
            if (cfg.max_restarts < 0) {
                std::cerr << "invalid --max-restarts value: " << cfg.max_restarts << '\n';
                return std::optional<int>{2};
            }
            if (cfg.page_size <= 0) {
                std::cerr << "invalid --page-size value: " << cfg.page_size << " (expected a positive count)\n";
                return std::optional<int>{2};
            }
            if (cfg.max_frame_bytes == 0U) {
                std::cerr << "invalid --max-frame-bytes value: 0\n";
                return std::optional<int>{2};
            }

            if (app.count("--server") > 0U) {
                auto command = utils::split_whitespace(server_arg);
                if (command.empty()) {
                    std::cerr << "invalid --server value: empty command\n";
                    return std::optional<int>{2};
                }
                cfg.server_command = std::move(command);
            }
            cfg.project_root = root_arg;
            if (no_auto_restart) {
                cfg.auto_restart = false;
            }

            set_log_level(cfg.log);

            if (cfg.print_config) {
                print_config(cfg, std::cout);
                return std::optional<int>{0};
            }

            return std::nullopt;
        }

    }  // namespace cli

}  // namespace langbridge
