#pragma once

#include "langbridge/utils.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace langbridge::lsp {

    using namespace std::string_view_literals;

    // Requests we originate always carry integer ids; the server may use strings.
    using message_id = std::variant<std::int64_t, std::string>;

    inline std::string to_string(const message_id& id) {
        if (auto* number = std::get_if<std::int64_t>(&id)) {
            return std::to_string(*number);
        }
        return std::get<std::string>(id);
    }

    namespace error_code {
        inline constexpr std::int64_t parse_error = -32700;
        inline constexpr std::int64_t invalid_request = -32600;
        inline constexpr std::int64_t method_not_found = -32601;
        inline constexpr std::int64_t invalid_params = -32602;
        inline constexpr std::int64_t internal_error = -32603;
        inline constexpr std::int64_t server_not_initialized = -32002;
        inline constexpr std::int64_t request_cancelled = -32800;
        inline constexpr std::int64_t content_modified = -32801;
    }  // namespace error_code

    /*
     * Payloads (`params`, `result`, `error.data`) are kept as raw JSON text; the bridge never
     * interprets them. An empty `params` means the member is omitted on the wire.
     */
    struct response_error {
        std::int64_t code{};
        std::string message{};
        std::optional<std::string> data{};

        bool operator==(const response_error&) const = default;
    };

    struct request {
        message_id id{};
        std::string method{};
        std::string params{};

        bool operator==(const request&) const = default;
    };

    struct response {
        message_id id{};
        std::string result{"null"};
        std::optional<response_error> error{};

        bool operator==(const response&) const = default;
    };

    struct notification {
        std::string method{};
        std::string params{};

        bool operator==(const notification&) const = default;
    };

    using message = std::variant<request, response, notification>;

    // ── Errors ──────────────────────────────────────────────────────

    class bridge_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // executable could not be launched, or the initialize handshake failed
    class startup_error : public bridge_error {
      public:
        using bridge_error::bridge_error;
    };

    // one malformed frame; the stream itself stays usable
    class framing_error : public bridge_error {
      public:
        using bridge_error::bridge_error;
    };

    // the byte stream ended; terminal for a frame_reader
    class stream_closed : public bridge_error {
      public:
        explicit stream_closed(bool truncated, const std::string& what)
                : bridge_error{what}, truncated_{truncated} {}

        // true when the stream ended in the middle of a frame
        bool truncated() const noexcept { return truncated_; }

      private:
        bool truncated_{false};
    };

    class process_terminated_error : public bridge_error {
      public:
        using bridge_error::bridge_error;
    };

    class timeout_error : public bridge_error {
      public:
        using bridge_error::bridge_error;
    };

    // error object returned by the server, surfaced verbatim
    class remote_error : public bridge_error {
      public:
        explicit remote_error(response_error error)
                : bridge_error{std::format("{} (code: {})", error.message, error.code)}, error_{std::move(error)} {}

        std::int64_t code() const noexcept { return error_.code; }
        const std::string& message() const noexcept { return error_.message; }
        const std::optional<std::string>& data() const noexcept { return error_.data; }
        const response_error& error() const noexcept { return error_; }

      private:
        response_error error_{};
    };

}  // namespace langbridge::lsp
