#include "langbridge/lsp/framing.hpp"

#include "langbridge/format.hpp"

#include <glaze/glaze.hpp>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <variant>

using namespace langbridge::literals;
using namespace std::string_view_literals;

namespace langbridge::lsp {

    namespace detail {

        // ── Wire types ──────────────────────────────────────────────────

        using wire_id = std::variant<std::int64_t, std::string>;

        struct wire_error {
            std::int64_t code{};
            std::string message{};
            std::optional<glz::raw_json> data{};
            struct glaze {
                using T = wire_error;
                static constexpr auto value = glz::object(&T::code, &T::message, &T::data);
            };
        };

        struct wire_message {
            std::string jsonrpc{"2.0"};
            std::optional<wire_id> id{};
            std::optional<std::string> method{};
            std::optional<glz::raw_json> params{};
            std::optional<glz::raw_json> result{};
            std::optional<wire_error> error{};
            struct glaze {
                using T = wire_message;
                static constexpr auto value =
                        glz::object(&T::jsonrpc, &T::id, &T::method, &T::params, &T::result, &T::error);
            };
        };

        static constexpr auto content_length_header = "content-length"sv;
        static constexpr auto header_terminator = "\r\n\r\n"sv;

        static std::optional<glz::raw_json> optional_raw(const std::string& text) {
            if (text.empty()) {
                return std::nullopt;
            }
            return glz::raw_json{text};
        }

        static wire_message to_wire(const message& msg) {
            wire_message wire{};
            std::visit(
                    [&wire](const auto& m) {
                        using M = std::decay_t<decltype(m)>;
                        if constexpr (std::is_same_v<M, request>) {
                            wire.id = m.id;
                            wire.method = m.method;
                            wire.params = optional_raw(m.params);
                        }
                        else if constexpr (std::is_same_v<M, notification>) {
                            wire.method = m.method;
                            wire.params = optional_raw(m.params);
                        }
                        else {
                            wire.id = m.id;
                            if (m.error) {
                                wire.error = wire_error{
                                        .code = m.error->code,
                                        .message = m.error->message,
                                        .data = m.error->data ? std::optional<glz::raw_json>{*m.error->data}
                                                              : std::nullopt};
                            }
                            else {
                                wire.result = glz::raw_json{m.result.empty() ? std::string{"null"} : m.result};
                            }
                        }
                    },
                    msg);
            return wire;
        }

        // `Content-Length` value, or a framing error for a header block that lacks a usable one
        static std::expected<std::size_t, framing_error> parse_header_block(std::string_view block) {
            std::optional<std::size_t> length{};
            while (!block.empty()) {
                auto eol = block.find("\r\n"sv);
                auto line = block.substr(0, eol);
                block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 2);

                auto colon = line.find(':');
                if (colon == std::string_view::npos) {
                    continue;
                }
                auto name = utils::trim_ascii(line.substr(0, colon));
                if (!utils::str_case_eq(name, content_length_header)) {
                    continue;
                }
                auto value = utils::trim_ascii(line.substr(colon + 1));
                auto parsed = utils::parse_arithmetic<std::size_t>(value);
                if (!parsed) {
                    return std::unexpected{framing_error{"invalid Content-Length header: '{}'"_format(value)}};
                }
                length = *parsed;
            }
            if (!length) {
                return std::unexpected{framing_error{"header block without Content-Length"}};
            }
            return *length;
        }

    }  // namespace detail

    std::string encode_body(const message& msg) {
        auto wire = detail::to_wire(msg);
        std::string body{};
        if (auto ec = glz::write_json(wire, body); ec) {
            throw framing_error{"failed to serialize message: {}"_format(glz::format_error(ec, body))};
        }
        return body;
    }

    std::string encode(const message& msg) {
        auto body = encode_body(msg);
        return "Content-Length: {}\r\n\r\n{}"_format(body.size(), body);
    }

    std::expected<message, framing_error> parse_message(std::string_view body) {
        detail::wire_message wire{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, body); ec) {
            return std::unexpected{framing_error{"malformed message body: {}"_format(glz::format_error(ec, body))}};
        }

        auto params = wire.params ? std::move(wire.params->str) : std::string{};

        if (wire.method) {
            if (wire.id) {
                return request{.id = std::move(*wire.id), .method = std::move(*wire.method), .params = std::move(params)};
            }
            return notification{.method = std::move(*wire.method), .params = std::move(params)};
        }

        if (!wire.id) {
            return std::unexpected{framing_error{"message has neither method nor id"}};
        }

        response resp{.id = std::move(*wire.id)};
        if (wire.error) {
            resp.error = response_error{
                    .code = wire.error->code,
                    .message = std::move(wire.error->message),
                    .data = wire.error->data ? std::optional<std::string>{std::move(wire.error->data->str)}
                                             : std::nullopt};
        }
        else if (wire.result) {
            resp.result = std::move(wire.result->str);
        }
        return resp;
    }

    // ── frame_decoder ───────────────────────────────────────────────

    bool frame_decoder::mid_frame() const noexcept {
        return !buffer_.empty() || body_length_.has_value() || skip_remaining_ > 0;
    }

    std::optional<std::expected<std::size_t, framing_error>> frame_decoder::take_header_block() {
        // blank lines between frames carry nothing
        while (buffer_.starts_with("\r\n"sv)) {
            buffer_.erase(0, 2);
        }

        auto end = buffer_.find(detail::header_terminator);
        if (end == std::string::npos) {
            if (buffer_.size() > max_header_bytes) {
                buffer_.clear();
                return std::unexpected{framing_error{"header block exceeds {} bytes"_format(max_header_bytes)}};
            }
            return std::nullopt;
        }

        auto length = detail::parse_header_block(std::string_view{buffer_}.substr(0, end));
        buffer_.erase(0, end + detail::header_terminator.size());
        return length;
    }

    std::optional<std::expected<message, framing_error>> frame_decoder::next() {
        for (;;) {
            if (skip_remaining_ > 0) {
                auto n = std::min(skip_remaining_, buffer_.size());
                buffer_.erase(0, n);
                skip_remaining_ -= n;
                if (skip_remaining_ > 0) {
                    return std::nullopt;
                }
            }

            if (!body_length_) {
                auto header = take_header_block();
                if (!header) {
                    return std::nullopt;
                }
                if (!*header) {
                    return std::unexpected{std::move(header->error())};
                }
                if (**header > max_body_bytes_) {
                    skip_remaining_ = **header;
                    return std::unexpected{
                            framing_error{"frame body of {} bytes exceeds limit of {}"_format(**header, max_body_bytes_)}};
                }
                body_length_ = **header;
            }

            if (buffer_.size() < *body_length_) {
                return std::nullopt;
            }

            auto body = buffer_.substr(0, *body_length_);
            buffer_.erase(0, *body_length_);
            body_length_.reset();
            return parse_message(body);
        }
    }

    // ── frame_reader ────────────────────────────────────────────────

    std::expected<message, framing_error> frame_reader::next() {
        char chunk[4096]{};
        for (;;) {
            if (closed_) {
                throw stream_closed{
                        truncated_, truncated_ ? "stream ended inside a frame" : "stream ended between frames"};
            }

            if (auto frame = decoder_.next()) {
                return std::move(*frame);
            }

            auto n = ::read(fd_, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0) {
                debug_log("read from fd ", fd_, " failed: ", std::strerror(errno));
            }
            if (n <= 0) {
                closed_ = true;
                truncated_ = decoder_.mid_frame();
                continue;
            }
            decoder_.feed(std::string_view{chunk, static_cast<std::size_t>(n)});
        }
    }

}  // namespace langbridge::lsp
