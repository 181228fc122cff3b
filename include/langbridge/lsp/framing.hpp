#pragma once

#include "protocol.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace langbridge::lsp {

    inline constexpr std::size_t default_max_frame_bytes = 64U << 20U;
    inline constexpr std::size_t max_header_bytes = 16U << 10U;

    // Serializes `msg` as `Content-Length: N\r\n\r\n<body>`; throws framing_error if the body cannot be written.
    std::string encode(const message& msg);

    // JSON body only, no header block
    std::string encode_body(const message& msg);

    // Classifies one JSON-RPC body: method+id is a request, method alone a notification, id alone a response.
    std::expected<message, framing_error> parse_message(std::string_view body);

    /*
     * Push-based incremental decoder. Bytes arrive in arbitrary chunks through `feed`; each call to `next`
     * yields one complete frame, a framing_error for one skipped header block or body, or nothing when more
     * input is needed. A framing error never poisons the stream: decoding resumes at the next header block.
     */
    class frame_decoder {
      public:
        explicit frame_decoder(std::size_t max_body_bytes = default_max_frame_bytes)
                : max_body_bytes_{max_body_bytes} {}

        void feed(std::string_view bytes) { buffer_.append(bytes); }

        std::optional<std::expected<message, framing_error>> next();

        // true when buffered input holds part of a frame
        bool mid_frame() const noexcept;

        std::size_t buffered() const noexcept { return buffer_.size(); }

      private:
        std::size_t max_body_bytes_;
        std::string buffer_{};
        std::optional<std::size_t> body_length_{};
        std::size_t skip_remaining_{0};

        std::optional<std::expected<std::size_t, framing_error>> take_header_block();
    };

    /*
     * Pull-based frame sequence over a readable file descriptor (not owned). `next` blocks until one frame
     * or framing error is available. End of input throws stream_closed, every time it is called afterwards.
     */
    class frame_reader {
      public:
        explicit frame_reader(int fd, std::size_t max_body_bytes = default_max_frame_bytes)
                : fd_{fd}, decoder_{max_body_bytes} {}

        frame_reader(const frame_reader&) = delete;
        frame_reader& operator=(const frame_reader&) = delete;

        std::expected<message, framing_error> next();

      private:
        int fd_;
        frame_decoder decoder_;
        bool closed_{false};
        bool truncated_{false};
    };

}  // namespace langbridge::lsp
