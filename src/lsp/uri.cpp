#include "langbridge/lsp/uri.hpp"

#include "langbridge/utils.hpp"

#include <array>

using namespace std::string_view_literals;

namespace langbridge::lsp {

    namespace detail {

        static constexpr auto file_scheme = "file://"sv;
        static constexpr std::array<char, 16> hex_digits{
                '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

        // RFC 3986 unreserved characters plus the sub-delims and separators legal in a path segment
        static constexpr bool keep_in_path(char c) {
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                return true;
            }
            return "-._~/!$&'()*+,;=:@"sv.find(c) != std::string_view::npos;
        }

        static int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            c = utils::char_tolower(c);
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            return -1;
        }

        static std::string percent_encode(std::string_view path) {
            std::string out{};
            out.reserve(path.size());
            for (char c : path) {
                if (keep_in_path(c)) {
                    out.push_back(c);
                    continue;
                }
                auto byte = static_cast<unsigned char>(c);
                out.push_back('%');
                out.push_back(hex_digits[byte >> 4U]);
                out.push_back(hex_digits[byte & 0x0FU]);
            }
            return out;
        }

        static std::string percent_decode(std::string_view text) {
            std::string out{};
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '%' && i + 2 < text.size()) {
                    auto hi = hex_value(text[i + 1]);
                    auto lo = hex_value(text[i + 2]);
                    if (hi >= 0 && lo >= 0) {
                        out.push_back(static_cast<char>((hi << 4) | lo));
                        i += 2;
                        continue;
                    }
                }
                out.push_back(text[i]);
            }
            return out;
        }

    }  // namespace detail

    std::string to_file_uri(std::string_view path) {
        if (path.starts_with(detail::file_scheme)) {
            return std::string{path};
        }
        auto absolute = std::filesystem::absolute(std::filesystem::path{path}).lexically_normal();
        return std::string{detail::file_scheme} + detail::percent_encode(absolute.generic_string());
    }

    std::filesystem::path from_file_uri(std::string_view uri) {
        if (!uri.starts_with(detail::file_scheme)) {
            return std::filesystem::path{uri};
        }
        auto rest = uri.substr(detail::file_scheme.size());
        // file://host/path; only the local host form is meaningful here
        if (!rest.starts_with('/')) {
            auto slash = rest.find('/');
            rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
        }
        return std::filesystem::path{detail::percent_decode(rest)};
    }

}  // namespace langbridge::lsp
