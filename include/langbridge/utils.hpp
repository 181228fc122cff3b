#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace langbridge {

    using namespace std::string_view_literals;

    // stderr logger; stdout belongs to the MCP transport
    enum class log_level : uint8_t { debug, info, warning, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "DEBUG"sv;
            case log_level::info:
                return "INFO"sv;
            case log_level::warning:
                return "WARNING"sv;
            case log_level::error:
                return "ERROR"sv;
            case log_level::off:
                return "OFF"sv;
        }
        return "INFO"sv;
    }

    namespace detail {
        inline std::atomic<log_level> active_log_level{log_level::info};
        inline std::mutex log_mutex{};

        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        inline void prepend_header(std::ostream& os, log_level level, const std::source_location& loc) {
            auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
            os << std::format("{:%F %T}", now) << ' ' << to_string(level) << " [" << sloc_fname(loc) << ':'
               << loc.line() << "] ";
        }

        template <typename... Args>
        void emit_log(log_level level, const std::source_location& loc, Args&&... args) {
            if (level < active_log_level.load(std::memory_order_relaxed)) {
                return;
            }
            std::lock_guard lock{log_mutex};
            prepend_header(std::cerr, level, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::active_log_level.store(level, std::memory_order_relaxed);
    }

    inline log_level current_log_level() {
        return detail::active_log_level.load(std::memory_order_relaxed);
    }

    template <typename... Args>
    struct debug_log {
        explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct info_log {
        explicit info_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct warn_log {
        explicit warn_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::warning, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct error_log {
        explicit error_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::error, loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;
    template <typename... Args>
    info_log(Args&&...) -> info_log<Args...>;
    template <typename... Args>
    warn_log(Args&&...) -> warn_log<Args...>;
    template <typename... Args>
    error_log(Args&&...) -> error_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool str_case_contains(std::string_view haystack, std::string_view needle) {
            if (needle.empty()) {
                return true;
            }
            if (haystack.size() < needle.size()) {
                return false;
            }
            for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
                if (str_case_eq(haystack.substr(i, needle.size()), needle)) {
                    return true;
                }
            }
            return false;
        }

        constexpr std::string_view trim_ascii(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::vector<std::string> split_whitespace(std::string_view text) {
            std::vector<std::string> parts{};
            for (auto word : text | std::views::split(' ')) {
                auto token = trim_ascii(std::string_view{word.begin(), word.end()});
                if (!token.empty()) {
                    parts.emplace_back(token);
                }
            }
            return parts;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace langbridge
