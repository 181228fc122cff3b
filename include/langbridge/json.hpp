#pragma once

#include <glaze/glaze.hpp>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

namespace langbridge::json {

    // Member lookup on a generic value that is never mutated; nullptr when `value` is not an object or lacks `key`.
    inline const glz::generic* find(const glz::generic& value, std::string_view key) {
        if (!value.is_object()) {
            return nullptr;
        }
        const auto& object = value.get_object();
        auto it = object.find(key);
        return it == object.end() ? nullptr : &it->second;
    }

    inline const glz::generic* find_path(const glz::generic& value, std::initializer_list<std::string_view> keys) {
        const glz::generic* current = &value;
        for (auto key : keys) {
            current = find(*current, key);
            if (current == nullptr) {
                return nullptr;
            }
        }
        return current;
    }

    inline double number_or(const glz::generic* value, double fallback = 0.0) {
        return value != nullptr && value->is_number() ? value->get_number() : fallback;
    }

    inline std::string string_or(const glz::generic* value, std::string_view fallback = {}) {
        return value != nullptr && value->is_string() ? value->get_string() : std::string{fallback};
    }

    inline std::string dump(const glz::generic& value) {
        std::string out{};
        if (auto ec = glz::write_json(value, out); ec) {
            throw std::runtime_error{"failed to serialize JSON value: " + glz::format_error(ec, out)};
        }
        return out;
    }

}  // namespace langbridge::json
