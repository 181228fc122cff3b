#include "langbridge/pagination.hpp"

#include "langbridge/format.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

using namespace langbridge::literals;

namespace langbridge {

    namespace detail {

        struct page_envelope {
            std::vector<glz::generic> items{};
            std::int64_t totalItems{};
            std::int64_t offset{};
            std::int64_t limit{};
            bool hasMore{false};
            std::optional<std::int64_t> nextOffset{};
            struct glaze {
                using T = page_envelope;
                static constexpr auto value = glz::object(
                        &T::items, &T::totalItems, &T::offset, &T::limit, &T::hasMore, &T::nextOffset);
            };
        };

    }  // namespace detail

    std::string paginate(std::vector<glz::generic> items, const page_request& page) {
        if (page.offset < 0) {
            throw std::invalid_argument{"offset must not be negative (got {})"_format(page.offset)};
        }
        if (page.limit <= 0) {
            throw std::invalid_argument{"limit must be positive (got {})"_format(page.limit)};
        }

        auto total = static_cast<std::int64_t>(items.size());
        auto start = std::min(page.offset, total);
        auto end = std::min(start + page.limit, total);

        detail::page_envelope envelope{
                .totalItems = total, .offset = page.offset, .limit = page.limit, .hasMore = end < total};
        if (envelope.hasMore) {
            envelope.nextOffset = end;
        }

        envelope.items.reserve(static_cast<size_t>(end - start));
        for (auto i = start; i < end; ++i) {
            auto& item = items[static_cast<size_t>(i)];
            if (item.is_object()) {
                item["offset"] = static_cast<double>(i);
            }
            envelope.items.push_back(std::move(item));
        }

        std::string json{};
        if (auto ec = glz::write<glz::opts{.skip_null_members = false}>(envelope, json); ec) {
            throw std::runtime_error{"failed to serialize page: {}"_format(glz::format_error(ec, json))};
        }
        return json;
    }

}  // namespace langbridge
