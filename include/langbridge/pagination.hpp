#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace langbridge {

    inline constexpr std::int64_t default_page_size = 50;

    struct page_request {
        std::int64_t offset{0};
        std::int64_t limit{default_page_size};
    };

    /*
     * Slices `items` into the envelope list-returning tools answer with:
     *
     *  {"items": [...], "totalItems": N, "offset": o, "limit": l, "hasMore": b, "nextOffset": n|null}
     *
     * Every returned object gains an absolute "offset" member. Throws std::invalid_argument for a negative
     * offset or a non-positive limit.
     */
    std::string paginate(std::vector<glz::generic> items, const page_request& page);

}  // namespace langbridge
