#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace langbridge::lsp {

    // `file://` URIs pass through unchanged; other paths are made absolute and percent-encoded.
    std::string to_file_uri(std::string_view path);

    // Filesystem path of a `file://` URI; anything else is returned as given.
    std::filesystem::path from_file_uri(std::string_view uri);

}  // namespace langbridge::lsp
