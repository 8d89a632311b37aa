#pragma once

#include <filesystem>
#include <string>

namespace attachq {

/// MIME type for a file based on its extension (case-insensitive).
/// Unknown extensions map to "application/octet-stream".
std::string guess_mime_type(const std::filesystem::path& path);

}  // namespace attachq
