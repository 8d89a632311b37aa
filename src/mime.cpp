#include "attachq/mime.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace attachq {

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> by_extension = {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".heic", "image/heic"},
        {".heif", "image/heif"},
        {".bmp", "image/bmp"},
        {".svg", "image/svg+xml"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".webm", "video/webm"},
        {".mp3", "audio/mpeg"},
        {".m4a", "audio/mp4"},
        {".wav", "audio/wav"},
        {".pdf", "application/pdf"},
        {".json", "application/json"},
        {".zip", "application/zip"},
        {".txt", "text/plain"},
        {".log", "text/plain"},
        {".csv", "text/csv"},
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = by_extension.find(ext);
    return it != by_extension.end() ? it->second : "application/octet-stream";
}

}  // namespace attachq
