#include "mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace sd {

static const std::unordered_map<std::string, std::string> mime_types = {
    {".html", "text/html"},
    {".htm",  "text/html"},
    {".css",  "text/css"},
    {".js",   "text/javascript"},
    {".mjs",  "text/javascript"},
    {".json", "application/json"},
    {".txt",  "text/plain"},
    {".md",   "text/markdown"},
    {".xml",  "application/xml"},
    {".csv",  "text/csv"},
    {".pdf",  "application/pdf"},
    {".zip",  "application/zip"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".svg",  "image/svg+xml"},
    {".webp", "image/webp"},
    {".bmp",  "image/bmp"},
    {".ico",  "image/x-icon"},
    {".wav",  "audio/wav"},
    {".mp3",  "audio/mpeg"},
    {".ogg",  "audio/ogg"},
    {".mp4",  "video/mp4"},
    {".webm", "video/webm"},
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
    {".otf",  "font/otf"},
    {".eot",  "application/vnd.ms-fontobject"},
    {".wasm", "application/wasm"},
};

std::string content_type_for(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }
    return kDefaultMimeType;
}

} // namespace sd
