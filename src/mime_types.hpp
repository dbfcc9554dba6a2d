#pragma once

#include <string>

namespace sd {

inline constexpr const char* kDefaultMimeType = "application/octet-stream";

// MIME type for a file path, chosen by its (case-insensitive) extension.
// Unknown or missing extensions map to kDefaultMimeType.
std::string content_type_for(const std::string& path);

} // namespace sd
