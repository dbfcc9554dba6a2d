#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sd {

struct ResolvedTarget {
    std::string absolute_path;   // root joined with the normalized request path
    std::string url_path;        // normalized, decoded request path ("/", "/a/b")
    bool within_root = false;
};

// Map a request target onto the filesystem under `root`.
//
// The query string and fragment are dropped, the path is percent-decoded and
// normalized ("." removed, ".." resolved wherever it appears, leading ".."
// discarded) before it is joined onto root. The result is accepted only if it
// is root itself or lies beneath it, compared component by component.
// Malformed escapes and encoded NUL bytes reject the target.
//
// No filesystem access is performed.
ResolvedTarget resolve_target(const std::string& root, const std::string& request_target);

// Percent-decode `in`. Returns false on a truncated or non-hex escape.
bool percent_decode(const std::string& in, std::string& out);

// Split a decoded path into segments with "", "." and ".." resolved.
std::vector<std::string> normalize_segments(const std::string& decoded_path);

// True if `candidate` equals `root` or is a descendant of it. Both must be
// absolute and lexically normal.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

} // namespace sd
