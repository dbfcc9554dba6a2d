#pragma once

#include <chrono>
#include <cstdint>
#include <locale>
#include <string>
#include <vector>

namespace sd {

struct DirectoryEntry {
    std::string name;
    std::string relative_request_path;   // href target, e.g. "/docs/a.txt"
    uint64_t size_bytes = 0;
    std::chrono::system_clock::time_point last_modified;
    bool is_directory = false;
};

// Renders auto-generated HTML index pages. Holds only the collation locale;
// every call re-reads the directory.
class ListingRenderer {
public:
    explicit ListingRenderer(std::locale collation = std::locale::classic());

    // Enumerate `directory` (immediate children) and render the page for
    // `url_path`. Throws std::filesystem::filesystem_error if the directory
    // itself cannot be read.
    std::string render(const std::string& directory, const std::string& url_path) const;

    // Stat every child of `directory`. Children that can't be stat'd are
    // skipped with a warning.
    std::vector<DirectoryEntry> collect(const std::string& directory,
                                        const std::string& url_path) const;

    // Directories first, then files, each group sorted by name.
    std::string render_entries(const std::string& url_path,
                               std::vector<DirectoryEntry> entries) const;

    bool name_less(const std::string& a, const std::string& b) const;

private:
    std::locale collation_;
};

// Locale named `name` ("" = environment). Falls back to the classic locale
// when the name isn't available on this system.
std::locale make_collation_locale(const std::string& name);

// "/a/b" -> "/a", "/a" -> "/"
std::string parent_url_path(const std::string& url_path);

std::string html_escape(const std::string& s);

// Percent-encode everything but unreserved characters and '/'.
std::string url_encode_path(const std::string& s);

} // namespace sd
