#include "directory_listing.hpp"
#include "format.hpp"
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sd {

static const char* kListingCss = R"CSS(
        body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Arial, sans-serif; margin: 2rem; }
        h1 { color: #333; border-bottom: 1px solid #eee; padding-bottom: 0.5rem; }
        table { width: 100%; border-collapse: collapse; margin-top: 1rem; }
        th, td { text-align: left; padding: 0.5rem; border-bottom: 1px solid #eee; }
        th { background: #f5f5f5; font-weight: 600; }
        .dir { color: #0066cc; font-weight: 500; }
        .file { color: #333; }
        .size { text-align: right; font-family: monospace; color: #666; }
        .modified { color: #666; font-size: 0.9em; }
        a { text-decoration: none; }
        a:hover { text-decoration: underline; }
        .footer { margin-top: 2rem; padding-top: 1rem; border-top: 1px solid #eee; color: #666; font-size: 0.9em; }
)CSS";

std::locale make_collation_locale(const std::string& name) {
    try {
        return std::locale(name.c_str());
    } catch (const std::runtime_error& e) {
        spdlog::warn("Locale '{}' unavailable ({}), sorting listings bytewise", name, e.what());
        return std::locale::classic();
    }
}

std::string parent_url_path(const std::string& url_path) {
    auto slash = url_path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return url_path.substr(0, slash);
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

std::string url_encode_path(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

ListingRenderer::ListingRenderer(std::locale collation)
    : collation_(std::move(collation))
{
}

bool ListingRenderer::name_less(const std::string& a, const std::string& b) const {
    const auto& coll = std::use_facet<std::collate<char>>(collation_);
    int cmp = coll.compare(a.data(), a.data() + a.size(), b.data(), b.data() + b.size());
    if (cmp != 0) return cmp < 0;
    return a < b;
}

std::vector<DirectoryEntry> ListingRenderer::collect(const std::string& directory,
                                                     const std::string& url_path) const {
    std::vector<DirectoryEntry> entries;
    const std::string base = url_path == "/" ? "" : url_path;

    // Throws filesystem_error when the directory can't be opened
    for (const auto& child : fs::directory_iterator(directory)) {
        std::string name = child.path().filename().string();

        struct stat st{};
        if (::stat(child.path().c_str(), &st) != 0) {
            spdlog::warn("Listing: cannot stat '{}': {}", child.path().string(), std::strerror(errno));
            continue;
        }

        DirectoryEntry entry;
        entry.relative_request_path = base + "/" + name;
        entry.name = std::move(name);
        entry.is_directory = S_ISDIR(st.st_mode);
        entry.size_bytes = static_cast<uint64_t>(st.st_size);
        entry.last_modified = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string ListingRenderer::render_entries(const std::string& url_path,
                                            std::vector<DirectoryEntry> entries) const {
    std::vector<DirectoryEntry> dirs;
    std::vector<DirectoryEntry> files;
    for (auto& e : entries) {
        (e.is_directory ? dirs : files).push_back(std::move(e));
    }

    auto by_name = [this](const DirectoryEntry& a, const DirectoryEntry& b) {
        return name_less(a.name, b.name);
    };
    std::sort(dirs.begin(), dirs.end(), by_name);
    std::sort(files.begin(), files.end(), by_name);

    const std::string title = "Directory listing for " + html_escape(url_path);

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n"
         << "    <meta charset=\"utf-8\">\n"
         << "    <title>" << title << "</title>\n"
         << "    <style>" << kListingCss << "    </style>\n"
         << "</head>\n<body>\n"
         << "    <h1>" << title << "</h1>\n"
         << "    <table>\n"
         << "        <thead>\n"
         << "            <tr><th>Name</th><th>Size</th><th>Modified</th></tr>\n"
         << "        </thead>\n"
         << "        <tbody>\n";

    if (url_path != "/") {
        html << "        <tr><td><a href=\"" << url_encode_path(parent_url_path(url_path))
             << "\" class=\"dir parent\">..</a></td><td></td><td></td></tr>\n";
    }

    for (const auto& d : dirs) {
        html << "        <tr>\n"
             << "            <td><a href=\"" << url_encode_path(d.relative_request_path)
             << "/\" class=\"dir\">" << html_escape(d.name) << "/</a></td>\n"
             << "            <td class=\"size\">-</td>\n"
             << "            <td class=\"modified\">" << format_local_time(d.last_modified) << "</td>\n"
             << "        </tr>\n";
    }

    for (const auto& f : files) {
        html << "        <tr>\n"
             << "            <td><a href=\"" << url_encode_path(f.relative_request_path)
             << "\" class=\"file\">" << html_escape(f.name) << "</a></td>\n"
             << "            <td class=\"size\">" << format_size(f.size_bytes) << "</td>\n"
             << "            <td class=\"modified\">" << format_local_time(f.last_modified) << "</td>\n"
             << "        </tr>\n";
    }

    html << "        </tbody>\n    </table>\n"
         << "    <div class=\"footer\">\n"
         << "        Served by <strong>serve-dir</strong> &bull; "
         << dirs.size() << " directories, " << files.size() << " files\n"
         << "    </div>\n"
         << "</body>\n</html>\n";

    return html.str();
}

std::string ListingRenderer::render(const std::string& directory, const std::string& url_path) const {
    return render_entries(url_path, collect(directory, url_path));
}

} // namespace sd
