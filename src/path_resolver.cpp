#include "path_resolver.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace sd {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "/a/b/" -> "/a/b", but "/" stays "/"
static fs::path strip_trailing_separator(fs::path p) {
    p = p.lexically_normal();
    if (!p.has_filename() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

bool percent_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return false;
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

std::vector<std::string> normalize_segments(const std::string& decoded_path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= decoded_path.size()) {
        size_t next = decoded_path.find('/', pos);
        if (next == std::string::npos) next = decoded_path.size();
        std::string seg = decoded_path.substr(pos, next - pos);
        pos = next + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            // Escapes above the top are dropped, not honoured
            if (!segments.empty()) segments.pop_back();
            continue;
        }
        segments.push_back(std::move(seg));
    }
    return segments;
}

bool is_within(const fs::path& root, const fs::path& candidate) {
    auto r = std::distance(root.begin(), root.end());
    auto c = std::distance(candidate.begin(), candidate.end());
    if (c < r) return false;
    auto mismatch = std::mismatch(root.begin(), root.end(), candidate.begin());
    return mismatch.first == root.end();
}

ResolvedTarget resolve_target(const std::string& root, const std::string& request_target) {
    ResolvedTarget target;

    std::string raw = request_target.substr(0, request_target.find_first_of("?#"));
    std::string decoded;
    if (!percent_decode(raw, decoded)) return target;
    if (decoded.find('\0') != std::string::npos) return target;

    auto segments = normalize_segments(decoded);

    target.url_path = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) target.url_path += '/';
        target.url_path += segments[i];
    }

    std::error_code ec;
    fs::path root_path = fs::absolute(root, ec);
    if (ec) return target;
    root_path = strip_trailing_separator(root_path);

    fs::path full = root_path;
    for (const auto& seg : segments) {
        full /= seg;
    }
    full = full.lexically_normal();

    target.absolute_path = full.string();
    target.within_root = is_within(root_path, full);
    return target;
}

} // namespace sd
