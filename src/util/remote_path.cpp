#include "remote_path.hpp"
#include "string_utils.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <vector>

namespace RemotePath {

std::string join(std::initializer_list<std::string> segments) {
    bool absolute = false;
    bool seen_first = false;
    std::vector<std::string> parts;

    for (std::string seg : segments) {
        std::replace(seg.begin(), seg.end(), '\\', '/');
        if (seg.empty()) continue;
        if (!seen_first) {
            absolute = seg[0] == '/';
            seen_first = true;
        }
        for (const auto& p : StringUtils::split(seg, '/')) {
            if (p.empty() || p == ".") continue;
            if (p == "..") {
                if (!parts.empty() && parts.back() != "..") {
                    parts.pop_back();
                } else if (!absolute) {
                    parts.push_back(p);
                }
                continue;
            }
            parts.push_back(p);
        }
    }

    std::string joined = StringUtils::join(parts, '/');
    if (absolute) return "/" + joined;
    return joined.empty() ? "." : joined;
}

std::string parent(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

std::string basename(const std::string& path) {
    std::string p = path;
    while (!p.empty() && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string directory_key(const std::string& path) {
    std::vector<std::string> parts;
    for (const auto& p : StringUtils::split(path, '/')) {
        if (!p.empty()) parts.push_back(p);
    }
    return StringUtils::join(parts, '/');
}

std::string encode(const std::string& path) {
    std::string p = (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    auto parts = StringUtils::split(p, '/');
    for (auto& seg : parts) seg = percent_encode(seg);
    return StringUtils::join(parts, '/');
}

} // namespace RemotePath
