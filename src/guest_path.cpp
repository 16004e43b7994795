#include "guest_path.h"
#include "engine_errors.h"

#include <algorithm>
#include <sstream>
#include <vector>

namespace malsand {
namespace guest_path {

std::string normalize(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        char ch = (c == '\\') ? '/' : c;
        if (ch == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out += ch;
    }
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

std::string require_absolute(const std::string& path) {
    std::string normalized = normalize(path);
    if (normalized.empty() || normalized[0] != '/') {
        throw TransferError(TransferFailure::INVALID_PATH,
                            "Guest path must be absolute: '" + path + "'");
    }

    std::istringstream segments(normalized);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "." || segment == "..") {
            throw TransferError(TransferFailure::INVALID_PATH,
                                "Guest path must not contain relative segments: '" + path + "'");
        }
    }
    return normalized;
}

std::string join(const std::string& dir, const std::string& name) {
    std::string base = normalize(dir);
    std::string leaf = normalize(name);
    if (base.empty()) return leaf;
    if (leaf.empty()) return base;
    if (leaf.front() == '/') leaf.erase(0, 1);
    if (base.back() == '/') return base + leaf;
    return base + "/" + leaf;
}

std::string basename(const std::string& path) {
    std::string normalized = normalize(path);
    size_t slash = normalized.rfind('/');
    if (slash == std::string::npos) return normalized;
    return normalized.substr(slash + 1);
}

std::string dirname(const std::string& path) {
    std::string normalized = normalize(path);
    size_t slash = normalized.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return normalized.substr(0, slash);
}

std::string sanitize_filename(const std::string& filename) {
    std::string name = basename(filename);
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out += safe ? c : '_';
    }
    // No hidden or dot-only names
    while (!out.empty() && out.front() == '.') {
        out.front() = '_';
    }
    if (out.empty()) out = "sample";
    return out;
}

std::string stem(const std::string& filename) {
    std::string name = basename(filename);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return name;
    return name.substr(0, dot);
}

} // namespace guest_path
} // namespace malsand
