#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace batchsync {

// Remote locators are plain strings with POSIX semantics; local paths are
// std::filesystem::path. Nothing here converts one into the other except
// RemoteRelative(), which spells a local relative path with '/'.

// Normalize a remote prefix:
// - collapse duplicate slashes
// - drop a trailing "/" (but keep a lone "/")
inline std::string NormalizeRemotePath(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// posixpath.join for two components: an absolute right-hand side replaces
// the left, an empty one is ignored.
inline std::string RemoteJoin(std::string_view base, std::string_view rel) {
    if (rel.empty()) return std::string(base);
    if (base.empty() || rel.front() == '/') return std::string(rel);

    std::string out(base);
    if (out.back() != '/') out.push_back('/');
    out.append(rel);
    return out;
}

inline std::string RemoteJoin(std::string_view base, std::string_view mid, std::string_view leaf) {
    return RemoteJoin(RemoteJoin(base, mid), leaf);
}

// Relative local path spelled for the remote side. "" and "." both mean the scan root.
inline std::string RemoteRelative(const std::filesystem::path& rel) {
    std::string s = rel.generic_string();
    if (s == ".") s.clear();
    return s;
}

inline constexpr std::string_view kRootBundleBase = "root_files";

// Flat staging name for a group directory: every separator becomes '_'.
inline std::string BundleBaseName(const std::filesystem::path& rel_dir) {
    std::string s = RemoteRelative(rel_dir);
    if (s.empty()) return std::string(kRootBundleBase);
    for (char& c : s) {
        if (c == '/' || c == static_cast<char>(std::filesystem::path::preferred_separator)) {
            c = '_';
        }
    }
    return s;
}

// Split "name.ext" into {"name", ".ext"}. The extension is the last dot
// suffix; leading dots belong to the stem, so ".bashrc" has no extension.
inline std::pair<std::string, std::string> SplitExtension(std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return {std::string(name), {}};

    const auto first_non_dot = name.find_first_not_of('.');
    if (first_non_dot == std::string_view::npos || dot < first_non_dot) {
        return {std::string(name), {}};
    }
    return {std::string(name.substr(0, dot)), std::string(name.substr(dot))};
}

} // namespace batchsync
