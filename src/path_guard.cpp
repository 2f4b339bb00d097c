#include "path_guard.hpp"
#include <system_error>

namespace toolgate {

namespace fs = std::filesystem;

// weakly_canonical stops at a dangling symlink and keeps it lexically, so a
// link whose target is missing could still point outside the root. Walk the
// components and check where any such link would lead.
static bool dangling_link_escapes(const fs::path& p, const PathGuard& guard) {
    fs::path current;
    for (const auto& part : p) {
        current /= part;
        std::error_code ec;
        auto st = fs::symlink_status(current, ec);
        if (ec || st.type() == fs::file_type::not_found) return false;
        if (st.type() != fs::file_type::symlink) continue;
        fs::path target = fs::read_symlink(current, ec);
        if (ec) return true;
        if (target.is_relative()) target = current.parent_path() / target;
        target = fs::weakly_canonical(target, ec).lexically_normal();
        if (ec || !guard.contains(target)) return true;
    }
    return false;
}

PathGuard::PathGuard(const fs::path& root) {
    std::error_code ec;
    root_ = fs::canonical(root, ec);
    if (ec) {
        // Non-existent root: keep the lexical absolute form so every resolve
        // still has a stable prefix to compare against.
        root_ = fs::absolute(root, ec).lexically_normal();
    }
    root_str_ = root_.string();
    if (root_str_.size() > 1 && root_str_.back() == '/') {
        root_str_.pop_back();
        root_ = fs::path(root_str_);
    }
}

bool PathGuard::contains(const fs::path& canonical) const {
    const std::string s = canonical.string();
    if (s == root_str_) return true;
    if (root_str_ == "/") return !s.empty() && s[0] == '/';
    return s.size() > root_str_.size() &&
           s.compare(0, root_str_.size(), root_str_) == 0 &&
           s[root_str_.size()] == '/';
}

std::optional<fs::path> PathGuard::resolve(const std::string& raw_path,
                                           std::string* error) const {
    if (raw_path.find('\0') != std::string::npos) {
        if (error) *error = "Path contains a NUL byte";
        return std::nullopt;
    }

    fs::path joined = raw_path.empty() ? root_ : root_ / fs::path(raw_path);

    // weakly_canonical follows symlinks through the longest existing prefix
    // and normalizes the remainder lexically.
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        if (error) *error = "Cannot resolve path '" + raw_path + "': " + ec.message();
        return std::nullopt;
    }
    canonical = canonical.lexically_normal();
    std::string s = canonical.string();
    if (s.size() > 1 && s.back() == '/') {
        s.pop_back();
        canonical = fs::path(s);
    }

    if (!contains(canonical) || dangling_link_escapes(canonical, *this)) {
        if (error) *error = "Path escapes the project directory: " + raw_path;
        return std::nullopt;
    }
    return canonical;
}

std::string PathGuard::relative(const fs::path& canonical) const {
    if (canonical.string() == root_str_) return ".";
    std::string rel = canonical.lexically_relative(root_).string();
    return rel.empty() ? "." : rel;
}

std::optional<fs::path> resolve_path(const std::string& raw_path,
                                     const fs::path& project_root,
                                     std::string* error) {
    return PathGuard(project_root).resolve(raw_path, error);
}

} // namespace toolgate
