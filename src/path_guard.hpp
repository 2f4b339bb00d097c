#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace toolgate {

// Confines filesystem paths to a project root. Resolution works on the
// canonical form: symlinks in the existing part of the path are followed and
// ".." segments are collapsed before the containment check.
class PathGuard {
public:
    // root must exist; it is canonicalized once here.
    explicit PathGuard(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    // Resolve raw_path (relative, absolute, or containing "..") against the
    // root. Returns nullopt and fills *error when the result escapes the root.
    std::optional<std::filesystem::path> resolve(const std::string& raw_path,
                                                 std::string* error = nullptr) const;

    // True when an already-canonical absolute path lies inside the root.
    bool contains(const std::filesystem::path& canonical) const;

    // Root-relative display form ("." for the root itself).
    std::string relative(const std::filesystem::path& canonical) const;

private:
    std::filesystem::path root_;
    std::string root_str_;
};

// Free-function form: resolve raw_path against project_root.
std::optional<std::filesystem::path> resolve_path(const std::string& raw_path,
                                                  const std::filesystem::path& project_root,
                                                  std::string* error = nullptr);

} // namespace toolgate
