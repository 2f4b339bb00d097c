#include "glob_search.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <set>

namespace toolgate {

namespace fs = std::filesystem;

// Directory depth the walk must reach for pattern to match anything, or 0
// when a "**" segment makes it unbounded.
static size_t pattern_depth(const std::string& pattern) {
    size_t depth = 0;
    for (const auto& seg : split(pattern, '/')) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "**") return 0;
        ++depth;
    }
    return depth;
}

static bool pattern_wants_hidden(const std::string& pattern) {
    return pattern.rfind('.', 0) == 0 || pattern.find("/.") != std::string::npos;
}

ToolResult GlobSearchTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "pattern")) return *err;

    std::string pattern = args["pattern"].get<std::string>();
    std::string raw_dir;
    if (auto err = optional_string(args, "path", raw_dir)) return *err;
    if (pattern.empty()) {
        return tool_error(ErrorKind::InvalidArguments, "pattern must not be empty");
    }

    fs::path base;
    if (auto err = resolve_tool_path(guard_, raw_dir, base)) return *err;

    std::string shown_dir = raw_dir.empty() ? "." : raw_dir;
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        return tool_error(ErrorKind::NotFound, "Directory not found: " + shown_dir);
    }
    if (!fs::is_directory(base, ec)) {
        return tool_error(ErrorKind::InvalidArguments, "Not a directory: " + shown_dir);
    }

    size_t max_depth = pattern_depth(pattern);
    bool hidden = pattern_wants_hidden(pattern);

    std::set<std::string> matches;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return tool_error(ErrorKind::ExecutionFailed,
                          "Failed to list " + shown_dir + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::path& entry = it->path();
        std::string name = entry.filename().string();
        bool is_dir = it->is_directory(ec);

        if (is_dir && ((!hidden && !name.empty() && name[0] == '.') ||
                       (max_depth > 0 && static_cast<size_t>(it.depth()) + 1 >= max_depth))) {
            it.disable_recursion_pending();
        }

        std::string rel = entry.lexically_relative(base).generic_string();
        if (!glob_match(pattern, rel)) continue;

        fs::path canonical = fs::weakly_canonical(entry, ec);
        if (ec || !guard_.contains(canonical)) continue;
        matches.insert(guard_.relative(canonical));
    }

    if (matches.empty()) return ToolResult{true, "No matches found"};

    std::string out;
    size_t count = 0;
    for (const auto& m : matches) {
        if (count == max_results_) {
            out += "\n... (results truncated)";
            break;
        }
        if (count > 0) out += '\n';
        out += m;
        ++count;
    }
    return ToolResult{true, out};
}

std::string GlobSearchTool::description() const {
    return "Find files and directories matching a glob pattern (supports *, ?, [...] and "
           "** for any number of directories). Results are relative to the project root.";
}

std::string GlobSearchTool::parameters_json() const {
    return R"json({"type":"object","properties":{"pattern":{"type":"string","description":"Glob pattern, e.g. src/**/*.cpp"},"path":{"type":"string","description":"Directory to search in (default: project root)"}},"required":["pattern"]})json";
}

} // namespace toolgate
