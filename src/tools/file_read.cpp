#include "file_read.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <algorithm>
#include <vector>

namespace toolgate {

static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = nl == std::string::npos ? content.size() : nl;
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

ToolResult FileReadTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;

    std::optional<size_t> offset;
    std::optional<size_t> limit;
    if (auto err = optional_count(args, "offset", offset)) return *err;
    if (auto err = optional_count(args, "limit", limit)) return *err;
    if (limit && *limit == 0) {
        return tool_error(ErrorKind::InvalidArguments, "Limit must be positive");
    }

    std::string raw = args["path"].get<std::string>();
    std::filesystem::path path;
    if (auto err = resolve_tool_path(guard_, raw, path)) return *err;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return tool_error(ErrorKind::NotFound, "File not found: " + raw);
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return tool_error(ErrorKind::InvalidArguments, "Not a file: " + raw);
    }

    std::string contents;
    if (!read_file_contents(path, contents)) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to open file: " + raw);
    }
    if (contents.find('\0') != std::string::npos) {
        return tool_error(ErrorKind::ExecutionFailed, "Cannot read binary file: " + raw);
    }

    if (!offset && !limit) {
        if (contents.size() > max_bytes_) {
            contents = truncate_utf8(contents, max_bytes_) + "\n[truncated]";
        }
        return ToolResult{true, contents};
    }

    auto lines = split_lines(contents);
    size_t total = lines.size();
    size_t start = offset.value_or(0);
    if (total == 0) {
        if (start == 0) return ToolResult{true, "[lines 0-0 of 0] (file is empty)"};
        return tool_error(ErrorKind::InvalidArguments,
                          "Offset beyond end of file (file is empty)");
    }
    if (start >= total) {
        return tool_error(ErrorKind::InvalidArguments,
                          "Offset " + std::to_string(start) + " beyond end of file (total " +
                          std::to_string(total) + " lines)");
    }
    size_t end = limit ? std::min(total, start + *limit) : total;

    std::string out = "[lines " + std::to_string(start + 1) + "-" + std::to_string(end) +
                      " of " + std::to_string(total) + "]\n";
    for (size_t i = start; i < end; ++i) {
        if (i > start) out += '\n';
        out += lines[i];
    }
    if (out.size() > max_bytes_) {
        out = truncate_utf8(out, max_bytes_) + "\n[truncated]";
    }
    return ToolResult{true, out};
}

std::string FileReadTool::description() const {
    return "Read a file in the project directory. Use offset (0-based line) and limit "
           "to page through large files.";
}

std::string FileReadTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Path relative to the project directory"},"offset":{"type":"integer","description":"Line number to start reading from (0-based)"},"limit":{"type":"integer","description":"Maximum number of lines to read"}},"required":["path"]})json";
}

} // namespace toolgate
