#include "file_write.hpp"
#include "tool_util.hpp"
#include <fstream>

namespace toolgate {

ToolResult FileWriteTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (auto err = require_string(args, "content")) return *err;

    std::string raw = args["path"].get<std::string>();
    std::string content = args["content"].get<std::string>();

    std::filesystem::path path;
    if (auto err = resolve_tool_path(guard_, raw, path)) return *err;

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return tool_error(ErrorKind::InvalidArguments, "Path is a directory: " + raw);
    }
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return tool_error(ErrorKind::ExecutionFailed,
                              "Failed to create directories: " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to open file for writing: " + raw);
    }

    file << content;
    file.close();

    if (file.fail()) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to write to file: " + raw);
    }

    return ToolResult{true, "Successfully wrote " + std::to_string(content.size()) +
                            " bytes to " + raw};
}

std::string FileWriteTool::description() const {
    return "Write content to a file in the project directory, creating it and any parent "
           "directories if needed. Existing files are overwritten.";
}

std::string FileWriteTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Path relative to the project directory"},"content":{"type":"string","description":"The full content to write"}},"required":["path","content"]})json";
}

} // namespace toolgate
