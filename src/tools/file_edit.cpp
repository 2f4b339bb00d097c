#include "file_edit.hpp"
#include "tool_util.hpp"
#include <fstream>

namespace toolgate {

static size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

ToolResult FileEditTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (auto err = require_string(args, "old_string")) return *err;
    if (auto err = require_string(args, "new_string")) return *err;

    std::string raw = args["path"].get<std::string>();
    std::string old_string = args["old_string"].get<std::string>();
    std::string new_string = args["new_string"].get<std::string>();
    bool replace_all = flag_value(args, "replace_all");

    if (old_string.empty()) {
        return tool_error(ErrorKind::InvalidArguments, "old_string must not be empty");
    }
    if (old_string == new_string) {
        return tool_error(ErrorKind::NoOp, "old_string and new_string are identical");
    }

    std::filesystem::path path;
    if (auto err = resolve_tool_path(guard_, raw, path)) return *err;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return tool_error(ErrorKind::NotFound, "File not found: " + raw);
    }

    std::string contents;
    if (!read_file_contents(path, contents)) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to open file: " + raw);
    }

    size_t occurrences = count_occurrences(contents, old_string);
    if (occurrences == 0) {
        std::string preview = old_string.substr(0, 100);
        if (old_string.size() > 100) preview += "...";
        return tool_error(ErrorKind::NotFound, "String not found in file: " + preview);
    }
    // Without replace_all only the first match changes.
    size_t replaced = replace_all ? occurrences : 1;

    std::string updated;
    updated.reserve(contents.size());
    size_t last = 0;
    size_t done = 0;
    for (size_t pos = contents.find(old_string); pos != std::string::npos && done < replaced;
         pos = contents.find(old_string, last)) {
        updated.append(contents, last, pos - last);
        updated += new_string;
        last = pos + old_string.size();
        ++done;
    }
    updated.append(contents, last, std::string::npos);

    std::ofstream outfile(path, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to open file for writing: " + raw);
    }

    outfile << updated;
    outfile.close();

    if (outfile.fail()) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to write to file: " + raw);
    }

    return ToolResult{true, "Replaced " + std::to_string(replaced) +
                            " occurrence(s) in " + raw};
}

std::string FileEditTool::description() const {
    return "Edit a file by replacing exact text. Only the first match is replaced "
           "unless replace_all is set.";
}

std::string FileEditTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Path relative to the project directory"},"old_string":{"type":"string","description":"The exact text to find"},"new_string":{"type":"string","description":"The replacement text"},"replace_all":{"type":"boolean","description":"Replace every occurrence instead of the first (default false)"}},"required":["path","old_string","new_string"]})json";
}

} // namespace toolgate
