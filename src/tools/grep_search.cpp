#include "grep_search.hpp"
#include "tool_util.hpp"
#include "../process.hpp"
#include "../util.hpp"
#include <algorithm>

namespace toolgate {

ToolResult GrepSearchTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "pattern")) return *err;

    std::string pattern = args["pattern"].get<std::string>();
    std::string raw_dir, glob, type, output_mode;
    if (auto err = optional_string(args, "path", raw_dir)) return *err;
    if (auto err = optional_string(args, "glob", glob)) return *err;
    if (auto err = optional_string(args, "type", type)) return *err;
    if (auto err = optional_string(args, "output_mode", output_mode)) return *err;

    std::optional<size_t> after, before, context, head_limit, offset;
    if (auto err = optional_count(args, "-A", after)) return *err;
    if (auto err = optional_count(args, "-B", before)) return *err;
    if (auto err = optional_count(args, "-C", context)) return *err;
    if (auto err = optional_count(args, "head_limit", head_limit)) return *err;
    if (auto err = optional_count(args, "offset", offset)) return *err;
    if (head_limit && *head_limit == 0) {
        return tool_error(ErrorKind::InvalidArguments, "head_limit must be positive");
    }

    if (output_mode.empty()) output_mode = "files_with_matches";
    if (output_mode != "content" && output_mode != "files_with_matches" &&
        output_mode != "count") {
        return tool_error(ErrorKind::InvalidArguments, "Invalid output_mode: " + output_mode);
    }

    std::filesystem::path target;
    if (auto err = resolve_tool_path(guard_, raw_dir, target)) return *err;

    std::string rg = find_in_path("rg");
    if (rg.empty()) {
        return tool_error(ErrorKind::ExecutionFailed, "ripgrep (rg) is not installed");
    }

    std::vector<std::string> argv = {rg, "--color", "never"};
    if (!glob.empty()) { argv.push_back("--glob"); argv.push_back(glob); }
    if (!type.empty()) { argv.push_back("--type"); argv.push_back(type); }
    if (context) {
        argv.push_back("-C");
        argv.push_back(std::to_string(*context));
    } else {
        if (before) { argv.push_back("-B"); argv.push_back(std::to_string(*before)); }
        if (after) { argv.push_back("-A"); argv.push_back(std::to_string(*after)); }
    }
    if (output_mode == "files_with_matches") {
        argv.push_back("-l");
    } else if (output_mode == "count") {
        argv.push_back("-c");
    } else {
        bool numbers = !args.contains("-n") || !args["-n"].is_boolean() ||
                       args["-n"].get<bool>();
        if (numbers) argv.push_back("-n");
    }
    if (flag_value(args, "-i")) argv.push_back("-i");
    if (flag_value(args, "multiline")) {
        argv.push_back("-U");
        argv.push_back("--multiline-dotall");
    }
    // -e keeps a pattern starting with '-' from being read as a flag.
    argv.push_back("-e");
    argv.push_back(pattern);
    argv.push_back("--");
    argv.push_back(guard_.relative(target));

    SpawnOptions opts;
    opts.argv = argv;
    opts.cwd = guard_.root().string();
    opts.env = scrubbed_environment({});
    opts.pipe_stdin = false;

    RunResult run = run_process(opts, std::chrono::seconds(sandbox_.shell_timeout_sec),
                                sandbox_.max_output_bytes);
    if (!run.started) return tool_error(ErrorKind::ExecutionFailed, run.error);
    if (run.timed_out) {
        return tool_error(ErrorKind::Timeout, "Search timed out after " +
                          std::to_string(sandbox_.shell_timeout_sec) + " seconds");
    }

    std::string out = trim(run.out);
    std::string err = trim(run.err);
    if (run.exit_code != 0 && run.exit_code != 1) {
        return tool_error(ErrorKind::ExecutionFailed,
                          err.empty() ? "rg failed with exit code " +
                                        std::to_string(run.exit_code)
                                      : err);
    }
    if (run.exit_code == 1 && out.empty()) return ToolResult{true, "No matches found"};

    auto lines = split(out, '\n');
    size_t start = offset.value_or(0);
    if (start >= lines.size()) {
        return tool_error(ErrorKind::InvalidArguments, "Offset skips all output");
    }
    size_t end = head_limit ? std::min(lines.size(), start + *head_limit) : lines.size();

    std::string result;
    for (size_t i = start; i < end; ++i) {
        if (i > start) result += '\n';
        result += lines[i];
    }
    if (end < lines.size() || run.truncated) result += "\n... (results truncated)";
    if (!err.empty()) result += "\n[stderr]: " + err;
    return ToolResult{true, result.empty() ? "(no output)" : result};
}

std::string GrepSearchTool::description() const {
    return "Search file contents with ripgrep. output_mode is files_with_matches (default), "
           "content or count; page results with offset and head_limit.";
}

std::string GrepSearchTool::parameters_json() const {
    return R"json({"type":"object","properties":{"pattern":{"type":"string","description":"Regular expression to search for"},"path":{"type":"string","description":"File or directory to search (default: project root)"},"glob":{"type":"string","description":"Only search files matching this glob, e.g. *.ts"},"type":{"type":"string","description":"ripgrep file type, e.g. py or js"},"output_mode":{"type":"string","enum":["content","files_with_matches","count"]},"-A":{"type":"integer","description":"Lines of context after each match"},"-B":{"type":"integer","description":"Lines of context before each match"},"-C":{"type":"integer","description":"Lines of context around each match"},"-n":{"type":"boolean","description":"Show line numbers (content mode, default true)"},"-i":{"type":"boolean","description":"Case-insensitive search"},"head_limit":{"type":"integer","description":"Return at most this many lines"},"offset":{"type":"integer","description":"Skip this many lines first"},"multiline":{"type":"boolean","description":"Let patterns span lines"}},"required":["pattern"]})json";
}

} // namespace toolgate
