#include "tool_executor.hpp"
#include "protocol_adapter.hpp"
#include "tools/browser.hpp"
#include "util.hpp"
#include <iostream>

namespace toolgate {

ToolExecutor::ToolExecutor(const std::filesystem::path& project_root,
                           const SandboxConfig& sandbox)
    : guard_(project_root), sandbox_(sandbox) {
    tools_ = create_builtin_tools(guard_, sandbox_);
}

ToolExecutor::~ToolExecutor() = default;

void ToolExecutor::attach_adapter(ProtocolAdapter& adapter) {
    browser_tools_ = create_browser_tools(adapter);
}

void ToolExecutor::detach_adapter() {
    browser_tools_.clear();
}

void ToolExecutor::reset() {
    for (auto& tool : tools_) tool->reset();
}

Tool* ToolExecutor::find_tool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->tool_name() == name) return tool.get();
    }
    for (const auto& tool : browser_tools_) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

std::vector<ToolSpec> ToolExecutor::tool_specs() const {
    std::vector<ToolSpec> specs;
    for (const auto& tool : tools_) specs.push_back(tool->spec());
    for (const auto& tool : browser_tools_) specs.push_back(tool->spec());
    return specs;
}

ToolResult ToolExecutor::execute(const ToolCall& call) {
    auto dispatch = [&]() -> ToolResult {
        if (call.name.empty()) {
            return tool_error(ErrorKind::InvalidArguments, "Missing tool name");
        }

        std::string raw = trim(call.arguments);
        if (raw.empty()) raw = "{}";
        auto args = nlohmann::json::parse(raw, nullptr, false);
        if (args.is_discarded()) {
            args = nlohmann::json::parse(repair_json(raw), nullptr, false);
        }
        if (args.is_discarded() || !args.is_object()) {
            return tool_error(ErrorKind::InvalidArguments,
                              "Arguments for '" + call.name + "' are not a JSON object");
        }

        if (is_browser_tool(call.name)) {
            std::string name = canonical_browser_tool_name(call.name);
            Tool* tool = find_tool(name);
            if (!tool) {
                return tool_error(ErrorKind::Unavailable, "Browser automation is not enabled");
            }
            return tool->execute(args.dump());
        }

        Tool* tool = find_tool(call.name);
        if (!tool) return tool_error(ErrorKind::UnknownTool, "Unknown tool: " + call.name);
        return tool->execute(args.dump());
    };

    ToolResult result{false, {}};
    try {
        result = dispatch();
    } catch (const std::exception& e) {
        std::cerr << "[executor] " << call.name << " threw: " << e.what() << "\n";
        result = tool_error(ErrorKind::ExecutionFailed,
                            "Tool '" + call.name + "' failed: " + e.what());
    }
    if (!result.success && result.kind == ErrorKind::None) result.kind = ErrorKind::ExecutionFailed;
    result.success = result.kind == ErrorKind::None;
    result.call_id = call.id;
    return result;
}

std::string repair_json(const std::string& json_str) {
    std::string s = json_str;

    // Balance braces
    int brace_count = 0;
    int bracket_count = 0;
    for (char c : s) {
        if (c == '{') brace_count++;
        else if (c == '}') brace_count--;
        else if (c == '[') bracket_count++;
        else if (c == ']') bracket_count--;
    }

    // Append missing closing braces/brackets
    while (bracket_count > 0) {
        s += ']';
        bracket_count--;
    }
    while (brace_count > 0) {
        s += '}';
        brace_count--;
    }

    // Remove trailing commas before } or ]
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) {
                j++;
            }
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) {
                continue;
            }
        }
        result += s[i];
    }

    if (nlohmann::json::accept(result)) return result;
    return json_str;
}

nlohmann::json tool_result_to_json(const ToolResult& result) {
    nlohmann::json j = {
        {"id", result.call_id},
        {"success", result.success},
        {"output", result.output}
    };
    j["error_kind"] = result.success ? nlohmann::json(nullptr)
                                     : nlohmann::json(error_kind_to_string(result.kind));
    return j;
}

bool tool_call_from_json(const nlohmann::json& j, ToolCall& out, std::string& error) {
    if (!j.is_object()) {
        error = "Request must be a JSON object";
        return false;
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        error = "Request is missing \"name\"";
        return false;
    }
    out.name = j["name"].get<std::string>();

    if (j.contains("id") && j["id"].is_string()) {
        out.id = j["id"].get<std::string>();
    } else if (j.contains("id") && j["id"].is_number_integer()) {
        out.id = std::to_string(j["id"].get<int64_t>());
    } else {
        out.id = generate_id();
    }

    if (!j.contains("arguments") || j["arguments"].is_null()) {
        out.arguments = "{}";
    } else if (j["arguments"].is_string()) {
        out.arguments = j["arguments"].get<std::string>();
    } else {
        out.arguments = j["arguments"].dump();
    }
    return true;
}

} // namespace toolgate
