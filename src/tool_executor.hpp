#pragma once
#include "config.hpp"
#include "path_guard.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace toolgate {

class ProtocolAdapter;

// Single entry point that turns a ToolCall into exactly one ToolResult.
// Local tools run confined to the project root; browser tools are forwarded
// to the attached ProtocolAdapter. execute() never throws.
class ToolExecutor {
public:
    ToolExecutor(const std::filesystem::path& project_root, const SandboxConfig& sandbox);
    ~ToolExecutor();

    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    // Expose the browser catalog backed by adapter. The adapter must outlive
    // this executor (or be detached first).
    void attach_adapter(ProtocolAdapter& adapter);
    void detach_adapter();

    ToolResult execute(const ToolCall& call);

    // Catalog of currently exposed tools.
    std::vector<ToolSpec> tool_specs() const;

    const PathGuard& guard() const { return guard_; }

    // Kill background processes and reset per-session tool state.
    void reset();

private:
    Tool* find_tool(const std::string& name) const;

    PathGuard guard_;
    SandboxConfig sandbox_;
    std::vector<std::unique_ptr<Tool>> tools_;
    std::vector<std::unique_ptr<Tool>> browser_tools_;
};

// Try to repair malformed JSON from LLM output (unbalanced braces, trailing
// commas). Returns the input unchanged when the repair does not parse.
std::string repair_json(const std::string& json_str);

// Bridge wire form of a result: {"id","success","output","error_kind"}.
nlohmann::json tool_result_to_json(const ToolResult& result);

// Parse a bridge request {"id","name","arguments"}. arguments may be an
// object or a JSON string.
bool tool_call_from_json(const nlohmann::json& j, ToolCall& out, std::string& error);

} // namespace toolgate
