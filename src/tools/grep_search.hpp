#pragma once
#include "../tool.hpp"
#include "../config.hpp"

namespace toolgate {

class PathGuard;

// Content search backed by ripgrep, run directly (no shell) in the project root.
class GrepSearchTool : public Tool {
public:
    GrepSearchTool(const PathGuard& guard, const SandboxConfig& sandbox)
        : guard_(guard), sandbox_(sandbox) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "grep_search"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathGuard& guard_;
    SandboxConfig sandbox_;
};

} // namespace toolgate
