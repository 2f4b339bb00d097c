#pragma once
#include "../tool.hpp"
#include <cstddef>

namespace toolgate {

class PathGuard;

class GlobSearchTool : public Tool {
public:
    GlobSearchTool(const PathGuard& guard, size_t max_results)
        : guard_(guard), max_results_(max_results) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "glob_search"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathGuard& guard_;
    size_t max_results_;
};

} // namespace toolgate
