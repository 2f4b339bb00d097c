#pragma once
#include "../tool.hpp"

namespace toolgate {

class PathGuard;

class FileWriteTool : public Tool {
public:
    explicit FileWriteTool(const PathGuard& guard) : guard_(guard) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "write_file"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathGuard& guard_;
};

} // namespace toolgate
