#pragma once
#include "../tool.hpp"

namespace toolgate {

class PathGuard;

class FileEditTool : public Tool {
public:
    explicit FileEditTool(const PathGuard& guard) : guard_(guard) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "edit_file"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathGuard& guard_;
};

} // namespace toolgate
