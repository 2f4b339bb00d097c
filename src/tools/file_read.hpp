#pragma once
#include "../tool.hpp"
#include <cstddef>

namespace toolgate {

class PathGuard;

class FileReadTool : public Tool {
public:
    FileReadTool(const PathGuard& guard, size_t max_bytes)
        : guard_(guard), max_bytes_(max_bytes) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "read_file"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathGuard& guard_;
    size_t max_bytes_;
};

} // namespace toolgate
