#pragma once
#include "../tool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace toolgate {

class ProtocolAdapter;

// Prefix some providers put on MCP tool names.
inline constexpr const char* kBrowserToolPrefix = "mcp__puppeteer__";

// Remote tool served by the browser automation subprocess.
class BrowserTool : public Tool {
public:
    BrowserTool(ProtocolAdapter& adapter, ToolSpec spec)
        : adapter_(adapter), spec_(std::move(spec)) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return spec_.name; }
    std::string description() const override { return spec_.description; }
    std::string parameters_json() const override { return spec_.parameters_json; }

private:
    ProtocolAdapter& adapter_;
    ToolSpec spec_;
};

// The fixed browser catalog (puppeteer_navigate, puppeteer_click, ...).
const std::vector<ToolSpec>& browser_tool_specs();

// Strip kBrowserToolPrefix if present.
std::string canonical_browser_tool_name(const std::string& name);

bool is_browser_tool(const std::string& name);

std::vector<std::unique_ptr<Tool>> create_browser_tools(ProtocolAdapter& adapter);

} // namespace toolgate
