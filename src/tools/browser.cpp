#include "browser.hpp"
#include "tool_util.hpp"
#include "../protocol_adapter.hpp"

namespace toolgate {

const std::vector<ToolSpec>& browser_tool_specs() {
    static const std::vector<ToolSpec> specs = {
        {"puppeteer_connect_active_tab",
         "Connect to an existing Chrome instance with remote debugging enabled. Chrome must "
         "be started with --remote-debugging-port.",
         R"json({"type":"object","properties":{"targetUrl":{"type":"string","description":"Optional URL of the target tab to connect to"},"debugPort":{"type":"number","description":"Chrome debugging port (default: 9222)","default":9222}},"required":[]})json"},
        {"puppeteer_navigate",
         "Navigate the browser to a URL.",
         R"json({"type":"object","properties":{"url":{"type":"string","description":"URL to navigate to"}},"required":["url"]})json"},
        {"puppeteer_screenshot",
         "Take a screenshot of the current page or a specific element.",
         R"json({"type":"object","properties":{"name":{"type":"string","description":"Name for the screenshot"},"selector":{"type":"string","description":"Optional CSS selector for the element to capture"},"width":{"type":"number","description":"Width in pixels (default: 800)"},"height":{"type":"number","description":"Height in pixels (default: 600)"}},"required":["name"]})json"},
        {"puppeteer_click",
         "Click an element on the page using a CSS selector.",
         R"json({"type":"object","properties":{"selector":{"type":"string","description":"CSS selector for the element to click"}},"required":["selector"]})json"},
        {"puppeteer_fill",
         "Fill out an input field with text.",
         R"json({"type":"object","properties":{"selector":{"type":"string","description":"CSS selector for the input field"},"value":{"type":"string","description":"Text to fill in"}},"required":["selector","value"]})json"},
        {"puppeteer_select",
         "Select an option from a dropdown element.",
         R"json({"type":"object","properties":{"selector":{"type":"string","description":"CSS selector for the select element"},"value":{"type":"string","description":"Value of the option to select"}},"required":["selector","value"]})json"},
        {"puppeteer_hover",
         "Hover the mouse over an element on the page.",
         R"json({"type":"object","properties":{"selector":{"type":"string","description":"CSS selector for the element to hover over"}},"required":["selector"]})json"},
        {"puppeteer_evaluate",
         "Execute JavaScript in the page and return the result.",
         R"json({"type":"object","properties":{"script":{"type":"string","description":"JavaScript code to execute"}},"required":["script"]})json"},
    };
    return specs;
}

std::string canonical_browser_tool_name(const std::string& name) {
    std::string prefix = kBrowserToolPrefix;
    if (name.compare(0, prefix.size(), prefix) == 0) return name.substr(prefix.size());
    return name;
}

bool is_browser_tool(const std::string& name) {
    std::string canonical = canonical_browser_tool_name(name);
    for (const auto& spec : browser_tool_specs()) {
        if (spec.name == canonical) return true;
    }
    return false;
}

ToolResult BrowserTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    if (!adapter_.is_ready()) {
        return tool_error(ErrorKind::Unavailable,
                          std::string("Browser automation is unavailable (adapter ") +
                          adapter_state_to_string(adapter_.state()) + ")");
    }
    return adapter_.call_tool(spec_.name, args);
}

std::vector<std::unique_ptr<Tool>> create_browser_tools(ProtocolAdapter& adapter) {
    std::vector<std::unique_ptr<Tool>> tools;
    for (const auto& spec : browser_tool_specs()) {
        tools.push_back(std::make_unique<BrowserTool>(adapter, spec));
    }
    return tools;
}

} // namespace toolgate
