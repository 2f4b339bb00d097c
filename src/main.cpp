#include "config.hpp"
#include "protocol_adapter.hpp"
#include "tool_executor.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: toolgate [options]\n"
              << "\n"
              << "Reads tool calls as JSON lines on stdin ({\"id\",\"name\",\"arguments\"})\n"
              << "and writes one JSON result line per call to stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --call NAME          Run a single tool call and exit\n"
              << "  --args JSON          Arguments for --call (default: {})\n"
              << "  --list-tools         Print the tool catalog as JSON and exit\n"
              << "  --project DIR        Project directory (default: current directory)\n"
              << "  --enable-browser     Start the browser automation server\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLGATE_PROJECT_DIR      Project directory\n"
              << "  TOOLGATE_ENABLE_BROWSER   1/true to enable browser tools\n"
              << "  TOOLGATE_BROWSER_COMMAND  Browser server command line\n"
              << "  TOOLGATE_SHELL_TIMEOUT    Shell timeout in seconds\n";
}

static toolgate::AdapterOptions browser_options(const toolgate::Config& config,
                                                const std::string& project_dir) {
    toolgate::AdapterOptions opts;
    opts.name = "browser";
    opts.argv.push_back(config.browser.command);
    opts.argv.insert(opts.argv.end(), config.browser.args.begin(), config.browser.args.end());
    opts.cwd = project_dir;
    opts.env_passthrough = config.browser.env_passthrough;
    opts.start_timeout = std::chrono::milliseconds(config.browser.start_timeout_ms);
    opts.call_timeout = std::chrono::milliseconds(config.browser.call_timeout_ms);
    opts.health_interval = std::chrono::seconds(config.browser.health_interval_sec);
    return opts;
}

static int run_bridge(toolgate::ToolExecutor& executor) {
    std::string line;
    while (!g_shutdown.load() && std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        toolgate::ToolCall call;
        toolgate::ToolResult result{false, {}};
        std::string error;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            result = toolgate::tool_error(toolgate::ErrorKind::InvalidArguments,
                                          "Request is not valid JSON");
        } else if (!toolgate::tool_call_from_json(j, call, error)) {
            result = toolgate::tool_error(toolgate::ErrorKind::InvalidArguments, error);
            if (j.is_object() && j.contains("id") && j["id"].is_string())
                result.call_id = j["id"].get<std::string>();
        } else {
            result = executor.execute(call);
        }
        std::cout << toolgate::tool_result_to_json(result).dump() << "\n" << std::flush;
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string call_name;
    std::string call_args = "{}";
    std::string project_dir;
    bool list_tools = false;
    bool enable_browser = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--call") == 0 && i + 1 < argc) {
            call_name = argv[++i];
        } else if (std::strcmp(argv[i], "--args") == 0 && i + 1 < argc) {
            call_args = argv[++i];
        } else if (std::strcmp(argv[i], "--project") == 0 && i + 1 < argc) {
            project_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--list-tools") == 0) {
            list_tools = true;
        } else if (std::strcmp(argv[i], "--enable-browser") == 0) {
            enable_browser = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = toolgate::Config::load();

    // Override config with CLI args
    if (!project_dir.empty()) config.project_dir = project_dir;
    if (enable_browser) config.browser.enabled = true;

    std::string root = config.resolved_project_dir();
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        std::cerr << "Error: project directory does not exist: " << root << "\n";
        return 1;
    }

    // Declared before the executor: browser tools hold a reference to it.
    std::unique_ptr<toolgate::ProtocolAdapter> adapter;
    toolgate::ToolExecutor executor(root, config.sandbox);

    if (config.browser.enabled) {
        adapter = std::make_unique<toolgate::ProtocolAdapter>(browser_options(config, root));
        if (list_tools) {
            executor.attach_adapter(*adapter);
        } else {
            std::string error;
            if (adapter->start(error)) {
                executor.attach_adapter(*adapter);
            } else {
                std::cerr << "[browser] Failed to start, browser tools disabled: "
                          << error << "\n";
            }
        }
    }

    int rc = 0;
    if (list_tools) {
        nlohmann::json catalog = nlohmann::json::array();
        for (const auto& spec : executor.tool_specs()) {
            catalog.push_back({
                {"name", spec.name},
                {"description", spec.description},
                {"parameters", nlohmann::json::parse(spec.parameters_json)}
            });
        }
        std::cout << catalog.dump(2) << "\n";
    } else if (!call_name.empty()) {
        toolgate::ToolCall call{"cli", call_name, call_args};
        toolgate::ToolResult result = executor.execute(call);
        std::cout << result.output << "\n";
        if (!result.success) {
            std::cerr << "[" << toolgate::error_kind_to_string(result.kind) << "]\n";
            rc = 1;
        }
    } else {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        rc = run_bridge(executor);
    }

    executor.detach_adapter();
    if (adapter) adapter->shutdown();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
