#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolgate {

struct SandboxConfig {
    uint32_t shell_timeout_sec = 300;
    uint32_t max_output_bytes = 30000;
    uint32_t max_read_bytes = 50000;
    uint32_t max_background_processes = 4;
    uint32_t max_glob_results = 1000;
};

struct BrowserConfig {
    bool enabled = false;
    std::string command = "npx";
    std::vector<std::string> args = {"puppeteer-mcp-server"};
    uint32_t start_timeout_ms = 30000;
    uint32_t call_timeout_ms = 60000;
    uint32_t health_interval_sec = 0;          // 0 = no periodic health check
    std::vector<std::string> env_passthrough;  // secret-looking vars to keep anyway
};

struct Config {
    std::string project_dir;  // empty = current directory

    SandboxConfig sandbox;
    BrowserConfig browser;

    // Load from ~/.toolgate/config.json + env vars
    static Config load();

    // Parse an already-merged config document
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply TOOLGATE_* environment overrides
    void apply_env();

    // Project directory with "" mapped to the current directory and ~ expanded
    std::string resolved_project_dir() const;
};

// Recursively add keys from defaults missing in existing.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace toolgate
