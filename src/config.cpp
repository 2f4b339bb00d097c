#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace toolgate {

nlohmann::json Config::defaults_json() {
    return {
        {"project_dir", ""},
        {"sandbox", {
            {"shell_timeout_sec", 300},
            {"max_output_bytes", 30000},
            {"max_read_bytes", 50000},
            {"max_background_processes", 4},
            {"max_glob_results", 1000}
        }},
        {"browser", {
            {"enabled", false},
            {"command", "npx"},
            {"args", nlohmann::json::array({"puppeteer-mcp-server"})},
            {"start_timeout_ms", 30000},
            {"call_timeout_ms", 60000},
            {"health_interval_sec", 0},
            {"env_passthrough", nlohmann::json::array()}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t value = obj[key].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << value << "\n";
        return;
    }
    out = static_cast<uint32_t>(value);
}

static std::vector<std::string> read_string_list(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("project_dir") && j["project_dir"].is_string())
        cfg.project_dir = j["project_dir"].get<std::string>();

    if (j.contains("sandbox") && j["sandbox"].is_object()) {
        auto& s = j["sandbox"];
        read_u32(s, "shell_timeout_sec", cfg.sandbox.shell_timeout_sec);
        read_u32(s, "max_output_bytes", cfg.sandbox.max_output_bytes);
        read_u32(s, "max_read_bytes", cfg.sandbox.max_read_bytes);
        read_u32(s, "max_background_processes", cfg.sandbox.max_background_processes);
        read_u32(s, "max_glob_results", cfg.sandbox.max_glob_results);
    }

    if (j.contains("browser") && j["browser"].is_object()) {
        auto& b = j["browser"];
        if (b.contains("enabled") && b["enabled"].is_boolean())
            cfg.browser.enabled = b["enabled"].get<bool>();
        if (b.contains("command") && b["command"].is_string())
            cfg.browser.command = b["command"].get<std::string>();
        if (b.contains("args") && b["args"].is_array())
            cfg.browser.args = read_string_list(b["args"]);
        read_u32(b, "start_timeout_ms", cfg.browser.start_timeout_ms);
        read_u32(b, "call_timeout_ms", cfg.browser.call_timeout_ms);
        read_u32(b, "health_interval_sec", cfg.browser.health_interval_sec);
        if (b.contains("env_passthrough") && b["env_passthrough"].is_array())
            cfg.browser.env_passthrough = read_string_list(b["env_passthrough"]);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.toolgate/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("TOOLGATE_PROJECT_DIR"))
        project_dir = v;
    if (const char* v = std::getenv("TOOLGATE_ENABLE_BROWSER")) {
        std::string s = v;
        browser.enabled = (s == "1" || s == "true" || s == "yes");
    }
    if (const char* v = std::getenv("TOOLGATE_BROWSER_COMMAND")) {
        auto parts = split(v, ' ');
        std::vector<std::string> argv;
        for (auto& p : parts) {
            if (!p.empty()) argv.push_back(p);
        }
        if (!argv.empty()) {
            browser.command = argv.front();
            browser.args.assign(argv.begin() + 1, argv.end());
        }
    }
    if (const char* v = std::getenv("TOOLGATE_SHELL_TIMEOUT")) {
        char* end = nullptr;
        unsigned long secs = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && secs > 0)
            sandbox.shell_timeout_sec = static_cast<uint32_t>(secs);
    }
}

std::string Config::resolved_project_dir() const {
    if (project_dir.empty()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::string(".") : cwd.string();
    }
    return expand_home(project_dir);
}

} // namespace toolgate
