#pragma once
#include "../tool.hpp"
#include "../path_guard.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace toolgate {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = args_json.empty() ? nlohmann::json::object()
                                : nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return tool_error(ErrorKind::InvalidArguments,
                          std::string("Failed to parse arguments: ") + e.what());
    }
    if (!out.is_object()) {
        return tool_error(ErrorKind::InvalidArguments, "Arguments must be a JSON object");
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return tool_error(ErrorKind::InvalidArguments,
                          std::string("Missing required parameter: ") + field);
    }
    return std::nullopt;
}

// Optional string field; wrong type is an error, absence is not.
inline std::optional<ToolResult> optional_string(const nlohmann::json& args, const char* field,
                                                 std::string& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_string()) {
        return tool_error(ErrorKind::InvalidArguments,
                          std::string("Parameter must be a string: ") + field);
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

// Upper bound for counts, offsets and timeouts; sums of two stay in range.
constexpr size_t kMaxCountArgument = 1000000000;

// Optional non-negative integer field, at most kMaxCountArgument.
inline std::optional<ToolResult> optional_count(const nlohmann::json& args, const char* field,
                                                std::optional<size_t>& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    // Models sometimes send 10.0 for 10.
    if (!args[field].is_number() || args[field].get<double>() < 0) {
        return tool_error(ErrorKind::InvalidArguments,
                          std::string("Parameter must be a non-negative integer: ") + field);
    }
    if (args[field].get<double>() > static_cast<double>(kMaxCountArgument)) {
        return tool_error(ErrorKind::InvalidArguments,
                          std::string("Parameter is too large: ") + field + " (max " +
                          std::to_string(kMaxCountArgument) + ")");
    }
    out = static_cast<size_t>(args[field].get<double>());
    return std::nullopt;
}

inline bool flag_value(const nlohmann::json& args, const char* field) {
    return args.contains(field) && args[field].is_boolean() && args[field].get<bool>();
}

inline bool read_file_contents(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return !file.bad();
}

// Confine a path argument to the project root. Escapes are SecurityDenied.
inline std::optional<ToolResult> resolve_tool_path(const PathGuard& guard,
                                                   const std::string& raw,
                                                   std::filesystem::path& out) {
    std::string error;
    auto resolved = guard.resolve(raw, &error);
    if (!resolved) return tool_error(ErrorKind::SecurityDenied, error);
    out = *resolved;
    return std::nullopt;
}

} // namespace toolgate
