#pragma once
#include <string>
#include <memory>
#include <vector>
#include <utility>

namespace toolgate {

enum class ErrorKind {
    None,
    InvalidArguments,
    UnknownTool,
    SecurityDenied,
    NotFound,
    NoOp,
    Timeout,
    Disconnected,
    Unavailable,
    Cancelled,
    MalformedResponse,
    RemoteError,
    ExecutionFailed
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidArguments: return "invalid_arguments";
        case ErrorKind::UnknownTool: return "unknown_tool";
        case ErrorKind::SecurityDenied: return "security_denied";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::NoOp: return "no_op";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::MalformedResponse: return "malformed_response";
        case ErrorKind::RemoteError: return "remote_error";
        case ErrorKind::ExecutionFailed: return "execution_failed";
    }
    return "execution_failed";
}

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON object text
};

// success == true exactly when kind == ErrorKind::None.
struct ToolResult {
    bool success;
    std::string output;
    ErrorKind kind = ErrorKind::None;
    std::string call_id;
};

inline ToolResult tool_error(ErrorKind kind, std::string message) {
    return ToolResult{false, std::move(message), kind, {}};
}

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;
    virtual void reset() {}

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

class PathGuard;
struct SandboxConfig;

// Create the local (filesystem and shell) tools confined to guard's root.
std::vector<std::unique_ptr<Tool>> create_builtin_tools(const PathGuard& guard,
                                                        const SandboxConfig& sandbox);

} // namespace toolgate
