#pragma once
#include "process.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace toolgate {

enum class AdapterState { NotStarted, Starting, Ready, Degraded, Stopped };

inline const char* adapter_state_to_string(AdapterState state) {
    switch (state) {
        case AdapterState::NotStarted: return "not_started";
        case AdapterState::Starting: return "starting";
        case AdapterState::Ready: return "ready";
        case AdapterState::Degraded: return "degraded";
        case AdapterState::Stopped: return "stopped";
    }
    return "stopped";
}

// Outcome of one request. kind is None for a successful result,
// RemoteError for a JSON-RPC error object, and Timeout / Disconnected /
// Cancelled / Unavailable / MalformedResponse for adapter-level failures.
struct ProtocolResponse {
    int64_t id = 0;
    ErrorKind kind = ErrorKind::None;
    nlohmann::json result;
    int error_code = 0;
    std::string error_message;

    bool ok() const { return kind == ErrorKind::None; }
};

using ResponseFuture = std::shared_future<ProtocolResponse>;

struct RemoteToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct AdapterOptions {
    std::string name = "mcp";                 // log tag
    std::vector<std::string> argv;
    std::string cwd;
    std::vector<std::string> env_passthrough;
    std::chrono::milliseconds start_timeout{30000};
    std::chrono::milliseconds call_timeout{60000};
    std::chrono::milliseconds health_timeout{5000};
    std::chrono::milliseconds shutdown_grace{2000};
    std::chrono::seconds health_interval{0};  // 0 = on demand only
    std::string protocol_version = "2024-11-05";
    std::string client_name = "toolgate";
    std::string client_version = "1.0.0";
};

// Owns a child process speaking newline-delimited JSON-RPC 2.0 over its
// stdin/stdout. Requests are correlated by id, so any number of calls may be
// outstanding and responses may arrive in any order.
//
// State machine: NotStarted -> Starting -> Ready -> Degraded -> Stopped.
// All methods are thread-safe.
class ProtocolAdapter {
public:
    explicit ProtocolAdapter(AdapterOptions options);
    ~ProtocolAdapter();

    ProtocolAdapter(const ProtocolAdapter&) = delete;
    ProtocolAdapter& operator=(const ProtocolAdapter&) = delete;

    // Spawn the process and perform the initialize handshake. On failure the
    // adapter ends in Stopped and error describes why.
    bool start(std::string& error);

    // Cancel pending calls, stop the process (stdin EOF, SIGTERM, SIGKILL
    // after the grace period), reap it, and enter Stopped. Idempotent.
    void shutdown();

    AdapterState state() const;
    bool is_ready() const { return state() == AdapterState::Ready; }
    pid_t pid() const;
    size_t pending_count() const;
    std::string stderr_tail() const;

    // Send a request. The future always resolves: with the response, or with
    // Timeout after the per-call deadline, Disconnected if the process dies,
    // Cancelled on shutdown. Outside Ready it resolves immediately.
    ResponseFuture call(const std::string& method, const nlohmann::json& params);
    ResponseFuture call(const std::string& method, const nlohmann::json& params,
                        std::chrono::milliseconds timeout);

    // Fire-and-forget JSON-RPC notification.
    bool notify(const std::string& method, const nlohmann::json& params);

    // Lightweight ping. A timeout marks the process hung: the adapter enters
    // Degraded and the process is killed.
    bool health_check();

    // tools/list
    std::vector<RemoteToolInfo> list_tools(std::string* error = nullptr);

    // tools/call, with the result content flattened to text. Adapter failures
    // keep their kind; a JSON-RPC error becomes RemoteError and an isError
    // result becomes ExecutionFailed.
    ToolResult call_tool(const std::string& name, const nlohmann::json& arguments);

private:
    struct Pending {
        std::promise<ProtocolResponse> promise;
        std::chrono::steady_clock::time_point deadline;
        std::chrono::milliseconds timeout;
    };

    ResponseFuture send_request(const std::string& method, const nlohmann::json& params,
                                std::chrono::milliseconds timeout, bool during_handshake);
    bool write_line(const std::string& line);

    void reader_loop();
    void handle_line(const std::string& line);
    void handle_server_request(const nlohmann::json& msg);
    void resolve(int64_t id, ProtocolResponse response);
    void drain_stderr();
    void expire_overdue();
    int poll_timeout_ms() const;
    void fail_all(ErrorKind kind, const std::string& message);
    void enter_degraded(const std::string& reason);
    void monitor_loop();

    std::string tag() const { return "[" + options_.name + "] "; }

    AdapterOptions options_;
    std::unique_ptr<Subprocess> process_;

    // Guards state_, pending_, next_id_ and stderr_tail_.
    mutable std::mutex mutex_;
    AdapterState state_ = AdapterState::NotStarted;
    std::unordered_map<int64_t, Pending> pending_;
    int64_t next_id_ = 1;
    std::string stderr_tail_;

    std::mutex write_mutex_;      // one writer on the child's stdin at a time
    std::mutex lifecycle_mutex_;  // serializes start() and shutdown()
    std::atomic<bool> stopping_{false};
    std::thread reader_;

    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;
    std::thread monitor_;
};

} // namespace toolgate
