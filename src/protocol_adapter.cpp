#include "protocol_adapter.hpp"
#include "util.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <poll.h>
#include <unistd.h>

namespace toolgate {

static constexpr size_t kStderrTailBytes = 4096;
static constexpr int kMaxPollMs = 200;

static ResponseFuture ready_response(ErrorKind kind, const std::string& message) {
    std::promise<ProtocolResponse> promise;
    ProtocolResponse resp;
    resp.kind = kind;
    resp.error_message = message;
    promise.set_value(std::move(resp));
    return promise.get_future().share();
}

// Typed field reads that fall back instead of throwing on a type mismatch.
static std::string string_field(const nlohmann::json& obj, const char* key,
                                const std::string& fallback) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : fallback;
}

static bool bool_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

ProtocolAdapter::ProtocolAdapter(AdapterOptions options)
    : options_(std::move(options)) {}

ProtocolAdapter::~ProtocolAdapter() {
    shutdown();
}

AdapterState ProtocolAdapter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

pid_t ProtocolAdapter::pid() const {
    return process_ ? process_->pid() : -1;
}

size_t ProtocolAdapter::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::string ProtocolAdapter::stderr_tail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stderr_tail_;
}

// ── Lifecycle ────────────────────────────────────────────────────

bool ProtocolAdapter::start(std::string& error) {
    std::unique_lock<std::mutex> life(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != AdapterState::NotStarted) {
            error = std::string("Adapter already ") + adapter_state_to_string(state_);
            return state_ == AdapterState::Ready;
        }
        state_ = AdapterState::Starting;
    }

    if (options_.argv.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = AdapterState::Stopped;
        error = "No command configured";
        return false;
    }

    // A dead child must surface as EPIPE on write, not kill this process.
    std::signal(SIGPIPE, SIG_IGN);

    SpawnOptions spawn;
    spawn.argv = options_.argv;
    spawn.cwd = options_.cwd;
    spawn.env = scrubbed_environment(options_.env_passthrough);
    spawn.new_session = true;
    spawn.pipe_stdin = true;

    process_ = Subprocess::spawn(spawn, error);
    if (!process_) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = AdapterState::Stopped;
        return false;
    }
    std::cerr << tag() << "Started '" << options_.argv[0] << "' (pid "
              << process_->pid() << ")\n";

    reader_ = std::thread(&ProtocolAdapter::reader_loop, this);

    nlohmann::json params = {
        {"protocolVersion", options_.protocol_version},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", options_.client_name},
                        {"version", options_.client_version}}}
    };
    ProtocolResponse init = send_request("initialize", params,
                                         options_.start_timeout, true).get();

    std::string failure;
    if (!init.ok()) {
        failure = "initialize failed (" + std::string(error_kind_to_string(init.kind)) +
                  "): " + init.error_message;
    } else if (!init.result.is_object()) {
        failure = "initialize returned a malformed result";
    } else if (!notify("notifications/initialized", nlohmann::json::object())) {
        failure = "failed to send initialized notification";
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == AdapterState::Starting) {
            state_ = AdapterState::Ready;
        } else {
            failure = "process exited during handshake";
        }
    }

    if (!failure.empty()) {
        life.unlock();
        shutdown();
        std::string tail = stderr_tail();
        error = failure;
        if (!tail.empty()) error += "\n" + trim(tail);
        return false;
    }

    if (init.result.contains("serverInfo") && init.result["serverInfo"].is_object()) {
        const auto& info = init.result["serverInfo"];
        std::cerr << tag() << "Ready: " << string_field(info, "name", "?") << " "
                  << string_field(info, "version", "") << "\n";
    } else {
        std::cerr << tag() << "Ready\n";
    }

    if (options_.health_interval.count() > 0) {
        monitor_ = std::thread(&ProtocolAdapter::monitor_loop, this);
    }
    return true;
}

void ProtocolAdapter::shutdown() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    AdapterState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        state_ = AdapterState::Stopped;
    }
    if (previous == AdapterState::Stopped && !reader_.joinable() && !monitor_.joinable())
        return;

    stopping_ = true;
    fail_all(ErrorKind::Cancelled, "Adapter shut down");

    if (monitor_.joinable()) {
        {
            std::lock_guard<std::mutex> lock(monitor_mutex_);
            monitor_stop_ = true;
        }
        monitor_cv_.notify_all();
        monitor_.join();
    }

    if (process_) {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            process_->close_stdin();
        }
        process_->terminate(options_.shutdown_grace);
    }
    if (reader_.joinable()) reader_.join();
    if (process_) {
        drain_stderr();
        process_->close_output();
        std::cerr << tag() << "Stopped (exit code " << process_->exit_code() << ")\n";
    }
}

// ── Requests ─────────────────────────────────────────────────────

ResponseFuture ProtocolAdapter::call(const std::string& method,
                                     const nlohmann::json& params) {
    return call(method, params, options_.call_timeout);
}

ResponseFuture ProtocolAdapter::call(const std::string& method,
                                     const nlohmann::json& params,
                                     std::chrono::milliseconds timeout) {
    return send_request(method, params, timeout, false);
}

ResponseFuture ProtocolAdapter::send_request(const std::string& method,
                                             const nlohmann::json& params,
                                             std::chrono::milliseconds timeout,
                                             bool during_handshake) {
    int64_t id;
    ResponseFuture future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        AdapterState expected = during_handshake ? AdapterState::Starting
                                                 : AdapterState::Ready;
        if (state_ != expected) {
            if (state_ == AdapterState::Degraded)
                return ready_response(ErrorKind::Disconnected, "Process is not running");
            return ready_response(ErrorKind::Unavailable,
                                  std::string("Adapter is ") + adapter_state_to_string(state_));
        }
        id = next_id_++;
        Pending pending;
        pending.deadline = std::chrono::steady_clock::now() + timeout;
        pending.timeout = timeout;
        future = pending.promise.get_future().share();
        pending_.emplace(id, std::move(pending));
    }

    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };
    if (!write_line(request.dump())) {
        ProtocolResponse resp;
        resp.id = id;
        resp.kind = ErrorKind::Disconnected;
        resp.error_message = "Failed to write request to process";
        resolve(id, std::move(resp));
    }
    return future;
}

bool ProtocolAdapter::notify(const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params}
    };
    return write_line(msg.dump());
}

bool ProtocolAdapter::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!process_) return false;
    return process_->write_all(line + "\n");
}

bool ProtocolAdapter::health_check() {
    if (!is_ready()) return false;

    ProtocolResponse resp = call("ping", nlohmann::json::object(),
                                 options_.health_timeout).get();
    // An error reply still proves the process is reading and answering.
    if (resp.kind == ErrorKind::None || resp.kind == ErrorKind::RemoteError)
        return true;

    if (resp.kind == ErrorKind::Timeout) {
        enter_degraded("health check timed out");
        if (process_) process_->signal(SIGKILL);
    }
    return false;
}

std::vector<RemoteToolInfo> ProtocolAdapter::list_tools(std::string* error) {
    std::vector<RemoteToolInfo> tools;
    ProtocolResponse resp = call("tools/list", nlohmann::json::object()).get();
    if (!resp.ok()) {
        if (error) *error = resp.error_message;
        return tools;
    }
    if (!resp.result.contains("tools") || !resp.result["tools"].is_array()) {
        if (error) *error = "tools/list returned no tools array";
        return tools;
    }
    for (const auto& t : resp.result["tools"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) continue;
        RemoteToolInfo info;
        info.name = t["name"].get<std::string>();
        info.description = string_field(t, "description", "");
        if (t.contains("inputSchema") && t["inputSchema"].is_object())
            info.input_schema = t["inputSchema"];
        else
            info.input_schema = nlohmann::json::object();
        tools.push_back(std::move(info));
    }
    return tools;
}

// Text blocks joined by newlines; images are summarized by MIME type.
static std::string flatten_content(const nlohmann::json& result) {
    if (!result.is_object() || !result.contains("content") ||
        !result["content"].is_array() || result["content"].empty()) {
        return result.is_null() ? std::string() : result.dump();
    }
    std::string out;
    bool first = true;
    for (const auto& block : result["content"]) {
        if (!block.is_object()) continue;
        std::string type = string_field(block, "type", "");
        std::string part;
        if (type == "text") {
            if (!block.contains("text") || !block["text"].is_string()) continue;
            part = block["text"].get<std::string>();
        } else if (type == "image") {
            part = "[Image: " + string_field(block, "mimeType", "image/png") + "]";
        } else {
            continue;
        }
        if (!first) out += "\n";
        out += part;
        first = false;
    }
    return out;
}

ToolResult ProtocolAdapter::call_tool(const std::string& name,
                                      const nlohmann::json& arguments) {
    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    ProtocolResponse resp = call("tools/call", params).get();

    if (resp.kind == ErrorKind::RemoteError)
        return tool_error(ErrorKind::RemoteError, "MCP error: " + resp.error_message);
    if (!resp.ok())
        return tool_error(resp.kind, resp.error_message);

    std::string text = flatten_content(resp.result);
    if (resp.result.is_object() && bool_field(resp.result, "isError"))
        return tool_error(ErrorKind::ExecutionFailed, text.empty() ? "Tool failed" : text);
    return ToolResult{true, text.empty() ? "(no output)" : text};
}

// ── Reader thread ────────────────────────────────────────────────

void ProtocolAdapter::reader_loop() {
    int out_fd = process_->stdout_fd();
    int err_fd = process_->stderr_fd();
    std::string buffer;
    char chunk[8192];

    while (!stopping_) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int rc = ::poll(fds, nfds, poll_timeout_ms());
        if (rc < 0 && errno != EINTR) break;

        expire_overdue();
        if (rc <= 0) continue;

        if (nfds > 1 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = ::read(err_fd, chunk, sizeof(chunk));
            if (n > 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                stderr_tail_.append(chunk, static_cast<size_t>(n));
                if (stderr_tail_.size() > kStderrTailBytes)
                    stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
            } else if (n == 0 || errno != EINTR) {
                err_fd = -1;
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(out_fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;

            buffer.append(chunk, static_cast<size_t>(n));
            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                try {
                    handle_line(line);
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << tag() << "Dropping unreadable message: " << e.what() << "\n";
                }
            }
        }
    }

    if (stopping_) return;

    // stdout closed: the process is gone or no longer usable.
    process_->signal(SIGKILL);
    process_->wait();
    enter_degraded("process exited with code " + std::to_string(process_->exit_code()));
}

// Collect whatever the exited process left on stderr without blocking.
void ProtocolAdapter::drain_stderr() {
    int err_fd = process_->stderr_fd();
    if (err_fd < 0) return;
    char chunk[4096];
    for (;;) {
        struct pollfd pfd = {err_fd, POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) return;
        ssize_t n = ::read(err_fd, chunk, sizeof(chunk));
        if (n <= 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_tail_.append(chunk, static_cast<size_t>(n));
        if (stderr_tail_.size() > kStderrTailBytes)
            stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
    }
}

int ProtocolAdapter::poll_timeout_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) return kMaxPollMs;
    auto earliest = std::chrono::steady_clock::time_point::max();
    for (const auto& [id, p] : pending_) earliest = std::min(earliest, p.deadline);
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        earliest - std::chrono::steady_clock::now()).count();
    if (wait < 1) return 1;
    return static_cast<int>(std::min<long long>(wait, kMaxPollMs));
}

void ProtocolAdapter::handle_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty()) return;

    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        std::cerr << tag() << "Dropping malformed line: " << truncate_utf8(line, 200) << "\n";
        return;
    }

    if (msg.contains("method")) {
        if (msg.contains("id")) handle_server_request(msg);
        return;  // server notifications carry nothing we act on
    }

    if (!msg.contains("id") || !msg["id"].is_number_integer()) {
        std::cerr << tag() << "Dropping message without a usable id: "
                  << truncate_utf8(line, 200) << "\n";
        return;
    }

    ProtocolResponse resp;
    resp.id = msg["id"].get<int64_t>();
    if (msg.contains("error") && msg["error"].is_object()) {
        const auto& err = msg["error"];
        if (!err.contains("code") || !err["code"].is_number_integer()) {
            std::cerr << tag() << "Response " << resp.id << " has a malformed error: "
                      << truncate_utf8(line, 200) << "\n";
            resp.kind = ErrorKind::MalformedResponse;
            resp.error_message = "Response has a malformed error object";
        } else {
            resp.kind = ErrorKind::RemoteError;
            resp.error_code = err["code"].get<int>();
            resp.error_message = string_field(err, "message", "Unknown error");
            if (err.contains("data")) resp.result = err["data"];
        }
    } else if (msg.contains("result")) {
        resp.result = msg["result"];
    } else {
        std::cerr << tag() << "Response " << resp.id << " has neither result nor error\n";
        resp.kind = ErrorKind::MalformedResponse;
        resp.error_message = "Response has neither result nor error";
    }
    resolve(resp.id, std::move(resp));
}

void ProtocolAdapter::handle_server_request(const nlohmann::json& msg) {
    std::string method = msg["method"].is_string() ? msg["method"].get<std::string>() : "";
    nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
    if (method == "ping") {
        reply["result"] = nlohmann::json::object();
    } else {
        std::cerr << tag() << "Ignoring server request: " << method << "\n";
        reply["error"] = {{"code", -32601}, {"message", "Method not found"}};
    }
    write_line(reply.dump());
}

void ProtocolAdapter::resolve(int64_t id, ProtocolResponse response) {
    std::promise<ProtocolResponse> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Late reply after a timeout, or an id we never issued.
            if (response.kind != ErrorKind::Disconnected)
                std::cerr << tag() << "Dropping response with unknown id " << id << "\n";
            return;
        }
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }
    promise.set_value(std::move(response));
}

void ProtocolAdapter::expire_overdue() {
    std::vector<std::pair<int64_t, Pending>> expired;
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [id, p] : expired) {
        ProtocolResponse resp;
        resp.id = id;
        resp.kind = ErrorKind::Timeout;
        resp.error_message = "Request timed out after " +
                             std::to_string(p.timeout.count()) + " ms";
        p.promise.set_value(std::move(resp));
    }
}

void ProtocolAdapter::fail_all(ErrorKind kind, const std::string& message) {
    std::unordered_map<int64_t, Pending> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    for (auto& [id, p] : drained) {
        ProtocolResponse resp;
        resp.id = id;
        resp.kind = kind;
        resp.error_message = message;
        p.promise.set_value(std::move(resp));
    }
}

void ProtocolAdapter::enter_degraded(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != AdapterState::Ready && state_ != AdapterState::Starting) return;
        state_ = AdapterState::Degraded;
    }
    std::cerr << tag() << "Degraded: " << reason << "\n";
    fail_all(ErrorKind::Disconnected, "Process disconnected: " + reason);
}

void ProtocolAdapter::monitor_loop() {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    while (!monitor_stop_) {
        monitor_cv_.wait_for(lock, options_.health_interval, [this] { return monitor_stop_; });
        if (monitor_stop_) break;
        lock.unlock();
        bool healthy = health_check();
        lock.lock();
        if (!healthy && !is_ready()) break;
    }
}

} // namespace toolgate
