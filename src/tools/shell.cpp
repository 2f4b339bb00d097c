#include "shell.hpp"
#include "tool_util.hpp"
#include "../path_guard.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

namespace toolgate {

// Argument names agents use to ask for an unsandboxed run.
static const char* const kBypassKeys[] = {
    "dangerouslyDisableSandbox", "dangerously_disable_sandbox",
    "disable_sandbox", "disableSandbox", "unsandboxed",
};

std::string format_shell_output(const RunResult& run) {
    std::string output = run.out;
    if (!run.err.empty()) output += "\n[stderr]: " + run.err;
    if (run.truncated) output += "\n[output truncated]";
    if (run.exit_code != 0) output += "\n[exit code: " + std::to_string(run.exit_code) + "]";
    return trim(output).empty() ? "(no output)" : output;
}

// ── BackgroundProcessTable ───────────────────────────────────────

static constexpr std::chrono::milliseconds kLogCheckInterval{250};

BackgroundProcessTable::BackgroundProcessTable(size_t max_processes, size_t max_log_bytes)
    : max_processes_(max_processes), max_log_bytes_(max_log_bytes) {
    watcher_ = std::thread(&BackgroundProcessTable::watch_logs, this);
}

BackgroundProcessTable::~BackgroundProcessTable() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (watcher_.joinable()) watcher_.join();
    kill_all();
}

void BackgroundProcessTable::watch_logs() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_cv_.wait_for(lock, kLogCheckInterval, [this] { return stopping_; })) {
        for (auto& [id, bp] : processes_) cap_log_locked(id, bp);
    }
}

// Empty a log that outgrew the cap. The child appends, so it keeps writing
// at the new end.
void BackgroundProcessTable::cap_log_locked(const std::string& id, BackgroundProcess& bp) {
    struct stat st;
    if (::stat(bp.log_path.c_str(), &st) != 0) return;
    auto size = static_cast<size_t>(st.st_size);
    if (size <= max_log_bytes_) return;
    if (::truncate(bp.log_path.c_str(), 0) != 0) {
        std::cerr << "[bash] Failed to truncate output of " << id << ": "
                  << std::strerror(errno) << "\n";
        return;
    }
    bp.discarded += size - std::min(size, bp.read_offset);
    bp.read_offset = 0;
    std::cerr << "[bash] Output of " << id << " exceeded " << max_log_bytes_
              << " bytes; discarded\n";
}

ToolResult BackgroundProcessTable::start(const std::string& command, SpawnOptions opts) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (processes_.size() >= max_processes_) {
        for (auto it = processes_.begin(); it != processes_.end();) {
            auto next = std::next(it);
            if (it->second.process->try_reap()) remove_locked(it);
            it = next;
        }
    }
    if (processes_.size() >= max_processes_) {
        return tool_error(ErrorKind::ExecutionFailed,
                          "Too many background processes (max " +
                          std::to_string(max_processes_) + "); stop one with bash_kill");
    }

    std::error_code ec;
    std::string tmpl = (std::filesystem::temp_directory_path(ec) / "toolgate-bg-XXXXXX").string();
    if (ec) tmpl = "/tmp/toolgate-bg-XXXXXX";
    std::vector<char> path(tmpl.begin(), tmpl.end());
    path.push_back('\0');
    int log_fd = ::mkstemp(path.data());
    if (log_fd < 0) {
        return tool_error(ErrorKind::ExecutionFailed, "Failed to create output file");
    }
    if (::fcntl(log_fd, F_SETFL, O_APPEND) != 0) {
        ::close(log_fd);
        ::unlink(path.data());
        return tool_error(ErrorKind::ExecutionFailed, "Failed to prepare output file");
    }

    opts.stdout_fd = log_fd;
    opts.pipe_stdin = false;
    std::string error;
    auto proc = Subprocess::spawn(opts, error);
    ::close(log_fd);
    if (!proc) {
        ::unlink(path.data());
        return tool_error(ErrorKind::ExecutionFailed, error);
    }

    std::string id = "proc_" + std::to_string(next_id_++);
    pid_t pid = proc->pid();
    BackgroundProcess bp;
    bp.command = command;
    bp.process = std::move(proc);
    bp.log_path = path.data();
    bp.started = std::chrono::steady_clock::now();
    processes_.emplace(id, std::move(bp));

    std::cerr << "[bash] Started " << id << " (pid " << pid << "): " << command << "\n";
    return ToolResult{true, "Started background process " + id + " (pid " +
                            std::to_string(pid) + "). Use bash_output with id \"" + id +
                            "\" to read its output."};
}

ToolResult BackgroundProcessTable::output(const std::string& id, size_t max_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(id);
    if (it == processes_.end()) {
        return tool_error(ErrorKind::NotFound, "No such background process: " + id);
    }
    auto& bp = it->second;
    bool finished = bp.process->try_reap();
    cap_log_locked(id, bp);

    std::string chunk;
    bool more = false;
    std::ifstream log(bp.log_path, std::ios::binary);
    if (log.is_open()) {
        log.seekg(0, std::ios::end);
        auto size = static_cast<size_t>(std::max<std::streamoff>(0, log.tellg()));
        if (size > bp.read_offset) {
            size_t take = std::min(size - bp.read_offset, max_bytes);
            chunk.resize(take);
            log.seekg(static_cast<std::streamoff>(bp.read_offset));
            log.read(&chunk[0], static_cast<std::streamsize>(take));
            chunk.resize(static_cast<size_t>(log.gcount()));
            bp.read_offset += chunk.size();
            more = bp.read_offset < size;
        }
    }

    std::string out = chunk.empty() ? "(no new output)" : chunk;
    if (bp.discarded > 0) {
        out = "[output truncated: " + std::to_string(bp.discarded) +
              " bytes discarded]\n" + out;
        bp.discarded = 0;
    }
    if (more) out += "\n[more output available]";
    if (finished) {
        out += "\n[status: exited with code " + std::to_string(bp.process->exit_code()) + "]";
    } else {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - bp.started).count();
        out += "\n[status: running for " + std::to_string(secs) + "s]";
    }
    return ToolResult{true, out};
}

ToolResult BackgroundProcessTable::kill(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(id);
    if (it == processes_.end()) {
        return tool_error(ErrorKind::NotFound, "No such background process: " + id);
    }
    auto& proc = *it->second.process;
    bool was_running = !proc.try_reap();
    if (was_running) {
        proc.signal(SIGKILL);
        proc.wait();
    }
    std::cerr << "[bash] Killed " << id << " (pid " << proc.pid() << ")\n";
    std::string msg = was_running ? "Killed background process " + id
                                  : "Background process " + id + " had already exited with code " +
                                        std::to_string(proc.exit_code());
    remove_locked(it);
    return ToolResult{true, msg};
}

bool BackgroundProcessTable::owns_pid(long pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_t group = ::getpgid(static_cast<pid_t>(pid));
    for (const auto& [id, bp] : processes_) {
        if (bp.process->exited()) continue;
        if (bp.process->pid() == pid || bp.process->pid() == group) return true;
    }
    return false;
}

size_t BackgroundProcessTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

void BackgroundProcessTable::kill_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!processes_.empty()) {
        auto it = processes_.begin();
        it->second.process->signal(SIGKILL);
        it->second.process->wait();
        remove_locked(it);
    }
}

void BackgroundProcessTable::remove_locked(std::map<std::string, BackgroundProcess>::iterator it) {
    ::unlink(it->second.log_path.c_str());
    processes_.erase(it);
}

// ── ShellTool ────────────────────────────────────────────────────

ShellTool::ShellTool(const PathGuard& guard, const SandboxConfig& sandbox,
                     std::shared_ptr<BackgroundProcessTable> background)
    : guard_(guard),
      sandbox_(sandbox),
      background_(std::move(background)),
      validator_(CommandPolicy::defaults(),
                 [table = background_](long pid) { return table->owns_pid(pid); }) {}

void ShellTool::reset() {
    background_->kill_all();
}

SpawnOptions ShellTool::shell_options(const std::string& command) const {
    SpawnOptions opts;
    opts.argv = {"/bin/sh", "-c", command};
    opts.cwd = guard_.root().string();
    opts.env = scrubbed_environment({});
    opts.new_session = true;
    opts.pipe_stdin = false;
    return opts;
}

ToolResult ShellTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    for (const char* key : kBypassKeys) {
        if (args.contains(key) && !(args[key].is_boolean() && !args[key].get<bool>())) {
            return tool_error(ErrorKind::SecurityDenied,
                              "Command blocked: running outside the sandbox is not permitted");
        }
    }

    if (auto err = require_string(args, "command")) return *err;
    std::string command = args["command"].get<std::string>();

    std::optional<size_t> timeout_ms;
    if (auto err = optional_count(args, "timeout", timeout_ms)) return *err;
    auto limit = std::chrono::milliseconds(
        static_cast<int64_t>(sandbox_.shell_timeout_sec) * 1000);
    auto timeout = limit;
    if (timeout_ms && *timeout_ms > 0) {
        timeout = std::min(limit, std::chrono::milliseconds(static_cast<int64_t>(*timeout_ms)));
    }

    SecurityDecision decision = validator_.validate(command);
    if (!decision.allowed) {
        std::cerr << "[bash] Blocked: " << decision.reason << "\n";
        return tool_error(ErrorKind::SecurityDenied, "Command blocked: " + decision.reason);
    }

    if (flag_value(args, "run_in_background")) {
        return background_->start(command, shell_options(command));
    }
    return run_foreground(command, timeout);
}

ToolResult ShellTool::run_foreground(const std::string& command,
                                     std::chrono::milliseconds timeout) {
    RunResult run = run_process(shell_options(command), timeout, sandbox_.max_output_bytes);
    if (!run.started) {
        return tool_error(ErrorKind::ExecutionFailed, "Command execution failed: " + run.error);
    }
    if (run.timed_out) {
        auto ms = timeout.count();
        std::string msg = "Command timed out after " +
                          (ms % 1000 == 0 ? std::to_string(ms / 1000) + " seconds"
                                          : std::to_string(ms) + " ms");
        std::string partial = trim(run.out + run.err);
        if (!partial.empty()) msg += "\n" + partial;
        return tool_error(ErrorKind::Timeout, msg);
    }

    std::string output = format_shell_output(run);
    if (run.exit_code != 0) return tool_error(ErrorKind::ExecutionFailed, output);
    return ToolResult{true, output};
}

std::string ShellTool::description() const {
    return "Run a shell command in the project directory. Only allowlisted commands are "
           "permitted. Set run_in_background for long-running servers and read their "
           "output with bash_output.";
}

std::string ShellTool::parameters_json() const {
    return R"json({"type":"object","properties":{"command":{"type":"string","description":"The command to run"},"timeout":{"type":"integer","description":"Timeout in milliseconds (capped by the sandbox limit)"},"run_in_background":{"type":"boolean","description":"Start the command in the background and return an id"}},"required":["command"]})json";
}

// ── ShellOutputTool / ShellKillTool ──────────────────────────────

ToolResult ShellOutputTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "id")) return *err;
    return background_->output(args["id"].get<std::string>(), max_bytes_);
}

std::string ShellOutputTool::description() const {
    return "Read new output from a background process started by bash, with its status.";
}

std::string ShellOutputTool::parameters_json() const {
    return R"json({"type":"object","properties":{"id":{"type":"string","description":"Background process id returned by bash"}},"required":["id"]})json";
}

ToolResult ShellKillTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "id")) return *err;
    return background_->kill(args["id"].get<std::string>());
}

std::string ShellKillTool::description() const {
    return "Stop a background process started by bash.";
}

std::string ShellKillTool::parameters_json() const {
    return R"json({"type":"object","properties":{"id":{"type":"string","description":"Background process id returned by bash"}},"required":["id"]})json";
}

} // namespace toolgate
