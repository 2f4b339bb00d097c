#pragma once
#include "../tool.hpp"
#include "../command_validator.hpp"
#include "../config.hpp"
#include "../process.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace toolgate {

class PathGuard;

struct BackgroundProcess {
    std::string command;
    std::unique_ptr<Subprocess> process;
    std::string log_path;       // combined stdout+stderr
    size_t read_offset = 0;     // bytes already returned by output()
    size_t discarded = 0;       // unread bytes dropped by the log cap, not yet reported
    std::chrono::steady_clock::time_point started;
};

// Processes started with run_in_background. Shared by bash, bash_output and
// bash_kill; its pids are the "agent-started" set the kill rule checks.
// Each log is kept under max_log_bytes: a watcher thread empties any log that
// grows past it and output() reports the dropped byte count.
class BackgroundProcessTable {
public:
    static constexpr size_t kDefaultMaxLogBytes = 4 * 1024 * 1024;

    explicit BackgroundProcessTable(size_t max_processes,
                                    size_t max_log_bytes = kDefaultMaxLogBytes);
    ~BackgroundProcessTable();

    BackgroundProcessTable(const BackgroundProcessTable&) = delete;
    BackgroundProcessTable& operator=(const BackgroundProcessTable&) = delete;

    ToolResult start(const std::string& command, SpawnOptions opts);
    // New output since the last call, plus running/exited status.
    ToolResult output(const std::string& id, size_t max_bytes);
    ToolResult kill(const std::string& id);

    // pid is one of ours, or a member of one of our process groups.
    bool owns_pid(long pid) const;
    size_t size() const;
    void kill_all();

private:
    void remove_locked(std::map<std::string, BackgroundProcess>::iterator it);
    void cap_log_locked(const std::string& id, BackgroundProcess& bp);
    void watch_logs();

    mutable std::mutex mutex_;
    std::map<std::string, BackgroundProcess> processes_;
    uint32_t next_id_ = 0;
    size_t max_processes_;
    size_t max_log_bytes_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    std::thread watcher_;
};

class ShellTool : public Tool {
public:
    ShellTool(const PathGuard& guard, const SandboxConfig& sandbox,
              std::shared_ptr<BackgroundProcessTable> background);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "bash"; }
    std::string description() const override;
    std::string parameters_json() const override;
    void reset() override;

private:
    ToolResult run_foreground(const std::string& command, std::chrono::milliseconds timeout);
    SpawnOptions shell_options(const std::string& command) const;

    const PathGuard& guard_;
    SandboxConfig sandbox_;
    std::shared_ptr<BackgroundProcessTable> background_;
    CommandValidator validator_;
};

class ShellOutputTool : public Tool {
public:
    ShellOutputTool(std::shared_ptr<BackgroundProcessTable> background, size_t max_bytes)
        : background_(std::move(background)), max_bytes_(max_bytes) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "bash_output"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    std::shared_ptr<BackgroundProcessTable> background_;
    size_t max_bytes_;
};

class ShellKillTool : public Tool {
public:
    explicit ShellKillTool(std::shared_ptr<BackgroundProcessTable> background)
        : background_(std::move(background)) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "bash_kill"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    std::shared_ptr<BackgroundProcessTable> background_;
};

// Combine captured streams the way the agent sees them: stdout, then
// "[stderr]: ...", then "[exit code: N]" when non-zero.
std::string format_shell_output(const RunResult& run);

} // namespace toolgate
