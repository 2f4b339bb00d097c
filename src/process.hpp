#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace toolgate {

struct SpawnOptions {
    std::vector<std::string> argv;       // argv[0] is looked up on PATH
    std::string cwd;                     // empty = inherit
    std::vector<std::string> env;        // "NAME=value"; empty = inherit
    bool new_session = true;             // setsid() so the whole group can be signalled
    bool pipe_stdin = true;              // false = /dev/null
    int stdout_fd = -1;                  // >= 0: child writes stdout+stderr here, no pipes
};

// A spawned child process with its pipes. The destructor kills and reaps a
// child that is still running, so a Subprocess never leaks a zombie.
class Subprocess {
public:
    ~Subprocess();
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Returns nullptr and sets error when the executable cannot be started
    // (fork failure, missing binary, bad working directory).
    static std::unique_ptr<Subprocess> spawn(const SpawnOptions& opts, std::string& error);

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Write the whole buffer to the child's stdin. False on a closed pipe.
    bool write_all(const std::string& data);
    void close_stdin();
    void close_output();

    // Send sig to the child (and its process group when it has one).
    void signal(int sig);

    // Non-blocking reap. True once the child has exited.
    bool try_reap();
    // Blocking reap. Returns the raw wait status.
    int wait();
    // SIGTERM, wait up to grace, then SIGKILL. Always reaps.
    int terminate(std::chrono::milliseconds grace);

    bool exited() const;
    // Exit code, or 128 + signal number for a signalled child.
    int exit_code() const;

private:
    Subprocess() = default;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool group_ = false;

    mutable std::mutex mutex_;
    bool reaped_ = false;
    int status_ = 0;
};

struct RunResult {
    bool started = false;
    std::string error;        // spawn error when !started
    int exit_code = -1;
    bool timed_out = false;
    bool truncated = false;
    std::string out;
    std::string err;
};

// Run to completion, capturing stdout and stderr separately (each capped at
// max_output bytes; the rest is drained and dropped). On timeout the process
// group is killed and reaped.
RunResult run_process(const SpawnOptions& opts, std::chrono::milliseconds timeout,
                      size_t max_output, const std::string& stdin_data = "");

// Variable names that look like credentials (API keys, tokens, secrets).
bool is_secret_variable(const std::string& name);

// Current environment minus secret variables, except those in passthrough.
std::vector<std::string> scrubbed_environment(const std::vector<std::string>& passthrough);

// Resolve an executable name against PATH. Empty when not found.
std::string find_in_path(const std::string& name);

} // namespace toolgate
