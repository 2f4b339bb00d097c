#include "process.hpp"
#include "util.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolgate {

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !exited()) {
        signal(SIGKILL);
        wait();
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

std::unique_ptr<Subprocess> Subprocess::spawn(const SpawnOptions& opts, std::string& error) {
    if (opts.argv.empty()) {
        error = "No command given";
        return nullptr;
    }

    // Everything the child needs is prepared before fork(): the child of a
    // multithreaded parent may only call async-signal-safe functions.
    std::vector<char*> argv;
    for (const auto& a : opts.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& e : opts.env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    bool ok = ::pipe2(exec_pipe, O_CLOEXEC) == 0;
    if (ok && opts.pipe_stdin) ok = ::pipe2(in_pipe, O_CLOEXEC) == 0;
    if (ok && !opts.pipe_stdin) {
        in_pipe[0] = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        ok = in_pipe[0] >= 0;
    }
    if (ok && opts.stdout_fd < 0) {
        ok = ::pipe2(out_pipe, O_CLOEXEC) == 0 && ::pipe2(err_pipe, O_CLOEXEC) == 0;
    }
    if (!ok) {
        error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_all();
        return nullptr;
    }

    const char* cwd = opts.cwd.empty() ? nullptr : opts.cwd.c_str();
    int child_out = opts.stdout_fd >= 0 ? opts.stdout_fd : out_pipe[1];
    int child_err = opts.stdout_fd >= 0 ? opts.stdout_fd : err_pipe[1];

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("Failed to fork process: ") + std::strerror(errno);
        close_all();
        return nullptr;
    }

    if (pid == 0) {
        if (opts.new_session) ::setsid();
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(child_out, STDOUT_FILENO);
        ::dup2(child_err, STDERR_FILENO);
        int err = 0;
        if (cwd && ::chdir(cwd) != 0) {
            err = errno;
        } else {
            if (!opts.env.empty()) environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t w = ::write(exec_pipe[1], &err, sizeof(err));
        (void)w;
        _exit(127);
    }

    auto proc = std::unique_ptr<Subprocess>(new Subprocess());
    proc->pid_ = pid;
    proc->group_ = opts.new_session;

    close_fd(exec_pipe[1]);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    // The exec pipe closes on successful exec (O_CLOEXEC) or carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        error = "Failed to start '" + opts.argv[0] + "': " + std::strerror(child_errno);
        proc->wait();
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        return nullptr;
    }

    proc->stdin_fd_ = in_pipe[1];
    proc->stdout_fd_ = out_pipe[0];
    proc->stderr_fd_ = err_pipe[0];
    return proc;
}

bool Subprocess::write_all(const std::string& data) {
    if (stdin_fd_ < 0) return false;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

void Subprocess::close_stdin() {
    close_fd(stdin_fd_);
}

void Subprocess::close_output() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void Subprocess::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || reaped_) return;
    if (group_) ::kill(-pid_, sig);
    ::kill(pid_, sig);
}

bool Subprocess::try_reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return true;
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
        status_ = status;
    }
    return reaped_;
}

// Polls instead of blocking in waitpid() so signal() from another thread
// is never stuck behind the mutex while the child is still alive.
int Subprocess::wait() {
    while (!try_reap()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

int Subprocess::terminate(std::chrono::milliseconds grace) {
    signal(SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap()) return wait();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    signal(SIGKILL);
    return wait();
}

bool Subprocess::exited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_;
}

int Subprocess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) return -1;
    if (WIFEXITED(status_)) return WEXITSTATUS(status_);
    if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
    return -1;
}

// ── run_process ──────────────────────────────────────────────────

static void append_capped(std::string& dst, const char* data, size_t len,
                          size_t cap, bool& truncated) {
    if (dst.size() >= cap) {
        truncated = true;
        return;
    }
    size_t take = std::min(len, cap - dst.size());
    dst.append(data, take);
    if (take < len) truncated = true;
}

RunResult run_process(const SpawnOptions& opts, std::chrono::milliseconds timeout,
                      size_t max_output, const std::string& stdin_data) {
    RunResult result;
    SpawnOptions o = opts;
    o.stdout_fd = -1;
    o.pipe_stdin = !stdin_data.empty();

    std::string error;
    auto proc = Subprocess::spawn(o, error);
    if (!proc) {
        result.error = error;
        return result;
    }
    result.started = true;

    if (!stdin_data.empty()) {
        proc->write_all(stdin_data);
        proc->close_stdin();
    }

    int fds[2] = {proc->stdout_fd(), proc->stderr_fd()};
    bool open[2] = {true, true};
    std::array<char, 4096> buffer;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (open[0] || open[1]) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        int which[2];
        for (int i = 0; i < 2; ++i) {
            if (!open[i]) continue;
            pfds[count].fd = fds[i];
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            which[count] = i;
            ++count;
        }

        int wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 100));
        int ret = ::poll(pfds, count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            // A background grandchild can hold the pipes open after the
            // shell exits; stop once the direct child is gone and idle.
            if (proc->try_reap()) break;
            continue;
        }

        for (nfds_t k = 0; k < count; ++k) {
            if (pfds[k].revents == 0) continue;
            int i = which[k];
            ssize_t n = ::read(fds[i], buffer.data(), buffer.size());
            if (n > 0) {
                append_capped(i == 0 ? result.out : result.err, buffer.data(),
                              static_cast<size_t>(n), max_output, result.truncated);
            } else if (n == 0 || errno != EINTR) {
                open[i] = false;
            }
        }
    }

    if (result.timed_out) {
        proc->signal(SIGKILL);
    }
    proc->wait();
    proc->close_output();
    result.exit_code = proc->exit_code();
    return result;
}

// ── Environment ──────────────────────────────────────────────────

bool is_secret_variable(const std::string& name) {
    static const char* const markers[] = {
        "API_KEY", "APIKEY", "TOKEN", "SECRET", "PASSWORD", "PASSWD", "CREDENTIAL",
        "PRIVATE_KEY", "ACCESS_KEY",
    };
    std::string upper = to_upper(name);
    for (const char* m : markers) {
        if (upper.find(m) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> scrubbed_environment(const std::vector<std::string>& passthrough) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string name = entry.substr(0, entry.find('='));
        bool keep = !is_secret_variable(name) ||
                    std::find(passthrough.begin(), passthrough.end(), name) != passthrough.end();
        if (keep) env.push_back(std::move(entry));
    }
    return env;
}

std::string find_in_path(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    const char* path = std::getenv("PATH");
    if (!path) return {};
    for (const auto& dir : split(path, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        struct stat st;
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

} // namespace toolgate
