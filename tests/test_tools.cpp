#include <catch2/catch.hpp>
#include "config.hpp"
#include "path_guard.hpp"
#include "process.hpp"
#include "tools/file_read.hpp"
#include "tools/file_write.hpp"
#include "tools/file_edit.hpp"
#include "tools/glob_search.hpp"
#include "tools/grep_search.hpp"
#include "tools/shell.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <thread>
#include <cstdlib>
#include <unistd.h>

using namespace toolgate;

// Helper: create a temp directory and return its path
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "toolgate_test_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::filesystem::canonical(result).string() : "";
}

// Helper: write a file directly for setup
static void write_file(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

// Helper: read a file directly for verification
static std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static std::string args_json(const nlohmann::json& j) {
    return j.dump();
}

// ═══ FileReadTool ════════════════════════════════════════════════

TEST_CASE("FileReadTool: reads existing file", "[tools]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    write_file(dir + "/test.txt", "hello world");

    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"test.txt"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "hello world");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: line window with header", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/lines.txt", "one\ntwo\nthree\nfour\nfive\n");

    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"lines.txt","offset":1,"limit":2})");
    REQUIRE(result.success);
    REQUIRE(result.output == "[lines 2-3 of 5]\ntwo\nthree");

    result = tool.execute(R"({"path":"lines.txt","offset":3})");
    REQUIRE(result.output == "[lines 4-5 of 5]\nfour\nfive");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: offset past end of file", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/short.txt", "a\nb\n");

    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"short.txt","offset":10})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::InvalidArguments);
    REQUIRE(result.output.find("total 2 lines") != std::string::npos);

    result = tool.execute(R"({"path":"short.txt","limit":0})");
    REQUIRE(result.kind == ErrorKind::InvalidArguments);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: oversized window values are rejected", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/lines.txt", "one\ntwo\nthree\n");

    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto huge = tool.execute(R"({"path":"lines.txt","limit":1e30})");
    REQUIRE(huge.kind == ErrorKind::InvalidArguments);
    REQUIRE(huge.output == "Parameter is too large: limit (max 1000000000)");

    REQUIRE(tool.execute(R"({"path":"lines.txt","offset":1e19})").kind ==
            ErrorKind::InvalidArguments);

    // Largest accepted values still read to the end of the file.
    auto max = tool.execute(R"({"path":"lines.txt","offset":1,"limit":1000000000})");
    REQUIRE(max.success);
    REQUIRE(max.output == "[lines 2-3 of 3]\ntwo\nthree");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: empty file with window", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/empty.txt", "");

    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"empty.txt","limit":5})");
    REQUIRE(result.success);
    REQUIRE(result.output == "[lines 0-0 of 0] (file is empty)");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: rejects binary file", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/blob.bin", std::string("abc\0def", 7));

    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"blob.bin"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("binary") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: output is capped", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/big.txt", std::string(200, 'x'));

    PathGuard guard(dir);
    FileReadTool tool(guard, 50);
    auto result = tool.execute(R"({"path":"big.txt"})");
    REQUIRE(result.success);
    REQUIRE(result.output == std::string(50, 'x') + "\n[truncated]");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: missing path parameter", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::InvalidArguments);
    REQUIRE(result.output.find("path") != std::string::npos);
}

TEST_CASE("FileReadTool: nonexistent file", "[tools]") {
    auto dir = make_temp_dir();
    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"no_such_file.txt"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::NotFound);
    REQUIRE(result.output.find("File not found") != std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: rejects path traversal", "[tools]") {
    auto dir = make_temp_dir();
    PathGuard guard(dir);
    FileReadTool tool(guard, 50000);
    auto result = tool.execute(R"({"path":"../../../etc/passwd"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::SecurityDenied);

    result = tool.execute(R"({"path":"/etc/passwd"})");
    REQUIRE(result.kind == ErrorKind::SecurityDenied);
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileReadTool: invalid JSON args", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileReadTool tool(guard, 50000);
    auto result = tool.execute("not json");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::InvalidArguments);
    REQUIRE(result.output.find("parse") != std::string::npos);
}

TEST_CASE("FileReadTool: tool_name is read_file", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileReadTool tool(guard, 50000);
    REQUIRE(tool.tool_name() == "read_file");
}

// ═══ FileWriteTool ═══════════════════════════════════════════════

TEST_CASE("FileWriteTool: writes new file", "[tools]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());

    PathGuard guard(dir);
    FileWriteTool tool(guard);
    auto result = tool.execute(R"({"path":"output.txt","content":"written content"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Successfully wrote 15 bytes to output.txt");
    REQUIRE(read_file(dir + "/output.txt") == "written content");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriteTool: creates parent directories", "[tools]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());

    PathGuard guard(dir);
    FileWriteTool tool(guard);
    auto result = tool.execute(R"({"path":"sub/deep/file.txt","content":"nested"})");
    REQUIRE(result.success);
    REQUIRE(read_file(dir + "/sub/deep/file.txt") == "nested");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriteTool: overwrites existing content", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/f.txt", "a much longer original content");

    PathGuard guard(dir);
    FileWriteTool tool(guard);
    REQUIRE(tool.execute(R"({"path":"f.txt","content":"short"})").success);
    REQUIRE(read_file(dir + "/f.txt") == "short");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriteTool: missing content parameter", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileWriteTool tool(guard);
    auto result = tool.execute(R"({"path":"test.txt"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("content") != std::string::npos);
}

TEST_CASE("FileWriteTool: rejects path traversal without touching disk", "[tools]") {
    auto dir = make_temp_dir();
    auto inner = dir + "/project";
    std::filesystem::create_directories(inner);

    PathGuard guard(inner);
    FileWriteTool tool(guard);
    auto result = tool.execute(R"({"path":"../bad.txt","content":"x"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::SecurityDenied);
    REQUIRE_FALSE(std::filesystem::exists(dir + "/bad.txt"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriteTool: tool_name is write_file", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileWriteTool tool(guard);
    REQUIRE(tool.tool_name() == "write_file");
}

// ═══ FileEditTool ════════════════════════════════════════════════

TEST_CASE("FileEditTool: replaces text in file", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/edit.txt", "hello world");

    PathGuard guard(dir);
    FileEditTool tool(guard);
    auto result = tool.execute(R"({"path":"edit.txt","old_string":"world","new_string":"there"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Replaced 1 occurrence(s) in edit.txt");
    REQUIRE(read_file(dir + "/edit.txt") == "hello there");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileEditTool: repeated match replaces only the first", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/dup.txt", "foo bar foo");

    PathGuard guard(dir);
    FileEditTool tool(guard);
    auto result = tool.execute(R"({"path":"dup.txt","old_string":"foo","new_string":"baz"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Replaced 1 occurrence(s) in dup.txt");
    REQUIRE(read_file(dir + "/dup.txt") == "baz bar foo");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileEditTool: replace_all replaces every occurrence", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/dup.txt", "foo bar foo foo");

    PathGuard guard(dir);
    FileEditTool tool(guard);
    auto result = tool.execute(
        R"({"path":"dup.txt","old_string":"foo","new_string":"foofoo","replace_all":true})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Replaced 3 occurrence(s) in dup.txt");
    REQUIRE(read_file(dir + "/dup.txt") == "foofoo bar foofoo foofoo");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileEditTool: old_string not found", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/nf.txt", "hello");

    PathGuard guard(dir);
    FileEditTool tool(guard);
    auto result = tool.execute(R"({"path":"nf.txt","old_string":"missing","new_string":"x"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::NotFound);
    REQUIRE(result.output.find("String not found") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileEditTool: identical strings are a no-op", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/same.txt", "hello");

    PathGuard guard(dir);
    FileEditTool tool(guard);
    auto result = tool.execute(R"({"path":"same.txt","old_string":"hello","new_string":"hello"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::NoOp);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileEditTool: nonexistent file", "[tools]") {
    auto dir = make_temp_dir();
    PathGuard guard(dir);
    FileEditTool tool(guard);
    auto result = tool.execute(R"({"path":"nope.txt","old_string":"a","new_string":"b"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::NotFound);
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileEditTool: missing new_string parameter", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileEditTool tool(guard);
    auto result = tool.execute(R"({"path":"x.txt","old_string":"a"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("new_string") != std::string::npos);
}

TEST_CASE("FileEditTool: tool_name is edit_file", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileEditTool tool(guard);
    REQUIRE(tool.tool_name() == "edit_file");
}

// ═══ GlobSearchTool ══════════════════════════════════════════════

TEST_CASE("GlobSearchTool: recursive pattern, sorted root-relative results", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/src/b.cpp", "");
    write_file(dir + "/src/a.cpp", "");
    write_file(dir + "/src/deep/c.cpp", "");
    write_file(dir + "/src/readme.md", "");
    write_file(dir + "/.git/x.cpp", "");

    PathGuard guard(dir);
    GlobSearchTool tool(guard, 1000);
    auto result = tool.execute(R"({"pattern":"**/*.cpp"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "src/a.cpp\nsrc/b.cpp\nsrc/deep/c.cpp");

    std::filesystem::remove_all(dir);
}

TEST_CASE("GlobSearchTool: search inside a subdirectory", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/src/a.cpp", "");
    write_file(dir + "/src/deep/c.cpp", "");
    write_file(dir + "/top.cpp", "");

    PathGuard guard(dir);
    GlobSearchTool tool(guard, 1000);
    auto result = tool.execute(R"({"pattern":"*.cpp","path":"src"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "src/a.cpp");

    std::filesystem::remove_all(dir);
}

TEST_CASE("GlobSearchTool: no matches", "[tools]") {
    auto dir = make_temp_dir();
    PathGuard guard(dir);
    GlobSearchTool tool(guard, 1000);
    auto result = tool.execute(R"({"pattern":"*.nothing"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "No matches found");
    std::filesystem::remove_all(dir);
}

TEST_CASE("GlobSearchTool: symlink to outside is excluded", "[tools]") {
    auto dir = make_temp_dir();
    auto outside = make_temp_dir();
    write_file(outside + "/secret.txt", "s");
    write_file(dir + "/inside.txt", "i");
    std::filesystem::create_symlink(outside + "/secret.txt", dir + "/link.txt");

    PathGuard guard(dir);
    GlobSearchTool tool(guard, 1000);
    auto result = tool.execute(R"({"pattern":"*.txt"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "inside.txt");

    std::filesystem::remove_all(dir);
    std::filesystem::remove_all(outside);
}

TEST_CASE("GlobSearchTool: search path outside root is denied", "[tools]") {
    auto dir = make_temp_dir();
    PathGuard guard(dir);
    GlobSearchTool tool(guard, 1000);
    auto result = tool.execute(R"({"pattern":"*","path":"../.."})");
    REQUIRE(result.kind == ErrorKind::SecurityDenied);
    std::filesystem::remove_all(dir);
}

TEST_CASE("GlobSearchTool: result cap", "[tools]") {
    auto dir = make_temp_dir();
    for (int i = 0; i < 5; ++i) write_file(dir + "/f" + std::to_string(i) + ".txt", "");

    PathGuard guard(dir);
    GlobSearchTool tool(guard, 2);
    auto result = tool.execute(R"({"pattern":"*.txt"})");
    REQUIRE(result.output == "f0.txt\nf1.txt\n... (results truncated)");
    std::filesystem::remove_all(dir);
}

// ═══ GrepSearchTool ══════════════════════════════════════════════

TEST_CASE("GrepSearchTool: content, files and count modes", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/a.txt", "alpha\nneedle one\n");
    write_file(dir + "/b.txt", "needle two\nneedle three\n");
    write_file(dir + "/c.txt", "nothing here\n");

    PathGuard guard(dir);
    SandboxConfig sandbox;
    GrepSearchTool tool(guard, sandbox);

    if (find_in_path("rg").empty()) {
        auto result = tool.execute(R"({"pattern":"needle"})");
        REQUIRE(result.kind == ErrorKind::ExecutionFailed);
        WARN("rg not installed; only the missing-binary path was checked");
        std::filesystem::remove_all(dir);
        return;
    }

    auto files = tool.execute(R"({"pattern":"needle","glob":"*.txt"})");
    REQUIRE(files.success);
    REQUIRE(files.output.find("a.txt") != std::string::npos);
    REQUIRE(files.output.find("b.txt") != std::string::npos);
    REQUIRE(files.output.find("c.txt") == std::string::npos);

    auto content = tool.execute(R"({"pattern":"needle t","path":"b.txt","output_mode":"content"})");
    REQUIRE(content.success);
    REQUIRE(content.output == "1:needle two\n2:needle three");

    auto paged = tool.execute(
        R"({"pattern":"needle","path":"b.txt","output_mode":"content","offset":1,"head_limit":1})");
    REQUIRE(paged.output == "2:needle three");

    auto limited = tool.execute(
        R"({"pattern":"needle","path":"b.txt","output_mode":"content","head_limit":1})");
    REQUIRE(limited.output == "1:needle two\n... (results truncated)");

    auto none = tool.execute(R"({"pattern":"zzz_absent"})");
    REQUIRE(none.success);
    REQUIRE(none.output == "No matches found");

    std::filesystem::remove_all(dir);
}

TEST_CASE("GrepSearchTool: argument validation", "[tools]") {
    auto dir = make_temp_dir();
    PathGuard guard(dir);
    GrepSearchTool tool(guard, SandboxConfig{});

    REQUIRE(tool.execute(R"({"pattern":"x","output_mode":"lines"})").kind ==
            ErrorKind::InvalidArguments);
    REQUIRE(tool.execute(R"({"pattern":"x","head_limit":0})").kind ==
            ErrorKind::InvalidArguments);
    REQUIRE(tool.execute(R"({"pattern":"x","head_limit":1e30})").kind ==
            ErrorKind::InvalidArguments);
    REQUIRE(tool.execute(R"({"pattern":"x","offset":18446744073709551615})").kind ==
            ErrorKind::InvalidArguments);
    REQUIRE(tool.execute(R"({"pattern":"x","path":"/etc"})").kind ==
            ErrorKind::SecurityDenied);
    REQUIRE(tool.execute(R"({})").kind == ErrorKind::InvalidArguments);

    std::filesystem::remove_all(dir);
}

// ═══ ShellTool ═══════════════════════════════════════════════════

struct ShellFixture {
    std::string dir = make_temp_dir();
    PathGuard guard{dir};
    SandboxConfig sandbox;
    std::shared_ptr<BackgroundProcessTable> background =
        std::make_shared<BackgroundProcessTable>(2);

    ~ShellFixture() { std::filesystem::remove_all(dir); }
};

TEST_CASE("ShellTool: runs simple command in project root", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({"command":"pwd"})");
    REQUIRE(result.success);
    REQUIRE(result.output == fx.dir + "\n");
}

TEST_CASE("ShellTool: git status is allowed", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({"command":"git status"})");
    // Not a repository here, but the command was permitted and ran.
    REQUIRE(result.kind != ErrorKind::SecurityDenied);
}

TEST_CASE("ShellTool: reports stderr and exit code", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({"command":"ls no_such_entry"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::ExecutionFailed);
    REQUIRE(result.output.find("[stderr]: ") != std::string::npos);
    REQUIRE(result.output.find("[exit code: ") != std::string::npos);
}

TEST_CASE("ShellTool: empty output", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({"command":"true"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "(no output)");
}

TEST_CASE("ShellTool: pipelines of allowed commands", "[tools]") {
    ShellFixture fx;
    write_file(fx.dir + "/words.txt", "b\na\nb\n");
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({"command":"cat words.txt | sort | uniq"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "a\nb\n");
}

TEST_CASE("ShellTool: blocked commands never run", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);

    auto result = tool.execute(R"({"command":"rm -rf /"})");
    REQUIRE(result.kind == ErrorKind::SecurityDenied);
    REQUIRE(result.output.find("Command blocked") == 0);

    result = tool.execute(R"({"command":"ls && curl http://example.com"})");
    REQUIRE(result.kind == ErrorKind::SecurityDenied);

    result = tool.execute(R"({"command":"touch marker; python3 -c 1"})");
    REQUIRE(result.kind == ErrorKind::SecurityDenied);
    REQUIRE_FALSE(std::filesystem::exists(fx.dir + "/marker"));
}

TEST_CASE("ShellTool: sandbox bypass request is refused", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({"command":"ls","dangerouslyDisableSandbox":true})");
    REQUIRE(result.kind == ErrorKind::SecurityDenied);
}

TEST_CASE("ShellTool: timeout kills the command", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto start = std::chrono::steady_clock::now();
    auto result = tool.execute(R"({"command":"sleep 30","timeout":300})");
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(result.kind == ErrorKind::Timeout);
    REQUIRE(result.output.find("300 ms") != std::string::npos);
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("ShellTool: missing command parameter", "[tools]") {
    ShellFixture fx;
    ShellTool tool(fx.guard, fx.sandbox, fx.background);
    auto result = tool.execute(R"({})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.kind == ErrorKind::InvalidArguments);
}

TEST_CASE("ShellTool: background process output and kill", "[tools]") {
    ShellFixture fx;
    ShellTool bash(fx.guard, fx.sandbox, fx.background);
    ShellOutputTool output(fx.background, 30000);
    ShellKillTool kill_tool(fx.background);

    auto started = bash.execute(
        R"({"command":"echo ready; sleep 30","run_in_background":true})");
    REQUIRE(started.success);
    REQUIRE(started.output.find("proc_0") != std::string::npos);
    REQUIRE(fx.background->size() == 1);

    std::string seen;
    for (int i = 0; i < 50 && seen.find("ready") == std::string::npos; ++i) {
        auto r = output.execute(R"({"id":"proc_0"})");
        REQUIRE(r.success);
        seen += r.output;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    REQUIRE(seen.find("ready") != std::string::npos);
    REQUIRE(seen.find("[status: running") != std::string::npos);

    // Already-read output is not returned again.
    auto again = output.execute(R"({"id":"proc_0"})");
    REQUIRE(again.output.find("(no new output)") == 0);

    auto killed = kill_tool.execute(R"({"id":"proc_0"})");
    REQUIRE(killed.success);
    REQUIRE(fx.background->size() == 0);

    REQUIRE(output.execute(R"({"id":"proc_0"})").kind == ErrorKind::NotFound);
}

TEST_CASE("ShellTool: kill only targets agent-started processes", "[tools]") {
    ShellFixture fx;
    ShellTool bash(fx.guard, fx.sandbox, fx.background);

    auto started = bash.execute(R"({"command":"sleep 30","run_in_background":true})");
    REQUIRE(started.success);
    auto pos = started.output.find("(pid ");
    REQUIRE(pos != std::string::npos);
    std::string pid = started.output.substr(pos + 5, started.output.find(')', pos) - pos - 5);

    auto denied = bash.execute(R"({"command":"kill 1"})");
    REQUIRE(denied.kind == ErrorKind::SecurityDenied);

    auto allowed = bash.execute(args_json({{"command", "kill " + pid}}));
    REQUIRE(allowed.success);

    fx.background->kill_all();
}

TEST_CASE("ShellTool: pkill only reaches agent process groups", "[tools]") {
    ShellFixture fx;
    ShellTool bash(fx.guard, fx.sandbox, fx.background);

    auto started = bash.execute(R"({"command":"sleep 30","run_in_background":true})");
    REQUIRE(started.success);
    auto pos = started.output.find("(pid ");
    std::string pid = started.output.substr(pos + 5, started.output.find(')', pos) - pos - 5);

    REQUIRE(bash.execute(R"({"command":"pkill node"})").kind == ErrorKind::SecurityDenied);
    REQUIRE(bash.execute(R"({"command":"pkill -g 1"})").kind == ErrorKind::SecurityDenied);

    auto scoped = bash.execute(args_json({{"command", "pkill -g " + pid}}));
    REQUIRE(scoped.kind != ErrorKind::SecurityDenied);

    fx.background->kill_all();
}

TEST_CASE("BackgroundProcessTable: output log is capped", "[tools]") {
    ShellFixture fx;
    write_file(fx.dir + "/big.txt", std::string(200000, 'x'));
    auto table = std::make_shared<BackgroundProcessTable>(2, 4096);
    ShellTool bash(fx.guard, fx.sandbox, table);

    auto started = bash.execute(
        R"({"command":"cat big.txt; sleep 30","run_in_background":true})");
    REQUIRE(started.success);

    std::string seen;
    for (int i = 0; i < 100 && seen.find("[output truncated: ") == std::string::npos; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto r = table->output("proc_0", 1000);
        REQUIRE(r.success);
        seen += r.output;
    }
    REQUIRE(seen.find("[output truncated: ") != std::string::npos);
    REQUIRE(std::count(seen.begin(), seen.end(), 'x') < 200000);

    table->kill_all();
}

TEST_CASE("ShellTool: background capacity is enforced", "[tools]") {
    ShellFixture fx;
    ShellTool bash(fx.guard, fx.sandbox, fx.background);
    REQUIRE(bash.execute(R"({"command":"sleep 30","run_in_background":true})").success);
    REQUIRE(bash.execute(R"({"command":"sleep 30","run_in_background":true})").success);
    auto third = bash.execute(R"({"command":"sleep 30","run_in_background":true})");
    REQUIRE_FALSE(third.success);
    REQUIRE(third.output.find("Too many background processes") != std::string::npos);

    bash.reset();
    REQUIRE(fx.background->size() == 0);
}

TEST_CASE("format_shell_output: combines streams", "[tools]") {
    RunResult run;
    run.out = "out";
    run.err = "err";
    run.exit_code = 2;
    REQUIRE(format_shell_output(run) == "out\n[stderr]: err\n[exit code: 2]");

    RunResult empty;
    empty.exit_code = 0;
    REQUIRE(format_shell_output(empty) == "(no output)");
}

TEST_CASE("Tool::spec builds ToolSpec correctly", "[tools]") {
    PathGuard guard(std::filesystem::temp_directory_path());
    FileReadTool tool(guard, 100);
    auto spec = tool.spec();
    REQUIRE(spec.name == "read_file");
    REQUIRE(spec.description == tool.description());
    auto params = nlohmann::json::parse(spec.parameters_json);
    REQUIRE(params["required"][0] == "path");
}
