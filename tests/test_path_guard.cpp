#include <catch2/catch.hpp>
#include "path_guard.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace toolgate;
namespace fs = std::filesystem;

static std::string make_temp_dir() {
    auto path = fs::temp_directory_path() / "toolgate_guard_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? fs::canonical(result).string() : "";
}

struct GuardFixture {
    std::string base = make_temp_dir();
    std::string root = base + "/project";

    GuardFixture() {
        fs::create_directories(root + "/src");
        std::ofstream(root + "/src/main.cpp") << "int main() {}";
    }
    ~GuardFixture() { fs::remove_all(base); }
};

TEST_CASE("PathGuard: relative path inside root", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    auto p = guard.resolve("src/main.cpp");
    REQUIRE(p.has_value());
    REQUIRE(p->string() == fx.root + "/src/main.cpp");
}

TEST_CASE("PathGuard: empty path and dot resolve to the root", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    REQUIRE(guard.resolve("")->string() == fx.root);
    REQUIRE(guard.resolve(".")->string() == fx.root);
    REQUIRE(guard.resolve("./")->string() == fx.root);
}

TEST_CASE("PathGuard: dot-dot inside the root is fine", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    auto p = guard.resolve("src/../src/./main.cpp");
    REQUIRE(p.has_value());
    REQUIRE(p->string() == fx.root + "/src/main.cpp");
}

TEST_CASE("PathGuard: traversal outside the root is rejected", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    std::string error;
    REQUIRE_FALSE(guard.resolve("../../etc/passwd", &error).has_value());
    REQUIRE(error == "Path escapes the project directory: ../../etc/passwd");
    REQUIRE_FALSE(guard.resolve("..").has_value());
    REQUIRE_FALSE(guard.resolve("src/../../outside.txt").has_value());
}

TEST_CASE("PathGuard: sibling with a shared prefix is outside", "[path_guard]") {
    GuardFixture fx;
    fs::create_directories(fx.base + "/project-evil");
    PathGuard guard(fx.root);
    REQUIRE_FALSE(guard.resolve("../project-evil/x").has_value());
    REQUIRE_FALSE(guard.resolve(fx.base + "/project-evil").has_value());
}

TEST_CASE("PathGuard: absolute paths", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    REQUIRE(guard.resolve(fx.root + "/src")->string() == fx.root + "/src");
    REQUIRE_FALSE(guard.resolve("/etc/passwd").has_value());
    REQUIRE_FALSE(guard.resolve("/").has_value());
}

TEST_CASE("PathGuard: non-existent targets can be validated", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    auto p = guard.resolve("new/dir/../file.txt");
    REQUIRE(p.has_value());
    REQUIRE(p->string() == fx.root + "/new/file.txt");
}

TEST_CASE("PathGuard: symlink pointing outside is rejected", "[path_guard]") {
    GuardFixture fx;
    fs::create_directories(fx.base + "/secret");
    std::ofstream(fx.base + "/secret/key") << "k";
    fs::create_directory_symlink(fx.base + "/secret", fx.root + "/link");

    PathGuard guard(fx.root);
    REQUIRE_FALSE(guard.resolve("link").has_value());
    REQUIRE_FALSE(guard.resolve("link/key").has_value());
    REQUIRE_FALSE(guard.resolve("link/new_file").has_value());
}

TEST_CASE("PathGuard: dangling symlink pointing outside is rejected", "[path_guard]") {
    GuardFixture fx;
    fs::create_symlink(fx.base + "/not_there_yet", fx.root + "/dangling");

    PathGuard guard(fx.root);
    REQUIRE_FALSE(guard.resolve("dangling").has_value());
}

TEST_CASE("PathGuard: symlink staying inside is followed", "[path_guard]") {
    GuardFixture fx;
    fs::create_directory_symlink(fx.root + "/src", fx.root + "/alias");

    PathGuard guard(fx.root);
    auto p = guard.resolve("alias/main.cpp");
    REQUIRE(p.has_value());
    REQUIRE(p->string() == fx.root + "/src/main.cpp");
}

TEST_CASE("PathGuard: resolution is idempotent", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    auto once = guard.resolve("src/../src/main.cpp");
    REQUIRE(once.has_value());
    auto twice = guard.resolve(once->string());
    REQUIRE(twice.has_value());
    REQUIRE(*once == *twice);
}

TEST_CASE("PathGuard: root given through a symlink", "[path_guard]") {
    GuardFixture fx;
    fs::create_directory_symlink(fx.root, fx.base + "/root_link");
    PathGuard guard(fx.base + "/root_link");
    REQUIRE(guard.root().string() == fx.root);
    REQUIRE(guard.resolve("src")->string() == fx.root + "/src");
}

TEST_CASE("PathGuard: NUL bytes are rejected", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    std::string error;
    REQUIRE_FALSE(guard.resolve(std::string("src\0/x", 6), &error).has_value());
    REQUIRE(error == "Path contains a NUL byte");
}

TEST_CASE("PathGuard: relative display form", "[path_guard]") {
    GuardFixture fx;
    PathGuard guard(fx.root);
    REQUIRE(guard.relative(fs::path(fx.root)) == ".");
    REQUIRE(guard.relative(fs::path(fx.root + "/src/main.cpp")) == "src/main.cpp");
}

TEST_CASE("resolve_path: etc/passwd escape from a project root", "[path_guard]") {
    GuardFixture fx;
    std::string error;
    REQUIRE_FALSE(resolve_path("../../etc/passwd", fx.root, &error).has_value());
    REQUIRE(error.find("escapes") != std::string::npos);
}

TEST_CASE("resolve_path: non-existent root still confines", "[path_guard]") {
    REQUIRE_FALSE(resolve_path("../../etc/passwd", "/work/project").has_value());
    auto p = resolve_path("src/app.js", "/work/project");
    REQUIRE(p.has_value());
    REQUIRE(p->string() == "/work/project/src/app.js");
}
