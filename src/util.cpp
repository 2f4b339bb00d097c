#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <fnmatch.h>
#include <unistd.h>

namespace toolgate {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string to_upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::string dir = ".";
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos) dir = slash == 0 ? "/" : path.substr(0, slash);

    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            // Parent directory may not exist yet
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            out.open(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) return false;
        }
        out << content;
        out.flush();
        if (!out) {
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            // Collapse consecutive ** segments
            while (pi + 1 < pat.size() && pat[pi + 1] == "**") ++pi;
            if (pi + 1 == pat.size()) {
                for (size_t k = si; k < path.size(); ++k) {
                    if (!path[k].empty() && path[k][0] == '.') return false;
                }
                return true;
            }
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi + 1, path, k)) return true;
                if (k < path.size() && !path[k].empty() && path[k][0] == '.') break;
            }
            return false;
        }
        if (si >= path.size()) return false;
        if (::fnmatch(pat[pi].c_str(), path[si].c_str(), FNM_PERIOD) != 0) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    auto clean = [](const std::string& s) {
        std::vector<std::string> parts;
        for (auto& p : split(s, '/')) {
            if (p.empty() || p == ".") continue;
            parts.push_back(p);
        }
        return parts;
    };
    return match_segments(clean(pattern), 0, clean(path), 0);
}

std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

} // namespace toolgate
