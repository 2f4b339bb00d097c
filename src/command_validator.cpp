#include "command_validator.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iterator>

namespace toolgate {

CommandPolicy CommandPolicy::defaults() {
    CommandPolicy p;
    p.allowed_commands = {
        // File inspection
        "ls", "cat", "head", "tail", "wc", "grep", "rg", "find", "file", "stat",
        "diff", "sort", "uniq", "cut", "tr", "du", "tree", "which",
        // File operations
        "cp", "mv", "mkdir", "touch", "rm", "chmod",
        // Output and shell builtins
        "echo", "printf", "pwd", "true", "false", "test", "date", "sleep",
        // Node.js development
        "npm", "npx", "node", "yarn", "pnpm",
        // Version control
        "git",
        // Process inspection and control
        "ps", "lsof", "pkill", "kill",
    };
    p.allowed_scripts = {"./init.sh"};
    p.pkill_targets = {"node", "npm", "npx", "vite", "next"};
    p.system_bin_dirs = {"/bin", "/usr/bin", "/usr/local/bin"};
    return p;
}

// ── Tokenizer ────────────────────────────────────────────────────

static const char* const kOperators[] = {
    // Longest first so "&&" wins over "&" and "&>>" over "&>".
    "&>>", "&&", "||", "|&", ">>", ">&", "<&", "&>", "<<", "<>",
    ";", "|", "&", "(", ")", "<", ">",
};

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool tokenize_shell(const std::string& input, std::vector<ShellToken>& out,
                    std::string& error) {
    out.clear();
    ShellToken word{ShellToken::Type::Word, ""};
    std::string& cur = word.text;
    bool in_word = false;
    const size_t n = input.size();
    size_t i = 0;

    auto flush = [&]() {
        if (in_word) {
            out.push_back(word);
            word = ShellToken{ShellToken::Type::Word, ""};
            in_word = false;
        }
    };

    while (i < n) {
        char c = input[i];

        if (c == '\'') {
            size_t close = input.find('\'', i + 1);
            if (close == std::string::npos) {
                error = "Unterminated single quote";
                return false;
            }
            cur.append(input, i + 1, close - i - 1);
            in_word = true;
            i = close + 1;
            continue;
        }

        if (c == '"') {
            ++i;
            bool closed = false;
            while (i < n) {
                char d = input[i];
                if (d == '"') { closed = true; ++i; break; }
                if (d == '\\' && i + 1 < n &&
                    std::strchr("\"\\$`\n", input[i + 1]) != nullptr) {
                    if (input[i + 1] != '\n') cur += input[i + 1];
                    i += 2;
                    continue;
                }
                if (d == '`' || (d == '$' && i + 1 < n && input[i + 1] == '(')) {
                    error = "Command substitution is not allowed";
                    return false;
                }
                if (d == '$') word.expands_variable = true;
                cur += d;
                ++i;
            }
            if (!closed) {
                error = "Unterminated double quote";
                return false;
            }
            in_word = true;
            continue;
        }

        if (c == '\\') {
            if (i + 1 >= n) {
                error = "Trailing backslash";
                return false;
            }
            if (input[i + 1] != '\n') {
                cur += input[i + 1];
                in_word = true;
            }
            i += 2;
            continue;
        }

        if (c == '`' || (c == '$' && i + 1 < n && input[i + 1] == '(')) {
            error = "Command substitution is not allowed";
            return false;
        }

        if (c == ' ' || c == '\t' || c == '\r') {
            flush();
            ++i;
            continue;
        }

        if (c == '\n') {
            flush();
            out.push_back({ShellToken::Type::Operator, ";"});
            ++i;
            continue;
        }

        if (c == '#' && !in_word) {
            size_t eol = input.find('\n', i);
            i = (eol == std::string::npos) ? n : eol;
            continue;
        }

        if (std::strchr(";|&()<>", c) != nullptr) {
            if ((c == '<' || c == '>') && in_word && all_digits(cur)) {
                // "2>" style fd prefix belongs to the redirection
                word = ShellToken{ShellToken::Type::Word, ""};
                in_word = false;
            } else {
                flush();
            }
            const char* op = nullptr;
            for (const char* candidate : kOperators) {
                size_t len = std::strlen(candidate);
                if (input.compare(i, len, candidate) == 0) {
                    op = candidate;
                    break;
                }
            }
            std::string op_str(op);
            if (op_str == "<<") {
                error = "Here-documents are not allowed";
                return false;
            }
            if ((op_str == "<" || op_str == ">") && i + 1 < n && input[i + 1] == '(') {
                error = "Process substitution is not allowed";
                return false;
            }
            out.push_back({ShellToken::Type::Operator, op_str});
            i += op_str.size();
            continue;
        }

        if (c == '$') word.expands_variable = true;
        if (c == '*' || c == '?' || c == '[') word.expands_glob = true;
        if (c == '{') word.expands_brace = true;
        cur += c;
        in_word = true;
        ++i;
    }
    flush();
    return true;
}

// ── Validation ───────────────────────────────────────────────────

static bool is_separator(const std::string& op) {
    return op == ";" || op == "&&" || op == "||" || op == "|" || op == "|&" ||
           op == "(" || op == ")";
}

static bool is_redirection(const std::string& op) {
    return op == ">" || op == ">>" || op == "<" || op == ">&" || op == "<&" ||
           op == "&>" || op == "&>>" || op == "<>";
}

static bool is_assignment(const std::string& word) {
    size_t eq = word.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    if (!(std::isalpha(static_cast<unsigned char>(word[0])) || word[0] == '_')) return false;
    for (size_t i = 1; i < eq; ++i) {
        unsigned char c = static_cast<unsigned char>(word[i]);
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

// Variables that change how later commands are located or loaded.
static bool is_sensitive_variable(const std::string& name) {
    static const char* const exact[] = {
        "PATH", "IFS", "BASH_ENV", "ENV", "SHELLOPTS", "PS4", "NODE_OPTIONS",
    };
    for (const char* e : exact) {
        if (name == e) return true;
    }
    return name.compare(0, 3, "LD_") == 0 || name.compare(0, 4, "GIT_") == 0;
}

static std::string basename_of(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static SecurityDecision allow() { return SecurityDecision{true, ""}; }
static SecurityDecision deny(std::string reason) {
    return SecurityDecision{false, std::move(reason)};
}

CommandValidator::CommandValidator(CommandPolicy policy, PidOwnership owns_pid)
    : policy_(std::move(policy)), owns_pid_(std::move(owns_pid)) {}

SecurityDecision CommandValidator::validate(const std::string& command_line) const {
    std::vector<ShellToken> tokens;
    std::string error;
    if (!tokenize_shell(command_line, tokens, error)) {
        return deny("Could not parse command: " + error);
    }

    std::vector<std::vector<ShellToken>> segments(1);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.type == ShellToken::Type::Word) {
            segments.back().push_back(tok);
            continue;
        }
        if (tok.text == "&") {
            return deny("Background operator '&' is not allowed; "
                        "use run_in_background instead");
        }
        if (is_redirection(tok.text)) {
            if (i + 1 >= tokens.size() || tokens[i + 1].type != ShellToken::Type::Word) {
                return deny("Could not parse command: redirection without a target");
            }
            ++i; // the target is a file, not a command
            continue;
        }
        if (is_separator(tok.text)) {
            if (!segments.back().empty()) segments.emplace_back();
            continue;
        }
        return deny("Could not parse command: unexpected operator '" + tok.text + "'");
    }

    bool any_command = false;
    for (const auto& words : segments) {
        if (words.empty()) continue;
        any_command = true;
        auto decision = validate_segment(words);
        if (!decision.allowed) return decision;
    }
    if (!any_command) {
        return deny("Empty command");
    }
    return allow();
}

SecurityDecision CommandValidator::validate_segment(const std::vector<ShellToken>& words) const {
    size_t idx = 0;
    while (idx < words.size() && is_assignment(words[idx].text)) {
        std::string name = words[idx].text.substr(0, words[idx].text.find('='));
        if (is_sensitive_variable(name)) {
            return deny("Setting " + name + " is not allowed");
        }
        ++idx;
    }
    if (idx == words.size()) return allow(); // assignments only

    const std::string& exe = words[idx].text;
    if (exe.empty()) {
        return deny("Empty command name");
    }
    if (exe.find_first_of("$*?[") != std::string::npos || words[idx].expands_variable ||
        words[idx].expands_glob || words[idx].expands_brace) {
        return deny("Command name must be a literal: " + exe);
    }

    std::string name;
    if (exe.find('/') != std::string::npos) {
        if (policy_.allowed_scripts.count(exe) > 0) {
            name = basename_of(exe);
        } else {
            std::string dir = exe.substr(0, exe.find_last_of('/'));
            bool system_dir = std::find(policy_.system_bin_dirs.begin(),
                                        policy_.system_bin_dirs.end(),
                                        dir) != policy_.system_bin_dirs.end();
            name = basename_of(exe);
            if (!system_dir || policy_.allowed_commands.count(name) == 0) {
                return deny("Executable path '" + exe + "' is not allowed");
            }
        }
    } else {
        name = exe;
        if (policy_.allowed_commands.count(name) == 0) {
            return deny("Command '" + name + "' is not in the allowed commands list");
        }
    }

    std::vector<ShellToken> arg_tokens(words.begin() + static_cast<std::ptrdiff_t>(idx) + 1,
                                       words.end());
    std::vector<std::string> args;
    for (const auto& t : arg_tokens) args.push_back(t.text);

    // The rules below judge literal text; the shell would rewrite these words.
    static const char* const guarded[] = {"rm", "chmod", "find", "git", "kill", "pkill"};
    if (std::find_if(std::begin(guarded), std::end(guarded),
                     [&name](const char* g) { return name == g; }) != std::end(guarded)) {
        for (const auto& t : arg_tokens) {
            if (t.expands_variable) {
                return deny(name + " arguments may not use variable expansion: " + t.text);
            }
            if (t.expands_brace) {
                return deny(name + " arguments may not use brace expansion: " + t.text);
            }
            if (t.expands_glob && name != "rm") {
                return deny(name + " arguments may not use unquoted wildcards: " + t.text);
            }
        }
    }

    if (name == "rm") return check_rm(arg_tokens);
    if (name == "chmod") return check_chmod(args);
    if (name == "find") return check_find(args);
    if (name == "git") return check_git(args);
    if (name == "pkill") return check_pkill(args);
    if (name == "kill") return check_kill(args);
    return allow();
}

static bool has_parent_segment(const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0 && end - start == 2) return true;
        start = end + 1;
    }
    return false;
}

SecurityDecision CommandValidator::check_rm(const std::vector<ShellToken>& args) const {
    bool recursive = false;
    bool end_of_options = false;
    std::vector<const ShellToken*> targets;
    for (const auto& tok : args) {
        const std::string& a = tok.text;
        if (!end_of_options && a == "--") { end_of_options = true; continue; }
        if (!end_of_options && tok.expands_glob &&
            (a[0] == '-' || std::strchr("*?[", a[0]) != nullptr)) {
            // Could expand to a file named like an option, e.g. "-rf".
            return deny("rm wildcards must follow '--' or start with a literal path: " + a);
        }
        if (!end_of_options && a.size() > 2 && a.compare(0, 2, "--") == 0) {
            if (a == "--no-preserve-root") return deny("rm --no-preserve-root is not allowed");
            if (a == "--recursive") recursive = true;
            continue;
        }
        if (!end_of_options && a.size() > 1 && a[0] == '-') {
            if (a.find_first_of("rR") != std::string::npos) recursive = true;
            continue;
        }
        targets.push_back(&tok);
    }

    for (const auto* tok : targets) {
        const std::string& t = tok->text;
        if (recursive && tok->expands_glob) {
            return deny("Recursive rm with unquoted wildcards is not allowed: " + t);
        }
        if (!t.empty() && t[0] == '/') {
            return deny("rm on absolute paths is not allowed: " + t);
        }
        if (!t.empty() && t[0] == '~') {
            return deny("rm on home-relative paths is not allowed: " + t);
        }
        if (has_parent_segment(t)) {
            return deny("rm on paths containing '..' is not allowed: " + t);
        }
        if (recursive && (t == "." || t == "./" || t == "*" || t == "./*" || t.empty())) {
            return deny("Recursive rm of the whole project is not allowed");
        }
    }
    return allow();
}

SecurityDecision CommandValidator::check_chmod(const std::vector<std::string>& args) const {
    std::string mode;
    size_t files = 0;
    for (const auto& a : args) {
        if (mode.empty() && !a.empty() && a[0] == '-') {
            return deny("chmod flags are not allowed: " + a);
        }
        if (mode.empty()) { mode = a; continue; }
        ++files;
    }
    if (mode.empty()) return deny("chmod requires a mode");
    if (files == 0) return deny("chmod requires at least one file");

    // Only [ugoa]*+x
    size_t plus = mode.find('+');
    bool ok = plus != std::string::npos && mode.substr(plus) == "+x";
    for (size_t i = 0; ok && i < plus; ++i) {
        if (std::strchr("ugoa", mode[i]) == nullptr) ok = false;
    }
    if (!ok) return deny("chmod only allowed with +x mode, got: " + mode);
    return allow();
}

SecurityDecision CommandValidator::check_find(const std::vector<std::string>& args) const {
    static const char* const banned[] = {"-exec", "-execdir", "-ok", "-okdir", "-delete", "-fls"};
    for (const auto& a : args) {
        for (const char* b : banned) {
            if (a == b) return deny("find " + a + " is not allowed");
        }
        if (a.compare(0, 7, "-fprint") == 0) return deny("find " + a + " is not allowed");
    }
    return allow();
}

SecurityDecision CommandValidator::check_git(const std::vector<std::string>& args) const {
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "-c" || a.compare(0, 11, "--exec-path") == 0 ||
            a.compare(0, 12, "--config-env") == 0) {
            return deny("git configuration overrides are not allowed");
        }
        if (a == "-C" || a == "--git-dir" || a == "--work-tree") { ++i; continue; }
        if (a.empty() || a[0] != '-') break;
    }
    if (i < args.size() && args[i] == "push") {
        for (size_t j = i + 1; j < args.size(); ++j) {
            const auto& a = args[j];
            if (a == "-f" || a == "--force" || a.compare(0, 18, "--force-with-lease") == 0 ||
                (a.size() > 1 && a[0] == '+')) {
                return deny("git force push is not allowed");
            }
        }
    }
    return allow();
}

// pkill must be confined to process groups the agent started (-g PGID).
// A name pattern, when given, further narrows the match.
SecurityDecision CommandValidator::check_pkill(const std::vector<std::string>& args) const {
    static const char* const value_short = "gGPstuU";
    static const char* const value_long[] = {
        "--pgroup", "--group", "--parent", "--session", "--terminal", "--euid", "--uid",
        "--signal", "--ns", "--nslist",
    };

    std::vector<std::string> groups;
    std::vector<std::string> names;
    auto add_groups = [&groups](const std::string& list) {
        size_t start = 0;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            if (comma == std::string::npos) comma = list.size();
            groups.push_back(list.substr(start, comma - start));
            start = comma + 1;
        }
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "-v" || a == "--inverse") return deny("pkill " + a + " is not allowed");
        if (a.compare(0, 2, "--") == 0 && a.size() > 2) {
            size_t eq = a.find('=');
            std::string opt = a.substr(0, eq);
            std::string value;
            bool takes_value = std::find_if(std::begin(value_long), std::end(value_long),
                [&opt](const char* o) { return opt == o; }) != std::end(value_long);
            if (takes_value && eq == std::string::npos) {
                if (i + 1 >= args.size()) return deny("pkill " + a + " requires a value");
                value = args[++i];
            } else if (eq != std::string::npos) {
                value = a.substr(eq + 1);
            }
            if (opt == "--inverse") return deny("pkill --inverse is not allowed");
            if (opt == "--pgroup") add_groups(value);
            continue;
        }
        if (a.size() > 1 && a[0] == '-') {
            // -9, -KILL, -TERM: a signal, not a selector
            if (std::isdigit(static_cast<unsigned char>(a[1])) ||
                (a.size() > 2 && std::all_of(a.begin() + 1, a.end(), [](unsigned char ch) {
                    return std::isupper(ch) || std::isdigit(ch);
                }))) {
                continue;
            }
            for (size_t k = 1; k < a.size(); ++k) {
                char opt = a[k];
                if (opt == 'v') return deny("pkill -v is not allowed");
                if (std::strchr(value_short, opt) == nullptr) continue;
                std::string value;
                if (k + 1 < a.size()) {
                    value = a.substr(k + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    return deny(std::string("pkill -") + opt + " requires a value");
                }
                if (opt == 'g') add_groups(value);
                break;
            }
            continue;
        }
        names.push_back(a);
    }

    if (groups.empty()) {
        return deny("pkill must be limited to an agent-started process group with -g PGID");
    }
    for (const auto& g : groups) {
        if (!all_digits(g)) return deny("pkill process group must be numeric: " + g);
        long pgid = std::strtol(g.c_str(), nullptr, 10);
        if (pgid <= 0 || !owns_pid_ || !owns_pid_(pgid)) {
            return deny("pkill process group " + g + " was not started by the agent");
        }
    }

    // With -f the pattern may be a full command line; judge its first word.
    for (const auto& n : names) {
        std::string target = n.substr(0, n.find(' '));
        if (policy_.pkill_targets.count(target) == 0) {
            return deny("pkill only allowed for dev processes (node, npm, npx, vite, next), got: " +
                        target);
        }
    }
    return allow();
}

SecurityDecision CommandValidator::check_kill(const std::vector<std::string>& args) const {
    std::vector<std::string> targets;
    bool end_of_options = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (!end_of_options && a == "--") { end_of_options = true; continue; }
        if (!end_of_options && (a == "-l" || a == "-L")) return allow();
        if (!end_of_options && (a == "-s" || a == "-n")) { ++i; continue; }
        if (!end_of_options && a.size() > 1 && a[0] == '-' &&
            !std::isdigit(static_cast<unsigned char>(a[1]))) {
            continue; // -KILL, -TERM
        }
        if (!end_of_options && a.size() > 1 && a[0] == '-' && targets.empty() &&
            all_digits(a.substr(1)) && i + 1 < args.size()) {
            continue; // -9 followed by a pid
        }
        targets.push_back(a);
    }
    if (targets.empty()) return deny("kill requires a PID");
    if (!owns_pid_) {
        return deny("kill is only permitted for processes started by the agent");
    }
    for (const auto& t : targets) {
        if (!all_digits(t)) {
            return deny("kill target must be a PID of a process started by the agent: " + t);
        }
        long pid = std::strtol(t.c_str(), nullptr, 10);
        if (pid <= 0 || !owns_pid_(pid)) {
            return deny("kill target " + t + " was not started by the agent");
        }
    }
    return allow();
}

} // namespace toolgate
