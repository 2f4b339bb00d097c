#pragma once
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace toolgate {

struct SecurityDecision {
    bool allowed;
    std::string reason;
};

// Static, code-reviewed command policy. Adding an executable here is a
// deliberate change; nothing the agent sends can modify it.
struct CommandPolicy {
    std::unordered_set<std::string> allowed_commands;
    std::unordered_set<std::string> allowed_scripts;   // exact spellings, e.g. "./init.sh"
    std::unordered_set<std::string> pkill_targets;
    std::vector<std::string> system_bin_dirs;

    static CommandPolicy defaults();
};

struct ShellToken {
    enum class Type { Word, Operator };
    Type type;
    std::string text;
    // Set when the shell would rewrite the word after validation.
    bool expands_variable = false;  // unquoted or double-quoted '$'
    bool expands_glob = false;      // unquoted '*', '?' or '['
    bool expands_brace = false;     // unquoted '{'
};

// Shell-aware tokenizer. Quotes and escapes are resolved into the word text;
// control and redirection operators become Operator tokens (newlines become
// ";"). Returns false and sets error for anything it cannot parse
// confidently (unterminated quotes, command substitution, here-documents).
bool tokenize_shell(const std::string& input, std::vector<ShellToken>& out,
                    std::string& error);

// Returns true when pid belongs to a process the agent itself started.
using PidOwnership = std::function<bool(long pid)>;

class CommandValidator {
public:
    explicit CommandValidator(CommandPolicy policy = CommandPolicy::defaults(),
                              PidOwnership owns_pid = nullptr);

    SecurityDecision validate(const std::string& command_line) const;

    const CommandPolicy& policy() const { return policy_; }

private:
    SecurityDecision validate_segment(const std::vector<ShellToken>& words) const;

    SecurityDecision check_rm(const std::vector<ShellToken>& args) const;
    SecurityDecision check_chmod(const std::vector<std::string>& args) const;
    SecurityDecision check_find(const std::vector<std::string>& args) const;
    SecurityDecision check_git(const std::vector<std::string>& args) const;
    SecurityDecision check_pkill(const std::vector<std::string>& args) const;
    SecurityDecision check_kill(const std::vector<std::string>& args) const;

    CommandPolicy policy_;
    PidOwnership owns_pid_;
};

} // namespace toolgate
