#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// Allowlist of executables the output layer may spawn. An empty list allows
// nothing.
class SecurityPolicy {
public:
    SecurityPolicy() = default;
    explicit SecurityPolicy(const std::vector<std::string>& allowed_commands);

    // Only the base name is compared, so "/tmp/evil/xsel" is checked as "xsel".
    bool is_command_allowed(std::string_view command) const;

    // Replace the allowlist, e.g. after the configuration was reloaded.
    // Not synchronized: the owner must not call this while outputters that
    // reference the policy are in use on other threads.
    void set_allowed_commands(const std::vector<std::string>& allowed_commands);

    const std::set<std::string, std::less<>>& allowed_commands() const { return allowed_; }

    // Cleans every argument before it is handed to execvp(). The result has
    // the same number of elements. Control bytes (except tab and newline) are
    // dropped and malformed UTF-8 is replaced by U+FFFD; valid multibyte text
    // is left alone. Shell metacharacters stay literal: arguments are never
    // passed through a shell, so they have no special meaning.
    static std::vector<std::string> sanitize_arguments(const std::vector<std::string>& args);
    static std::string sanitize_argument(std::string_view arg);

private:
    std::set<std::string, std::less<>> allowed_;
};
