#include "security/command_policy.hpp"

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

std::string_view base_name(std::string_view command) {
    auto slash = command.find_last_of('/');
    if (slash == std::string_view::npos) return command;
    return command.substr(slash + 1);
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence at the start of s, or 0 if it is
// malformed (bad lead byte, truncated, overlong, surrogate or > U+10FFFF).
size_t utf8_sequence_length(std::string_view s) {
    auto b0 = static_cast<unsigned char>(s[0]);
    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (s.size() < len) return 0;
    auto b1 = static_cast<unsigned char>(s[1]);
    if (b1 < lo || b1 > hi) return 0;
    for (size_t i = 2; i < len; i++) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) return 0;
    }
    return len;
}

bool is_allowed_ascii(unsigned char c) {
    if (c == '\t' || c == '\n') return true;
    return c >= 0x20 && c != 0x7F;
}

} // namespace

SecurityPolicy::SecurityPolicy(const std::vector<std::string>& allowed_commands)
    : allowed_(allowed_commands.begin(), allowed_commands.end()) {}

bool SecurityPolicy::is_command_allowed(std::string_view command) const {
    auto base = base_name(command);
    if (base.empty()) return false;
    return allowed_.find(base) != allowed_.end();
}

void SecurityPolicy::set_allowed_commands(const std::vector<std::string>& allowed_commands) {
    allowed_ = std::set<std::string, std::less<>>(allowed_commands.begin(), allowed_commands.end());
}

std::vector<std::string> SecurityPolicy::sanitize_arguments(const std::vector<std::string>& args) {
    std::vector<std::string> sanitized;
    sanitized.reserve(args.size());
    for (const auto& arg : args) {
        sanitized.push_back(sanitize_argument(arg));
    }
    return sanitized;
}

std::string SecurityPolicy::sanitize_argument(std::string_view arg) {
    std::string out;
    out.reserve(arg.size());

    size_t i = 0;
    while (i < arg.size()) {
        auto c = static_cast<unsigned char>(arg[i]);
        if (c < 0x80) {
            if (is_allowed_ascii(c)) out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        size_t len = utf8_sequence_length(arg.substr(i));
        if (len == 0) {
            out.append(kReplacementChar);
            i++;
            continue;
        }

        // C1 controls (U+0080..U+009F) are encoded as C2 80..C2 9F.
        bool c1_control = len == 2 && c == 0xC2 && static_cast<unsigned char>(arg[i + 1]) < 0xA0;
        if (!c1_control) out.append(arg.substr(i, len));
        i += len;
    }
    return out;
}
