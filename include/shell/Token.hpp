#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace rcs::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    if (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Heuristic: decide if "-XYZ" is a bundle or "-X<value>".
// If tail contains obvious value chars (/, ., :, =, ~), treat as glued value.
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](char c) { return c == '/' || c == '.' || c == ':' || c == '=' || c == '~'; });
}

// Expand short bundle "-abc" -> flags a,b,c
inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// argv atoms are already split by the shell, so only flag syntax is interpreted here.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 2);

    bool stop_flags = false;
    for (const auto& arg : args) {
        if (stop_flags || arg.empty() || arg[0] != '-' || arg == "-" || looks_negative_number(arg)) {
            pushWord(out, arg);
            continue;
        }

        // Sentinel: everything after "--" is positional
        if (arg == "--") {
            pushWord(out, arg);
            stop_flags = true;
            continue;
        }

        // Long flag forms: --key or --key=value
        if (arg.rfind("--", 0) == 0) {
            const auto eq = arg.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, arg.substr(2));
            } else {
                pushFlag(out, arg.substr(2, eq - 2));
                pushWord(out, arg.substr(eq + 1));
            }
            continue;
        }

        // Short flag(s)
        if (arg.size() == 2) {
            pushFlag(out, arg.substr(1));
            continue;
        }

        // Could be bundle "-abc" or glued "-kVALUE"
        const std::string_view tail = std::string_view(arg).substr(2);
        if (looks_glued_value(tail)) {
            pushFlag(out, std::string(1, arg[1]));
            std::string value(tail);
            if (!value.empty() && value[0] == '=') value.erase(value.begin());
            pushWord(out, std::move(value));
        } else {
            expand_bundle(std::string_view(arg).substr(1), out);
        }
    }

    return out;
}

}
