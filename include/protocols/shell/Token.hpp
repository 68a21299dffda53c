#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sw::shell {

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
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// argv is already split by the invoking shell; only flags need recognizing.
// "--key=value" splits into Flag(key) Word(value), "-k" is a short flag,
// and "--" passes through as a Word for the parser's sentinel handling.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 2);

    for (const auto& arg : args) {
        if (arg == "--" || arg == "-" || arg.empty() || looks_negative_number(arg) || arg[0] != '-') {
            pushWord(out, arg);
            continue;
        }

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

        pushFlag(out, arg.substr(1));
    }

    return out;
}

}
