#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sw::shell {

// Flags that never take a value, so a following word stays positional
inline bool isSwitch(const std::string& key) {
    return key == "json" || key == "no-autostart" || key == "restart-on-exit" || key == "help" || key == "h";
}

inline CommandCall parseTokens(const std::vector<Token>& toks) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;

    // 1) Command name = first Word
    for (; i < toks.size(); ++i) {
        if (toks[i].type == TokenType::Word) {
            call.name = toks[i].text;
            ++i;
            break;
        }
        // Leading flags before the command (e.g. --json list)
        call.options.push_back(FlagKV{toks[i].text, std::nullopt});
    }

    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (!isSwitch(t.text) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                call.options.push_back(FlagKV{t.text, toks[i + 1].text});
                ++i; // consumed value
            } else {
                call.options.push_back(FlagKV{t.text, std::nullopt});
            }
            continue;
        }

        // Positional (either after "--" or just a Word)
        call.positionals.push_back(t.text);
    }

    return call;
}

}
