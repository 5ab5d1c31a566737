#include "argenv/scanner.hpp"

#include <utility>

namespace argenv {

Token classify_token(const std::string& arg, bool terminator_seen) {
    Token token;
    token.raw = arg;

    // Everything after a terminator is positional, verbatim
    if (terminator_seen) {
        token.kind = TokenKind::Positional;
        return token;
    }

    if (arg == "--") {
        token.kind = TokenKind::Terminator;
        return token;
    }

    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
        token.kind = TokenKind::LongOption;
        auto eq = arg.find('=', 2);
        if (eq == std::string::npos) {
            token.name = arg.substr(2);
        } else {
            token.name = arg.substr(2, eq - 2);
            token.inline_value = arg.substr(eq + 1);
        }
        return token;
    }

    if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
        token.kind = TokenKind::ShortOption;
        token.name = arg.substr(1);
        return token;
    }

    token.kind = TokenKind::Positional;
    return token;
}

TokenScanner::TokenScanner(std::vector<std::string> args)
    : args_(std::move(args)) {}

std::optional<Token> TokenScanner::next() {
    if (at_end()) {
        return std::nullopt;
    }
    Token token = classify_token(args_[cursor_], terminator_seen_);
    token.index = cursor_;
    ++cursor_;
    if (token.kind == TokenKind::Terminator) {
        terminator_seen_ = true;
    }
    return token;
}

std::optional<std::string> TokenScanner::take_value() {
    if (at_end()) {
        return std::nullopt;
    }
    return args_[cursor_++];
}

void TokenScanner::reset() {
    cursor_ = 0;
    terminator_seen_ = false;
}

} // namespace argenv
