#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace argenv {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenKind {
    LongOption,   // --name or --name=value
    ShortOption,  // -n
    Terminator,   // --
    Positional
};

struct Token {
    TokenKind kind = TokenKind::Positional;
    std::string raw;                          // token exactly as given
    std::string name;                         // option name without dashes
    std::optional<std::string> inline_value;  // text after '=' in --name=value
    size_t index = 0;                         // position in argv

    bool operator==(const Token& other) const {
        return kind == other.kind && raw == other.raw && name == other.name &&
               inline_value == other.inline_value && index == other.index;
    }
};

// Purely lexical classification of a single argument
Token classify_token(const std::string& arg, bool terminator_seen);

// ============================================================================
// Token Scanner
// ============================================================================

// Lazy classifier over an argument vector (program name excluded).
// Tokens are classified only when requested, so values pulled with
// take_value() are never interpreted as options or terminators.
class TokenScanner {
public:
    explicit TokenScanner(std::vector<std::string> args);

    // Classify and consume the next token
    std::optional<Token> next();

    // Consume the next token verbatim, without classification
    std::optional<std::string> take_value();

    bool at_end() const { return cursor_ >= args_.size(); }
    size_t remaining() const { return args_.size() - cursor_; }
    size_t position() const { return cursor_; }
    bool terminator_seen() const { return terminator_seen_; }

    // Restart from the first argument
    void reset();

private:
    std::vector<std::string> args_;
    size_t cursor_ = 0;
    bool terminator_seen_ = false;
};

} // namespace argenv
