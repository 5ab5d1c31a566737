#include "argenv/matcher.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace argenv {

namespace {

// Cursor over the not-yet-saturated positional specs of one command
struct PositionalCursor {
    std::vector<const ArgumentSpec*> specs;
    size_t index = 0;
    size_t filled = 0;  // values already given to specs[index]

    const ArgumentSpec* head() const {
        return index < specs.size() ? specs[index] : nullptr;
    }
};

MatchError make_error(MatchErrorKind kind, const Schema& schema, const std::string& key,
                      const std::string& token) {
    MatchError err;
    err.kind = kind;
    err.command = schema.name;
    err.key = key;
    err.token = token;
    return err;
}

void apply_action(const ArgumentSpec& spec, std::vector<std::string> collected,
                  ParseState& state) {
    state.seen.insert(spec.key);
    switch (spec.action) {
        case ArgAction::Set:
            state.values[spec.key] = std::move(collected);
            break;
        case ArgAction::Append: {
            auto& list = state.values[spec.key];
            list.insert(list.end(), collected.begin(), collected.end());
            break;
        }
        case ArgAction::Count:
            ++state.counts[spec.key];
            break;
        case ArgAction::SetTrue:
        case ArgAction::SetFalse:
            break;
    }
}

bool match_option(const Schema& schema, const ArgumentSpec& spec, const Token& token,
                  TokenScanner& scanner, ParseState& state, MatchError& err) {
    const size_t needed = spec.number_of_values;
    std::vector<std::string> collected;

    if (token.inline_value) {
        if (needed == 0) {
            err = make_error(MatchErrorKind::UnexpectedArgument, schema, spec.key, *token.inline_value);
            return false;
        }
        collected.push_back(*token.inline_value);
    }

    // Values are taken verbatim, even when they look like options
    while (collected.size() < needed) {
        auto value = scanner.take_value();
        if (!value) {
            err = make_error(MatchErrorKind::MissingValue, schema, spec.key, spec.display_name());
            err.expected = needed;
            err.shortfall = needed - collected.size();
            return false;
        }
        collected.push_back(std::move(*value));
    }

    apply_action(spec, std::move(collected), state);
    return true;
}

bool match_positional(const Schema& schema, const Token& token, PositionalCursor& cursor,
                      ParseState& state, MatchError& err) {
    const ArgumentSpec* spec = cursor.head();
    if (!spec) {
        err = make_error(MatchErrorKind::UnexpectedArgument, schema, "", token.raw);
        return false;
    }

    state.seen.insert(spec->key);
    auto& list = state.values[spec->key];
    if (spec->is_unbounded()) {
        list.push_back(token.raw);
        return true;
    }

    list.push_back(token.raw);
    if (++cursor.filled == spec->number_of_values) {
        ++cursor.index;
        cursor.filled = 0;
    }
    return true;
}

// Checks that run once a command has received all of its tokens
bool finish_command(const Schema& schema, const PositionalCursor& cursor,
                    const TokenScanner& scanner, ParseState& state, MatchError& err) {
    state.terminator_seen = scanner.terminator_seen();

    if (cursor.filled > 0) {
        const ArgumentSpec* spec = cursor.head();
        err = make_error(MatchErrorKind::MissingValue, schema, spec->key, spec->display_name());
        err.expected = spec->number_of_values;
        err.shortfall = spec->number_of_values - cursor.filled;
        return false;
    }

    for (const auto& spec : schema.args) {
        if (spec.required && !state.was_seen(spec.key)) {
            err = make_error(MatchErrorKind::MissingRequired, schema, spec.key, spec.display_name());
            return false;
        }
    }
    return true;
}

} // namespace

MatchResult match_arguments(const Schema& schema, TokenScanner& scanner) {
    MatchResult result;
    result.commands.push_back(CommandMatch{&schema, ParseState{}});

    const Schema* current = &schema;
    PositionalCursor cursor;
    cursor.specs = current->positionals();

    while (auto token = scanner.next()) {
        ParseState& state = result.commands.back().state;

        switch (token->kind) {
            case TokenKind::Terminator:
                break;

            case TokenKind::LongOption: {
                const ArgumentSpec* spec = current->find_by_long(token->name);
                if (!spec) {
                    if (token->name == "help") {
                        result.status = MatchStatus::HelpRequested;
                        result.ok = true;
                        return result;
                    }
                    if (token->name == "version" && !current->version.empty()) {
                        result.status = MatchStatus::VersionRequested;
                        result.ok = true;
                        return result;
                    }
                    result.error = make_error(MatchErrorKind::UnknownArgument, *current, "",
                                              "--" + token->name);
                    return result;
                }
                if (!match_option(*current, *spec, *token, scanner, state, result.error)) {
                    return result;
                }
                break;
            }

            case TokenKind::ShortOption: {
                char c = token->name[0];
                const ArgumentSpec* spec = current->find_by_short(c);
                if (!spec) {
                    if (c == 'h') {
                        result.status = MatchStatus::HelpRequested;
                        result.ok = true;
                        return result;
                    }
                    if (c == 'V' && !current->version.empty()) {
                        result.status = MatchStatus::VersionRequested;
                        result.ok = true;
                        return result;
                    }
                    result.error = make_error(MatchErrorKind::UnknownArgument, *current, "",
                                              token->raw);
                    return result;
                }
                if (!match_option(*current, *spec, *token, scanner, state, result.error)) {
                    return result;
                }
                break;
            }

            case TokenKind::Positional: {
                const Schema* sub = scanner.terminator_seen() ? nullptr
                                                              : current->find_subcommand(token->raw);
                if (sub) {
                    if (!finish_command(*current, cursor, scanner, state, result.error)) {
                        return result;
                    }
                    spdlog::debug("dispatching '{}' to subcommand '{}'", current->name, sub->name);
                    current = sub;
                    cursor = PositionalCursor{};
                    cursor.specs = current->positionals();
                    result.commands.push_back(CommandMatch{current, ParseState{}});
                    break;
                }
                if (!match_positional(*current, *token, cursor, state, result.error)) {
                    return result;
                }
                break;
            }
        }
    }

    if (!finish_command(*current, cursor, scanner, result.commands.back().state, result.error)) {
        return result;
    }

    if (current->executable.empty()) {
        result.error = make_error(MatchErrorKind::MissingSubcommand, *current, "", "");
        return result;
    }

    result.ok = true;
    return result;
}

MatchResult match_arguments(const Schema& schema, const std::vector<std::string>& args) {
    TokenScanner scanner(args);
    return match_arguments(schema, scanner);
}

} // namespace argenv
