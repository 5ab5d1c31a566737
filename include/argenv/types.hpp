#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace argenv {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* ARGENV_VERSION = "1.0.0";

// Separator used to join multi-value bindings. Values containing it are not
// escaped.
constexpr char VALUE_SEPARATOR = ',';

// Payloads for presence-only actions
constexpr const char* PRESENT_VALUE = "true";
constexpr const char* ABSENT_VALUE = "false";

// Upper bound on number_of_values for a single argument
constexpr size_t MAX_NUMBER_OF_VALUES = 255;

// Environment variables added by --add-self-to-env
constexpr const char* SELF_ENV_VAR = "ARGENV_SELF";
constexpr const char* VERSION_ENV_VAR = "ARGENV_VERSION";

// ============================================================================
// Argument Actions
// ============================================================================

enum class ArgAction {
    Set,       // last occurrence wins
    Append,    // occurrences accumulate in arrival order
    Count,     // occurrences counted, no value consumed
    SetTrue,   // presence-only, "true" when seen
    SetFalse   // presence-only, "false" when seen
};

inline const char* action_to_string(ArgAction a) {
    switch (a) {
        case ArgAction::Set: return "set";
        case ArgAction::Append: return "append";
        case ArgAction::Count: return "count";
        case ArgAction::SetTrue: return "set_true";
        case ArgAction::SetFalse: return "set_false";
        default: return "set";
    }
}

// Parse an arg_action string (case-insensitive). "flag" is an alias of set_true.
std::optional<ArgAction> parse_arg_action(const std::string& s);

// Presence-only actions consume no values
inline bool is_presence_action(ArgAction a) {
    return a == ArgAction::Count || a == ArgAction::SetTrue || a == ArgAction::SetFalse;
}

// ============================================================================
// Schema Errors (compile time)
// ============================================================================

enum class SchemaRule {
    invalid_document,
    invalid_field_type,
    unknown_field,
    invalid_action,
    invalid_arity,
    action_arity_mismatch,
    invalid_flag_spelling,
    invalid_env_var,
    duplicate_key,
    duplicate_long,
    duplicate_short,
    duplicate_env_name,
    multiple_unbounded_positionals,
    unbounded_positional_not_last,
    positional_presence_action,
    default_on_presence_action,
    duplicate_subcommand,
    missing_executable,
};

inline const char* schema_rule_to_string(SchemaRule r) {
    switch (r) {
        case SchemaRule::invalid_document: return "invalid_document";
        case SchemaRule::invalid_field_type: return "invalid_field_type";
        case SchemaRule::unknown_field: return "unknown_field";
        case SchemaRule::invalid_action: return "invalid_action";
        case SchemaRule::invalid_arity: return "invalid_arity";
        case SchemaRule::action_arity_mismatch: return "action_arity_mismatch";
        case SchemaRule::invalid_flag_spelling: return "invalid_flag_spelling";
        case SchemaRule::invalid_env_var: return "invalid_env_var";
        case SchemaRule::duplicate_key: return "duplicate_key";
        case SchemaRule::duplicate_long: return "duplicate_long";
        case SchemaRule::duplicate_short: return "duplicate_short";
        case SchemaRule::duplicate_env_name: return "duplicate_env_name";
        case SchemaRule::multiple_unbounded_positionals: return "multiple_unbounded_positionals";
        case SchemaRule::unbounded_positional_not_last: return "unbounded_positional_not_last";
        case SchemaRule::positional_presence_action: return "positional_presence_action";
        case SchemaRule::default_on_presence_action: return "default_on_presence_action";
        case SchemaRule::duplicate_subcommand: return "duplicate_subcommand";
        case SchemaRule::missing_executable: return "missing_executable";
        default: return "unknown";
    }
}

struct SchemaError {
    SchemaRule rule = SchemaRule::invalid_document;
    std::string command;  // command path, e.g. "tool deploy"
    std::string key;      // offending argument key, empty for command-level errors
    std::string detail;

    std::string message() const;
};

// ============================================================================
// Match Errors (parse time)
// ============================================================================

enum class MatchErrorKind {
    UnknownArgument,
    MissingValue,
    UnexpectedArgument,
    MissingRequired,
    MissingSubcommand
};

inline const char* match_error_kind_to_string(MatchErrorKind k) {
    switch (k) {
        case MatchErrorKind::UnknownArgument: return "unknown_argument";
        case MatchErrorKind::MissingValue: return "missing_value";
        case MatchErrorKind::UnexpectedArgument: return "unexpected_argument";
        case MatchErrorKind::MissingRequired: return "missing_required";
        case MatchErrorKind::MissingSubcommand: return "missing_subcommand";
        default: return "unknown";
    }
}

struct MatchError {
    MatchErrorKind kind = MatchErrorKind::UnknownArgument;
    std::string command;   // name of the command being matched
    std::string key;       // argument key, when one was resolved
    std::string token;     // offending token or flag spelling
    size_t expected = 0;   // MissingValue: values per occurrence
    size_t shortfall = 0;  // MissingValue: values that were missing

    std::string message() const;
};

} // namespace argenv
