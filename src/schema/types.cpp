#include "argenv/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace argenv {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ArgAction> parse_arg_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "set") return ArgAction::Set;
    if (lower == "append") return ArgAction::Append;
    if (lower == "count") return ArgAction::Count;
    if (lower == "set_true" || lower == "flag") return ArgAction::SetTrue;
    if (lower == "set_false") return ArgAction::SetFalse;
    return std::nullopt;
}

std::string SchemaError::message() const {
    std::string msg = "invalid schema";
    if (!command.empty()) {
        msg += " for '" + command + "'";
    }
    if (!key.empty()) {
        msg += ": argument '" + key + "'";
    }
    msg += ": ";
    msg += schema_rule_to_string(rule);
    if (!detail.empty()) {
        msg += " (" + detail + ")";
    }
    return msg;
}

std::string MatchError::message() const {
    switch (kind) {
        case MatchErrorKind::UnknownArgument:
            return "unexpected argument '" + token + "' found";

        case MatchErrorKind::MissingValue: {
            std::string msg = "argument '" + token + "' requires " +
                              std::to_string(expected) +
                              (expected == 1 ? " value" : " values");
            msg += " but " + std::to_string(shortfall) +
                   (shortfall == 1 ? " was" : " were") + " missing";
            return msg;
        }

        case MatchErrorKind::UnexpectedArgument:
            if (!key.empty()) {
                return "unexpected value '" + token + "' for argument '" + key + "'";
            }
            return "unexpected argument '" + token + "' found";

        case MatchErrorKind::MissingRequired:
            return "the following required argument was not provided: " + token;

        case MatchErrorKind::MissingSubcommand:
            return "'" + command + "' requires a subcommand but one was not provided";
    }
    return "argument error";
}

} // namespace argenv
