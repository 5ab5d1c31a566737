#include "argenv/bindings.hpp"

namespace argenv {

std::string join_values(const std::vector<std::string>& values) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += VALUE_SEPARATOR;
        result += values[i];
    }
    return result;
}

std::optional<std::string> format_binding(const ArgumentSpec& spec, const ParseState& state) {
    switch (spec.action) {
        case ArgAction::Count:
            return std::to_string(state.count_of(spec.key));

        case ArgAction::SetTrue:
            return std::string(state.was_seen(spec.key) ? PRESENT_VALUE : ABSENT_VALUE);

        case ArgAction::SetFalse:
            return std::string(state.was_seen(spec.key) ? ABSENT_VALUE : PRESENT_VALUE);

        case ArgAction::Set:
        case ArgAction::Append:
            break;
    }

    if (const auto* values = state.values_of(spec.key)) {
        return join_values(*values);
    }
    if (!spec.default_values.empty()) {
        return join_values(spec.default_values);
    }
    return std::nullopt;
}

Bindings format_bindings(const Schema& schema, const ParseState& state) {
    Bindings::Map entries;
    for (const auto& spec : schema.args) {
        if (auto value = format_binding(spec, state)) {
            entries.emplace(spec.env_var, std::move(*value));
        }
    }
    return Bindings(std::move(entries));
}

Bindings format_bindings(const MatchResult& match) {
    if (match.commands.empty()) {
        return Bindings();
    }
    const auto& leaf = match.leaf();
    return format_bindings(*leaf.schema, leaf.state);
}

} // namespace argenv
