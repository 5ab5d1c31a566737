#pragma once

#include "argenv/types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace argenv {

// ============================================================================
// Schema Model
// ============================================================================

struct ArgumentSpec {
    std::string key;
    std::optional<std::string> long_name;   // spelled --long_name
    std::optional<char> short_name;         // spelled -s
    std::string value_name;                 // help text only
    std::string help;                       // help text only
    bool required = false;
    ArgAction action = ArgAction::Set;
    size_t number_of_values = 1;
    std::vector<std::string> default_values;
    std::string env_var;                    // resolved environment name

    bool is_positional() const { return !long_name && !short_name; }

    // An Append positional absorbs every remaining positional token
    bool is_unbounded() const { return is_positional() && action == ArgAction::Append; }

    // "--name" or "-n", whichever is declared (long preferred), else the key
    std::string display_name() const;
};

struct Schema {
    std::string name;
    std::string about;
    std::string version;
    std::string author;
    std::string executable;  // empty when the command only dispatches
    std::vector<ArgumentSpec> args;
    std::vector<Schema> subcommands;

    const ArgumentSpec* find_by_long(const std::string& long_name) const;
    const ArgumentSpec* find_by_short(char short_name) const;
    const Schema* find_subcommand(const std::string& name) const;

    // Positional specs in declaration order
    std::vector<const ArgumentSpec*> positionals() const;
};

// ============================================================================
// Schema Compiler
// ============================================================================

struct SchemaCompileResult {
    bool ok = false;
    SchemaError error;
    Schema schema;
};

// Compile a configuration document. Fails on the first violated rule; no
// partially-validated schema is ever returned.
SchemaCompileResult compile_schema(const nlohmann::ordered_json& document);

// Parse JSON text, then compile it
SchemaCompileResult compile_schema(const std::string& json_text);

// Environment name derived from an argument key: characters outside
// [A-Za-z0-9_] become '_', a leading digit becomes '_', result upper-cased.
std::string to_env_var_name(const std::string& key);

// True when name is a valid POSIX environment variable name
bool is_valid_env_var_name(const std::string& name);

} // namespace argenv
