#include "argenv/schema.hpp"

#include <cctype>
#include <cstdint>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace argenv {

using json = nlohmann::ordered_json;

namespace {

const std::set<std::string> kArgumentFields = {
    "long", "short", "value_name", "help", "required",
    "arg_action", "number_of_values", "default_value", "env_var"
};

const std::set<std::string> kCommandFields = {
    "name", "about", "description", "version", "author",
    "executable", "args", "subcommands"
};

SchemaError make_error(SchemaRule rule, const std::string& command,
                       const std::string& key, const std::string& detail) {
    SchemaError err;
    err.rule = rule;
    err.command = command;
    err.key = key;
    err.detail = detail;
    return err;
}

// Reads an optional string field. Absent or null leaves `out` untouched.
bool read_string(const json& obj, const char* field, const std::string& command,
                 const std::string& key, std::string& out, SchemaError& err) {
    if (!obj.contains(field) || obj[field].is_null()) {
        return true;
    }
    if (!obj[field].is_string()) {
        err = make_error(SchemaRule::invalid_field_type, command, key,
                         std::string("field '") + field + "' must be a string");
        return false;
    }
    out = obj[field].get<std::string>();
    return true;
}

bool is_valid_long(const std::string& s) {
    if (s.empty() || s[0] == '-') return false;
    for (char c : s) {
        if (c == '=' || std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_valid_short(const std::string& s) {
    if (s.size() != 1) return false;
    char c = s[0];
    return c != '-' && c != '=' && !std::isspace(static_cast<unsigned char>(c));
}

std::string basename_of(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool compile_argument(const std::string& key, const json& body, const std::string& command,
                      ArgumentSpec& spec, SchemaError& err) {
    spec.key = key;

    if (key.empty()) {
        err = make_error(SchemaRule::invalid_document, command, key,
                         "argument key must not be empty");
        return false;
    }
    if (!body.is_object()) {
        err = make_error(SchemaRule::invalid_field_type, command, key,
                         "argument definition must be an object");
        return false;
    }

    for (const auto& [field, _] : body.items()) {
        if (kArgumentFields.count(field) == 0) {
            err = make_error(SchemaRule::unknown_field, command, key,
                             "unknown field '" + field + "'");
            return false;
        }
    }

    // Flag spellings
    std::string long_name;
    if (!read_string(body, "long", command, key, long_name, err)) return false;
    if (body.contains("long") && !body["long"].is_null()) {
        if (!is_valid_long(long_name)) {
            err = make_error(SchemaRule::invalid_flag_spelling, command, key,
                             "long name '" + long_name + "' is not a valid flag spelling");
            return false;
        }
        spec.long_name = long_name;
    }

    std::string short_name;
    if (!read_string(body, "short", command, key, short_name, err)) return false;
    if (body.contains("short") && !body["short"].is_null()) {
        if (!is_valid_short(short_name)) {
            err = make_error(SchemaRule::invalid_flag_spelling, command, key,
                             "short name '" + short_name + "' must be a single non-dash character");
            return false;
        }
        spec.short_name = short_name[0];
    }

    if (!read_string(body, "value_name", command, key, spec.value_name, err)) return false;
    if (!read_string(body, "help", command, key, spec.help, err)) return false;

    if (body.contains("required") && !body["required"].is_null()) {
        if (!body["required"].is_boolean()) {
            err = make_error(SchemaRule::invalid_field_type, command, key,
                             "field 'required' must be a boolean");
            return false;
        }
        spec.required = body["required"].get<bool>();
    }

    // Action
    std::string action_str = "set";
    if (!read_string(body, "arg_action", command, key, action_str, err)) return false;
    auto action = parse_arg_action(action_str);
    if (!action) {
        err = make_error(SchemaRule::invalid_action, command, key,
                         "unrecognized arg_action '" + action_str + "'");
        return false;
    }
    spec.action = *action;
    bool presence = is_presence_action(spec.action);

    // Arity
    spec.number_of_values = presence ? 0 : 1;
    if (body.contains("number_of_values") && !body["number_of_values"].is_null()) {
        const auto& nov = body["number_of_values"];
        if (nov.is_number_unsigned()) {
            uint64_t requested = nov.get<uint64_t>();
            if (requested > MAX_NUMBER_OF_VALUES) {
                err = make_error(SchemaRule::invalid_arity, command, key,
                                 "number_of_values must not exceed " +
                                 std::to_string(MAX_NUMBER_OF_VALUES));
                return false;
            }
            spec.number_of_values = static_cast<size_t>(requested);
        } else if (nov.is_number_integer()) {
            err = make_error(SchemaRule::invalid_arity, command, key,
                             "number_of_values must not be negative");
            return false;
        } else {
            err = make_error(SchemaRule::invalid_field_type, command, key,
                             "field 'number_of_values' must be an integer");
            return false;
        }

        if (spec.number_of_values == 0 && !presence) {
            err = make_error(SchemaRule::action_arity_mismatch, command, key,
                             std::string("action '") + action_to_string(spec.action) +
                             "' requires number_of_values >= 1");
            return false;
        }
        if (spec.number_of_values > 0 && presence) {
            err = make_error(SchemaRule::action_arity_mismatch, command, key,
                             std::string("action '") + action_to_string(spec.action) +
                             "' takes no values");
            return false;
        }
    }

    if (spec.is_positional() && presence) {
        err = make_error(SchemaRule::positional_presence_action, command, key,
                         std::string("positional arguments cannot use action '") +
                         action_to_string(spec.action) + "'");
        return false;
    }

    // Defaults
    if (body.contains("default_value") && !body["default_value"].is_null()) {
        if (presence) {
            err = make_error(SchemaRule::default_on_presence_action, command, key,
                             std::string("action '") + action_to_string(spec.action) +
                             "' cannot declare default_value");
            return false;
        }
        const auto& dv = body["default_value"];
        if (dv.is_string()) {
            spec.default_values.push_back(dv.get<std::string>());
        } else if (dv.is_array()) {
            for (const auto& item : dv) {
                if (!item.is_string()) {
                    err = make_error(SchemaRule::invalid_field_type, command, key,
                                     "default_value entries must be strings");
                    return false;
                }
                spec.default_values.push_back(item.get<std::string>());
            }
        } else {
            err = make_error(SchemaRule::invalid_field_type, command, key,
                             "field 'default_value' must be a string or an array of strings");
            return false;
        }
    }

    // Environment name
    if (body.contains("env_var") && !body["env_var"].is_null()) {
        if (!read_string(body, "env_var", command, key, spec.env_var, err)) return false;
        if (!is_valid_env_var_name(spec.env_var)) {
            err = make_error(SchemaRule::invalid_env_var, command, key,
                             "'" + spec.env_var + "' is not a valid environment variable name");
            return false;
        }
    } else {
        spec.env_var = to_env_var_name(key);
    }

    return true;
}

// Uniqueness and positional ordering rules across one command's arguments
bool check_argument_set(const std::vector<ArgumentSpec>& args, const std::string& command,
                        SchemaError& err) {
    std::unordered_set<std::string> keys;
    std::unordered_map<std::string, std::string> longs;
    std::unordered_map<char, std::string> shorts;
    std::unordered_map<std::string, std::string> env_names;
    const ArgumentSpec* unbounded = nullptr;

    for (const auto& spec : args) {
        if (!keys.insert(spec.key).second) {
            err = make_error(SchemaRule::duplicate_key, command, spec.key,
                             "argument key declared more than once");
            return false;
        }

        if (spec.long_name) {
            auto [it, inserted] = longs.emplace(*spec.long_name, spec.key);
            if (!inserted) {
                err = make_error(SchemaRule::duplicate_long, command, spec.key,
                                 "--" + *spec.long_name + " is already used by '" + it->second + "'");
                return false;
            }
        }

        if (spec.short_name) {
            auto [it, inserted] = shorts.emplace(*spec.short_name, spec.key);
            if (!inserted) {
                err = make_error(SchemaRule::duplicate_short, command, spec.key,
                                 std::string("-") + *spec.short_name +
                                 " is already used by '" + it->second + "'");
                return false;
            }
        }

        auto [env_it, env_inserted] = env_names.emplace(spec.env_var, spec.key);
        if (!env_inserted) {
            err = make_error(SchemaRule::duplicate_env_name, command, spec.key,
                             "environment name " + spec.env_var + " is already used by '" +
                             env_it->second + "'");
            return false;
        }

        if (spec.is_positional()) {
            if (unbounded) {
                // Any positional after an unbounded one could never be reached
                SchemaRule rule = spec.is_unbounded() ? SchemaRule::multiple_unbounded_positionals
                                                      : SchemaRule::unbounded_positional_not_last;
                err = make_error(rule, command, spec.key,
                                 "positional '" + unbounded->key +
                                 "' takes all remaining values and must be the last positional");
                return false;
            }
            if (spec.is_unbounded()) {
                unbounded = &spec;
            }
        }
    }

    return true;
}

bool compile_command(const json& doc, const std::string& default_name,
                     const std::string& parent_path, Schema& schema, SchemaError& err) {
    if (!doc.is_object()) {
        err = make_error(SchemaRule::invalid_document,
                         parent_path.empty() ? default_name : parent_path + " " + default_name,
                         "", "command definition must be a JSON object");
        return false;
    }

    std::string label = parent_path.empty() ? default_name : parent_path + " " + default_name;

    if (!read_string(doc, "executable", label, "", schema.executable, err)) return false;

    schema.name = default_name;
    if (!read_string(doc, "name", label, "", schema.name, err)) return false;
    if (schema.name.empty()) {
        schema.name = schema.executable.empty() ? "command" : basename_of(schema.executable);
    }
    std::string path = parent_path.empty() ? schema.name : parent_path + " " + schema.name;

    for (const auto& [field, _] : doc.items()) {
        if (kCommandFields.count(field) == 0) {
            spdlog::warn("ignoring unknown field '{}' in command '{}'", field, path);
        }
    }

    if (!read_string(doc, "description", path, "", schema.about, err)) return false;
    if (!read_string(doc, "about", path, "", schema.about, err)) return false;
    if (!read_string(doc, "version", path, "", schema.version, err)) return false;
    if (!read_string(doc, "author", path, "", schema.author, err)) return false;

    // "args": ordered list of single-key objects
    if (doc.contains("args") && !doc["args"].is_null()) {
        const auto& args = doc["args"];
        if (!args.is_array()) {
            err = make_error(SchemaRule::invalid_document, path, "",
                             "'args' must be an array of single-key objects");
            return false;
        }
        for (size_t i = 0; i < args.size(); ++i) {
            const auto& entry = args[i];
            if (!entry.is_object() || entry.size() != 1) {
                err = make_error(SchemaRule::invalid_document, path, "",
                                 "args[" + std::to_string(i) + "] must be an object with exactly one key");
                return false;
            }
            auto it = entry.begin();
            ArgumentSpec spec;
            if (!compile_argument(it.key(), it.value(), path, spec, err)) return false;
            schema.args.push_back(std::move(spec));
        }
    }

    if (!check_argument_set(schema.args, path, err)) return false;

    // "subcommands": name -> nested command document
    if (doc.contains("subcommands") && !doc["subcommands"].is_null()) {
        const auto& subs = doc["subcommands"];
        if (!subs.is_object()) {
            err = make_error(SchemaRule::invalid_document, path, "",
                             "'subcommands' must be an object");
            return false;
        }
        std::unordered_set<std::string> names;
        for (const auto& [sub_name, sub_doc] : subs.items()) {
            Schema sub;
            if (!compile_command(sub_doc, sub_name, path, sub, err)) return false;
            if (!names.insert(sub.name).second) {
                err = make_error(SchemaRule::duplicate_subcommand, path, "",
                                 "subcommand '" + sub.name + "' declared more than once");
                return false;
            }
            schema.subcommands.push_back(std::move(sub));
        }
    }

    if (schema.executable.empty() && schema.subcommands.empty()) {
        err = make_error(SchemaRule::missing_executable, path, "",
                         "a command needs an executable or at least one subcommand");
        return false;
    }

    spdlog::debug("compiled command '{}' with {} argument(s) and {} subcommand(s)",
                  path, schema.args.size(), schema.subcommands.size());
    return true;
}

} // namespace

SchemaCompileResult compile_schema(const json& document) {
    SchemaCompileResult result;
    Schema schema;
    if (!compile_command(document, "", "", schema, result.error)) {
        return result;
    }
    result.schema = std::move(schema);
    result.ok = true;
    return result;
}

SchemaCompileResult compile_schema(const std::string& json_text) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::exception& e) {
        SchemaCompileResult result;
        result.error = make_error(SchemaRule::invalid_document, "", "",
                                  std::string("JSON parse error: ") + e.what());
        return result;
    }
    return compile_schema(document);
}

std::string to_env_var_name(const std::string& key) {
    std::string result;
    result.reserve(key.size());
    for (size_t i = 0; i < key.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(key[i]);
        char out = (std::isalnum(c) && c < 0x80) || c == '_' ? static_cast<char>(c) : '_';
        if (i == 0 && std::isdigit(static_cast<unsigned char>(out))) {
            out = '_';
        }
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(out)));
    }
    return result;
}

bool is_valid_env_var_name(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_') || first >= 0x80) return false;
    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 0x80 || !(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

// ============================================================================
// Schema lookups
// ============================================================================

std::string ArgumentSpec::display_name() const {
    if (long_name) return "--" + *long_name;
    if (short_name) return std::string("-") + *short_name;
    return "<" + (value_name.empty() ? env_var : value_name) + ">";
}

const ArgumentSpec* Schema::find_by_long(const std::string& long_name) const {
    for (const auto& spec : args) {
        if (spec.long_name && *spec.long_name == long_name) return &spec;
    }
    return nullptr;
}

const ArgumentSpec* Schema::find_by_short(char short_name) const {
    for (const auto& spec : args) {
        if (spec.short_name && *spec.short_name == short_name) return &spec;
    }
    return nullptr;
}

const Schema* Schema::find_subcommand(const std::string& sub_name) const {
    for (const auto& sub : subcommands) {
        if (sub.name == sub_name) return &sub;
    }
    return nullptr;
}

std::vector<const ArgumentSpec*> Schema::positionals() const {
    std::vector<const ArgumentSpec*> result;
    for (const auto& spec : args) {
        if (spec.is_positional()) result.push_back(&spec);
    }
    return result;
}

} // namespace argenv
