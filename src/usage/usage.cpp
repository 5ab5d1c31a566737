#include "argenv/usage.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace argenv {

namespace {

std::string value_placeholder(const ArgumentSpec& spec) {
    return "<" + (spec.value_name.empty() ? spec.env_var : spec.value_name) + ">";
}

std::string positional_label(const ArgumentSpec& spec) {
    std::string label = spec.value_name.empty() ? spec.env_var : spec.value_name;
    std::string out;
    for (size_t i = 0; i < spec.number_of_values; ++i) {
        if (i > 0) out += " ";
        out += spec.required ? "<" + label + ">" : "[" + label + "]";
    }
    if (spec.is_unbounded()) out += "...";
    return out;
}

std::string option_label(const ArgumentSpec& spec) {
    std::string out = spec.short_name ? std::string("-") + *spec.short_name : "  ";
    if (spec.long_name) {
        out += spec.short_name ? ", --" : "  --";
        out += *spec.long_name;
    }
    for (size_t i = 0; i < spec.number_of_values; ++i) {
        out += " " + value_placeholder(spec);
    }
    return out;
}

// Two-column block with labels padded to a common width
void write_table(std::ostringstream& os, const std::string& title,
                 const std::vector<std::pair<std::string, std::string>>& rows) {
    if (rows.empty()) return;

    size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.first.size());
    }

    os << "\n" << title << ":\n";
    for (const auto& [label, text] : rows) {
        os << "  " << label;
        if (!text.empty()) {
            os << std::string(width - label.size() + 2, ' ') << text;
        }
        os << "\n";
    }
}

// Label for a built-in flag, covering only the spellings the schema left free
std::string builtin_label(const Schema& schema, char short_name, const char* long_name) {
    bool short_free = schema.find_by_short(short_name) == nullptr;
    bool long_free = schema.find_by_long(long_name) == nullptr;
    if (short_free && long_free) return std::string("-") + short_name + ", --" + long_name;
    if (short_free) return std::string("-") + short_name;
    if (long_free) return std::string("    --") + long_name;
    return "";
}

} // namespace

std::string command_path(const MatchResult& match) {
    std::string path;
    for (const auto& command : match.commands) {
        if (!path.empty()) path += " ";
        path += command.schema->name;
    }
    return path;
}

std::string render_usage_line(const Schema& schema, const std::string& path) {
    std::string line = "Usage: " + (path.empty() ? schema.name : path);

    bool has_options = std::any_of(schema.args.begin(), schema.args.end(),
                                   [](const ArgumentSpec& spec) { return !spec.is_positional(); });
    if (has_options) {
        line += " [OPTIONS]";
    }

    // Required options are spelled out, clap style
    for (const auto& spec : schema.args) {
        if (spec.is_positional() || !spec.required) continue;
        line += " " + spec.display_name();
        for (size_t i = 0; i < spec.number_of_values; ++i) {
            line += " " + value_placeholder(spec);
        }
    }

    for (const auto* spec : schema.positionals()) {
        line += " " + positional_label(*spec);
    }

    if (!schema.subcommands.empty()) {
        line += schema.executable.empty() ? " <COMMAND>" : " [COMMAND]";
    }
    return line;
}

std::string render_help(const Schema& schema, const std::string& path) {
    std::ostringstream os;

    if (!schema.about.empty()) {
        os << schema.about << "\n\n";
    }
    os << render_usage_line(schema, path) << "\n";

    std::vector<std::pair<std::string, std::string>> commands;
    for (const auto& sub : schema.subcommands) {
        commands.emplace_back(sub.name, sub.about);
    }
    write_table(os, "Commands", commands);

    std::vector<std::pair<std::string, std::string>> positionals;
    std::vector<std::pair<std::string, std::string>> options;
    for (const auto& spec : schema.args) {
        if (spec.is_positional()) {
            positionals.emplace_back(positional_label(spec), spec.help);
        } else {
            std::string text = spec.help;
            if (!spec.default_values.empty()) {
                std::string defaults;
                for (const auto& value : spec.default_values) {
                    if (!defaults.empty()) defaults += ", ";
                    defaults += value;
                }
                text += (text.empty() ? "" : " ") + std::string("[default: ") + defaults + "]";
            }
            options.emplace_back(option_label(spec), text);
        }
    }
    std::string help_label = builtin_label(schema, 'h', "help");
    if (!help_label.empty()) {
        options.emplace_back(help_label, "Print help");
    }
    std::string version_label = builtin_label(schema, 'V', "version");
    if (!schema.version.empty() && !version_label.empty()) {
        options.emplace_back(version_label, "Print version");
    }

    write_table(os, "Arguments", positionals);
    write_table(os, "Options", options);

    return os.str();
}

std::string render_version(const Schema& schema) {
    return schema.name + " " + schema.version;
}

} // namespace argenv
