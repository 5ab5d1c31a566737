#include "argenv/launch.hpp"

#include "argenv/bindings.hpp"
#include "argenv/matcher.hpp"
#include "argenv/usage.hpp"

#include <spdlog/spdlog.h>

namespace argenv {

int PreparedLaunch::exit_code() const {
    switch (status) {
        case LaunchStatus::Ready:
        case LaunchStatus::ShowHelp:
        case LaunchStatus::ShowVersion:
            return 0;
        case LaunchStatus::SchemaFailed:
            return EXIT_SCHEMA_ERROR;
        case LaunchStatus::MatchFailed:
            return EXIT_USAGE_ERROR;
    }
    return EXIT_SCHEMA_ERROR;
}

std::string PreparedLaunch::error_message() const {
    switch (status) {
        case LaunchStatus::SchemaFailed:
            return schema_error.message();
        case LaunchStatus::MatchFailed:
            return match_error.message();
        default:
            return "";
    }
}

PreparedLaunch prepare_launch(const std::string& config_json,
                              const std::vector<std::string>& args,
                              const LaunchOptions& options) {
    auto compiled = compile_schema(config_json);
    if (!compiled.ok) {
        PreparedLaunch prepared;
        prepared.status = LaunchStatus::SchemaFailed;
        prepared.schema_error = compiled.error;
        return prepared;
    }
    return prepare_launch(compiled.schema, args, options);
}

PreparedLaunch prepare_launch(const Schema& schema,
                              const std::vector<std::string>& args,
                              const LaunchOptions& options) {
    PreparedLaunch prepared;

    TokenScanner scanner(args);
    auto match = match_arguments(schema, scanner);
    std::string path = command_path(match);

    if (!match.ok) {
        spdlog::debug("match failed in '{}': {}", path,
                      match_error_kind_to_string(match.error.kind));
        prepared.status = LaunchStatus::MatchFailed;
        prepared.match_error = match.error;
        prepared.usage = render_usage_line(*match.leaf().schema, path);
        return prepared;
    }

    const Schema& leaf = *match.leaf().schema;

    if (match.status == MatchStatus::HelpRequested) {
        prepared.status = LaunchStatus::ShowHelp;
        prepared.output = render_help(leaf, path);
        return prepared;
    }
    if (match.status == MatchStatus::VersionRequested) {
        prepared.status = LaunchStatus::ShowVersion;
        prepared.output = render_version(leaf);
        return prepared;
    }

    prepared.plan.executable = leaf.executable;
    prepared.plan.bindings = format_bindings(match);
    if (options.add_self_to_env) {
        prepared.plan.extra_environment.emplace_back(SELF_ENV_VAR, options.self_path);
        prepared.plan.extra_environment.emplace_back(VERSION_ENV_VAR, ARGENV_VERSION);
    }
    prepared.status = LaunchStatus::Ready;

    spdlog::debug("'{}' matched, {} binding(s) for {}", path,
                  prepared.plan.bindings.size(), prepared.plan.executable);
    return prepared;
}

} // namespace argenv
