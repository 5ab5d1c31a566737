/**
 * argenv CLI - Entry Point
 *
 * Parses the arguments after "--" against a JSON command definition and
 * replaces itself with the configured executable, passing the parsed values
 * as environment variables.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <argenv/handoff.hpp>
#include <argenv/launch.hpp>

#include <vector>

int main(int argc, char** argv) {
    using namespace argenv::cli;

    // Everything after the first literal "--" belongs to the target command
    SplitArgs split = split_at_separator(argc, argv);

    CLI::App app{"argenv - declarative argument parsing for shell scripts"};
    app.set_version_flag("--version", argenv::ARGENV_VERSION);
    app.footer("Arguments after -- are parsed against the command definition.");

    CliOptions opts;

    auto* json_opt = app.add_option("--json", opts.json, "Command definition as inline JSON");
    auto* file_opt = app.add_option("--json-file", opts.json_file, "Read the command definition from FILE")
                         ->type_name("FILE")
                         ->check(CLI::ExistingFile);
    json_opt->excludes(file_opt);
    app.add_flag("--add-self-to-env", opts.add_self_to_env,
                 "Expose ARGENV_SELF and ARGENV_VERSION to the target");
    app.add_flag("--print-env", opts.print_env, "Print the bindings instead of running the target");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");

    try {
        app.parse(split.own_argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    setup_logging(opts.verbose);

    std::string config;
    if (json_opt->count() > 0) {
        config = opts.json;
    } else if (file_opt->count() > 0) {
        auto content = read_file(opts.json_file);
        if (!content) {
            print_error("Failed to read " + opts.json_file);
            return argenv::EXIT_SCHEMA_ERROR;
        }
        config = *content;
    } else {
        print_error("You must provide either --json or --json-file");
        return argenv::EXIT_SCHEMA_ERROR;
    }

    argenv::LaunchOptions launch_opts;
    launch_opts.add_self_to_env = opts.add_self_to_env;
    launch_opts.self_path = argenv::current_executable_path(argv[0]);

    auto prepared = argenv::prepare_launch(config, split.trailing, launch_opts);

    switch (prepared.status) {
        case argenv::LaunchStatus::ShowHelp:
        case argenv::LaunchStatus::ShowVersion:
            std::cout << prepared.output << std::endl;
            return prepared.exit_code();

        case argenv::LaunchStatus::SchemaFailed:
            print_error(prepared.error_message());
            return prepared.exit_code();

        case argenv::LaunchStatus::MatchFailed:
            print_usage_error(prepared.error_message(), prepared.usage);
            return prepared.exit_code();

        case argenv::LaunchStatus::Ready:
            break;
    }

    if (opts.print_env) {
        write_env_lines(std::cout, prepared.plan.bindings);
        return 0;
    }

    // Only returns if execve failed
    std::string exec_error = argenv::exec_replace(prepared.plan);
    print_error("Failed to execute " + prepared.plan.executable + ": " + exec_error);
    return argenv::EXIT_EXEC_FAILED;
}
