#pragma once

#include "argenv/handoff.hpp"
#include "argenv/schema.hpp"
#include "argenv/types.hpp"

#include <string>
#include <vector>

namespace argenv {

// ============================================================================
// Launch Preparation
// ============================================================================

constexpr int EXIT_SCHEMA_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;
constexpr int EXIT_EXEC_FAILED = 127;

struct LaunchOptions {
    bool add_self_to_env = false;  // expose ARGENV_SELF / ARGENV_VERSION
    std::string self_path;
};

enum class LaunchStatus {
    Ready,         // plan is complete, hand off to the target
    ShowHelp,      // output holds help text
    ShowVersion,   // output holds version text
    SchemaFailed,
    MatchFailed
};

struct PreparedLaunch {
    LaunchStatus status = LaunchStatus::SchemaFailed;
    LaunchPlan plan;
    std::string output;
    SchemaError schema_error;
    MatchError match_error;
    std::string usage;  // usage line of the command that failed to match

    bool ok() const {
        return status != LaunchStatus::SchemaFailed && status != LaunchStatus::MatchFailed;
    }

    // Process exit status for every outcome except a successful handoff
    int exit_code() const;

    // One-line diagnostic for SchemaFailed / MatchFailed
    std::string error_message() const;
};

// Compile, scan, match and format. Nothing is executed; the returned plan is
// only populated when status is Ready.
PreparedLaunch prepare_launch(const std::string& config_json,
                              const std::vector<std::string>& args,
                              const LaunchOptions& options = {});

PreparedLaunch prepare_launch(const Schema& schema,
                              const std::vector<std::string>& args,
                              const LaunchOptions& options = {});

} // namespace argenv
