#pragma once

#include "argenv/bindings.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace argenv {

// ============================================================================
// Launch Plan
// ============================================================================

// Everything the handoff needs: produced only after every fallible parsing
// step has succeeded.
struct LaunchPlan {
    std::string executable;
    Bindings bindings;
    // Added before the bindings, e.g. ARGENV_SELF; bindings win on clashes
    std::vector<std::pair<std::string, std::string>> extra_environment;
};

// ============================================================================
// Environment Building
// ============================================================================

// "NAME=value" entries of the running process
std::vector<std::string> current_environment();

// Merge inherited entries, extra environment and bindings (in that order of
// precedence, last wins). Inherited order is preserved; new names are appended.
std::vector<std::string> build_environment(const LaunchPlan& plan,
                                           const std::vector<std::string>& inherited);

// Resolve a bare program name against a PATH-style list. Names containing
// '/' are returned unchanged.
std::optional<std::string> resolve_executable(const std::string& executable,
                                              const std::string& path_env);

// Absolute path of the running binary; falls back to argv[0]
std::string current_executable_path(const std::string& argv0);

// ============================================================================
// Execution
// ============================================================================

// Replace the current process with the target. Returns only on failure, with
// a description of what went wrong.
std::string exec_replace(const LaunchPlan& plan);

} // namespace argenv
