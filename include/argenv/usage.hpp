#pragma once

#include "argenv/matcher.hpp"
#include "argenv/schema.hpp"

#include <string>

namespace argenv {

// ============================================================================
// Help and Version Text
// ============================================================================

// Space-separated names of the matched command chain, e.g. "tool deploy"
std::string command_path(const MatchResult& match);

// "Usage: <path> [OPTIONS] <ARG>..." for one command
std::string render_usage_line(const Schema& schema, const std::string& path = "");

// Full help: about, usage line, subcommands, positionals and options
std::string render_help(const Schema& schema, const std::string& path = "");

// "<name> <version>"
std::string render_version(const Schema& schema);

} // namespace argenv
