#pragma once

#include "argenv/schema.hpp"
#include "argenv/scanner.hpp"
#include "argenv/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace argenv {

// ============================================================================
// Parse State
// ============================================================================

// Accumulated values for one command. Values are always lists so that Set,
// Append and multi-value arguments share one representation.
struct ParseState {
    std::unordered_map<std::string, std::vector<std::string>> values;
    std::unordered_map<std::string, size_t> counts;
    std::unordered_set<std::string> seen;
    bool terminator_seen = false;

    bool was_seen(const std::string& key) const { return seen.count(key) > 0; }

    // nullptr when the key never received a value
    const std::vector<std::string>* values_of(const std::string& key) const {
        auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    }

    size_t count_of(const std::string& key) const {
        auto it = counts.find(key);
        return it == counts.end() ? 0 : it->second;
    }
};

struct CommandMatch {
    const Schema* schema = nullptr;  // borrowed from the compiled root schema
    ParseState state;
};

// ============================================================================
// Matching Engine
// ============================================================================

enum class MatchStatus {
    Matched,
    HelpRequested,     // -h/--help, when the schema does not declare them
    VersionRequested   // -V/--version, when the schema has a version
};

struct MatchResult {
    bool ok = false;
    MatchError error;
    MatchStatus status = MatchStatus::Matched;

    // Root command first, selected subcommand last. On failure the chain ends
    // at the command that failed.
    std::vector<CommandMatch> commands;

    const CommandMatch& leaf() const { return commands.back(); }
};

// Match the scanner's tokens against a compiled schema. The schema must
// outlive the result.
MatchResult match_arguments(const Schema& schema, TokenScanner& scanner);

MatchResult match_arguments(const Schema& schema, const std::vector<std::string>& args);

} // namespace argenv
