#pragma once

#include "argenv/matcher.hpp"
#include "argenv/schema.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace argenv {

// ============================================================================
// Bindings
// ============================================================================

// Final environment-name -> value mapping. Built once from a completed parse
// and never modified afterwards.
class Bindings {
public:
    using Map = std::map<std::string, std::string>;

    Bindings() = default;
    explicit Bindings(Map entries) : entries_(std::move(entries)) {}

    const Map& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool contains(const std::string& name) const { return entries_.count(name) > 0; }

    std::optional<std::string> get(const std::string& name) const {
        auto it = entries_.find(name);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

private:
    Map entries_;
};

// Join values with VALUE_SEPARATOR
std::string join_values(const std::vector<std::string>& values);

// Binding value for one argument, or nullopt when it is omitted
std::optional<std::string> format_binding(const ArgumentSpec& spec, const ParseState& state);

// Bindings for every argument of a matched command
Bindings format_bindings(const Schema& schema, const ParseState& state);

// Bindings for the innermost command of a successful match
Bindings format_bindings(const MatchResult& match);

} // namespace argenv
