/**
 * Unit tests for the matching engine
 */

#include <doctest/doctest.h>
#include <argenv/matcher.hpp>

using namespace argenv;

namespace {

Schema compile_or_fail(const std::string& json) {
    auto result = compile_schema(json);
    REQUIRE_MESSAGE(result.ok, result.error.message());
    return result.schema;
}

// arg1: --arg1, append, 2 values; arg2: --arg2, append; arg3: required positional
const char* kAppendSchema = R"({
    "name": "clap-test",
    "executable": "/bin/true",
    "args": [
        {"arg1": {"long": "arg1", "value_name": "ARG1", "arg_action": "append", "number_of_values": 2}},
        {"arg2": {"long": "arg2", "arg_action": "append"}},
        {"arg3": {"required": true}}
    ]
})";

std::vector<std::string> values(const MatchResult& m, const std::string& key) {
    const auto* v = m.leaf().state.values_of(key);
    return v ? *v : std::vector<std::string>{};
}

} // namespace

TEST_CASE("append arguments accumulate in arrival order") {
    auto schema = compile_or_fail(kAppendSchema);

    SUBCASE("repeated multi-value occurrences") {
        auto m = match_arguments(schema, {"--arg1", "a", "b", "--arg2", "c", "--arg1", "d", "e", "positional-val"});
        REQUIRE_MESSAGE(m.ok, m.error.message());
        CHECK(m.status == MatchStatus::Matched);
        CHECK(values(m, "arg1") == std::vector<std::string>{"a", "b", "d", "e"});
        CHECK(values(m, "arg2") == std::vector<std::string>{"c"});
        CHECK(values(m, "arg3") == std::vector<std::string>{"positional-val"});
    }

    SUBCASE("three occurrences of two values give six values") {
        auto m = match_arguments(schema, {"--arg1", "1", "2", "--arg1", "3", "4", "--arg1", "5", "6", "p"});
        REQUIRE(m.ok);
        CHECK(values(m, "arg1") == std::vector<std::string>{"1", "2", "3", "4", "5", "6"});
    }

    SUBCASE("zero occurrences leave nothing") {
        auto m = match_arguments(schema, {"p"});
        REQUIRE(m.ok);
        CHECK(m.leaf().state.values_of("arg1") == nullptr);
        CHECK_FALSE(m.leaf().state.was_seen("arg1"));
    }

    SUBCASE("missing required positional") {
        auto m = match_arguments(schema, {"--arg1", "a", "b"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingRequired);
        CHECK(m.error.key == "arg3");
    }

    SUBCASE("too few values for a flag") {
        auto m = match_arguments(schema, {"--arg1", "a"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingValue);
        CHECK(m.error.key == "arg1");
        CHECK(m.error.token == "--arg1");
        CHECK(m.error.expected == 2);
        CHECK(m.error.shortfall == 1);
    }

    SUBCASE("missing value is reported before missing required") {
        auto m = match_arguments(schema, {"--arg2"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingValue);
        CHECK(m.error.shortfall == 1);
    }
}

TEST_CASE("option values are taken literally") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"pair": {"long": "pair", "number_of_values": 2}},
            {"flag": {"long": "flag", "arg_action": "set_true"}},
            {"rest": {"arg_action": "append"}}
        ]
    })");

    SUBCASE("option-like strings as values") {
        auto m = match_arguments(schema, {"--pair", "--flag", "-x"});
        REQUIRE(m.ok);
        CHECK(values(m, "pair") == std::vector<std::string>{"--flag", "-x"});
        CHECK_FALSE(m.leaf().state.was_seen("flag"));
    }

    SUBCASE("a terminator consumed as a value does not end option parsing") {
        auto m = match_arguments(schema, {"--pair", "--", "v", "--flag"});
        REQUIRE(m.ok);
        CHECK(values(m, "pair") == std::vector<std::string>{"--", "v"});
        CHECK(m.leaf().state.was_seen("flag"));
        CHECK_FALSE(m.leaf().state.terminator_seen);
    }
}

TEST_CASE("terminator") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"flag": {"long": "flag", "short": "f", "arg_action": "set_true"}},
            {"files": {"arg_action": "append"}}
        ]
    })");

    SUBCASE("option-looking tokens after -- are positionals") {
        auto m = match_arguments(schema, {"a", "--", "--flag", "-f", "--"});
        REQUIRE(m.ok);
        CHECK_FALSE(m.leaf().state.was_seen("flag"));
        CHECK(values(m, "files") == std::vector<std::string>{"a", "--flag", "-f", "--"});
        CHECK(m.leaf().state.terminator_seen);
    }

    SUBCASE("unknown options after -- are not errors") {
        auto m = match_arguments(schema, {"--", "--does-not-exist"});
        REQUIRE(m.ok);
        CHECK(values(m, "files") == std::vector<std::string>{"--does-not-exist"});
    }

    SUBCASE("the terminator itself is never a value") {
        auto m = match_arguments(schema, {"--"});
        REQUIRE(m.ok);
        CHECK(m.leaf().state.values_of("files") == nullptr);
    }
}

TEST_CASE("set overwrites earlier occurrences") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"mode": {"long": "mode", "short": "m"}},
            {"range": {"long": "range", "number_of_values": 2}}
        ]
    })");

    auto m = match_arguments(schema, {"--mode", "a", "-m", "b", "--range", "1", "2", "--range", "3", "4"});
    REQUIRE(m.ok);
    CHECK(values(m, "mode") == std::vector<std::string>{"b"});
    CHECK(values(m, "range") == std::vector<std::string>{"3", "4"});
}

TEST_CASE("inline values") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"name": {"long": "name"}},
            {"pair": {"long": "pair", "number_of_values": 2}},
            {"verbose": {"long": "verbose", "arg_action": "count"}}
        ]
    })");

    SUBCASE("single value") {
        auto m = match_arguments(schema, {"--name=alice"});
        REQUIRE(m.ok);
        CHECK(values(m, "name") == std::vector<std::string>{"alice"});
    }

    SUBCASE("inline value containing '='") {
        auto m = match_arguments(schema, {"--name=a=b"});
        REQUIRE(m.ok);
        CHECK(values(m, "name") == std::vector<std::string>{"a=b"});
    }

    SUBCASE("inline value is the first of several") {
        auto m = match_arguments(schema, {"--pair=1", "2"});
        REQUIRE(m.ok);
        CHECK(values(m, "pair") == std::vector<std::string>{"1", "2"});
    }

    SUBCASE("inline value with shortfall") {
        auto m = match_arguments(schema, {"--pair=1"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingValue);
        CHECK(m.error.shortfall == 1);
    }

    SUBCASE("inline value on a presence-only flag") {
        auto m = match_arguments(schema, {"--verbose=3"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnexpectedArgument);
        CHECK(m.error.key == "verbose");
        CHECK(m.error.token == "3");
    }
}

TEST_CASE("presence actions") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"verbose": {"short": "v", "long": "verbose", "arg_action": "count"}},
            {"force": {"long": "force", "arg_action": "flag"}},
            {"color": {"long": "no-color", "arg_action": "set_false"}}
        ]
    })");

    SUBCASE("count increments per occurrence") {
        auto m = match_arguments(schema, {"-v", "--verbose", "-v"});
        REQUIRE(m.ok);
        CHECK(m.leaf().state.count_of("verbose") == 3);
        CHECK(m.leaf().state.values_of("verbose") == nullptr);
    }

    SUBCASE("flags are idempotent") {
        auto m = match_arguments(schema, {"--force", "--force", "--no-color"});
        REQUIRE(m.ok);
        CHECK(m.leaf().state.was_seen("force"));
        CHECK(m.leaf().state.was_seen("color"));
        CHECK(m.leaf().state.count_of("force") == 0);
    }

    SUBCASE("flags never consume the following token") {
        auto m = match_arguments(schema, {"--force", "stray"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnexpectedArgument);
        CHECK(m.error.token == "stray");
    }
}

TEST_CASE("positional arity") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"src": {"number_of_values": 2}},
            {"flag": {"long": "flag", "arg_action": "set_true"}},
            {"dst": {}}
        ]
    })");

    SUBCASE("positionals fill in declaration order") {
        auto m = match_arguments(schema, {"a", "--flag", "b", "c"});
        REQUIRE(m.ok);
        CHECK(values(m, "src") == std::vector<std::string>{"a", "b"});
        CHECK(values(m, "dst") == std::vector<std::string>{"c"});
        CHECK(m.leaf().state.was_seen("flag"));
    }

    SUBCASE("surplus positional") {
        auto m = match_arguments(schema, {"a", "b", "c", "d"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnexpectedArgument);
        CHECK(m.error.token == "d");
        CHECK(m.error.key.empty());
    }

    SUBCASE("partially filled positional") {
        auto m = match_arguments(schema, {"a"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingValue);
        CHECK(m.error.key == "src");
        CHECK(m.error.expected == 2);
        CHECK(m.error.shortfall == 1);
    }

    SUBCASE("no positionals at all is fine when none are required") {
        auto m = match_arguments(schema, std::vector<std::string>{});
        CHECK(m.ok);
    }
}

TEST_CASE("largest arity reports a shortfall") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [{"big": {"long": "big", "number_of_values": 255}}]
    })");

    auto m = match_arguments(schema, {"--big", "x"});
    REQUIRE_FALSE(m.ok);
    CHECK(m.error.kind == MatchErrorKind::MissingValue);
    CHECK(m.error.key == "big");
    CHECK(m.error.expected == MAX_NUMBER_OF_VALUES);
    CHECK(m.error.shortfall == MAX_NUMBER_OF_VALUES - 1);
}

TEST_CASE("unbounded positional absorbs the rest") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"cmd": {"required": true}},
            {"args": {"arg_action": "append"}},
            {"dry": {"long": "dry-run", "arg_action": "flag"}}
        ]
    })");

    auto m = match_arguments(schema, {"run", "a", "--dry-run", "b", "c"});
    REQUIRE(m.ok);
    CHECK(values(m, "cmd") == std::vector<std::string>{"run"});
    CHECK(values(m, "args") == std::vector<std::string>{"a", "b", "c"});
    CHECK(m.leaf().state.was_seen("dry"));
}

TEST_CASE("unknown arguments") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [{"name": {"long": "name", "short": "n"}}]
    })");

    SUBCASE("long") {
        auto m = match_arguments(schema, {"--nmae", "x"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnknownArgument);
        CHECK(m.error.token == "--nmae");
    }

    SUBCASE("long with inline value reports the flag only") {
        auto m = match_arguments(schema, {"--nmae=x"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.token == "--nmae");
    }

    SUBCASE("short") {
        auto m = match_arguments(schema, {"-x"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnknownArgument);
        CHECK(m.error.token == "-x");
    }
}

TEST_CASE("required options") {
    auto schema = compile_or_fail(R"({
        "name": "t", "executable": "x",
        "args": [
            {"a": {"long": "a"}},
            {"token": {"long": "token", "required": true}},
            {"force": {"long": "force", "arg_action": "flag", "required": true}}
        ]
    })");

    SUBCASE("all present") {
        CHECK(match_arguments(schema, {"--force", "--token", "t"}).ok);
    }

    SUBCASE("first missing required key in declaration order is reported") {
        auto m = match_arguments(schema, {"--a", "1"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingRequired);
        CHECK(m.error.key == "token");
        CHECK(m.error.token == "--token");
    }

    SUBCASE("a required flag must appear") {
        auto m = match_arguments(schema, {"--token", "t"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.key == "force");
    }
}

TEST_CASE("help and version") {
    auto schema = compile_or_fail(R"({
        "name": "t", "version": "1.2.3", "executable": "x",
        "args": [{"name": {"long": "name", "required": true}}]
    })");

    SUBCASE("--help short-circuits required checks") {
        auto m = match_arguments(schema, {"--help"});
        REQUIRE(m.ok);
        CHECK(m.status == MatchStatus::HelpRequested);
    }

    SUBCASE("-h") {
        auto m = match_arguments(schema, {"-h"});
        REQUIRE(m.ok);
        CHECK(m.status == MatchStatus::HelpRequested);
    }

    SUBCASE("--version") {
        auto m = match_arguments(schema, {"-V"});
        REQUIRE(m.ok);
        CHECK(m.status == MatchStatus::VersionRequested);
    }

    SUBCASE("--help after -- is a positional") {
        auto m = match_arguments(schema, {"--name", "n", "--", "--help"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnexpectedArgument);
    }

    SUBCASE("version flag needs a version") {
        auto unversioned = compile_or_fail(R"({"name": "t", "executable": "x"})");
        auto m = match_arguments(unversioned, {"--version"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnknownArgument);
    }

    SUBCASE("declared flags take precedence over help") {
        auto own = compile_or_fail(R"({
            "name": "t", "executable": "x",
            "args": [{"host": {"short": "h"}}]
        })");
        auto m = match_arguments(own, {"-h", "example.org"});
        REQUIRE(m.ok);
        CHECK(m.status == MatchStatus::Matched);
        CHECK(values(m, "host") == std::vector<std::string>{"example.org"});
    }
}

TEST_CASE("subcommands") {
    auto schema = compile_or_fail(R"({
        "name": "tool",
        "args": [{"verbose": {"short": "v", "arg_action": "count"}}],
        "subcommands": {
            "build": {
                "executable": "/bin/build",
                "args": [
                    {"release": {"long": "release", "arg_action": "flag"}},
                    {"target": {"required": true}}
                ]
            },
            "clean": {"executable": "/bin/clean"}
        }
    })");

    SUBCASE("dispatch") {
        auto m = match_arguments(schema, {"-v", "build", "--release", "x86"});
        REQUIRE_MESSAGE(m.ok, m.error.message());
        REQUIRE(m.commands.size() == 2);
        CHECK(m.commands[0].schema->name == "tool");
        CHECK(m.commands[0].state.count_of("verbose") == 1);
        CHECK(m.leaf().schema->name == "build");
        CHECK(m.leaf().state.was_seen("release"));
        CHECK(values(m, "target") == std::vector<std::string>{"x86"});
    }

    SUBCASE("parent options are not visible in the subcommand") {
        auto m = match_arguments(schema, {"build", "-v", "x86"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnknownArgument);
        CHECK(m.error.command == "build");
    }

    SUBCASE("subcommand required arguments are enforced") {
        auto m = match_arguments(schema, {"build"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingRequired);
        CHECK(m.error.key == "target");
        CHECK(m.leaf().schema->name == "build");
    }

    SUBCASE("no subcommand selected") {
        auto m = match_arguments(schema, {"-v"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::MissingSubcommand);
        CHECK(m.error.command == "tool");
    }

    SUBCASE("unknown subcommand") {
        auto m = match_arguments(schema, {"deploy"});
        REQUIRE_FALSE(m.ok);
        CHECK(m.error.kind == MatchErrorKind::UnexpectedArgument);
        CHECK(m.error.token == "deploy");
    }

    SUBCASE("help for a subcommand") {
        auto m = match_arguments(schema, {"build", "--help"});
        REQUIRE(m.ok);
        CHECK(m.status == MatchStatus::HelpRequested);
        CHECK(m.leaf().schema->name == "build");
    }
}
