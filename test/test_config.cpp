#include <catch2/catch_all.hpp>
#include <sg/config.h>
#include <sg/json.h>
#include <sg/log.h>
#include <map>

using namespace sg;
using namespace sg::json_literals;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

}  // namespace

TEST_CASE("Defaults", "[config]") {
    EngineConfig c;
    REQUIRE(c.semantic_enabled);
    REQUIRE(c.semantic_endpoint.empty());
    REQUIRE(c.semantic_timeout_ms == 10000);
    REQUIRE(c.semantic.standard_threshold == 0.7);
    REQUIRE_FALSE(c.strict_unknown_fields);
    REQUIRE(c.name_aliases == default_name_aliases());
    REQUIRE(c.default_level == ValidationLevel::Standard);
}

TEST_CASE("Config is read from a JSON document", "[config]") {
    auto c = EngineConfig::from_dictionary(R"({
        "semantic": {
            "enabled": false,
            "endpoint": "http://localhost:11434/api/generate",
            "api_key": "secret",
            "model": "llama3",
            "timeout_ms": 2500,
            "thresholds": {"basic": 0.4, "strict": 0.9}
        },
        "structural": {
            "strict_unknown_fields": true,
            "name_aliases": ["name", "author"],
            "name_heuristic": {"keyboard_min_run": 3, "min_distinct_ratio": 0.25}
        },
        "schema_dir": "/var/lib/schemas",
        "default_level": "basic"
    })"_json);
    REQUIRE_FALSE(c.semantic_enabled);
    REQUIRE(c.semantic_endpoint == "http://localhost:11434/api/generate");
    REQUIRE(c.semantic_model == "llama3");
    REQUIRE(c.semantic_timeout_ms == 2500);
    REQUIRE(c.semantic.timeout == std::chrono::milliseconds(2500));
    REQUIRE(c.semantic.basic_threshold == 0.4);
    REQUIRE(c.semantic.standard_threshold == 0.7);
    REQUIRE(c.semantic.strict_threshold == 0.9);
    REQUIRE(c.strict_unknown_fields);
    REQUIRE(c.name_aliases == std::vector<std::string>{"name", "author"});
    REQUIRE(c.name_heuristic.keyboard_min_run == 3);
    REQUIRE(c.name_heuristic.min_distinct_ratio == 0.25);
    REQUIRE(c.name_heuristic.min_length == 2);
    REQUIRE(c.schema_dir == "/var/lib/schemas");
    REQUIRE(c.default_level == ValidationLevel::Basic);
}

TEST_CASE("Invalid config values are rejected", "[config]") {
    auto rejects = [](const Dictionary& d) { REQUIRE_THROWS_AS(EngineConfig::from_dictionary(d), ConfigError); };
    rejects(R"([1, 2])"_json);
    rejects(R"({"semantic": "on"})"_json);
    rejects(R"({"semantic": {"enabled": "yes"}})"_json);
    rejects(R"({"semantic": {"timeout_ms": 0}})"_json);
    rejects(R"({"semantic": {"timeout_ms": 1.5}})"_json);
    rejects(R"({"semantic": {"thresholds": {"strict": 1.5}}})"_json);
    rejects(R"({"structural": {"name_aliases": "name"}})"_json);
    rejects(R"({"structural": {"name_heuristic": {"min_length": -1}}})"_json);
    rejects(R"({"default_level": "paranoid"})"_json);
}

TEST_CASE("Config files are loaded from disk", "[config]") {
    REQUIRE_THROWS_AS(EngineConfig::load("/nonexistent/sg/config.json"), ConfigError);
    auto c = EngineConfig::load(std::string(SG_TEST_DATA_DIR) + "/config.json");
    REQUIRE(c.semantic_endpoint == "http://localhost:8080/assess");
    REQUIRE(c.semantic_timeout_ms == 3000);
    REQUIRE(c.schema_dir == "schemas");
}

TEST_CASE("Environment variables override the file", "[config]") {
    EngineConfig c;
    apply_environment(c, fake_env({{"SG_SEMANTIC_ENDPOINT", "http://assess.internal/v1"},
                                   {"SG_SEMANTIC_TIMEOUT_MS", "1500"},
                                   {"SG_SEMANTIC_ENABLED", "no"},
                                   {"SG_STRICT_UNKNOWN_FIELDS", "TRUE"},
                                   {"SG_NAME_ALIASES", "name, author ,,reviewer"},
                                   {"SG_SCHEMA_DIR", "/srv/schemas"}}));
    REQUIRE(c.semantic_endpoint == "http://assess.internal/v1");
    REQUIRE(c.semantic_timeout_ms == 1500);
    REQUIRE(c.semantic.timeout == std::chrono::milliseconds(1500));
    REQUIRE_FALSE(c.semantic_enabled);
    REQUIRE(c.strict_unknown_fields);
    REQUIRE(c.name_aliases == std::vector<std::string>{"name", "author", "reviewer"});
    REQUIRE(c.schema_dir == "/srv/schemas");
    REQUIRE(c.semantic_model == "gpt-4o");
}

TEST_CASE("Bad environment values are rejected", "[config]") {
    EngineConfig c;
    REQUIRE_THROWS_AS(apply_environment(c, fake_env({{"SG_SEMANTIC_TIMEOUT_MS", "soon"}})), ConfigError);
    REQUIRE_THROWS_AS(apply_environment(c, fake_env({{"SG_SEMANTIC_TIMEOUT_MS", "-5"}})), ConfigError);
    REQUIRE_THROWS_AS(apply_environment(c, fake_env({{"SG_STRICT_UNKNOWN_FIELDS", "maybe"}})), ConfigError);
}

TEST_CASE("Booleans parse from common spellings", "[config]") {
    REQUIRE(parse_bool("1"));
    REQUIRE(parse_bool("On"));
    REQUIRE_FALSE(parse_bool("off"));
    REQUIRE_FALSE(parse_bool(""));
    REQUIRE_THROWS_AS(parse_bool("2"), ConfigError);
}

TEST_CASE("Serialized config masks the API key", "[config]") {
    EngineConfig c;
    c.semantic_api_key = "secret";
    auto d = c.to_dictionary();
    REQUIRE(d.at("semantic").at("api_key").asString() == "***");
    REQUIRE(d.dump().find("secret") == std::string::npos);
    REQUIRE(EngineConfig::from_dictionary(d).semantic_timeout_ms == c.semantic_timeout_ms);
}

TEST_CASE("Log levels parse by name", "[config][log]") {
    REQUIRE(log::parse_level("debug") == log::Level::Debug);
    REQUIRE(log::parse_level("ERROR") == log::Level::Error);
    REQUIRE(log::parse_level("chatty", log::Level::Info) == log::Level::Info);
    REQUIRE(log::to_string(log::Level::Warn) == "warn");

    auto saved = log::level();
    log::set_level(log::Level::Error);
    REQUIRE_FALSE(log::enabled(log::Level::Warn));
    REQUIRE(log::enabled(log::Level::Error));
    log::set_level(saved);
}
