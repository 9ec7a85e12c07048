#pragma once

#include <sg/dictionary.h>
#include <sg/name_heuristic.h>
#include <sg/semantic.h>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sg {

struct ConfigError : public std::runtime_error {
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct EngineConfig {
    // semantic pass
    bool semantic_enabled = true;
    std::string semantic_endpoint;
    std::string semantic_api_key;
    std::string semantic_model = "gpt-4o";
    int64_t semantic_timeout_ms = 10000;
    SemanticOptions semantic;

    // structural pass
    bool strict_unknown_fields = false;
    std::vector<std::string> name_aliases;
    NameHeuristicConfig name_heuristic;

    std::string schema_dir;
    ValidationLevel default_level = ValidationLevel::Standard;

    EngineConfig();

    // Keys missing from `d` keep their defaults. Throws ConfigError.
    static EngineConfig from_dictionary(const Dictionary& d);

    // Throws ConfigError when the file is unreadable or invalid.
    static EngineConfig load(const std::string& path);

    Dictionary to_dictionary() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvLookup process_environment();

// Applies SG_SEMANTIC_ENDPOINT, SG_SEMANTIC_API_KEY, SG_SEMANTIC_MODEL,
// SG_SEMANTIC_TIMEOUT_MS, SG_SEMANTIC_ENABLED, SG_STRICT_UNKNOWN_FIELDS,
// SG_NAME_ALIASES (comma separated) and SG_SCHEMA_DIR.
void apply_environment(EngineConfig& config, const EnvLookup& env = process_environment());

bool parse_bool(const std::string& s);

}  // namespace sg
