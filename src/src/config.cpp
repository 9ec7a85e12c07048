#include <sg/config.h>
#include <sg/json.h>
#include <sg/log.h>
#include <sg/schema.h>
#include <sg/text_utils.h>
#include <cstdlib>

namespace sg {

namespace {

const Dictionary* section(const Dictionary& d, const std::string& key) {
    if (!d.has(key)) return nullptr;
    const Dictionary& s = d.at(key);
    if (!s.isMappedObject()) throw ConfigError("config section '" + key + "' must be an object");
    return &s;
}

void read_string(const Dictionary& d, const std::string& key, std::string& out) {
    if (!d.has(key)) return;
    if (!d.at(key).isString()) throw ConfigError("config key '" + key + "' must be a string");
    out = d.at(key).asString();
}

void read_bool(const Dictionary& d, const std::string& key, bool& out) {
    if (!d.has(key)) return;
    if (!d.at(key).isBool()) throw ConfigError("config key '" + key + "' must be true or false");
    out = d.at(key).asBool();
}

void read_double(const Dictionary& d, const std::string& key, double& out) {
    if (!d.has(key)) return;
    if (!d.at(key).isNumber()) throw ConfigError("config key '" + key + "' must be a number");
    out = d.at(key).asDouble();
}

void read_count(const Dictionary& d, const std::string& key, size_t& out) {
    if (!d.has(key)) return;
    if (!d.at(key).isInt() || d.at(key).asInt() < 0)
        throw ConfigError("config key '" + key + "' must be a non-negative integer");
    out = static_cast<size_t>(d.at(key).asInt());
}

void check_threshold(const std::string& name, double value) {
    if (value < 0.0 || value > 1.0) throw ConfigError("threshold '" + name + "' must be within [0, 1]");
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = text_utils::trim(s.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

}  // namespace

bool parse_bool(const std::string& s) {
    const std::string v = text_utils::to_lower_ascii(text_utils::trim(s));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw ConfigError("expected a boolean but got '" + s + "'");
}

EngineConfig::EngineConfig() : name_aliases(default_name_aliases()) {}

EngineConfig EngineConfig::from_dictionary(const Dictionary& d) {
    if (!d.isMappedObject()) throw ConfigError("config must be a JSON object");
    EngineConfig c;

    if (auto s = section(d, "semantic")) {
        read_bool(*s, "enabled", c.semantic_enabled);
        read_string(*s, "endpoint", c.semantic_endpoint);
        read_string(*s, "api_key", c.semantic_api_key);
        read_string(*s, "model", c.semantic_model);
        if (s->has("timeout_ms")) {
            if (!s->at("timeout_ms").isInt() || s->at("timeout_ms").asInt() <= 0)
                throw ConfigError("config key 'timeout_ms' must be a positive integer");
            c.semantic_timeout_ms = s->at("timeout_ms").asInt();
        }
        if (auto t = section(*s, "thresholds")) {
            read_double(*t, "basic", c.semantic.basic_threshold);
            read_double(*t, "standard", c.semantic.standard_threshold);
            read_double(*t, "strict", c.semantic.strict_threshold);
        }
    }

    if (auto s = section(d, "structural")) {
        read_bool(*s, "strict_unknown_fields", c.strict_unknown_fields);
        if (s->has("name_aliases")) {
            const Dictionary& a = s->at("name_aliases");
            if (!a.isArrayObject()) throw ConfigError("config key 'name_aliases' must be a list of strings");
            c.name_aliases.clear();
            for (auto const& e : a.elements()) {
                if (!e.isString()) throw ConfigError("config key 'name_aliases' must be a list of strings");
                c.name_aliases.push_back(e.asString());
            }
        }
        if (auto n = section(*s, "name_heuristic")) {
            read_count(*n, "min_length", c.name_heuristic.min_length);
            read_double(*n, "min_distinct_ratio", c.name_heuristic.min_distinct_ratio);
            read_count(*n, "entropy_min_length", c.name_heuristic.entropy_min_length);
            read_count(*n, "keyboard_min_run", c.name_heuristic.keyboard_min_run);
            read_double(*n, "keyboard_adjacency_ratio", c.name_heuristic.keyboard_adjacency_ratio);
            read_count(*n, "adjacency_min_length", c.name_heuristic.adjacency_min_length);
            read_count(*n, "max_repeat_run", c.name_heuristic.max_repeat_run);
        }
    }

    read_string(d, "schema_dir", c.schema_dir);
    if (d.has("default_level")) {
        if (!d.at("default_level").isString()) throw ConfigError("config key 'default_level' must be a string");
        auto level = parse_validation_level(d.at("default_level").asString());
        if (!level) throw ConfigError("unknown validation level '" + d.at("default_level").asString() + "'");
        c.default_level = *level;
    }
    if (d.has("log_level")) {
        if (!d.at("log_level").isString()) throw ConfigError("config key 'log_level' must be a string");
        log::set_level(log::parse_level(d.at("log_level").asString(), log::level()));
    }

    check_threshold("basic", c.semantic.basic_threshold);
    check_threshold("standard", c.semantic.standard_threshold);
    check_threshold("strict", c.semantic.strict_threshold);
    c.semantic.timeout = std::chrono::milliseconds(c.semantic_timeout_ms);
    return c;
}

EngineConfig EngineConfig::load(const std::string& path) {
    Dictionary d;
    try {
        d = parse_json_file(path);
    } catch (const JsonParseError& e) {
        throw ConfigError("invalid config file " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    log::debug("loaded config from " + path);
    return from_dictionary(d);
}

Dictionary EngineConfig::to_dictionary() const {
    Dictionary thresholds;
    thresholds["basic"] = semantic.basic_threshold;
    thresholds["standard"] = semantic.standard_threshold;
    thresholds["strict"] = semantic.strict_threshold;

    Dictionary sem;
    sem["enabled"] = semantic_enabled;
    sem["endpoint"] = semantic_endpoint;
    sem["api_key"] = semantic_api_key.empty() ? "" : "***";
    sem["model"] = semantic_model;
    sem["timeout_ms"] = semantic_timeout_ms;
    sem["thresholds"] = thresholds;

    Dictionary heuristic;
    heuristic["min_length"] = static_cast<int64_t>(name_heuristic.min_length);
    heuristic["min_distinct_ratio"] = name_heuristic.min_distinct_ratio;
    heuristic["entropy_min_length"] = static_cast<int64_t>(name_heuristic.entropy_min_length);
    heuristic["keyboard_min_run"] = static_cast<int64_t>(name_heuristic.keyboard_min_run);
    heuristic["keyboard_adjacency_ratio"] = name_heuristic.keyboard_adjacency_ratio;
    heuristic["adjacency_min_length"] = static_cast<int64_t>(name_heuristic.adjacency_min_length);
    heuristic["max_repeat_run"] = static_cast<int64_t>(name_heuristic.max_repeat_run);

    Dictionary structural;
    structural["strict_unknown_fields"] = strict_unknown_fields;
    structural["name_aliases"] = Dictionary(name_aliases);
    structural["name_heuristic"] = heuristic;

    Dictionary d;
    d["semantic"] = sem;
    d["structural"] = structural;
    d["schema_dir"] = schema_dir;
    d["default_level"] = to_string(default_level);
    return d;
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

void apply_environment(EngineConfig& config, const EnvLookup& env) {
    if (auto v = env("SG_SEMANTIC_ENDPOINT")) config.semantic_endpoint = *v;
    if (auto v = env("SG_SEMANTIC_API_KEY")) config.semantic_api_key = *v;
    if (auto v = env("SG_SEMANTIC_MODEL")) config.semantic_model = *v;
    if (auto v = env("SG_SEMANTIC_ENABLED")) config.semantic_enabled = parse_bool(*v);
    if (auto v = env("SG_SEMANTIC_TIMEOUT_MS")) {
        try {
            long long ms = std::stoll(*v);
            if (ms <= 0) throw ConfigError("SG_SEMANTIC_TIMEOUT_MS must be positive");
            config.semantic_timeout_ms = ms;
            config.semantic.timeout = std::chrono::milliseconds(ms);
        } catch (const std::logic_error&) {
            throw ConfigError("SG_SEMANTIC_TIMEOUT_MS is not a number: '" + *v + "'");
        }
    }
    if (auto v = env("SG_STRICT_UNKNOWN_FIELDS")) config.strict_unknown_fields = parse_bool(*v);
    if (auto v = env("SG_NAME_ALIASES")) config.name_aliases = split_list(*v);
    if (auto v = env("SG_SCHEMA_DIR")) config.schema_dir = *v;
}

}  // namespace sg
