#include <sg/schema_source.h>
#include <sg/json.h>
#include <sg/log.h>
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <regex>

namespace fs = std::filesystem;

namespace sg {

namespace {

bool is_valid_version(const std::string& version) {
    static const std::regex rx("^[A-Za-z0-9_][A-Za-z0-9._-]*$");
    return std::regex_match(version, rx) && version.find("..") == std::string::npos;
}

Dictionary read_json(const fs::path& path) {
    try {
        return parse_json_file(path.string());
    } catch (const JsonParseError& e) {
        throw SchemaSourceError("malformed schema file " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw SchemaSourceError(e.what());
    }
}

}  // namespace

SchemaRef SchemaRef::inline_schema(Dictionary description) {
    SchemaRef ref;
    ref.inline_ = true;
    ref.description_ = std::move(description);
    return ref;
}

SchemaRef SchemaRef::named(std::string name, std::string version) {
    SchemaRef ref;
    ref.inline_ = false;
    ref.name_ = std::move(name);
    ref.version_ = std::move(version);
    return ref;
}

SchemaRef SchemaRef::parse(const std::string& text) {
    auto at = text.find('@');
    if (at == std::string::npos) return named(text);
    return named(text.substr(0, at), text.substr(at + 1));
}

std::string SchemaRef::to_string() const {
    if (inline_) return "<inline>";
    return version_.empty() ? name_ : name_ + "@" + version_;
}

bool is_valid_schema_name(const std::string& name) {
    static const std::regex rx("^[a-z0-9_]+$");
    return std::regex_match(name, rx);
}

DirectorySchemaSource::DirectorySchemaSource(std::string base_dir) : base_dir_(std::move(base_dir)) {}

Dictionary DirectorySchemaSource::read_metadata(const std::string& name) const {
    fs::path path = fs::path(base_dir_) / name / "metadata.json";
    std::error_code ec;
    if (!fs::exists(path, ec)) throw SchemaSourceError("schema '" + name + "' not found");
    Dictionary metadata = read_json(path);
    if (!metadata.isMappedObject()) throw SchemaSourceError("metadata for schema '" + name + "' is not an object");
    return metadata;
}

ResolvedSchema DirectorySchemaSource::load_version(const std::string& name, const std::string& version) const {
    fs::path path = fs::path(base_dir_) / name / (version + ".json");
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw SchemaSourceError("version '" + version + "' of schema '" + name + "' not found");
    }
    Dictionary stored = read_json(path);
    if (!stored.isMappedObject() || !stored.has("schema") || !stored.at("schema").isMappedObject()) {
        throw SchemaSourceError("schema file " + path.string() + " has no 'schema' object");
    }

    ResolvedSchema resolved;
    resolved.name = name;
    resolved.version = version;
    resolved.description = stored.at("schema");
    if (stored.has("validation_level") && stored.at("validation_level").isString()) {
        const std::string& level = stored.at("validation_level").asString();
        if (level == "structure_only") {
            resolved.structure_only = true;
        } else if (auto parsed = parse_validation_level(level)) {
            resolved.validation_level = parsed;
        } else {
            log::warn("schema '" + name + "' stores unknown validation level '" + level + "'");
        }
    }
    return resolved;
}

ResolvedSchema DirectorySchemaSource::lookup(const std::string& name, const std::string& requested) const {
    if (!is_valid_schema_name(name)) {
        throw SchemaSourceError("invalid schema name '" + name + "' (use lowercase letters, digits and underscores)");
    }

    std::string version = requested;
    if (version.empty()) {
        Dictionary metadata = read_metadata(name);
        if (!metadata.has("current_version") || !metadata.at("current_version").isString()) {
            throw SchemaSourceError("metadata for schema '" + name + "' has no current_version");
        }
        version = metadata.at("current_version").asString();
    }
    if (!is_valid_version(version)) throw SchemaSourceError("invalid schema version '" + version + "'");

    const std::string key = name + "@" + version;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;
    }

    Dictionary metadata = read_metadata(name);
    if (metadata.has("versions") && metadata.at("versions").isArrayObject()) {
        bool listed = false;
        for (auto const& v : metadata.at("versions").elements()) {
            if (v.isString() && v.asString() == version) listed = true;
        }
        if (!listed) {
            throw SchemaSourceError("version '" + version + "' does not exist for schema '" + name + "'");
        }
    }
    ResolvedSchema resolved = load_version(name, version);
    log::debug("loaded schema " + key);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.emplace(key, resolved);
    return resolved;
}

std::vector<std::string> DirectorySchemaSource::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(base_dir_, ec)) return names;
    for (auto const& entry : fs::directory_iterator(base_dir_, ec)) {
        if (!entry.is_directory()) continue;
        std::string name = entry.path().filename().string();
        if (is_valid_schema_name(name) && fs::exists(entry.path() / "metadata.json")) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void DirectorySchemaSource::clear_cache() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
}

size_t DirectorySchemaSource::cache_size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

ResolvedSchema resolve_schema(const SchemaRef& ref, const SchemaSource* source) {
    if (ref.is_inline()) {
        ResolvedSchema resolved;
        resolved.description = ref.description();
        return resolved;
    }
    if (!source) throw SchemaSourceError("schema '" + ref.to_string() + "' requested but no schema source is configured");
    return source->lookup(ref.name(), ref.version());
}

}  // namespace sg
