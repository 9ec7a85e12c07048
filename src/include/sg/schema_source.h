#pragma once

#include <sg/dictionary.h>
#include <sg/errors.h>
#include <sg/semantic.h>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sg {

// A schema description together with what the repository stored about it.
struct ResolvedSchema {
    std::string name;     // empty for inline schemas
    std::string version;  // empty for inline schemas
    Dictionary description;
    std::optional<ValidationLevel> validation_level;
    bool structure_only = false;  // stored level "structure_only": no semantic pass
};

// Either an inline description or a name with an optional version.
class SchemaRef {
  public:
    static SchemaRef inline_schema(Dictionary description);
    static SchemaRef named(std::string name, std::string version = "");

    // "name" or "name@version"
    static SchemaRef parse(const std::string& text);

    bool is_inline() const { return inline_; }
    const Dictionary& description() const { return description_; }
    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }

    std::string to_string() const;

  private:
    bool inline_ = true;
    Dictionary description_;
    std::string name_;
    std::string version_;
};

bool is_valid_schema_name(const std::string& name);

// Read-only lookup of stored schemas. Implementations must allow concurrent
// lookups. Throws SchemaSourceError.
class SchemaSource {
  public:
    virtual ~SchemaSource() = default;

    // An empty version selects the current one.
    virtual ResolvedSchema lookup(const std::string& name, const std::string& version) const = 0;
};

// Reads <base>/<name>/metadata.json and <base>/<name>/<version>.json.
class DirectorySchemaSource : public SchemaSource {
  public:
    explicit DirectorySchemaSource(std::string base_dir);

    ResolvedSchema lookup(const std::string& name, const std::string& version) const override;

    // Names of all schemas that have a metadata file, sorted.
    std::vector<std::string> list() const;

    void clear_cache();
    size_t cache_size() const;

  private:
    Dictionary read_metadata(const std::string& name) const;
    ResolvedSchema load_version(const std::string& name, const std::string& version) const;

    std::string base_dir_;
    mutable std::shared_mutex mutex_;
    mutable std::map<std::string, ResolvedSchema> cache_;
};

// Inline references resolve to themselves; named ones need a source.
ResolvedSchema resolve_schema(const SchemaRef& ref, const SchemaSource* source);

}  // namespace sg
