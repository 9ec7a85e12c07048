#pragma once

#include <sg/dictionary.h>
#include <sg/errors.h>
#include <sg/field_path.h>
#include <sg/format_checkers.h>
#include <sg/name_heuristic.h>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sg {

enum class FieldType { String, Number, Integer, Boolean, Array, Object };

std::string to_string(FieldType type);
std::optional<FieldType> parse_field_type(const std::string& s);

// Whether a payload value is acceptable for the declared type. Integral
// doubles count as integers; integers count as numbers.
bool matches_type(FieldType type, const Dictionary& value);

// Type name of a payload value as it would appear in a schema.
std::string value_type_name(const Dictionary& value);

struct Constraints {
    LengthBounds length;
    NumericBounds bounds;
    std::optional<std::string> pattern;
    std::shared_ptr<const std::regex> pattern_regex;
    std::optional<std::string> format;
    std::vector<Dictionary> enum_values;
    bool name_check = false;
};

struct FieldSpec;
using FieldSpecPtr = std::shared_ptr<const FieldSpec>;

struct ScalarSpec {
    FieldType type = FieldType::String;
    Constraints constraints;
};

struct ArraySpec {
    LengthBounds length;
    FieldSpecPtr items;  // null when elements are unconstrained
};

struct ObjectSpec {
    std::vector<FieldSpecPtr> properties;  // declaration order
    bool has_properties = false;
};

// Declarative description of one field after normalization.
struct FieldSpec {
    std::string name;
    bool required = false;
    std::variant<ScalarSpec, ArraySpec, ObjectSpec> kind;

    FieldType type() const;
};

using Check = std::function<CheckResult(const Dictionary& value)>;

class CompiledValidator;
using CompiledValidatorPtr = std::shared_ptr<const CompiledValidator>;

// Validator for one field. The type check is implicit; checks hold every
// constraint that runs once the type is known to match.
class CompiledValidator {
  public:
    std::string name;
    bool required = false;
    FieldType type = FieldType::String;
    std::vector<Check> checks;
    CompiledValidatorPtr items;
    std::vector<CompiledValidatorPtr> properties;
    bool has_properties = false;
    FieldSpecPtr spec;
};

// Immutable result of compiling one schema description. Safe to share
// between threads.
class CompiledSchema {
  public:
    CompiledSchema(std::vector<CompiledValidatorPtr> fields, Dictionary description)
        : fields_(std::move(fields)), description_(std::move(description)) {}

    const std::vector<CompiledValidatorPtr>& fields() const { return fields_; }
    const Dictionary& description() const { return description_; }

  private:
    std::vector<CompiledValidatorPtr> fields_;
    Dictionary description_;
};

using CompiledSchemaPtr = std::shared_ptr<const CompiledSchema>;

std::vector<std::string> default_name_aliases();

struct CompilerOptions {
    std::vector<std::string> name_aliases = default_name_aliases();
    NameHeuristicConfig name_config;
};

class SchemaCompiler {
  public:
    SchemaCompiler();
    explicit SchemaCompiler(CompilerOptions options);

    // Throws CompilationError naming the offending field path.
    CompiledSchemaPtr compile(const Dictionary& description) const;

    bool is_name_field(const std::string& key) const;

    const CompilerOptions& options() const { return options_; }

  private:
    std::vector<FieldSpecPtr> parse_description(const Dictionary& description, const FieldPath& path) const;
    FieldSpecPtr parse_field(const std::string& name, const Dictionary& spec, const FieldPath& path) const;
    CompiledValidatorPtr build_validator(const FieldSpecPtr& spec) const;

    CompilerOptions options_;
};

}  // namespace sg
