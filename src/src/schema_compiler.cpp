#include <sg/schema.h>
#include <sg/log.h>
#include <sg/text_utils.h>
#include <cmath>
#include <map>
#include <set>

namespace sg {

namespace {

// alias -> canonical key
const std::map<std::string, std::string>& key_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"minLength", "min_length"},       {"min_items", "min_length"},       {"minItems", "min_length"},
        {"maxLength", "max_length"},       {"max_items", "max_length"},       {"maxItems", "max_length"},
        {"minimum", "min"},                {"ge", "min"},                     {"maximum", "max"},
        {"le", "max"},                     {"exclusiveMinimum", "gt"},        {"exclusiveMaximum", "lt"}};
    return aliases;
}

const std::set<std::string>& informational_keys() {
    static const std::set<std::string> keys = {"description", "title", "default", "example", "examples"};
    return keys;
}

const std::set<std::string>& constraint_keys() {
    static const std::set<std::string> keys = {"min_length", "max_length", "min",   "max",   "gt",
                                               "lt",         "pattern",    "format", "enum", "items",
                                               "properties", "name_check"};
    return keys;
}

const std::set<std::string>& allowed_constraints(FieldType type) {
    static const std::set<std::string> string_keys = {"min_length", "max_length", "pattern",
                                                      "format",     "enum",       "name_check"};
    static const std::set<std::string> numeric_keys = {"min", "max", "gt", "lt", "enum"};
    static const std::set<std::string> boolean_keys = {"enum"};
    static const std::set<std::string> array_keys = {"min_length", "max_length", "items"};
    static const std::set<std::string> object_keys = {"properties"};
    switch (type) {
        case FieldType::String:
            return string_keys;
        case FieldType::Number:
        case FieldType::Integer:
            return numeric_keys;
        case FieldType::Boolean:
            return boolean_keys;
        case FieldType::Array:
            return array_keys;
        case FieldType::Object:
            break;
    }
    return object_keys;
}

std::vector<std::string> all_known_keys() {
    std::vector<std::string> out = {"type", "required"};
    for (auto const& k : informational_keys()) out.push_back(k);
    for (auto const& k : constraint_keys()) out.push_back(k);
    for (auto const& p : key_aliases()) out.push_back(p.first);
    return out;
}

[[noreturn]] void fail(const FieldPath& path, const std::string& msg) {
    throw CompilationError("schema error at '" + path.to_string() + "': " + msg, path);
}

bool is_integral(const Dictionary& v) {
    if (v.isInt()) return true;
    if (!v.isDouble()) return false;
    // Whole doubles count as integers only while they fit an int64.
    double d = v.asDouble();
    return std::isfinite(d) && std::floor(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

bool is_wrapper(const Dictionary& description) {
    return description.has("type") && description.at("type").isString() &&
           description.at("type").asString() == "object" && description.has("properties") &&
           description.at("properties").isMappedObject();
}

std::optional<int64_t> read_length(const Dictionary& spec, const std::string& key, const FieldPath& path) {
    if (!spec.has(key)) return std::nullopt;
    const Dictionary& v = spec.at(key);
    if (!is_integral(v)) fail(path, "'" + key + "' must be an integer");
    int64_t n = v.asInt();
    if (n < 0) fail(path, "'" + key + "' must not be negative");
    return n;
}

std::optional<double> read_number(const Dictionary& spec, const std::string& key, const FieldPath& path) {
    if (!spec.has(key)) return std::nullopt;
    const Dictionary& v = spec.at(key);
    if (!v.isNumber()) fail(path, "'" + key + "' must be a number");
    return v.asDouble();
}

// Rewrites aliased keys to their canonical names and rejects unknown keys.
Dictionary normalize_keys(const Dictionary& spec, const FieldPath& path) {
    Dictionary out;
    for (auto const& p : spec.items()) {
        std::string key = p.first;
        auto alias = key_aliases().find(key);
        if (alias != key_aliases().end()) key = alias->second;

        if (key != "type" && key != "required" && !informational_keys().count(key) && !constraint_keys().count(key)) {
            std::string msg = "unknown key '" + p.first + "'";
            std::string close = text_utils::suggest_similar_option(p.first, all_known_keys());
            if (!close.empty()) msg += " (did you mean '" + close + "'?)";
            fail(path, msg);
        }
        if (out.has(key)) fail(path, "'" + key + "' is given more than once (through an alias)");
        out[key] = p.second;
    }
    return out;
}

void check_range(const NumericBounds& b, const FieldPath& path) {
    auto lower_inclusive = b.min;
    auto upper_inclusive = b.max;
    if (lower_inclusive && upper_inclusive && *lower_inclusive > *upper_inclusive)
        fail(path, "'min' is greater than 'max'");
    if (b.gt && b.lt && *b.gt >= *b.lt) fail(path, "'gt' must be less than 'lt'");
    if (b.min && b.lt && *b.min >= *b.lt) fail(path, "'min' must be less than 'lt'");
    if (b.gt && b.max && *b.gt >= *b.max) fail(path, "'gt' must be less than 'max'");
}

void check_length_range(const LengthBounds& b, const FieldPath& path) {
    if (b.min && b.max && *b.min > *b.max) fail(path, "'min_length' is greater than 'max_length'");
}

Violation name_violation(const std::string& value, const NameVerdict& verdict) {
    return Violation{ErrorKind::InvalidName,
                     "'" + value + "' does not look like a real name (" + to_string(verdict.reason) + ": " +
                         verdict.detail + ")",
                     "Provide a real person's name, e.g. John Smith"};
}

}  // namespace

std::string to_string(FieldType type) {
    switch (type) {
        case FieldType::String:
            return "string";
        case FieldType::Number:
            return "number";
        case FieldType::Integer:
            return "integer";
        case FieldType::Boolean:
            return "boolean";
        case FieldType::Array:
            return "array";
        case FieldType::Object:
            return "object";
    }
    return "unknown";
}

std::optional<FieldType> parse_field_type(const std::string& s) {
    if (s == "string") return FieldType::String;
    if (s == "number") return FieldType::Number;
    if (s == "integer") return FieldType::Integer;
    if (s == "boolean") return FieldType::Boolean;
    if (s == "array") return FieldType::Array;
    if (s == "object") return FieldType::Object;
    return std::nullopt;
}

bool matches_type(FieldType type, const Dictionary& value) {
    switch (type) {
        case FieldType::String:
            return value.isString();
        case FieldType::Number:
            return value.isNumber();
        case FieldType::Integer:
            return is_integral(value);
        case FieldType::Boolean:
            return value.isBool();
        case FieldType::Array:
            return value.isArrayObject();
        case FieldType::Object:
            return value.isMappedObject();
    }
    return false;
}

std::string value_type_name(const Dictionary& d) { return d.typeString(); }

FieldType FieldSpec::type() const {
    if (std::holds_alternative<ArraySpec>(kind)) return FieldType::Array;
    if (std::holds_alternative<ObjectSpec>(kind)) return FieldType::Object;
    return std::get<ScalarSpec>(kind).type;
}

std::vector<std::string> default_name_aliases() {
    return {"name", "customer_name", "full_name", "first_name", "last_name", "contact_name", "person_name"};
}

SchemaCompiler::SchemaCompiler() : SchemaCompiler(CompilerOptions{}) {}

SchemaCompiler::SchemaCompiler(CompilerOptions options) : options_(std::move(options)) {
    for (auto& alias : options_.name_aliases) alias = text_utils::to_lower_ascii(alias);
}

bool SchemaCompiler::is_name_field(const std::string& key) const {
    const std::string lower = text_utils::to_lower_ascii(key);
    for (auto const& alias : options_.name_aliases) {
        if (alias == lower) return true;
    }
    return false;
}

CompiledSchemaPtr SchemaCompiler::compile(const Dictionary& description) const {
    std::vector<FieldSpecPtr> specs = parse_description(description, FieldPath{});
    std::vector<CompiledValidatorPtr> fields;
    fields.reserve(specs.size());
    for (auto const& spec : specs) fields.push_back(build_validator(spec));
    log::debug("compiled schema with " + std::to_string(fields.size()) + " top-level fields");
    return std::make_shared<const CompiledSchema>(std::move(fields), description);
}

std::vector<FieldSpecPtr> SchemaCompiler::parse_description(const Dictionary& description, const FieldPath& path) const {
    if (!description.isMappedObject()) fail(path, "schema description must be an object");

    // JSON-Schema style {"type": "object", "properties": {...}, "required": [...]}
    const Dictionary* fields = &description;
    std::set<std::string> required_names;
    if (is_wrapper(description)) {
        static const std::set<std::string> wrapper_keys = {"type",        "properties", "required", "title",
                                                           "description", "$schema",    "additionalProperties"};
        for (auto const& key : description.keys()) {
            if (!wrapper_keys.count(key)) fail(path, "unknown key '" + key + "' in object schema");
        }
        fields = &description.at("properties");
        if (description.has("required")) {
            const Dictionary& req = description.at("required");
            if (!req.isArrayObject()) fail(path, "'required' must be a list of property names");
            for (auto const& r : req.elements()) {
                if (!r.isString()) fail(path, "'required' must be a list of property names");
                if (!fields->has(r.asString()))
                    fail(path, "required property '" + r.asString() + "' is not declared in 'properties'");
                required_names.insert(r.asString());
            }
        }
    }

    std::vector<FieldSpecPtr> out;
    for (auto const& p : fields->items()) {
        FieldPath child = path.child(p.first);
        auto spec = parse_field(p.first, p.second, child);
        if (required_names.count(p.first)) {
            auto copy = std::make_shared<FieldSpec>(*spec);
            copy->required = true;
            spec = copy;
        }
        out.push_back(spec);
    }
    return out;
}

FieldSpecPtr SchemaCompiler::parse_field(const std::string& name, const Dictionary& raw, const FieldPath& path) const {
    if (!raw.isMappedObject()) fail(path, "field specification must be an object");
    const Dictionary spec = normalize_keys(raw, path);

    if (!spec.has("type")) fail(path, "missing 'type'");
    if (!spec.at("type").isString()) fail(path, "'type' must be a string");
    auto type = parse_field_type(spec.at("type").asString());
    if (!type) {
        std::string msg = "unknown type '" + spec.at("type").asString() + "'";
        std::string close = text_utils::suggest_similar_option(
            spec.at("type").asString(), {"string", "number", "integer", "boolean", "array", "object"});
        if (!close.empty()) msg += " (did you mean '" + close + "'?)";
        fail(path, msg);
    }

    for (auto const& key : spec.keys()) {
        if (constraint_keys().count(key) && !allowed_constraints(*type).count(key)) {
            fail(path, "constraint '" + key + "' is not valid for type '" + to_string(*type) + "'");
        }
    }

    auto field = std::make_shared<FieldSpec>();
    field->name = name;
    if (spec.has("required")) {
        if (!spec.at("required").isBool()) fail(path, "'required' must be true or false");
        field->required = spec.at("required").asBool();
    }

    LengthBounds length;
    length.min = read_length(spec, "min_length", path);
    length.max = read_length(spec, "max_length", path);
    check_length_range(length, path);

    switch (*type) {
        case FieldType::Array: {
            ArraySpec a;
            a.length = length;
            if (spec.has("items")) a.items = parse_field(name, spec.at("items"), path.child("items"));
            field->kind = a;
            return field;
        }
        case FieldType::Object: {
            ObjectSpec o;
            if (spec.has("properties")) {
                o.properties = parse_description(spec.at("properties"), path);
                o.has_properties = true;
            }
            field->kind = o;
            return field;
        }
        default:
            break;
    }

    ScalarSpec s;
    s.type = *type;
    Constraints& c = s.constraints;
    c.length = length;
    c.bounds.min = read_number(spec, "min", path);
    c.bounds.max = read_number(spec, "max", path);
    c.bounds.gt = read_number(spec, "gt", path);
    c.bounds.lt = read_number(spec, "lt", path);
    check_range(c.bounds, path);

    if (spec.has("pattern")) {
        if (!spec.at("pattern").isString()) fail(path, "'pattern' must be a string");
        c.pattern = spec.at("pattern").asString();
        try {
            c.pattern_regex = std::make_shared<const std::regex>(*c.pattern);
        } catch (const std::regex_error& e) {
            fail(path, "invalid regular expression '" + *c.pattern + "': " + e.what());
        }
    }

    if (spec.has("format")) {
        if (!spec.at("format").isString()) fail(path, "'format' must be a string");
        const std::string& f = spec.at("format").asString();
        if (f != "email" && f != "date") fail(path, "unknown format '" + f + "' (supported: email, date)");
        c.format = f;
    }

    if (spec.has("enum")) {
        const Dictionary& e = spec.at("enum");
        if (!e.isArrayObject() || e.empty()) fail(path, "'enum' must be a non-empty list");
        for (auto const& v : e.elements()) {
            if (!matches_type(*type, v))
                fail(path, "enum value " + value_preview(v) + " is not of type '" + to_string(*type) + "'");
            c.enum_values.push_back(v);
        }
    }

    if (spec.has("name_check")) {
        if (!spec.at("name_check").isBool()) fail(path, "'name_check' must be true or false");
        c.name_check = spec.at("name_check").asBool();
    } else {
        c.name_check = *type == FieldType::String && is_name_field(name);
    }

    field->kind = s;
    return field;
}

CompiledValidatorPtr SchemaCompiler::build_validator(const FieldSpecPtr& spec) const {
    auto v = std::make_shared<CompiledValidator>();
    v->name = spec->name;
    v->required = spec->required;
    v->type = spec->type();
    v->spec = spec;

    if (auto a = std::get_if<ArraySpec>(&spec->kind)) {
        if (!a->length.empty()) {
            LengthBounds bounds = a->length;
            v->checks.push_back([bounds](const Dictionary& value) {
                return check_length(static_cast<size_t>(value.size()), bounds, "items");
            });
        }
        if (a->items) v->items = build_validator(a->items);
        return v;
    }

    if (auto o = std::get_if<ObjectSpec>(&spec->kind)) {
        v->has_properties = o->has_properties;
        for (auto const& p : o->properties) v->properties.push_back(build_validator(p));
        return v;
    }

    const ScalarSpec& s = std::get<ScalarSpec>(spec->kind);
    const Constraints& c = s.constraints;

    if (!c.length.empty()) {
        LengthBounds bounds = c.length;
        v->checks.push_back([bounds](const Dictionary& value) {
            return check_length(text_utils::utf8_length(value.asString()), bounds, "characters");
        });
    }
    if (c.pattern_regex) {
        auto re = c.pattern_regex;
        std::string text = *c.pattern;
        v->checks.push_back([re, text](const Dictionary& value) { return check_pattern(value.asString(), *re, text); });
    }
    if (c.format) {
        if (*c.format == "email")
            v->checks.push_back([](const Dictionary& value) { return check_email(value.asString()); });
        else
            v->checks.push_back([](const Dictionary& value) { return check_date(value.asString()); });
    }
    if (!c.bounds.empty()) {
        NumericBounds bounds = c.bounds;
        v->checks.push_back([bounds](const Dictionary& value) { return check_numeric_bounds(value.asDouble(), bounds); });
    }
    if (!c.enum_values.empty()) {
        std::vector<Dictionary> allowed = c.enum_values;
        v->checks.push_back([allowed](const Dictionary& value) { return check_enum(value, allowed); });
    }
    if (c.name_check) {
        NameHeuristicConfig config = options_.name_config;
        v->checks.push_back([config](const Dictionary& value) -> CheckResult {
            NameVerdict verdict = check_name(value.asString(), config);
            if (verdict) return std::nullopt;
            return name_violation(value.asString(), verdict);
        });
    }
    return v;
}

}  // namespace sg
