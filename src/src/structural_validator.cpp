#include <sg/structural_validator.h>
#include <sg/log.h>
#include <set>

namespace sg {

namespace {

FieldError type_mismatch(const FieldPath& path, const std::string& expected, const Dictionary& value) {
    return FieldError{path,
                      ErrorKind::TypeMismatch,
                      "expected " + expected + " but found " + value_type_name(value) + " (value: " +
                          value_preview(value) + ")",
                      "Provide a value of type " + expected};
}

Dictionary coerce(FieldType type, const Dictionary& value) {
    if (type == FieldType::Integer && value.isDouble()) return Dictionary(value.asInt());
    if (type == FieldType::Number && value.isInt()) return Dictionary(value.asDouble());
    return value;
}

}  // namespace

Dictionary StructuralResult::to_dictionary() const {
    Dictionary d;
    d["is_structurally_valid"] = is_structurally_valid;
    Dictionary errs = Dictionary::array();
    for (auto const& e : errors) errs.push_back(e.to_dictionary());
    d["errors"] = errs;
    d["validated_data"] = validated_data;
    return d;
}

StructuralResult StructuralValidator::validate(const CompiledSchema& schema, const Dictionary& payload) const {
    StructuralResult result;
    if (!payload.isMappedObject()) {
        result.errors.push_back(type_mismatch(FieldPath{}, "object", payload));
    } else {
        Dictionary data = validate_object(schema.fields(), payload, FieldPath{}, result.errors);
        if (result.errors.empty()) result.validated_data = data;
    }
    result.is_structurally_valid = result.errors.empty();
    log::debug("structural validation finished with " + std::to_string(result.errors.size()) + " error(s)");
    return result;
}

Dictionary StructuralValidator::validate_object(const std::vector<CompiledValidatorPtr>& fields,
                                                const Dictionary& object,
                                                const FieldPath& path,
                                                std::vector<FieldError>& errors) const {
    Dictionary out;
    std::set<std::string> declared;
    for (auto const& f : fields) {
        declared.insert(f->name);
        FieldPath child = path.child(f->name);
        if (!object.has(f->name)) {
            if (f->required) {
                errors.push_back(FieldError{child,
                                            ErrorKind::MissingField,
                                            "required field '" + f->name + "' is missing",
                                            "Add the field '" + f->name + "' with a value of type " +
                                                to_string(f->type)});
            }
            out[f->name] = Dictionary::null();
            continue;
        }
        const Dictionary& value = object.at(f->name);
        if (value.isNull()) {
            if (f->required) errors.push_back(type_mismatch(child, to_string(f->type), value));
            out[f->name] = Dictionary::null();
            continue;
        }
        out[f->name] = validate_value(*f, value, child, errors);
    }

    if (options_.strict_unknown_fields) {
        for (auto const& key : object.keys()) {
            if (declared.count(key)) continue;
            errors.push_back(FieldError{path.child(key),
                                        ErrorKind::UnexpectedField,
                                        "field '" + key + "' is not declared in the schema",
                                        "Remove the field '" + key + "'"});
        }
    }
    return out;
}

Dictionary StructuralValidator::validate_value(const CompiledValidator& validator,
                                               const Dictionary& value,
                                               const FieldPath& path,
                                               std::vector<FieldError>& errors) const {
    // Format and range checks are meaningless on the wrong type.
    if (!matches_type(validator.type, value)) {
        errors.push_back(type_mismatch(path, to_string(validator.type), value));
        return Dictionary::null();
    }

    Dictionary coerced = coerce(validator.type, value);
    for (auto const& check : validator.checks) {
        if (auto v = check(coerced)) errors.push_back(FieldError{path, v->kind, v->message, v->suggestion});
    }

    if (validator.type == FieldType::Array && validator.items) {
        Dictionary items = Dictionary::array();
        int index = 0;
        for (auto const& element : coerced.elements()) {
            FieldPath child = path.child(index++);
            if (element.isNull()) {
                errors.push_back(type_mismatch(child, to_string(validator.items->type), element));
                items.push_back(Dictionary::null());
                continue;
            }
            items.push_back(validate_value(*validator.items, element, child, errors));
        }
        return items;
    }

    if (validator.type == FieldType::Object && validator.has_properties) {
        return validate_object(validator.properties, coerced, path, errors);
    }
    return coerced;
}

}  // namespace sg
