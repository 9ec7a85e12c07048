#pragma once

#include <sg/dictionary.h>
#include <sg/errors.h>
#include <sg/schema.h>
#include <vector>

namespace sg {

struct StructuralOptions {
    // Report payload keys the schema does not declare as unexpected_field.
    bool strict_unknown_fields = false;
};

struct StructuralResult {
    bool is_structurally_valid = true;
    std::vector<FieldError> errors;  // traversal order
    Dictionary validated_data = Dictionary::null();  // null unless valid

    bool is_valid() const { return is_structurally_valid; }
    size_t error_count() const { return errors.size(); }

    bool operator==(const StructuralResult& rhs) const {
        return is_structurally_valid == rhs.is_structurally_valid && errors == rhs.errors &&
               validated_data == rhs.validated_data;
    }
    bool operator!=(const StructuralResult& rhs) const { return !(*this == rhs); }

    Dictionary to_dictionary() const;
};

class StructuralValidator {
  public:
    StructuralValidator() = default;
    explicit StructuralValidator(StructuralOptions options) : options_(options) {}

    // Never throws on payload shape; every problem becomes a FieldError.
    StructuralResult validate(const CompiledSchema& schema, const Dictionary& payload) const;

    const StructuralOptions& options() const { return options_; }

  private:
    Dictionary validate_object(const std::vector<CompiledValidatorPtr>& fields,
                               const Dictionary& object,
                               const FieldPath& path,
                               std::vector<FieldError>& errors) const;
    Dictionary validate_value(const CompiledValidator& validator,
                              const Dictionary& value,
                              const FieldPath& path,
                              std::vector<FieldError>& errors) const;

    StructuralOptions options_;
};

}  // namespace sg
