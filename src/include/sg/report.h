#pragma once

#include <sg/dictionary.h>
#include <sg/semantic.h>
#include <sg/structural_validator.h>
#include <optional>
#include <string>

namespace sg {

struct ValidationReport {
    bool is_valid = false;
    std::string validation_type = "generic";
    ValidationLevel validation_level = ValidationLevel::Standard;
    StructuralResult structural;
    std::optional<SemanticResult> semantic;  // absent when not attempted
    double processing_time_ms = 0.0;
    std::string schema_name;     // set for named schemas only
    std::string schema_version;

    // Stable field names: is_valid, structural_validation, semantic_validation, ...
    Dictionary to_dictionary() const;
    std::string to_json(int indent = 2) const { return to_dictionary().dump(indent); }
};

}  // namespace sg
