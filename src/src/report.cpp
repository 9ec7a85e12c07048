#include <sg/report.h>

namespace sg {

Dictionary ValidationReport::to_dictionary() const {
    Dictionary d;
    d["is_valid"] = is_valid;
    d["validation_type"] = validation_type;
    d["validation_level"] = to_string(validation_level);
    if (!schema_name.empty()) {
        d["schema_name"] = schema_name;
        d["schema_version"] = schema_version;
    }
    d["structural_validation"] = structural.to_dictionary();
    d["semantic_validation"] = semantic ? semantic->to_dictionary() : Dictionary::null();
    d["processing_time_ms"] = processing_time_ms;
    return d;
}

}  // namespace sg
