#include <sg/capabilities.h>
#include <sg/json.h>
#include <sg/schema.h>
#include <sg/semantic.h>

namespace sg {

Dictionary capabilities(const std::vector<std::string>& name_aliases) {
    using namespace json_literals;

    Dictionary d;
    d["version"] = SG_VERSION;
    d["supported_types"] =
        Dictionary(std::vector<std::string>{"string", "number", "integer", "boolean", "array", "object"});

    Dictionary formats;
    formats["string"] = Dictionary(std::vector<std::string>{"email", "date"});
    d["supported_formats"] = formats;

    d["validation_types"] = Dictionary(validation_types());
    d["validation_levels"] = Dictionary(std::vector<std::string>{"basic", "standard", "strict"});

    Dictionary constraints;
    constraints["string"] = Dictionary(std::vector<std::string>{"required", "min_length", "max_length", "pattern",
                                                                "format", "enum", "name_check"});
    constraints["number"] = Dictionary(std::vector<std::string>{"required", "min", "max", "gt", "lt", "enum"});
    constraints["integer"] = Dictionary(std::vector<std::string>{"required", "min", "max", "gt", "lt", "enum"});
    constraints["boolean"] = Dictionary(std::vector<std::string>{"required", "enum"});
    constraints["array"] = Dictionary(std::vector<std::string>{"required", "min_length", "max_length", "items"});
    constraints["object"] = Dictionary(std::vector<std::string>{"required", "properties"});
    d["schema_constraints"] = constraints;

    d["name_fields"] = Dictionary(name_aliases);

    d["examples"] = R"({
        "customer_order": {
            "schema": {
                "customer_name": {"type": "string", "required": true, "min_length": 2},
                "email": {"type": "string", "required": true, "format": "email"},
                "order_date": {"type": "string", "required": true, "format": "date"},
                "order_total": {"type": "number", "required": true, "gt": 0}
            },
            "content": {
                "customer_name": "John Doe",
                "email": "john.doe@example.com",
                "order_date": "2023-10-15",
                "order_total": 99.99
            },
            "validation_type": "generic",
            "validation_level": "standard"
        },
        "recommendation": {
            "schema": {
                "recommendation_text": {"type": "string", "required": true, "min_length": 20},
                "confidence": {"type": "number", "min": 0, "max": 1}
            },
            "content": {
                "recommendation_text": "Increase the reorder point for SKU 1042 to 40 units.",
                "confidence": 0.82
            },
            "validation_type": "recommendation",
            "validation_level": "strict"
        }
    })"_json;
    return d;
}

Dictionary capabilities() { return capabilities(default_name_aliases()); }

}  // namespace sg
