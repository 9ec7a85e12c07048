#include <sg/errors.h>

namespace sg {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingField:
            return "missing_field";
        case ErrorKind::TypeMismatch:
            return "type_mismatch";
        case ErrorKind::InvalidEmail:
            return "invalid_email";
        case ErrorKind::InvalidDate:
            return "invalid_date";
        case ErrorKind::PatternMismatch:
            return "pattern_mismatch";
        case ErrorKind::OutOfRange:
            return "out_of_range";
        case ErrorKind::NotInEnum:
            return "not_in_enum";
        case ErrorKind::LengthViolation:
            return "length_violation";
        case ErrorKind::InvalidName:
            return "invalid_name";
        case ErrorKind::UnexpectedField:
            return "unexpected_field";
        case ErrorKind::SchemaError:
            return "schema_error";
    }
    return "unknown";
}

Dictionary FieldError::to_dictionary() const {
    Dictionary d;
    d["loc"] = path.to_dictionary();
    d["type"] = to_string(kind);
    d["msg"] = message;
    d["suggestion"] = suggestion;
    return d;
}

}  // namespace sg
