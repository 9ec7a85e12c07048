#pragma once

#include <sg/dictionary.h>
#include <stdexcept>
#include <string>

namespace sg {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c) : std::runtime_error(msg), line(l), col(c) {}
};

// Deeper nesting of arrays and objects is a JsonParseError.
constexpr size_t max_json_depth = 512;

// Parses JSON text into a Dictionary. The parser is forgiving about the
// things generated content tends to get wrong: // and /* */ comments,
// a missing comma between members, and a trailing comma before a closer.
// Anything else throws JsonParseError with line/column and a caret excerpt.
Dictionary parse_json(const std::string& text);

// Reads a whole file and parses it; throws std::runtime_error if the file
// cannot be opened.
Dictionary parse_json_file(const std::string& path);

// Returns the outermost {...} span of `text`, or `text` unchanged when it has
// none. Used on model output that wraps JSON in prose or code fences.
std::string extract_json_object(const std::string& text);

namespace json_literals {
    inline Dictionary operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}  // namespace json_literals

}  // namespace sg
