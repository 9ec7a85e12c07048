#pragma once

#include <sg/dictionary.h>
#include <string>
#include <vector>

#define SG_VERSION "1.0.0"

namespace sg {

// Self-description: supported types, formats, constraint keys per type,
// validation types and levels, name fields, and example requests.
Dictionary capabilities(const std::vector<std::string>& name_aliases);
Dictionary capabilities();

}  // namespace sg
