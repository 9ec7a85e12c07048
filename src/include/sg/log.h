#pragma once

#include <string>

namespace sg {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Current threshold. Initialized from SG_LOG_LEVEL (debug|info|warn|error|off,
// default warn); SG_VALIDATE_DEBUG set to anything forces debug.
Level level();
void set_level(Level l);
Level parse_level(const std::string& s, Level fallback = Level::Warn);
std::string to_string(Level l);

bool enabled(Level l);
void write(Level l, const std::string& msg);

inline void debug(const std::string& msg) { write(Level::Debug, msg); }
inline void info(const std::string& msg) { write(Level::Info, msg); }
inline void warn(const std::string& msg) { write(Level::Warn, msg); }
inline void error(const std::string& msg) { write(Level::Error, msg); }

}  // namespace log
}  // namespace sg
