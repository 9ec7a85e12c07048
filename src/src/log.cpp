#include <sg/log.h>
#include <sg/text_utils.h>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace sg {
namespace log {

namespace {

Level level_from_environment() {
    if (std::getenv("SG_VALIDATE_DEBUG")) return Level::Debug;
    const char* env = std::getenv("SG_LOG_LEVEL");
    if (!env) return Level::Warn;
    return parse_level(env, Level::Warn);
}

std::atomic<int>& current_level() {
    static std::atomic<int> l{static_cast<int>(level_from_environment())};
    return l;
}

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

}  // namespace

Level parse_level(const std::string& s, Level fallback) {
    const std::string v = text_utils::to_lower_ascii(text_utils::trim(s));
    if (v == "debug") return Level::Debug;
    if (v == "info") return Level::Info;
    if (v == "warn" || v == "warning") return Level::Warn;
    if (v == "error") return Level::Error;
    if (v == "off" || v == "none") return Level::Off;
    return fallback;
}

std::string to_string(Level l) {
    switch (l) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Off:
            return "off";
    }
    return "unknown";
}

Level level() { return static_cast<Level>(current_level().load()); }

void set_level(Level l) { current_level().store(static_cast<int>(l)); }

bool enabled(Level l) { return l != Level::Off && static_cast<int>(l) >= current_level().load(); }

void write(Level l, const std::string& msg) {
    if (!enabled(l)) return;
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "schemagate " << to_string(l) << ": " << msg << "\n";
}

}  // namespace log
}  // namespace sg
