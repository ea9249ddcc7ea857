#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace kestrel {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Threshold from KESTREL_LOG_LEVEL (debug|info|warn|error). Default: info.
LogLevel log_threshold();
void set_log_threshold(LogLevel lvl);

// Writes "[component] message" to stderr if lvl passes the threshold.
// WARN and ERROR lines carry a "[WARN]" / "[ERROR]" prefix.
void log_line(LogLevel lvl, const std::string& component, const std::string& msg);

inline void log_debug(const std::string& c, const std::string& m) { log_line(LogLevel::DEBUG, c, m); }
inline void log_info(const std::string& c, const std::string& m)  { log_line(LogLevel::INFO, c, m); }
inline void log_warn(const std::string& c, const std::string& m)  { log_line(LogLevel::WARN, c, m); }
inline void log_error(const std::string& c, const std::string& m) { log_line(LogLevel::ERROR, c, m); }

// Append-only JSONL journal of lifecycle and security events.
// Every line is canonical JSON (sorted keys): {"event","payload","seq","ts"}.
// An EventLog constructed with an empty path discards events but still counts them.
class EventLog {
public:
    explicit EventLog(const std::string& path = "");
    void event(const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }
    uint64_t count() const;

private:
    std::string path_;
    std::ofstream out_;
    mutable std::mutex mu_;
    uint64_t seq_{0};
};

// Key-sorted re-serialization of a JSON document. Returns input unchanged
// if it does not parse.
std::string canonicalize_json(const std::string& raw);

} // namespace kestrel
