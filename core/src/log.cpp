#include "kestrel/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace kestrel {

static LogLevel parse_level_env() {
    const char* env = std::getenv("KESTREL_LOG_LEVEL");
    if (!env) return LogLevel::INFO;
    std::string v(env);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

static std::atomic<int> g_threshold{-1};
static std::mutex g_stderr_mu;

LogLevel log_threshold() {
    int t = g_threshold.load();
    if (t < 0) {
        t = static_cast<int>(parse_level_env());
        g_threshold.store(t);
    }
    return static_cast<LogLevel>(t);
}

void set_log_threshold(LogLevel lvl) {
    g_threshold.store(static_cast<int>(lvl));
}

void log_line(LogLevel lvl, const std::string& component, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(log_threshold())) return;
    std::lock_guard<std::mutex> lk(g_stderr_mu);
    if (lvl == LogLevel::WARN) std::cerr << "[WARN] ";
    else if (lvl == LogLevel::ERROR) std::cerr << "[ERROR] ";
    std::cerr << "[" << component << "] " << msg << "\n";
}

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

// Sorted-key serializer so journal lines are byte-stable for diffing.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_object* obj = json_tokener_parse(raw.c_str());
    if (!obj) return raw;
    std::ostringstream out;
    canonical_serialize(obj, out);
    json_object_put(obj);
    return out.str();
}

EventLog::EventLog(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) log_warn("events", "cannot open event log " + path_ + "; events will be dropped");
}

void EventLog::event(const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    seq_++;
    if (!out_.is_open()) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload", pobj ? pobj : json_object_new_string(payload_json.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)seq_));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    out_ << line.str() << "\n";
    out_.flush();
}

uint64_t EventLog::count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

} // namespace kestrel
