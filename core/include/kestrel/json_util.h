#pragma once

// json_util.h
//
// Thin helpers over json-c: an owning document handle, typed field getters
// and a small builder for compact objects. Used by every on-disk format in
// kestrel (allowlist, IPC files, state snapshot, task journal).

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace kestrel::json {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
    bool is_object() const { return root && json_object_is_type(root, json_type_object); }
};

// Strict parse: trailing garbage or a truncated document yields an empty Doc.
inline Doc parse(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < text.size(); i++) {
        char c = text[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline json_object* field(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_string_array(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_array)) return out;
    const size_t n = json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(v, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// Returns the object elements of an array field; non-objects are skipped.
// Pointers are borrowed from the owning Doc.
inline std::vector<json_object*> get_object_array(json_object* obj, const char* key) {
    std::vector<json_object*> out;
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_array)) return out;
    const size_t n = json_object_array_length(v);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(v, i);
        if (el && json_object_is_type(el, json_type_object)) out.push_back(el);
    }
    return out;
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

// Builder for a flat-or-nested JSON object. Owns its json_object until str().
class ObjectBuilder {
public:
    ObjectBuilder() : obj_(json_object_new_object()) {}
    ~ObjectBuilder() { if (obj_) json_object_put(obj_); }
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    ObjectBuilder& set(const char* key, const std::string& v) {
        json_object_object_add(obj_, key, json_object_new_string_len(v.c_str(), (int)v.size()));
        return *this;
    }
    ObjectBuilder& set(const char* key, const char* v) { return set(key, std::string(v)); }
    ObjectBuilder& set(const char* key, int64_t v) {
        json_object_object_add(obj_, key, json_object_new_int64(v));
        return *this;
    }
    ObjectBuilder& set(const char* key, int v) { return set(key, (int64_t)v); }
    ObjectBuilder& set_bool(const char* key, bool v) {
        json_object_object_add(obj_, key, json_object_new_boolean(v ? 1 : 0));
        return *this;
    }
    ObjectBuilder& set_null(const char* key) {
        json_object_object_add(obj_, key, nullptr);
        return *this;
    }
    ObjectBuilder& set_strings(const char* key, const std::vector<std::string>& vs) {
        json_object* arr = json_object_new_array();
        for (const auto& s : vs) json_object_array_add(arr, json_object_new_string(s.c_str()));
        json_object_object_add(obj_, key, arr);
        return *this;
    }
    // Takes ownership of `child`.
    ObjectBuilder& set_object(const char* key, json_object* child) {
        json_object_object_add(obj_, key, child);
        return *this;
    }

    // Releases the built object to the caller.
    json_object* release() {
        json_object* o = obj_;
        obj_ = nullptr;
        return o;
    }

    std::string str() const { return to_string(obj_); }

private:
    json_object* obj_;
};

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace kestrel::json
