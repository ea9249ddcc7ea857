#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

// Write body to <dst>.tmp, optionally fsync, then rename over dst.
// Readers polling the directory never observe a partial file under the
// final name. Returns empty string on success.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body, bool fsync = false);

// Whole-file read. nullopt if the file cannot be opened.
std::optional<std::string> slurp_file(const std::filesystem::path& p);

// *.json regular files in dir, sorted by filename. Hidden files and
// in-progress temporaries (*.tmp) are skipped.
std::vector<std::filesystem::path> list_dir_json(const std::filesystem::path& dir);

// Milliseconds since the file was last modified, or -1 if unknown.
int64_t file_age_ms(const std::filesystem::path& p);

// Expand a leading "~" or "~/" using $HOME.
std::filesystem::path expand_home(const std::string& p);

// Unique, lexically time-ordered file stem: "<epoch_ms>-<8 hex>".
std::string unique_stem(int64_t now_ms);

// Cryptographically secure 32-bit random (getrandom, /dev/urandom fallback).
uint32_t secure_rand32();

} // namespace kestrel
