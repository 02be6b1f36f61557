#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <cstdint>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict non-negative 64-bit parse of the whole string. nullopt on any junk.
std::optional<int64_t> parse_int64(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

std::string to_lower(std::string s);

// Standard alphabet with '=' padding.
std::string base64_encode(const std::string& input);

// Accepts the standard alphabet, padding optional. nullopt on invalid input.
std::optional<std::string> base64_decode(const std::string& input);

// Percent-encode one path segment (same set as JS encodeURIComponent).
std::string percent_encode(const std::string& segment);

// Decode %XX escapes. nullopt on a malformed escape.
std::optional<std::string> percent_decode(const std::string& s);

bool is_valid_utf8(const std::string& s);

std::string hex_encode(const unsigned char* data, size_t len);
std::optional<std::string> hex_decode(const std::string& hex);

// Lower-case hex MD5 of a file's contents. Throws LocalIOError if unreadable.
std::string compute_file_md5(const std::filesystem::path& path);
