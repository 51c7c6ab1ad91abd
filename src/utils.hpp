// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vigil {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char sep);
std::vector<std::string> split_whitespace(const std::string& s);

// Splits "key=value" at the first '=' and trims both halves.
bool parse_key_value(const std::string& line, std::string& key, std::string& value);

// Decimal or 0x-prefixed hex. Rejects signs, trailing garbage and overflow.
bool parse_uint64(const std::string& s, uint64_t& out);
// Optional leading '-', then as parse_uint64. Rejects overflow.
bool parse_int64(const std::string& s, int64_t& out);
// true/false/1/0/yes/no/on/off, case insensitive.
bool parse_bool(const std::string& s, bool& out);

std::string hex_encode(const uint8_t* data, size_t len);

// 64-bit FNV-1a, chainable through `seed`.
inline constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
uint64_t fnv1a64(const void* data, size_t len, uint64_t seed = kFnvOffsetBasis);

} // namespace vigil
