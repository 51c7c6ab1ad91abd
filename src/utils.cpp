// cppcheck-suppress-file missingIncludeSystem
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>

namespace vigil {

std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char sep)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

std::vector<std::string> split_whitespace(const std::string& s)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

bool parse_key_value(const std::string& line, std::string& key, std::string& value)
{
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));
    return !key.empty();
}

bool parse_uint64(const std::string& s, uint64_t& out)
{
    if (s.empty()) {
        return false;
    }
    uint64_t base = 10;
    size_t pos = 0;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        pos = 2;
    }
    uint64_t value = 0;
    for (; pos < s.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(s[pos]);
        uint64_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (base == 16 && c >= 'a' && c <= 'f') {
            digit = 10 + (c - 'a');
        } else if (base == 16 && c >= 'A' && c <= 'F') {
            digit = 10 + (c - 'A');
        } else {
            return false;
        }
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / base) {
            return false;
        }
        value = value * base + digit;
    }
    out = value;
    return true;
}

bool parse_int64(const std::string& s, int64_t& out)
{
    if (s.empty()) {
        return false;
    }
    const bool negative = s[0] == '-';
    uint64_t magnitude = 0;
    if (!parse_uint64(negative ? s.substr(1) : s, magnitude)) {
        return false;
    }
    if (negative) {
        const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
        if (magnitude > limit) {
            return false;
        }
        out = magnitude == limit ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(magnitude);
        return true;
    }
    if (magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    out = static_cast<int64_t>(magnitude);
    return true;
}

bool parse_bool(const std::string& s, bool& out)
{
    const std::string v = to_lower(trim(s));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string hex_encode(const uint8_t* data, size_t len)
{
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kHex[data[i] >> 4]);
        out.push_back(kHex[data[i] & 0x0f]);
    }
    return out;
}

uint64_t fnv1a64(const void* data, size_t len, uint64_t seed)
{
    constexpr uint64_t kPrime = 0x100000001b3ULL;
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint64_t hash = seed;
    for (size_t i = 0; i < len; ++i) {
        hash ^= bytes[i];
        hash *= kPrime;
    }
    return hash;
}

} // namespace vigil
