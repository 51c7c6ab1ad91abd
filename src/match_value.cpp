// cppcheck-suppress-file missingIncludeSystem
#include "match_value.hpp"

#include <limits>

#include "operators.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

Result<std::vector<uint8_t>> encode_string_literal(const std::string& literal, const CompilerConfig& cfg)
{
    if (literal.size() > cfg.max_string_len) {
        return Error(ErrorCode::EncodingError, "String literal exceeds maximum match length",
                     "len=" + std::to_string(literal.size()) + " max=" + std::to_string(cfg.max_string_len));
    }
    return encode_string_buffer(literal);
}

} // namespace

std::vector<uint8_t> encode_integer(uint64_t value, uint32_t width)
{
    std::vector<uint8_t> out(width, 0);
    for (uint32_t i = 0; i < width && i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return out;
}

std::vector<uint8_t> encode_string_buffer(const std::string& s)
{
    std::vector<uint8_t> out = encode_integer(static_cast<uint32_t>(s.size()), 4);
    out.resize(4 + kMaxMatchString, 0);
    for (size_t i = 0; i < s.size() && i < kMaxMatchString; ++i) {
        out[4 + i] = static_cast<uint8_t>(s[i]);
    }
    return out;
}

Result<uint64_t> parse_integer_literal(const std::string& literal, ArgType type)
{
    const std::string text = trim(literal);
    if (is_string_type(type)) {
        return Error(ErrorCode::EncodingError, "Integer literal for string argument", text);
    }

    if (is_signed_type(type)) {
        int64_t v = 0;
        if (!parse_int64(text, v)) {
            return Error(ErrorCode::EncodingError, "Invalid signed integer literal", text);
        }
        if (type == ArgType::Int &&
            (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())) {
            return Error(ErrorCode::EncodingError, "Literal out of range for int", text);
        }
        return static_cast<uint64_t>(v);
    }

    if (!text.empty() && text[0] == '-') {
        return Error(ErrorCode::EncodingError, "Negative literal for unsigned argument", text);
    }
    uint64_t v = 0;
    if (!parse_uint64(text, v)) {
        return Error(ErrorCode::EncodingError, "Invalid unsigned integer literal", text);
    }
    if (type == ArgType::Uint32 && v > std::numeric_limits<uint32_t>::max()) {
        return Error(ErrorCode::EncodingError, "Literal out of range for uint32", text);
    }
    return v;
}

Result<std::vector<uint8_t>> encode_value(const std::string& literal, ArgType type, const CompilerConfig& cfg)
{
    if (is_string_type(type)) {
        return encode_string_literal(literal, cfg);
    }
    auto v = parse_integer_literal(literal, type);
    if (!v) {
        return v.error();
    }
    return encode_integer(*v, value_width(type));
}

Result<std::vector<uint8_t>> encode_range(const std::string& literal, ArgType type)
{
    const auto parts = split(literal, ':');
    if (parts.size() != 2) {
        return Error(ErrorCode::EncodingError, "Range literal must be lo:hi", literal);
    }
    auto lo = parse_integer_literal(parts[0], type);
    if (!lo) {
        return lo.error();
    }
    auto hi = parse_integer_literal(parts[1], type);
    if (!hi) {
        return hi.error();
    }
    const bool inverted = is_signed_type(type) ? static_cast<int64_t>(*lo) > static_cast<int64_t>(*hi) : *lo > *hi;
    if (inverted) {
        return Error(ErrorCode::EncodingError, "Range lower bound exceeds upper bound", literal);
    }

    std::vector<uint8_t> out = encode_integer(*lo, value_width(type));
    std::vector<uint8_t> upper = encode_integer(*hi, value_width(type));
    out.insert(out.end(), upper.begin(), upper.end());
    return out;
}

Result<std::vector<uint8_t>> encode_table_key(const std::string& literal, ArgType type, const CompilerConfig& cfg)
{
    if (is_string_type(type)) {
        return encode_string_literal(literal, cfg);
    }
    auto v = parse_integer_literal(literal, type);
    if (!v) {
        return v.error();
    }
    return encode_integer(*v, kIntTableKeySize);
}

void BlobWriter::put_u32(uint32_t v)
{
    for (int i = 0; i < 4; ++i) {
        buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void BlobWriter::put_u64(uint64_t v)
{
    put_u32(static_cast<uint32_t>(v));
    put_u32(static_cast<uint32_t>(v >> 32));
}

void BlobWriter::put_bytes(const std::vector<uint8_t>& bytes)
{
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

void BlobWriter::patch_u32(size_t offset, uint32_t v)
{
    for (int i = 0; i < 4; ++i) {
        buf_[offset + i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint32_t load_u32(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t load_u64(const uint8_t* p)
{
    return static_cast<uint64_t>(load_u32(p)) | (static_cast<uint64_t>(load_u32(p + 4)) << 32);
}

bool BlobReader::get_u32(uint32_t& v)
{
    if (remaining() < 4) {
        return false;
    }
    v = load_u32(data_ + pos_);
    pos_ += 4;
    return true;
}

bool BlobReader::get_u64(uint64_t& v)
{
    if (remaining() < 8) {
        return false;
    }
    v = load_u64(data_ + pos_);
    pos_ += 8;
    return true;
}

bool BlobReader::get_bytes(size_t n, const uint8_t*& out)
{
    if (remaining() < n) {
        return false;
    }
    out = data_ + pos_;
    pos_ += n;
    return true;
}

bool BlobReader::skip(size_t n)
{
    if (remaining() < n) {
        return false;
    }
    pos_ += n;
    return true;
}

} // namespace vigil
