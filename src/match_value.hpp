// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "result.hpp"
#include "types.hpp"

namespace vigil {

/**
 * Literal encoders.
 *
 * All encodings are little-endian and fixed-width for the declared argument
 * type (see value_width()). Nothing is ever truncated: a literal that does
 * not fit its type fails with ErrorCode::EncodingError.
 */

// One literal at the inline width of `type`.
Result<std::vector<uint8_t>> encode_value(const std::string& literal, ArgType type, const CompilerConfig& cfg);

// "lo:hi" as two consecutive inline values, lo <= hi.
Result<std::vector<uint8_t>> encode_range(const std::string& literal, ArgType type);

// Table key: integers widened to 8 bytes (sign- or zero-extended), strings
// as length-prefixed kMaxMatchString buffers.
Result<std::vector<uint8_t>> encode_table_key(const std::string& literal, ArgType type, const CompilerConfig& cfg);

// Integer literal widened to 64 bits the way table keys are.
Result<uint64_t> parse_integer_literal(const std::string& literal, ArgType type);

std::vector<uint8_t> encode_string_buffer(const std::string& s);
std::vector<uint8_t> encode_integer(uint64_t value, uint32_t width);

// Appends little-endian words to a growing blob.
class BlobWriter {
  public:
    void put_u32(uint32_t v);
    void put_u64(uint64_t v);
    void put_bytes(const std::vector<uint8_t>& bytes);
    void patch_u32(size_t offset, uint32_t v);

    [[nodiscard]] size_t size() const { return buf_.size(); }
    std::vector<uint8_t> take() { return std::move(buf_); }

  private:
    std::vector<uint8_t> buf_;
};

// Bounds-checked little-endian reader over a blob.
class BlobReader {
  public:
    BlobReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    bool get_u32(uint32_t& v);
    bool get_u64(uint64_t& v);
    bool get_bytes(size_t n, const uint8_t*& out);
    bool skip(size_t n);

    [[nodiscard]] size_t offset() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return len_ - pos_; }

  private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

uint32_t load_u32(const uint8_t* p);
uint64_t load_u64(const uint8_t* p);

} // namespace vigil
