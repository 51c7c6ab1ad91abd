// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

inline constexpr const char* kBpfObjInstallPath = "/usr/lib/vigil/vigil.bpf.o";

// Names the libbpf loader resolves inside the BPF object.
inline constexpr const char* kSelConfigMap = "sel_config";
inline constexpr const char* kSelIntTablesMap = "sel_int_tables";
inline constexpr const char* kSelStrTablesMap = "sel_str_tables";

// Blob framing
inline constexpr uint32_t kBlobMagic = 0x4C455356; // "VSEL"
inline constexpr uint32_t kBlobVersion = 1;
inline constexpr uint32_t kBlobSentinel = 0xFFFFFFFF;
inline constexpr size_t kBlobHeaderBytes = 16;

// Descriptor constants shared with the kernel matcher
inline constexpr uint32_t kPidFlagNamespace = 1u << 0;
inline constexpr uint32_t kPidFlagFollowForks = 1u << 1;
inline constexpr uint32_t kModeInline = 0;
inline constexpr uint32_t kModeTable = 1;

// bpf_cookie of a kprobe link: bits 0-7 hold the captured return type
// (ArgType code, 0 when none), bit 8 marks a syscall wrapper.
inline constexpr uint64_t kCookieReturnTypeMask = 0xff;
inline constexpr uint64_t kCookieSyscall = 1ull << 8;

// Layout ceilings of the kernel side. CompilerConfig may only lower them.
inline constexpr uint32_t kMaxMatchString = 128;
inline constexpr uint32_t kMaxBlobBytes = 4096;
inline constexpr uint32_t kMaxLineageDepth = 32;

enum class ArgType : uint32_t {
    Int = 1,
    Uint32 = 2,
    Int64 = 3,
    Uint64 = 4,
    SizeT = 5,
    String = 6,
    CharBuf = 7,
    File = 8,
    Path = 9,
};

enum class PidOperator : uint32_t {
    In = 1,
    NotIn = 2,
};

enum class ArgOperator : uint32_t {
    Equal = 1,
    NotEqual = 2,
    Prefix = 3,
    NotPrefix = 4,
    Postfix = 5,
    NotPostfix = 6,
    GT = 7,
    LT = 8,
    Range = 9,
    Mask = 10,
    InMap = 11,
    NotInMap = 12,
};

struct ArgumentSpec {
    uint32_t index = 0;
    ArgType type = ArgType::Int;

    bool operator==(const ArgumentSpec& other) const = default;
};

struct PidSelector {
    PidOperator op = PidOperator::In;
    std::vector<uint32_t> values;
    bool is_namespace_pid = false;
    bool follow_forks = false;
    bool include_self = false;

    bool operator==(const PidSelector& other) const = default;
};

struct ArgSelector {
    uint32_t index = 0;
    ArgOperator op = ArgOperator::Equal;
    std::vector<std::string> values;

    bool operator==(const ArgSelector& other) const = default;
};

struct SelectorSpec {
    std::optional<PidSelector> match_pid;
    std::vector<ArgSelector> match_args;

    bool operator==(const SelectorSpec& other) const = default;
};

struct OptionSpec {
    std::string name;
    std::string value;
};

struct KprobeSpec {
    std::string call;
    bool syscall = false;
    bool return_probe = false;
    std::optional<ArgType> return_arg;
    std::vector<ArgumentSpec> args;
    std::vector<SelectorSpec> selectors;
    std::vector<OptionSpec> options;
};

struct TracepointSpec {
    std::string subsystem;
    std::string event;
    std::vector<ArgumentSpec> args;
    std::vector<SelectorSpec> selectors;
};

struct TracingPolicy {
    int version = 0;
    std::string name;
    std::vector<TracepointSpec> tracepoints;
    std::vector<KprobeSpec> kprobes;
};

struct PolicyIssues {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }
};

// The caller's own process identity, used to resolve `include_self`.
struct IdentityContext {
    uint32_t self_pid = 0;
    uint32_t self_ns_pid = 0;
};

enum class TableKeyKind : uint32_t {
    Integer = 1, // 8-byte normalized integers
    String = 2,  // u32 length + kMaxMatchString bytes
};

inline constexpr uint32_t kIntTableKeySize = 8;
inline constexpr uint32_t kStrTableKeySize = 4 + kMaxMatchString;

// Content of one set-membership table referenced from a compiled blob.
struct AuxTableContent {
    uint64_t id = 0;
    TableKeyKind kind = TableKeyKind::Integer;
    uint32_t key_size = kIntTableKeySize;
    std::vector<std::vector<uint8_t>> keys; // sorted, deduplicated

    bool operator==(const AuxTableContent& other) const = default;
};

struct CompiledSelectorBlob {
    std::vector<uint8_t> bytes;

    [[nodiscard]] size_t size() const { return bytes.size(); }
    [[nodiscard]] const uint8_t* data() const { return bytes.data(); }

    bool operator==(const CompiledSelectorBlob& other) const = default;
};

struct CompiledSelectors {
    CompiledSelectorBlob blob;
    std::vector<AuxTableContent> tables; // deduplicated, sorted by id
};

using BlobPtr = std::shared_ptr<const CompiledSelectorBlob>;

using AttachmentHandle = uint32_t;
using TableHandle = uint64_t;

inline constexpr AttachmentHandle kInvalidAttachment = 0;

} // namespace vigil
