// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace vigil {

// Limits applied by the selector compiler. Values above the kernel layout
// ceilings in types.hpp are clamped.
struct CompilerConfig {
    uint32_t max_inline_values = 8;
    uint32_t max_selectors = 5;
    uint32_t max_args_per_selector = 5;
    uint32_t max_string_len = kMaxMatchString;
    uint32_t max_blob_bytes = kMaxBlobBytes;
    uint32_t max_table_entries = 32768;
};

struct SensorConfig {
    CompilerConfig compiler;
    std::string bpf_obj_path = kBpfObjInstallPath;
};

// Reads VIGIL_MAX_INLINE_VALUES, VIGIL_MAX_SELECTORS, VIGIL_MAX_ARGS_PER_SELECTOR,
// VIGIL_MAX_STRING_LEN, VIGIL_MAX_TABLE_ENTRIES and VIGIL_BPF_OBJ. Invalid values
// keep the default.
SensorConfig sensor_config_from_env();

CompilerConfig clamp_compiler_config(CompilerConfig cfg);

inline constexpr const char* kOptionDisableKprobeMulti = "disable-kprobe-multi";

struct KprobeOptions {
    bool disable_kprobe_multi = false;
};

Result<KprobeOptions> parse_kprobe_options(const std::vector<OptionSpec>& specs);

} // namespace vigil
