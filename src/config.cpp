// cppcheck-suppress-file missingIncludeSystem
#include "config.hpp"

#include <cstdlib>
#include <functional>

#include "logging.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

bool parse_u32_env(const char* key, uint32_t& out)
{
    const char* env = std::getenv(key);
    if (!env || !*env) {
        return false;
    }
    uint64_t v = 0;
    if (!parse_uint64(env, v) || v == 0) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", key).field("value", env));
        return false;
    }
    if (v > UINT32_MAX) {
        logger().log(SLOG_WARN("Env value out of range; using default").field("key", key).field("value", v));
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace

CompilerConfig clamp_compiler_config(CompilerConfig cfg)
{
    if (cfg.max_string_len == 0 || cfg.max_string_len > kMaxMatchString) {
        cfg.max_string_len = kMaxMatchString;
    }
    if (cfg.max_blob_bytes == 0 || cfg.max_blob_bytes > kMaxBlobBytes) {
        cfg.max_blob_bytes = kMaxBlobBytes;
    }
    if (cfg.max_selectors == 0) {
        cfg.max_selectors = 1;
    }
    if (cfg.max_args_per_selector == 0) {
        cfg.max_args_per_selector = 1;
    }
    return cfg;
}

SensorConfig sensor_config_from_env()
{
    SensorConfig cfg;
    parse_u32_env("VIGIL_MAX_INLINE_VALUES", cfg.compiler.max_inline_values);
    parse_u32_env("VIGIL_MAX_SELECTORS", cfg.compiler.max_selectors);
    parse_u32_env("VIGIL_MAX_ARGS_PER_SELECTOR", cfg.compiler.max_args_per_selector);
    parse_u32_env("VIGIL_MAX_STRING_LEN", cfg.compiler.max_string_len);
    parse_u32_env("VIGIL_MAX_TABLE_ENTRIES", cfg.compiler.max_table_entries);

    const char* obj = std::getenv("VIGIL_BPF_OBJ");
    if (obj && *obj) {
        cfg.bpf_obj_path = obj;
    }

    CompilerConfig clamped = clamp_compiler_config(cfg.compiler);
    if (clamped.max_string_len != cfg.compiler.max_string_len) {
        logger().log(SLOG_WARN("max_string_len exceeds kernel layout; clamped")
                         .field("requested", cfg.compiler.max_string_len)
                         .field("effective", clamped.max_string_len));
    }
    cfg.compiler = clamped;
    return cfg;
}

Result<KprobeOptions> parse_kprobe_options(const std::vector<OptionSpec>& specs)
{
    struct Opt {
        const char* name;
        std::function<bool(const std::string&)> set;
    };

    KprobeOptions options;
    const Opt opts[] = {
        {kOptionDisableKprobeMulti,
         [&options](const std::string& value) { return parse_bool(value, options.disable_kprobe_multi); }},
    };

    for (const auto& spec : specs) {
        bool known = false;
        for (const auto& opt : opts) {
            if (spec.name != opt.name) {
                continue;
            }
            known = true;
            if (!opt.set(spec.value)) {
                return Error(ErrorCode::InvalidArgument, "Failed to set option",
                             std::string(opt.name) + "=" + spec.value);
            }
            logger().log(SLOG_INFO("Set option").field("name", spec.name).field("value", spec.value));
        }
        if (!known) {
            logger().log(SLOG_WARN("Ignoring unknown kprobe option").field("name", spec.name));
        }
    }
    return options;
}

} // namespace vigil
