// cppcheck-suppress-file missingIncludeSystem
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "commands_policy.hpp"
#include "config.hpp"
#include "daemon.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace {

int usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  lint <policy>                                   Parse and compile a policy\n"
              << "  compile <policy>                                Print the compiled selector blobs\n"
              << "  match <policy> <attachment> <pid> [idx=value]   Dry-run one event through the selectors\n"
              << "  run <policy>                                    Attach the policy until SIGINT/SIGTERM\n"
              << "\n"
              << "Environment: VIGIL_LOG_LEVEL, VIGIL_LOG_JSON, VIGIL_OTEL_SPANS, VIGIL_BPF_OBJ,\n"
              << "             VIGIL_MAX_INLINE_VALUES, VIGIL_MAX_SELECTORS, VIGIL_MAX_ARGS_PER_SELECTOR,\n"
              << "             VIGIL_MAX_STRING_LEN, VIGIL_MAX_TABLE_ENTRIES\n";
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    vigil::logger().configure_from_env();
    const vigil::SensorConfig cfg = vigil::sensor_config_from_env();

    if (argc < 3) {
        return usage(argv[0]);
    }
    const std::string cmd = argv[1];
    const std::string policy = argv[2];

    if (cmd == "lint" && argc == 3) {
        return vigil::cmd_policy_lint(policy, cfg);
    }
    if (cmd == "compile" && argc == 3) {
        return vigil::cmd_policy_compile(policy, cfg, std::cout);
    }
    if (cmd == "run" && argc == 3) {
        return vigil::daemon_run(policy, cfg);
    }
    if (cmd == "match" && argc >= 5) {
        uint64_t pid = 0;
        if (!vigil::parse_uint64(argv[4], pid) || pid == 0 || pid > UINT32_MAX) {
            std::cerr << "invalid pid '" << argv[4] << "'\n";
            return 1;
        }
        std::vector<std::string> args(argv + 5, argv + argc);
        return vigil::cmd_policy_match(policy, argv[3], static_cast<uint32_t>(pid), args, cfg, std::cout);
    }
    return usage(argv[0]);
}
