// cppcheck-suppress-file missingIncludeSystem
#include "daemon.hpp"

#include <chrono>
#include <csignal>
#include <thread>

#include "bpf_loader.hpp"
#include "logging.hpp"
#include "policy.hpp"
#include "reload.hpp"
#include "sensor.hpp"
#include "tracing.hpp"

namespace vigil {

namespace {

volatile sig_atomic_t g_exiting = 0;
volatile sig_atomic_t g_reload = 0;

DaemonDeps make_default_deps()
{
    DaemonDeps d;
    d.bump_memlock_rlimit = vigil::bump_memlock_rlimit;
    return d;
}

DaemonDeps g_deps = make_default_deps();

void handle_signal(int)
{
    g_exiting = 1;
}

void handle_reload_signal(int)
{
    g_reload = 1;
}

} // namespace

DaemonDeps& daemon_deps()
{
    return g_deps;
}

void set_daemon_deps_for_test(const DaemonDeps& deps)
{
    const DaemonDeps defaults = make_default_deps();
    g_deps.bump_memlock_rlimit = deps.bump_memlock_rlimit ? deps.bump_memlock_rlimit : defaults.bump_memlock_rlimit;
}

void reset_daemon_deps_for_test()
{
    g_deps = make_default_deps();
}

void request_daemon_exit()
{
    g_exiting = 1;
}

void request_daemon_reload()
{
    g_reload = 1;
}

Result<void> reload_sensor_from_file(Sensor& sensor, const std::string& policy_path)
{
    PolicyIssues issues;
    auto policy = parse_policy_file(policy_path, issues);
    report_policy_issues(issues);
    if (!policy) {
        return policy.error();
    }
    return sensor.reload_policy(*policy);
}

int run_sensor(const std::string& policy_path, AttachmentLoader& loader, const ProcessIdentity& identity,
               const SensorConfig& cfg)
{
    g_exiting = 0;
    g_reload = 0;

    const std::string trace_id = make_span_id("trace-daemon");
    ScopedSpan root_span("daemon.run", trace_id);
    auto fail = [&](const std::string& message) -> int {
        root_span.fail(message);
        return 1;
    };

    PolicyIssues issues;
    auto policy = parse_policy_file(policy_path, issues);
    report_policy_issues(issues);
    if (!policy) {
        return fail(policy.error().to_string());
    }

    auto ctx = identity_context(identity);
    if (!ctx) {
        logger().log(SLOG_ERROR("Failed to resolve own process identity").field("error", ctx.error().to_string()));
        return fail(ctx.error().to_string());
    }

    ReloadCoordinator coordinator(loader, *ctx, cfg.compiler);
    auto sensor = Sensor::load(*policy, loader, coordinator);
    if (!sensor) {
        logger().log(SLOG_ERROR("Failed to load sensor").field("error", sensor.error().to_string()));
        return fail(sensor.error().to_string());
    }

    logger().log(SLOG_INFO("Sensor running")
                     .field("policy", policy->name)
                     .field("path", policy_path)
                     .field("programs", static_cast<uint64_t>(loader.attached_program_count())));

    while (!g_exiting) {
        if (g_reload) {
            g_reload = 0;
            auto reloaded = reload_sensor_from_file(**sensor, policy_path);
            if (!reloaded) {
                // The previous selectors stay active.
                logger().log(SLOG_ERROR("Policy reload failed").field("error", reloaded.error().to_string()));
            } else {
                logger().log(SLOG_INFO("Policy reloaded").field("path", policy_path));
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto unloaded = (*sensor)->unload();
    if (!unloaded) {
        logger().log(SLOG_WARN("Sensor unload incomplete").field("error", unloaded.error().to_string()));
    }
    logger().log(SLOG_INFO("Sensor stopped").field("policy", policy->name));
    return 0;
}

int daemon_run(const std::string& policy_path, const SensorConfig& cfg)
{
    auto rlimit = g_deps.bump_memlock_rlimit();
    if (!rlimit) {
        logger().log(SLOG_ERROR("Failed to raise memlock rlimit").field("error", rlimit.error().to_string()));
        return 1;
    }
    install_libbpf_logger();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGHUP, handle_reload_signal);

    BpfLoader loader(cfg.bpf_obj_path);
    ProcfsIdentity identity;
    return run_sensor(policy_path, loader, identity, cfg);
}

} // namespace vigil
