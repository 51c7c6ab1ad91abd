// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "config.hpp"
#include "loader.hpp"
#include "process_identity.hpp"
#include "result.hpp"

namespace vigil {

class Sensor;

using BumpMemlockRlimitFn = Result<void> (*)();

/**
 * Dependencies of daemon_run() that touch the host.
 *
 * Defaults are the production functions; tests inject fakes.
 */
struct DaemonDeps {
    BumpMemlockRlimitFn bump_memlock_rlimit = nullptr;
};

DaemonDeps& daemon_deps();
void set_daemon_deps_for_test(const DaemonDeps& deps);
void reset_daemon_deps_for_test();

/**
 * Loads the policy at `policy_path` and keeps it attached until SIGINT or
 * SIGTERM. SIGHUP re-reads the file and reloads selectors in place.
 */
int daemon_run(const std::string& policy_path, const SensorConfig& cfg);

// The loop behind daemon_run with the loader supplied by the caller.
int run_sensor(const std::string& policy_path, AttachmentLoader& loader, const ProcessIdentity& identity,
               const SensorConfig& cfg);

// Re-reads `policy_path` and applies its selectors to `sensor`.
Result<void> reload_sensor_from_file(Sensor& sensor, const std::string& policy_path);

// Signal flags, exposed so tests can drive the loop.
void request_daemon_exit();
void request_daemon_reload();

} // namespace vigil
