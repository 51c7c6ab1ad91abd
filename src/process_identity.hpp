// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "result.hpp"
#include "types.hpp"

namespace vigil {

// Parent/child relation of host PIDs, used for follow-forks matching.
class ProcessLineage {
  public:
    virtual ~ProcessLineage() = default;

    // Host PID of the parent; nullopt for the init process or unknown PIDs.
    [[nodiscard]] virtual std::optional<uint32_t> parent_of(uint32_t pid) const = 0;

    // PID of `pid` inside its innermost PID namespace.
    [[nodiscard]] virtual Result<uint32_t> namespace_pid(uint32_t pid) const = 0;
};

class ProcessIdentity : public ProcessLineage {
  public:
    [[nodiscard]] virtual uint32_t self_pid() const = 0;
};

/**
 * ProcessIdentity backed by procfs.
 *
 * Reads PPid and NSpid from <proc_root>/<pid>/status. Kernels without NSpid
 * (pre 4.1) report the host PID as the namespace PID.
 */
class ProcfsIdentity final : public ProcessIdentity {
  public:
    explicit ProcfsIdentity(std::string proc_root = "/proc") : proc_root_(std::move(proc_root)) {}

    [[nodiscard]] uint32_t self_pid() const override;
    [[nodiscard]] std::optional<uint32_t> parent_of(uint32_t pid) const override;
    [[nodiscard]] Result<uint32_t> namespace_pid(uint32_t pid) const override;

  private:
    std::string proc_root_;
};

// Caller identity for include_self resolution.
Result<IdentityContext> identity_context(const ProcessIdentity& identity);

} // namespace vigil
