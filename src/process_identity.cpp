// cppcheck-suppress-file missingIncludeSystem
#include "process_identity.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <fstream>

#include "utils.hpp"

namespace vigil {

namespace {

// Value of `key:` in a /proc/<pid>/status file, or nullopt when absent.
Result<std::optional<std::string>> read_status_field(const std::string& proc_root, uint32_t pid,
                                                     const std::string& key)
{
    const std::string path = proc_root + "/" + std::to_string(pid) + "/status";
    std::ifstream in(path);
    if (!in.is_open()) {
        return Error::system(ENOENT, "Failed to open " + path);
    }

    std::string line;
    while (std::getline(in, line)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (line.compare(0, colon, key) == 0) {
            return std::optional<std::string>(trim(line.substr(colon + 1)));
        }
    }
    return std::optional<std::string>();
}

} // namespace

uint32_t ProcfsIdentity::self_pid() const
{
    return static_cast<uint32_t>(::getpid());
}

std::optional<uint32_t> ProcfsIdentity::parent_of(uint32_t pid) const
{
    auto field = read_status_field(proc_root_, pid, "PPid");
    if (!field || !*field) {
        return std::nullopt;
    }
    uint64_t ppid = 0;
    if (!parse_uint64(**field, ppid) || ppid == 0 || ppid > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(ppid);
}

Result<uint32_t> ProcfsIdentity::namespace_pid(uint32_t pid) const
{
    auto field = read_status_field(proc_root_, pid, "NSpid");
    if (!field) {
        return field.error();
    }
    if (!*field) {
        return pid;
    }
    // "NSpid:  <host> <ns1> ... <innermost>"
    const auto levels = split_whitespace(**field);
    uint64_t ns_pid = 0;
    if (levels.empty() || !parse_uint64(levels.back(), ns_pid) || ns_pid == 0 || ns_pid > UINT32_MAX) {
        return Error(ErrorCode::IoError, "Malformed NSpid field", "pid=" + std::to_string(pid));
    }
    return static_cast<uint32_t>(ns_pid);
}

Result<IdentityContext> identity_context(const ProcessIdentity& identity)
{
    IdentityContext ctx;
    ctx.self_pid = identity.self_pid();
    auto ns_pid = identity.namespace_pid(ctx.self_pid);
    if (!ns_pid) {
        return ns_pid.error();
    }
    ctx.self_ns_pid = *ns_pid;
    return ctx;
}

} // namespace vigil
