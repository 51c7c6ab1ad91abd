// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace vigil {

enum class ProgramKind : uint8_t {
    Kprobe,
    Tracepoint,
};

// What to attach. For kprobes `target` is the kernel function, for
// tracepoints `category` and `target` are subsystem and event. `syscall`
// marks a syscall entry wrapper whose arguments sit in the nested pt_regs;
// `return_arg` is the type the return probe captures.
struct ProgramDescriptor {
    ProgramKind kind = ProgramKind::Kprobe;
    std::string category;
    std::string target;
    bool syscall = false;
    bool return_probe = false;
    std::optional<ArgType> return_arg;
    bool disable_kprobe_multi = false;
};

struct TableRequest {
    uint64_t id = 0;
    TableKeyKind kind = TableKeyKind::Integer;
    uint32_t key_size = kIntTableKeySize;
    uint32_t size_hint = 0;
};

/**
 * Kernel program loader and attachment collaborator.
 *
 * update_config must be atomic from the point of view of a single event
 * evaluation: the matcher sees the previous blob or the new one, never a
 * mixture. Implementations: BpfLoader (libbpf) and the in-memory fakes used
 * by the tests.
 */
class AttachmentLoader {
  public:
    virtual ~AttachmentLoader() = default;

    virtual Result<AttachmentHandle> attach(const ProgramDescriptor& program) = 0;
    virtual Result<void> update_config(AttachmentHandle handle, const CompiledSelectorBlob& blob) = 0;
    virtual Result<TableHandle> alloc_table(AttachmentHandle handle, const TableRequest& request) = 0;
    virtual Result<void> write_table(TableHandle table, const std::vector<std::vector<uint8_t>>& keys) = 0;
    virtual Result<void> free_table(TableHandle table) = 0;
    virtual Result<void> detach(AttachmentHandle handle) = 0;
    [[nodiscard]] virtual size_t attached_program_count() const = 0;
};

} // namespace vigil
