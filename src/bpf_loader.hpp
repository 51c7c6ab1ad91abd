// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <bpf/bpf.h>
#include <bpf/libbpf.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "loader.hpp"
#include "result.hpp"
#include "types.hpp"

namespace vigil {

// Owned map file descriptor (inner maps created from userspace).
class MapFd {
  public:
    MapFd() = default;
    explicit MapFd(int fd) : fd_(fd) {}
    ~MapFd();
    MapFd(MapFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    MapFd& operator=(MapFd&& o) noexcept;
    MapFd(const MapFd&) = delete;
    MapFd& operator=(const MapFd&) = delete;
    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] explicit operator bool() const { return fd_ >= 0; }

  private:
    int fd_ = -1;
};

/**
 * RAII wrapper for one loaded copy of the sensor object.
 *
 * Every attachment gets its own object so its selector config and table
 * directories are private to it. Non-copyable but movable.
 */
class BpfState {
  public:
    BpfState() = default;
    ~BpfState() { cleanup(); }

    BpfState(const BpfState&) = delete;
    BpfState& operator=(const BpfState&) = delete;

    BpfState(BpfState&& other) noexcept { *this = std::move(other); }
    BpfState& operator=(BpfState&& other) noexcept
    {
        if (this != &other) {
            cleanup();
            obj = other.obj;
            sel_config = other.sel_config;
            int_tables = other.int_tables;
            str_tables = other.str_tables;
            links = std::move(other.links);
            config_blob = std::move(other.config_blob);

            other.obj = nullptr;
            other.sel_config = nullptr;
            other.int_tables = nullptr;
            other.str_tables = nullptr;
            other.links.clear();
        }
        return *this;
    }

    [[nodiscard]] bool is_loaded() const { return obj != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_loaded(); }

    void cleanup();

    bpf_object* obj = nullptr;
    bpf_map* sel_config = nullptr; // ARRAY_OF_MAPS, slot 0 holds the active blob
    bpf_map* int_tables = nullptr; // HASH_OF_MAPS keyed by table id
    bpf_map* str_tables = nullptr;
    std::vector<bpf_link*> links;

    // Inner array currently installed in sel_config.
    MapFd config_blob;
};

/**
 * AttachmentLoader over libbpf.
 *
 * Publishing never rewrites a live blob: update_config fills a fresh inner
 * array and swaps it into slot 0 of sel_config with one map update, so an
 * event sees either the old inner map or the new one.
 */
class BpfLoader final : public AttachmentLoader {
  public:
    explicit BpfLoader(std::string obj_path);
    ~BpfLoader() override;

    BpfLoader(const BpfLoader&) = delete;
    BpfLoader& operator=(const BpfLoader&) = delete;

    Result<AttachmentHandle> attach(const ProgramDescriptor& program) override;
    Result<void> update_config(AttachmentHandle handle, const CompiledSelectorBlob& blob) override;
    Result<TableHandle> alloc_table(AttachmentHandle handle, const TableRequest& request) override;
    Result<void> write_table(TableHandle table, const std::vector<std::vector<uint8_t>>& keys) override;
    Result<void> free_table(TableHandle table) override;
    Result<void> detach(AttachmentHandle handle) override;
    [[nodiscard]] size_t attached_program_count() const override;

  private:
    struct Table {
        AttachmentHandle attachment = kInvalidAttachment;
        uint64_t id = 0;
        TableKeyKind kind = TableKeyKind::Integer;
        uint32_t key_size = 0;
        MapFd map;
    };

    // Opens a private copy of the object, loads the one program `program`
    // needs and attaches it, as a kprobe_multi link when `kprobe_multi`.
    Result<void> load_and_attach(const ProgramDescriptor& program, bool kprobe_multi, BpfState& state);

    std::string obj_path_;
    mutable std::mutex mu_;
    std::map<AttachmentHandle, std::unique_ptr<BpfState>> attachments_;
    std::map<TableHandle, Table> tables_;
    AttachmentHandle next_attachment_ = 1;
    TableHandle next_table_ = 1;
};

// Program names inside the sensor object.
inline constexpr const char* kKprobeProgram = "vigil_kprobe";
inline constexpr const char* kKretprobeProgram = "vigil_kretprobe";
inline constexpr const char* kTracepointProgram = "vigil_tracepoint";

// Per-link flags the kprobe programs read with bpf_get_attach_cookie().
uint64_t attach_cookie(const ProgramDescriptor& program);

// System checks
Result<void> bump_memlock_rlimit();
std::string resolve_bpf_obj_path(const std::string& configured);

// Routes libbpf diagnostics into the structured logger.
void install_libbpf_logger();

} // namespace vigil
