// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "aux_tables.hpp"
#include "config.hpp"
#include "loader.hpp"
#include "result.hpp"
#include "types.hpp"

namespace vigil {

/**
 * Live selector replacement for attached programs.
 *
 * A reload compiles the new selectors, stages their tables, publishes the
 * blob through AttachmentLoader::update_config and only then retires tables
 * the previous blob used. Nothing kernel-visible changes when compilation
 * fails; a failed publish leaves the previous blob active.
 *
 * Reloads of one attachment are serialized: a second concurrent reload fails
 * with ConcurrentReload instead of waiting. Different attachments reload in
 * parallel.
 */
class ReloadCoordinator {
  public:
    ReloadCoordinator(AttachmentLoader& loader, IdentityContext identity, CompilerConfig cfg);
    ~ReloadCoordinator();

    ReloadCoordinator(const ReloadCoordinator&) = delete;
    ReloadCoordinator& operator=(const ReloadCoordinator&) = delete;

    Result<void> register_attachment(AttachmentHandle handle, std::string name, std::vector<ArgumentSpec> args);
    Result<void> unregister_attachment(AttachmentHandle handle);

    Result<void> reload(AttachmentHandle handle, const std::vector<SelectorSpec>& selectors);
    // Also replaces the attachment's argument list on success.
    Result<void> reload(AttachmentHandle handle, const std::vector<SelectorSpec>& selectors,
                        const std::vector<ArgumentSpec>& args);

    // nullptr before the first successful reload.
    [[nodiscard]] BlobPtr active_blob(AttachmentHandle handle) const;
    [[nodiscard]] uint64_t generation(AttachmentHandle handle) const;
    [[nodiscard]] std::vector<uint64_t> live_table_ids(AttachmentHandle handle) const;
    [[nodiscard]] std::vector<uint64_t> retiring_table_ids(AttachmentHandle handle) const;
    [[nodiscard]] size_t attachment_count() const;

    [[nodiscard]] const IdentityContext& identity() const { return identity_; }
    [[nodiscard]] const CompilerConfig& config() const { return cfg_; }

  private:
    struct Attachment {
        Attachment(AttachmentLoader& loader, AttachmentHandle handle, std::string attachment_name,
                   std::vector<ArgumentSpec> attachment_args)
            : name(std::move(attachment_name)), args(std::move(attachment_args)), tables(loader, handle)
        {
        }

        std::string name;
        std::vector<ArgumentSpec> args; // guarded by reload_mu
        std::mutex reload_mu;

        mutable std::mutex state_mu;
        BlobPtr active;
        uint64_t generation = 0;

        TableRegistry tables; // guarded by reload_mu
    };

    std::shared_ptr<Attachment> find(AttachmentHandle handle) const;
    Result<void> reload_locked(AttachmentHandle handle, Attachment& att, const std::vector<SelectorSpec>& selectors,
                               const std::vector<ArgumentSpec>& args);

    AttachmentLoader& loader_;
    IdentityContext identity_;
    CompilerConfig cfg_;

    mutable std::mutex mu_;
    std::map<AttachmentHandle, std::shared_ptr<Attachment>> attachments_;
};

} // namespace vigil
