// cppcheck-suppress-file missingIncludeSystem
#include "reload.hpp"

#include <utility>

#include "logging.hpp"
#include "selectors.hpp"
#include "tracing.hpp"

namespace vigil {

ReloadCoordinator::ReloadCoordinator(AttachmentLoader& loader, IdentityContext identity, CompilerConfig cfg)
    : loader_(loader), identity_(identity), cfg_(clamp_compiler_config(cfg))
{
}

ReloadCoordinator::~ReloadCoordinator()
{
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [handle, att] : attachments_) {
        std::lock_guard<std::mutex> reload_lock(att->reload_mu);
        att->tables.release_all();
    }
    attachments_.clear();
}

Result<void> ReloadCoordinator::register_attachment(AttachmentHandle handle, std::string name,
                                                    std::vector<ArgumentSpec> args)
{
    if (handle == kInvalidAttachment) {
        return Error::invalid_argument("attachment handle 0");
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (attachments_.count(handle) != 0) {
        return Error(ErrorCode::InvalidArgument, "Attachment already registered", name);
    }
    attachments_.emplace(handle, std::make_shared<Attachment>(loader_, handle, std::move(name), std::move(args)));
    return {};
}

Result<void> ReloadCoordinator::unregister_attachment(AttachmentHandle handle)
{
    std::shared_ptr<Attachment> att;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = attachments_.find(handle);
        if (it == attachments_.end()) {
            return Error::not_found("attachment " + std::to_string(handle));
        }
        att = it->second;
        attachments_.erase(it);
    }
    std::lock_guard<std::mutex> reload_lock(att->reload_mu);
    att->tables.release_all();
    return {};
}

std::shared_ptr<ReloadCoordinator::Attachment> ReloadCoordinator::find(AttachmentHandle handle) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<void> ReloadCoordinator::reload(AttachmentHandle handle, const std::vector<SelectorSpec>& selectors)
{
    auto att = find(handle);
    if (!att) {
        return Error(ErrorCode::PublishFailed, "Unknown attachment handle", std::to_string(handle));
    }
    std::unique_lock<std::mutex> lock(att->reload_mu, std::try_to_lock);
    if (!lock.owns_lock()) {
        return Error(ErrorCode::ConcurrentReload, "Reload already in progress", att->name);
    }
    const std::vector<ArgumentSpec> args = att->args;
    return reload_locked(handle, *att, selectors, args);
}

Result<void> ReloadCoordinator::reload(AttachmentHandle handle, const std::vector<SelectorSpec>& selectors,
                                       const std::vector<ArgumentSpec>& args)
{
    auto att = find(handle);
    if (!att) {
        return Error(ErrorCode::PublishFailed, "Unknown attachment handle", std::to_string(handle));
    }
    std::unique_lock<std::mutex> lock(att->reload_mu, std::try_to_lock);
    if (!lock.owns_lock()) {
        return Error(ErrorCode::ConcurrentReload, "Reload already in progress", att->name);
    }
    return reload_locked(handle, *att, selectors, args);
}

Result<void> ReloadCoordinator::reload_locked(AttachmentHandle handle, Attachment& att,
                                              const std::vector<SelectorSpec>& selectors,
                                              const std::vector<ArgumentSpec>& args)
{
    const std::string trace_id = current_trace_id().empty() ? make_span_id("trace-reload") : current_trace_id();
    ScopedSpan span("reload.selectors", trace_id, current_span_id());

    auto compiled = compile_selectors(selectors, args, identity_, cfg_);
    if (!compiled) {
        Error error = compiled.error().with_context(att.name);
        span.fail(error.to_string());
        logger().log(SLOG_WARN("Selector reload rejected").field("attachment", att.name).field("error", error.to_string()));
        return error;
    }

    BlobPtr previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(att.state_mu);
        previous = att.active;
        generation = att.generation;
    }
    if (previous && *previous == compiled->blob) {
        att.args = args;
        logger().log(SLOG_DEBUG("Selector reload unchanged")
                         .field("attachment", att.name)
                         .field("generation", generation));
        return {};
    }

    const uint64_t candidate = generation + 1;
    for (const auto& table : compiled->tables) {
        auto staged = att.tables.stage(candidate, table);
        if (!staged) {
            att.tables.abort(candidate);
            Error error = staged.error().with_context(att.name);
            span.fail(error.to_string());
            logger().log(SLOG_ERROR("Selector reload failed staging tables")
                             .field("attachment", att.name)
                             .field("generation", candidate)
                             .field("error", error.to_string()));
            return error;
        }
    }

    auto published = loader_.update_config(handle, compiled->blob);
    if (!published) {
        att.tables.abort(candidate);
        Error error(ErrorCode::PublishFailed, "Failed to publish selector blob",
                    att.name + ": " + published.error().to_string());
        span.fail(error.to_string());
        logger().log(SLOG_ERROR("Selector reload failed publishing")
                         .field("attachment", att.name)
                         .field("generation", candidate)
                         .field("error", error.to_string()));
        return error;
    }

    att.tables.commit(candidate);
    att.args = args;
    {
        std::lock_guard<std::mutex> lock(att.state_mu);
        att.active = std::make_shared<const CompiledSelectorBlob>(std::move(compiled->blob));
        att.generation = candidate;
    }

    logger().log(SLOG_INFO("Selectors reloaded")
                     .field("attachment", att.name)
                     .field("generation", candidate)
                     .field("selectors", static_cast<uint64_t>(selectors.size()))
                     .field("tables", static_cast<uint64_t>(compiled->tables.size()))
                     .field("retiring_tables", static_cast<uint64_t>(att.tables.retiring_ids().size())));
    return {};
}

BlobPtr ReloadCoordinator::active_blob(AttachmentHandle handle) const
{
    auto att = find(handle);
    if (!att) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(att->state_mu);
    return att->active;
}

uint64_t ReloadCoordinator::generation(AttachmentHandle handle) const
{
    auto att = find(handle);
    if (!att) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(att->state_mu);
    return att->generation;
}

std::vector<uint64_t> ReloadCoordinator::live_table_ids(AttachmentHandle handle) const
{
    auto att = find(handle);
    if (!att) {
        return {};
    }
    std::lock_guard<std::mutex> lock(att->reload_mu);
    return att->tables.live_ids();
}

std::vector<uint64_t> ReloadCoordinator::retiring_table_ids(AttachmentHandle handle) const
{
    auto att = find(handle);
    if (!att) {
        return {};
    }
    std::lock_guard<std::mutex> lock(att->reload_mu);
    return att->tables.retiring_ids();
}

size_t ReloadCoordinator::attachment_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return attachments_.size();
}

} // namespace vigil
