// cppcheck-suppress-file missingIncludeSystem
#include "aux_tables.hpp"

#include <string>

#include "logging.hpp"

namespace vigil {

Result<TableHandle> TableRegistry::stage(uint64_t generation, const AuxTableContent& content)
{
    auto it = entries_.find(content.id);
    if (it != entries_.end()) {
        if (!(it->second.content == content)) {
            return Error(ErrorCode::TableAllocationFailed, "Table id already bound to different content",
                         "id=" + std::to_string(content.id));
        }
        if (it->second.state == State::Retiring) {
            logger().log(SLOG_DEBUG("Resurrecting retiring table")
                             .field("attachment", static_cast<uint32_t>(attachment_))
                             .field("table_id", content.id)
                             .field("generation", generation));
        }
        candidate_.insert(content.id);
        return it->second.handle;
    }

    TableRequest request;
    request.id = content.id;
    request.kind = content.kind;
    request.key_size = content.key_size;
    request.size_hint = static_cast<uint32_t>(content.keys.size());

    auto handle = loader_.alloc_table(attachment_, request);
    if (!handle) {
        return Error(ErrorCode::TableAllocationFailed, "Failed to allocate table",
                     "id=" + std::to_string(content.id) + ": " + handle.error().to_string());
    }
    auto written = loader_.write_table(*handle, content.keys);
    if (!written) {
        auto freed = loader_.free_table(*handle);
        if (!freed) {
            logger().log(SLOG_WARN("Failed to free unwritten table").field("error", freed.error().to_string()));
        }
        return Error(ErrorCode::TableAllocationFailed, "Failed to populate table",
                     "id=" + std::to_string(content.id) + ": " + written.error().to_string());
    }

    Entry entry;
    entry.handle = *handle;
    entry.content = content;
    entry.state = State::Candidate;
    entries_.emplace(content.id, std::move(entry));
    candidate_.insert(content.id);
    allocated_for_candidate_.insert(content.id);
    return *handle;
}

void TableRegistry::commit(uint64_t generation)
{
    // Anything retiring since an earlier generation has had its grace period.
    for (auto it = entries_.begin(); it != entries_.end();) {
        const Entry& entry = it->second;
        if (entry.state == State::Retiring && entry.retired_at < generation && candidate_.count(it->first) == 0) {
            free_entry(it->first, entry);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& [id, entry] : entries_) {
        if (candidate_.count(id) != 0) {
            entry.state = State::Live;
            entry.retired_at = 0;
        } else if (entry.state == State::Live) {
            entry.state = State::Retiring;
            entry.retired_at = generation;
        }
    }

    candidate_.clear();
    allocated_for_candidate_.clear();
}

void TableRegistry::abort(uint64_t generation)
{
    for (uint64_t id : allocated_for_candidate_) {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            continue;
        }
        free_entry(id, it->second);
        entries_.erase(it);
    }
    if (!allocated_for_candidate_.empty()) {
        logger().log(SLOG_INFO("Released tables of failed candidate")
                         .field("attachment", static_cast<uint32_t>(attachment_))
                         .field("generation", generation)
                         .field("count", static_cast<uint64_t>(allocated_for_candidate_.size())));
    }
    candidate_.clear();
    allocated_for_candidate_.clear();
}

void TableRegistry::release_all()
{
    for (const auto& [id, entry] : entries_) {
        free_entry(id, entry);
    }
    entries_.clear();
    candidate_.clear();
    allocated_for_candidate_.clear();
}

std::vector<uint64_t> TableRegistry::live_ids() const
{
    std::vector<uint64_t> ids;
    for (const auto& [id, entry] : entries_) {
        if (entry.state == State::Live) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::vector<uint64_t> TableRegistry::retiring_ids() const
{
    std::vector<uint64_t> ids;
    for (const auto& [id, entry] : entries_) {
        if (entry.state == State::Retiring) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::optional<TableHandle> TableRegistry::handle_of(uint64_t id) const
{
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.handle;
}

void TableRegistry::free_entry(uint64_t id, const Entry& entry)
{
    auto result = loader_.free_table(entry.handle);
    if (!result) {
        logger().log(SLOG_WARN("Failed to free table")
                         .field("attachment", static_cast<uint32_t>(attachment_))
                         .field("table_id", id)
                         .field("error", result.error().to_string()));
    }
}

} // namespace vigil
