// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "loader.hpp"
#include "result.hpp"
#include "types.hpp"

namespace vigil {

/**
 * Side-table lifecycle of one attachment.
 *
 * Tables are keyed by their content id. A reload stages the tables of its
 * candidate blob, then either commits (after the blob was published) or
 * aborts. Tables dropped by a commit are kept retiring for one more
 * generation, because an evaluation that started on the previous blob may
 * still look them up, and are freed by the next commit.
 *
 * Not thread safe: the owner serializes access (the coordinator holds the
 * attachment's reload lock).
 */
class TableRegistry {
  public:
    TableRegistry(AttachmentLoader& loader, AttachmentHandle attachment) : loader_(loader), attachment_(attachment) {}
    ~TableRegistry() = default;

    TableRegistry(const TableRegistry&) = delete;
    TableRegistry& operator=(const TableRegistry&) = delete;

    // Reuse a live or retiring table with the same id, or allocate and fill a
    // new one for `generation`.
    Result<TableHandle> stage(uint64_t generation, const AuxTableContent& content);

    // The staged candidate is now published.
    void commit(uint64_t generation);

    // The staged candidate was not published; free what it allocated.
    void abort(uint64_t generation);

    void release_all();

    [[nodiscard]] std::vector<uint64_t> live_ids() const;
    [[nodiscard]] std::vector<uint64_t> retiring_ids() const;
    [[nodiscard]] std::optional<TableHandle> handle_of(uint64_t id) const;
    [[nodiscard]] size_t size() const { return entries_.size(); }

  private:
    enum class State : uint8_t {
        Candidate,
        Live,
        Retiring,
    };

    struct Entry {
        TableHandle handle = 0;
        AuxTableContent content;
        State state = State::Candidate;
        uint64_t retired_at = 0;
    };

    void free_entry(uint64_t id, const Entry& entry);

    AttachmentLoader& loader_;
    AttachmentHandle attachment_;
    std::map<uint64_t, Entry> entries_;
    std::set<uint64_t> candidate_;
    std::set<uint64_t> allocated_for_candidate_;
};

} // namespace vigil
