// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "process_identity.hpp"
#include "types.hpp"

namespace vigil {

struct PidDescriptor;

// One captured call argument.
struct EventArg {
    bool is_string = false;
    uint64_t integer = 0;
    std::string text;

    static EventArg of_int(int64_t v)
    {
        EventArg a;
        a.integer = static_cast<uint64_t>(v);
        return a;
    }
    static EventArg of_uint(uint64_t v)
    {
        EventArg a;
        a.integer = v;
        return a;
    }
    static EventArg of_string(std::string s)
    {
        EventArg a;
        a.is_string = true;
        a.text = std::move(s);
        return a;
    }
};

struct TraceEvent {
    uint32_t pid = 0; // thread group id
    uint32_t tid = 0;
    uint32_t ns_pid = 0;
    std::map<uint32_t, EventArg> args; // keyed by argument index
};

// Read side of the auxiliary tables, as the kernel matcher sees them.
class TableView {
  public:
    virtual ~TableView() = default;

    // nullopt when no table with `id` is visible.
    [[nodiscard]] virtual std::optional<bool> contains(uint64_t id, const std::vector<uint8_t>& key) const = 0;
};

// Tables straight from a compilation result, for dry runs.
class StaticTableView final : public TableView {
  public:
    explicit StaticTableView(const std::vector<AuxTableContent>& tables);

    [[nodiscard]] std::optional<bool> contains(uint64_t id, const std::vector<uint8_t>& key) const override;

  private:
    std::map<uint64_t, std::set<std::vector<uint8_t>>> tables_;
};

struct MatchResult {
    bool accepted = false;
    int selector = -1; // accepting selector; -1 when the blob has none
    bool malformed = false;
};

/**
 * Userspace evaluation of a compiled selector blob.
 *
 * Follows the kernel walker exactly: selectors in order, PID descriptor AND
 * argument descriptors, first accepting selector wins. Follow-forks state is
 * kept per selector index and must be reset whenever a different blob is
 * published. An evaluation that began before the reset neither records nor
 * reads approvals afterwards.
 */
class SelectorMatcher {
  public:
    explicit SelectorMatcher(const ProcessLineage* lineage = nullptr) : lineage_(lineage) {}

    MatchResult match(const CompiledSelectorBlob& blob, const TableView& tables, const TraceEvent& event);

    void reset_approvals();
    // Drops the approvals of an exited process so a recycled PID starts clean.
    void forget_process(uint32_t pid);
    [[nodiscard]] size_t approved_count() const;

  private:
    bool pid_matches(uint32_t selector, const PidDescriptor& desc, const TableView& tables, const TraceEvent& event,
                     uint64_t epoch);
    bool descends_from_listed(uint32_t selector, const PidDescriptor& desc, const TableView& tables, uint32_t pid,
                              uint64_t epoch);
    bool is_approved(uint32_t selector, uint32_t pid, uint64_t epoch) const;
    void approve(uint32_t selector, uint32_t pid, uint64_t epoch);
    uint64_t current_epoch() const;

    const ProcessLineage* lineage_;
    mutable std::mutex mu_;
    uint64_t epoch_ = 0; // bumped by reset_approvals()
    std::map<uint32_t, std::set<uint32_t>> approved_;
};

} // namespace vigil
