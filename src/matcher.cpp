// cppcheck-suppress-file missingIncludeSystem
#include "matcher.hpp"

#include <algorithm>
#include <cstring>

#include "match_value.hpp"
#include "operators.hpp"

namespace vigil {

struct PidDescriptor {
    bool present = false;
    PidOperator op = PidOperator::In;
    uint32_t flags = 0;
    std::vector<uint32_t> pids;
    std::optional<uint64_t> table_id;
};

namespace {

enum class Eval : uint8_t {
    Match,
    NoMatch,
    Malformed,
};

// Splits off one length-prefixed record (the length word counts itself).
bool next_record(BlobReader& r, BlobReader& body)
{
    uint32_t len = 0;
    const uint8_t* bytes = nullptr;
    if (!r.get_u32(len) || len < 4 || !r.get_bytes(len - 4, bytes)) {
        return false;
    }
    body = BlobReader(bytes, len - 4);
    return true;
}

bool parse_pid_descriptor(BlobReader& d, PidDescriptor& out)
{
    if (d.remaining() == 0) {
        out.present = false;
        return true;
    }
    uint32_t op = 0;
    uint32_t mode = 0;
    if (!d.get_u32(op) || !d.get_u32(out.flags) || !d.get_u32(mode)) {
        return false;
    }
    if (op != static_cast<uint32_t>(PidOperator::In) && op != static_cast<uint32_t>(PidOperator::NotIn)) {
        return false;
    }
    out.present = true;
    out.op = static_cast<PidOperator>(op);

    if (mode == kModeTable) {
        uint64_t id = 0;
        if (!d.get_u64(id)) {
            return false;
        }
        out.table_id = id;
        return true;
    }
    if (mode != kModeInline) {
        return false;
    }
    uint32_t count = 0;
    if (!d.get_u32(count) || count > d.remaining() / 4) {
        return false;
    }
    out.pids.resize(count);
    for (uint32_t i = 0; i < count; ++i) {
        if (!d.get_u32(out.pids[i])) {
            return false;
        }
    }
    return true;
}

// nullopt when the descriptor's table is not visible.
std::optional<bool> pid_listed(const PidDescriptor& desc, const TableView& tables, uint32_t value)
{
    if (desc.table_id) {
        return tables.contains(*desc.table_id, encode_integer(value, kIntTableKeySize));
    }
    return std::binary_search(desc.pids.begin(), desc.pids.end(), value);
}

// Integers as the kernel reads them: 4-byte types sign- or zero-extended.
uint64_t normalize(ArgType type, uint64_t v)
{
    if (value_width(type) != 4) {
        return v;
    }
    const uint32_t low = static_cast<uint32_t>(v);
    if (is_signed_type(type)) {
        return static_cast<uint64_t>(static_cast<int64_t>(static_cast<int32_t>(low)));
    }
    return low;
}

uint64_t load_literal(const uint8_t* p, ArgType type)
{
    return value_width(type) == 4 ? normalize(type, load_u32(p)) : load_u64(p);
}

bool less_than(ArgType type, uint64_t a, uint64_t b)
{
    if (is_signed_type(type)) {
        return static_cast<int64_t>(a) < static_cast<int64_t>(b);
    }
    return a < b;
}

bool string_literal_matches(ArgOperator op, uint32_t width, const uint8_t* lit, const std::string& text)
{
    const uint32_t len = std::min(load_u32(lit), width - 4);
    const char* s = reinterpret_cast<const char*>(lit + 4);
    switch (op) {
        case ArgOperator::Equal:
        case ArgOperator::NotEqual:
            return text.size() == len && std::memcmp(text.data(), s, len) == 0;
        case ArgOperator::Prefix:
        case ArgOperator::NotPrefix:
            return text.size() >= len && std::memcmp(text.data(), s, len) == 0;
        case ArgOperator::Postfix:
        case ArgOperator::NotPostfix:
            return text.size() >= len && std::memcmp(text.data() + text.size() - len, s, len) == 0;
        default:
            return false;
    }
}

bool integer_literal_matches(ArgOperator op, ArgType type, const uint8_t* lit, uint64_t value)
{
    const uint64_t literal = load_literal(lit, type);
    switch (op) {
        case ArgOperator::Equal:
        case ArgOperator::NotEqual:
            return value == literal;
        case ArgOperator::GT:
            return less_than(type, literal, value);
        case ArgOperator::LT:
            return less_than(type, value, literal);
        case ArgOperator::Range: {
            const uint64_t hi = load_literal(lit + value_width(type), type);
            return !less_than(type, value, literal) && !less_than(type, hi, value);
        }
        case ArgOperator::Mask:
            return (value & literal) != 0;
        default:
            return false;
    }
}

Eval eval_arg(BlobReader& d, const TableView& tables, const TraceEvent& event)
{
    uint32_t index = 0;
    uint32_t op_code = 0;
    uint32_t type_code = 0;
    uint32_t mode = 0;
    if (!d.get_u32(index) || !d.get_u32(op_code) || !d.get_u32(type_code) || !d.get_u32(mode)) {
        return Eval::Malformed;
    }
    if (op_code < static_cast<uint32_t>(ArgOperator::Equal) || op_code > static_cast<uint32_t>(ArgOperator::NotInMap) ||
        type_code < static_cast<uint32_t>(ArgType::Int) || type_code > static_cast<uint32_t>(ArgType::Path)) {
        return Eval::Malformed;
    }
    const auto op = static_cast<ArgOperator>(op_code);
    const auto type = static_cast<ArgType>(type_code);
    const OperatorInfo& info = operator_info(op);

    auto it = event.args.find(index);
    if (it == event.args.end() || it->second.is_string != is_string_type(type)) {
        return Eval::NoMatch;
    }
    const EventArg& arg = it->second;

    if (mode == kModeTable) {
        uint64_t id = 0;
        if (!d.get_u64(id)) {
            return Eval::Malformed;
        }
        bool hit = false;
        if (is_string_type(type)) {
            if (arg.text.size() <= kMaxMatchString) {
                auto found = tables.contains(id, encode_string_buffer(arg.text));
                if (!found) {
                    return Eval::NoMatch;
                }
                hit = *found;
            }
        } else {
            auto found = tables.contains(id, encode_integer(normalize(type, arg.integer), kIntTableKeySize));
            if (!found) {
                return Eval::NoMatch;
            }
            hit = *found;
        }
        return hit != info.negated ? Eval::Match : Eval::NoMatch;
    }
    if (mode != kModeInline) {
        return Eval::Malformed;
    }

    uint32_t count = 0;
    uint32_t width = 0;
    if (!d.get_u32(count) || !d.get_u32(width)) {
        return Eval::Malformed;
    }
    const uint32_t expected = info.range_literals ? 2 * value_width(type) : value_width(type);
    if (width != expected) {
        return Eval::Malformed;
    }

    bool any = false;
    for (uint32_t i = 0; i < count; ++i) {
        const uint8_t* lit = nullptr;
        if (!d.get_bytes(width, lit)) {
            return Eval::Malformed;
        }
        if (any) {
            continue;
        }
        any = is_string_type(type) ? string_literal_matches(op, width, lit, arg.text)
                                   : integer_literal_matches(op, type, lit, normalize(type, arg.integer));
    }
    return any != info.negated ? Eval::Match : Eval::NoMatch;
}

} // namespace

StaticTableView::StaticTableView(const std::vector<AuxTableContent>& tables)
{
    for (const auto& table : tables) {
        tables_[table.id].insert(table.keys.begin(), table.keys.end());
    }
}

std::optional<bool> StaticTableView::contains(uint64_t id, const std::vector<uint8_t>& key) const
{
    auto it = tables_.find(id);
    if (it == tables_.end()) {
        return std::nullopt;
    }
    return it->second.count(key) != 0;
}

MatchResult SelectorMatcher::match(const CompiledSelectorBlob& blob, const TableView& tables, const TraceEvent& event)
{
    MatchResult result;
    MatchResult malformed;
    malformed.malformed = true;

    BlobReader r(blob.data(), blob.size());
    uint32_t magic = 0;
    uint32_t version = 0;
    uint32_t count = 0;
    uint32_t total = 0;
    if (!r.get_u32(magic) || !r.get_u32(version) || !r.get_u32(count) || !r.get_u32(total) || magic != kBlobMagic ||
        version != kBlobVersion || total != blob.size()) {
        return malformed;
    }
    if (count == 0) {
        result.accepted = true;
        return result;
    }
    const uint64_t epoch = current_epoch();

    for (uint32_t i = 0; i < count; ++i) {
        BlobReader sel(nullptr, 0);
        BlobReader pid_body(nullptr, 0);
        PidDescriptor pid;
        if (!next_record(r, sel) || !next_record(sel, pid_body) || !parse_pid_descriptor(pid_body, pid)) {
            return malformed;
        }
        if (pid.present && !pid_matches(i, pid, tables, event, epoch)) {
            continue;
        }

        uint32_t arg_count = 0;
        if (!sel.get_u32(arg_count)) {
            return malformed;
        }
        bool all = true;
        for (uint32_t j = 0; j < arg_count && all; ++j) {
            BlobReader arg_body(nullptr, 0);
            if (!next_record(sel, arg_body)) {
                return malformed;
            }
            const Eval e = eval_arg(arg_body, tables, event);
            if (e == Eval::Malformed) {
                return malformed;
            }
            all = e == Eval::Match;
        }
        if (all) {
            result.accepted = true;
            result.selector = static_cast<int>(i);
            return result;
        }
    }

    uint32_t sentinel = 0;
    if (!r.get_u32(sentinel) || sentinel != kBlobSentinel) {
        return malformed;
    }
    return result;
}

bool SelectorMatcher::pid_matches(uint32_t selector, const PidDescriptor& desc, const TableView& tables,
                                  const TraceEvent& event, uint64_t epoch)
{
    const bool ns = (desc.flags & kPidFlagNamespace) != 0;
    const bool follow = (desc.flags & kPidFlagFollowForks) != 0;

    auto listed = pid_listed(desc, tables, ns ? event.ns_pid : event.pid);
    if (!listed) {
        return false;
    }
    bool in_set = *listed;
    if (follow) {
        if (in_set) {
            approve(selector, event.pid, epoch);
        } else {
            in_set = descends_from_listed(selector, desc, tables, event.pid, epoch);
        }
    }
    return desc.op == PidOperator::In ? in_set : !in_set;
}

bool SelectorMatcher::descends_from_listed(uint32_t selector, const PidDescriptor& desc, const TableView& tables,
                                           uint32_t pid, uint64_t epoch)
{
    if (is_approved(selector, pid, epoch)) {
        return true;
    }
    if (!lineage_) {
        return false;
    }

    const bool ns = (desc.flags & kPidFlagNamespace) != 0;
    uint32_t current = pid;
    for (uint32_t depth = 0; depth < kMaxLineageDepth; ++depth) {
        auto parent = lineage_->parent_of(current);
        if (!parent) {
            return false;
        }
        current = *parent;

        bool hit = is_approved(selector, current, epoch);
        if (!hit) {
            uint32_t value = current;
            if (ns) {
                auto ns_pid = lineage_->namespace_pid(current);
                if (!ns_pid) {
                    return false;
                }
                value = *ns_pid;
            }
            auto listed = pid_listed(desc, tables, value);
            hit = listed && *listed;
        }
        if (hit) {
            approve(selector, pid, epoch);
            return true;
        }
    }
    return false;
}

bool SelectorMatcher::is_approved(uint32_t selector, uint32_t pid, uint64_t epoch) const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (epoch != epoch_) {
        return false;
    }
    auto it = approved_.find(selector);
    return it != approved_.end() && it->second.count(pid) != 0;
}

void SelectorMatcher::approve(uint32_t selector, uint32_t pid, uint64_t epoch)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (epoch == epoch_) {
        approved_[selector].insert(pid);
    }
}

uint64_t SelectorMatcher::current_epoch() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return epoch_;
}

void SelectorMatcher::reset_approvals()
{
    std::lock_guard<std::mutex> lock(mu_);
    approved_.clear();
    ++epoch_;
}

void SelectorMatcher::forget_process(uint32_t pid)
{
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = approved_.begin(); it != approved_.end();) {
        it->second.erase(pid);
        if (it->second.empty()) {
            it = approved_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t SelectorMatcher::approved_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& [selector, pids] : approved_) {
        n += pids.size();
    }
    return n;
}

} // namespace vigil
