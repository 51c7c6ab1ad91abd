// cppcheck-suppress-file missingIncludeSystem
#include "selectors.hpp"

#include <algorithm>
#include <string>

#include "operators.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

void sort_unique(std::vector<std::vector<uint8_t>>& keys)
{
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
}

// Registers `content` in `tables`, returning its id. Two different contents
// hashing to the same id are rejected rather than silently merged.
Result<uint64_t> add_table(TableSet& tables, AuxTableContent content)
{
    auto it = tables.find(content.id);
    if (it != tables.end()) {
        if (!(it->second == content)) {
            return Error(ErrorCode::TableAllocationFailed, "Table id collision", "id=" + std::to_string(content.id));
        }
        return content.id;
    }
    const uint64_t id = content.id;
    tables.emplace(id, std::move(content));
    return id;
}

const ArgumentSpec* find_arg(const std::vector<ArgumentSpec>& args, uint32_t index)
{
    for (const auto& arg : args) {
        if (arg.index == index) {
            return &arg;
        }
    }
    return nullptr;
}

} // namespace

uint64_t table_content_id(TableKeyKind kind, uint32_t key_size, uint32_t index,
                          const std::vector<std::vector<uint8_t>>& keys)
{
    BlobWriter header;
    header.put_u32(static_cast<uint32_t>(kind));
    header.put_u32(key_size);
    header.put_u32(index);
    header.put_u32(static_cast<uint32_t>(keys.size()));
    const std::vector<uint8_t> head = header.take();

    uint64_t hash = fnv1a64(head.data(), head.size());
    for (const auto& key : keys) {
        hash = fnv1a64(key.data(), key.size(), hash);
    }
    return hash;
}

Result<void> compile_pid_filter(const std::optional<PidSelector>& selector, const IdentityContext& identity,
                                const CompilerConfig& cfg, BlobWriter& out, TableSet& tables)
{
    const size_t start = out.size();
    out.put_u32(0); // pid_len, patched below

    if (!selector || (selector->values.empty() && !selector->include_self)) {
        out.patch_u32(start, 4);
        return {};
    }

    std::vector<uint32_t> pids = selector->values;
    if (selector->include_self) {
        const uint32_t self = selector->is_namespace_pid ? identity.self_ns_pid : identity.self_pid;
        if (self == 0) {
            return Error(ErrorCode::EncodingError, "Identity context has no PID for include_self");
        }
        pids.push_back(self);
    }
    for (uint32_t pid : pids) {
        if (pid == 0) {
            return Error(ErrorCode::EncodingError, "PID 0 cannot be matched");
        }
    }
    std::sort(pids.begin(), pids.end());
    pids.erase(std::unique(pids.begin(), pids.end()), pids.end());

    uint32_t flags = 0;
    if (selector->is_namespace_pid) {
        flags |= kPidFlagNamespace;
    }
    if (selector->follow_forks) {
        flags |= kPidFlagFollowForks;
    }

    out.put_u32(static_cast<uint32_t>(selector->op));
    out.put_u32(flags);

    if (pids.size() > cfg.max_inline_values) {
        if (pids.size() > cfg.max_table_entries) {
            return Error(ErrorCode::EncodingError, "PID set exceeds table capacity",
                         "count=" + std::to_string(pids.size()));
        }
        AuxTableContent content;
        content.kind = TableKeyKind::Integer;
        content.key_size = kIntTableKeySize;
        for (uint32_t pid : pids) {
            content.keys.push_back(encode_integer(pid, kIntTableKeySize));
        }
        content.id = table_content_id(content.kind, content.key_size, kPidTableIndex, content.keys);
        auto id = add_table(tables, std::move(content));
        if (!id) {
            return id.error();
        }
        out.put_u32(kModeTable);
        out.put_u64(*id);
    } else {
        out.put_u32(kModeInline);
        out.put_u32(static_cast<uint32_t>(pids.size()));
        for (uint32_t pid : pids) {
            out.put_u32(pid);
        }
    }

    out.patch_u32(start, static_cast<uint32_t>(out.size() - start));
    return {};
}

Result<void> compile_arg_filter(const ArgSelector& selector, ArgType type, const CompilerConfig& cfg, BlobWriter& out,
                                TableSet& tables)
{
    TRY(check_operator_type(selector.op, type));

    const OperatorInfo& info = operator_info(selector.op);
    if (selector.values.empty()) {
        return Error(ErrorCode::EncodingError, "Operator requires at least one value", info.name);
    }
    if (info.arity == Arity::Single && selector.values.size() != 1) {
        return Error(ErrorCode::EncodingError, "Operator takes exactly one value",
                     std::string(info.name) + " got " + std::to_string(selector.values.size()));
    }

    const bool tabled = uses_table(selector.op, selector.values.size(), cfg.max_inline_values);
    const ArgOperator encoded_op = tabled ? info.table_op : selector.op;

    const size_t start = out.size();
    out.put_u32(0); // arg_len, patched below
    out.put_u32(selector.index);
    out.put_u32(static_cast<uint32_t>(encoded_op));
    out.put_u32(static_cast<uint32_t>(type));

    if (tabled) {
        if (selector.values.size() > cfg.max_table_entries) {
            return Error(ErrorCode::EncodingError, "Value set exceeds table capacity",
                         "count=" + std::to_string(selector.values.size()));
        }
        AuxTableContent content;
        content.kind = is_string_type(type) ? TableKeyKind::String : TableKeyKind::Integer;
        content.key_size = is_string_type(type) ? kStrTableKeySize : kIntTableKeySize;
        for (const auto& literal : selector.values) {
            auto key = encode_table_key(literal, type, cfg);
            if (!key) {
                return key.error();
            }
            content.keys.push_back(std::move(*key));
        }
        sort_unique(content.keys);
        content.id = table_content_id(content.kind, content.key_size, selector.index, content.keys);
        auto id = add_table(tables, std::move(content));
        if (!id) {
            return id.error();
        }
        out.put_u32(kModeTable);
        out.put_u64(*id);
    } else {
        std::vector<std::vector<uint8_t>> encoded;
        encoded.reserve(selector.values.size());
        for (const auto& literal : selector.values) {
            auto value = info.range_literals ? encode_range(literal, type) : encode_value(literal, type, cfg);
            if (!value) {
                return value.error();
            }
            encoded.push_back(std::move(*value));
        }
        // Set semantics: order of Equal/NotEqual literals carries no meaning.
        if (selector.op == ArgOperator::Equal || selector.op == ArgOperator::NotEqual) {
            sort_unique(encoded);
        }

        const uint32_t width = info.range_literals ? 2 * value_width(type) : value_width(type);
        out.put_u32(kModeInline);
        out.put_u32(static_cast<uint32_t>(encoded.size()));
        out.put_u32(width);
        for (const auto& value : encoded) {
            out.put_bytes(value);
        }
    }

    out.patch_u32(start, static_cast<uint32_t>(out.size() - start));
    return {};
}

Result<CompiledSelectors> compile_selectors(const std::vector<SelectorSpec>& selectors,
                                            const std::vector<ArgumentSpec>& args, const IdentityContext& identity,
                                            const CompilerConfig& cfg)
{
    if (selectors.size() > cfg.max_selectors) {
        return Error(ErrorCode::EncodingError, "Too many selectors",
                     "count=" + std::to_string(selectors.size()) + " max=" + std::to_string(cfg.max_selectors));
    }

    BlobWriter out;
    TableSet tables;

    out.put_u32(kBlobMagic);
    out.put_u32(kBlobVersion);
    out.put_u32(static_cast<uint32_t>(selectors.size()));
    out.put_u32(0); // total_len, patched below

    for (size_t i = 0; i < selectors.size(); ++i) {
        const SelectorSpec& sel = selectors[i];
        const std::string where = "selector[" + std::to_string(i) + "]";

        if (sel.match_args.size() > cfg.max_args_per_selector) {
            return Error(ErrorCode::EncodingError, "Too many argument filters in selector",
                         where + ": count=" + std::to_string(sel.match_args.size()));
        }

        const size_t sel_start = out.size();
        out.put_u32(0); // sel_len, patched below

        auto pid_result = compile_pid_filter(sel.match_pid, identity, cfg, out, tables);
        if (!pid_result) {
            return pid_result.error().with_context(where + ".match_pids");
        }

        out.put_u32(static_cast<uint32_t>(sel.match_args.size()));
        for (size_t j = 0; j < sel.match_args.size(); ++j) {
            const ArgSelector& arg_sel = sel.match_args[j];
            const std::string arg_where = where + ".match_args[" + std::to_string(j) + "]";

            const ArgumentSpec* spec = find_arg(args, arg_sel.index);
            if (!spec) {
                return Error(ErrorCode::TypeMismatch, "Selector references undeclared argument",
                             arg_where + ": index=" + std::to_string(arg_sel.index));
            }
            auto arg_result = compile_arg_filter(arg_sel, spec->type, cfg, out, tables);
            if (!arg_result) {
                return arg_result.error().with_context(arg_where);
            }
        }

        out.patch_u32(sel_start, static_cast<uint32_t>(out.size() - sel_start));
    }

    out.put_u32(kBlobSentinel);
    if (out.size() > cfg.max_blob_bytes) {
        return Error(ErrorCode::EncodingError, "Compiled selectors exceed blob capacity",
                     "bytes=" + std::to_string(out.size()) + " max=" + std::to_string(cfg.max_blob_bytes));
    }
    out.patch_u32(12, static_cast<uint32_t>(out.size()));

    CompiledSelectors compiled;
    compiled.blob.bytes = out.take();
    compiled.tables.reserve(tables.size());
    for (auto& [id, content] : tables) {
        compiled.tables.push_back(std::move(content));
    }
    return compiled;
}

} // namespace vigil
