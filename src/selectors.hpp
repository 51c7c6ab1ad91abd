// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "config.hpp"
#include "match_value.hpp"
#include "result.hpp"
#include "types.hpp"

namespace vigil {

// Table index used in the id of PID set tables, so they never share an id
// with an argument table holding the same numbers.
inline constexpr uint32_t kPidTableIndex = 0xFFFFFFFF;

// Collects the auxiliary tables of one compilation, keyed by table id.
using TableSet = std::map<uint64_t, AuxTableContent>;

/**
 * Compile one PID selector into its descriptor.
 *
 * An absent selector (or one with no values and no include_self) compiles to
 * the 4-byte "always match" descriptor.
 */
Result<void> compile_pid_filter(const std::optional<PidSelector>& selector, const IdentityContext& identity,
                                const CompilerConfig& cfg, BlobWriter& out, TableSet& tables);

/**
 * Compile one argument selector against the declared type of its argument.
 *
 * Fails with TypeMismatch when the operator does not support the type and
 * with EncodingError for bad literals or arity.
 */
Result<void> compile_arg_filter(const ArgSelector& selector, ArgType type, const CompilerConfig& cfg, BlobWriter& out,
                                TableSet& tables);

/**
 * Compile the OR-of-ANDs selector list of one attachment.
 *
 * Output is deterministic: equal input produces byte-identical blobs and the
 * same table ids. Errors carry "selector[i]..." in their context.
 */
Result<CompiledSelectors> compile_selectors(const std::vector<SelectorSpec>& selectors,
                                            const std::vector<ArgumentSpec>& args, const IdentityContext& identity,
                                            const CompilerConfig& cfg);

// Content id of a table: FNV-1a over kind, key size, index and sorted keys.
uint64_t table_content_id(TableKeyKind kind, uint32_t key_size, uint32_t index,
                          const std::vector<std::vector<uint8_t>>& keys);

} // namespace vigil
