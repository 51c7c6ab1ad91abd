// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "result.hpp"
#include "types.hpp"

namespace vigil {

enum class Arity {
    Single, // exactly one literal
    Multi,  // literals are OR-ed (negated operators: none may match)
};

enum class TableUse {
    Never,
    AboveInlineThreshold,
    Always,
};

/**
 * Encoding/evaluation contract of one operator.
 *
 * `table_op` is the operator the descriptor carries when the values are
 * stored in an auxiliary table instead of inline (Equal -> InMap).
 */
struct OperatorInfo {
    ArgOperator op;
    const char* name;
    Arity arity;
    TableUse table;
    bool negated;
    bool integers;
    bool strings;
    bool range_literals;
    ArgOperator table_op;
};

Result<ArgOperator> parse_arg_operator(const std::string& name);
Result<PidOperator> parse_pid_operator(const std::string& name);

const OperatorInfo& operator_info(ArgOperator op);
const char* arg_operator_name(ArgOperator op);
const char* pid_operator_name(PidOperator op);

bool is_string_type(ArgType type);
bool is_signed_type(ArgType type);
// Width of the inline encoding of one literal of `type`.
uint32_t value_width(ArgType type);

Result<ArgType> parse_arg_type(const std::string& name);
const char* arg_type_name(ArgType type);

// Returns a TypeMismatch error when `op` cannot be applied to `type`.
Result<void> check_operator_type(ArgOperator op, ArgType type);

// Whether `count` literals of `op` compile into an auxiliary table.
bool uses_table(ArgOperator op, size_t count, uint32_t max_inline_values);

} // namespace vigil
