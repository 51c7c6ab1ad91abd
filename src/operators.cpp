// cppcheck-suppress-file missingIncludeSystem
#include "operators.hpp"

#include <array>

namespace vigil {

namespace {

// Indexed by ArgOperator code - 1.
constexpr std::array<OperatorInfo, 12> kOperators = {{
    {ArgOperator::Equal, "Equal", Arity::Multi, TableUse::AboveInlineThreshold, false, true, true, false,
     ArgOperator::InMap},
    {ArgOperator::NotEqual, "NotEqual", Arity::Multi, TableUse::AboveInlineThreshold, true, true, true, false,
     ArgOperator::NotInMap},
    {ArgOperator::Prefix, "Prefix", Arity::Multi, TableUse::Never, false, false, true, false, ArgOperator::Prefix},
    {ArgOperator::NotPrefix, "NotPrefix", Arity::Multi, TableUse::Never, true, false, true, false,
     ArgOperator::NotPrefix},
    {ArgOperator::Postfix, "Postfix", Arity::Multi, TableUse::Never, false, false, true, false, ArgOperator::Postfix},
    {ArgOperator::NotPostfix, "NotPostfix", Arity::Multi, TableUse::Never, true, false, true, false,
     ArgOperator::NotPostfix},
    {ArgOperator::GT, "GT", Arity::Single, TableUse::Never, false, true, false, false, ArgOperator::GT},
    {ArgOperator::LT, "LT", Arity::Single, TableUse::Never, false, true, false, false, ArgOperator::LT},
    {ArgOperator::Range, "Range", Arity::Multi, TableUse::Never, false, true, false, true, ArgOperator::Range},
    {ArgOperator::Mask, "Mask", Arity::Multi, TableUse::Never, false, true, false, false, ArgOperator::Mask},
    {ArgOperator::InMap, "InMap", Arity::Multi, TableUse::Always, false, true, true, false, ArgOperator::InMap},
    {ArgOperator::NotInMap, "NotInMap", Arity::Multi, TableUse::Always, true, true, true, false,
     ArgOperator::NotInMap},
}};

struct TypeName {
    const char* name;
    ArgType type;
};

constexpr std::array<TypeName, 13> kTypeNames = {{
    {"int", ArgType::Int},
    {"fd", ArgType::Int},
    {"uint32", ArgType::Uint32},
    {"int64", ArgType::Int64},
    {"uint64", ArgType::Uint64},
    {"u64", ArgType::Uint64},
    {"size_t", ArgType::SizeT},
    {"string", ArgType::String},
    {"char_buf", ArgType::CharBuf},
    {"file", ArgType::File},
    {"path", ArgType::Path},
    {"s32", ArgType::Int},
    {"u32", ArgType::Uint32},
}};

} // namespace

Result<ArgOperator> parse_arg_operator(const std::string& name)
{
    for (const auto& info : kOperators) {
        if (name == info.name) {
            return info.op;
        }
    }
    return Error(ErrorCode::UnknownOperator, "Unknown argument operator", name);
}

Result<PidOperator> parse_pid_operator(const std::string& name)
{
    if (name == "In") {
        return PidOperator::In;
    }
    if (name == "NotIn") {
        return PidOperator::NotIn;
    }
    return Error(ErrorCode::UnknownOperator, "Unknown PID operator", name);
}

const OperatorInfo& operator_info(ArgOperator op)
{
    return kOperators[static_cast<uint32_t>(op) - 1];
}

const char* arg_operator_name(ArgOperator op)
{
    return operator_info(op).name;
}

const char* pid_operator_name(PidOperator op)
{
    return op == PidOperator::In ? "In" : "NotIn";
}

bool is_string_type(ArgType type)
{
    switch (type) {
        case ArgType::String:
        case ArgType::CharBuf:
        case ArgType::File:
        case ArgType::Path:
            return true;
        default:
            return false;
    }
}

bool is_signed_type(ArgType type)
{
    return type == ArgType::Int || type == ArgType::Int64;
}

uint32_t value_width(ArgType type)
{
    switch (type) {
        case ArgType::Int:
        case ArgType::Uint32:
            return 4;
        case ArgType::Int64:
        case ArgType::Uint64:
        case ArgType::SizeT:
            return 8;
        case ArgType::String:
        case ArgType::CharBuf:
        case ArgType::File:
        case ArgType::Path:
            return 4 + kMaxMatchString;
    }
    return 8;
}

Result<ArgType> parse_arg_type(const std::string& name)
{
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return Error(ErrorCode::InvalidArgument, "Unknown argument type", name);
}

const char* arg_type_name(ArgType type)
{
    switch (type) {
        case ArgType::Int:
            return "int";
        case ArgType::Uint32:
            return "uint32";
        case ArgType::Int64:
            return "int64";
        case ArgType::Uint64:
            return "uint64";
        case ArgType::SizeT:
            return "size_t";
        case ArgType::String:
            return "string";
        case ArgType::CharBuf:
            return "char_buf";
        case ArgType::File:
            return "file";
        case ArgType::Path:
            return "path";
    }
    return "unknown";
}

Result<void> check_operator_type(ArgOperator op, ArgType type)
{
    const OperatorInfo& info = operator_info(op);
    const bool ok = is_string_type(type) ? info.strings : info.integers;
    if (!ok) {
        return Error(ErrorCode::TypeMismatch, "Operator not supported for argument type",
                     std::string(info.name) + " on " + arg_type_name(type));
    }
    return {};
}

bool uses_table(ArgOperator op, size_t count, uint32_t max_inline_values)
{
    switch (operator_info(op).table) {
        case TableUse::Never:
            return false;
        case TableUse::Always:
            return true;
        case TableUse::AboveInlineThreshold:
            return count > max_inline_values;
    }
    return false;
}

} // namespace vigil
