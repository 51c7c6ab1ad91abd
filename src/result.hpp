// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace vigil {

enum class ErrorCode {
    Unknown,
    InvalidArgument,
    IoError,
    ResourceNotFound,
    ResourceBusy,
    PermissionDenied,
    PolicyParseFailed,
    BpfLoadFailed,
    BpfAttachFailed,
    BpfMapOperationFailed,

    // Selector compilation and live reload
    EncodingError,
    UnknownOperator,
    TypeMismatch,
    TableAllocationFailed,
    PublishFailed,
    ConcurrentReload,
};

inline const char* error_code_name(ErrorCode code);

class Error {
  public:
    Error(ErrorCode code, std::string message, std::string context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context))
    {
    }

    static Error system(int err, const std::string& message)
    {
        ErrorCode code = ErrorCode::IoError;
        switch (err) {
            case ENOENT:
                code = ErrorCode::ResourceNotFound;
                break;
            case EPERM:
            case EACCES:
                code = ErrorCode::PermissionDenied;
                break;
            case EBUSY:
            case EAGAIN:
                code = ErrorCode::ResourceBusy;
                break;
            case EINVAL:
                code = ErrorCode::InvalidArgument;
                break;
            default:
                break;
        }
        return Error(code, message, std::strerror(err));
    }

    static Error not_found(const std::string& what) { return Error(ErrorCode::ResourceNotFound, "Not found", what); }

    static Error invalid_argument(const std::string& what)
    {
        return Error(ErrorCode::InvalidArgument, "Invalid argument", what);
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& context() const { return context_; }

    // Prepends a location ("kprobe:__x64_sys_lseek", "selector[1]") to the context.
    [[nodiscard]] Error with_context(const std::string& where) const
    {
        if (context_.empty()) {
            return Error(code_, message_, where);
        }
        return Error(code_, message_, where + ": " + context_);
    }

    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += error_code_name(code_);
        out += "] ";
        out += message_;
        if (!context_.empty()) {
            out += " (" + context_ + ")";
        }
        return out;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string context_;
};

inline const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Unknown:
            return "Unknown";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::ResourceNotFound:
            return "ResourceNotFound";
        case ErrorCode::ResourceBusy:
            return "ResourceBusy";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::PolicyParseFailed:
            return "PolicyParseFailed";
        case ErrorCode::BpfLoadFailed:
            return "BpfLoadFailed";
        case ErrorCode::BpfAttachFailed:
            return "BpfAttachFailed";
        case ErrorCode::BpfMapOperationFailed:
            return "BpfMapOperationFailed";
        case ErrorCode::EncodingError:
            return "EncodingError";
        case ErrorCode::UnknownOperator:
            return "UnknownOperator";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::TableAllocationFailed:
            return "TableAllocationFailed";
        case ErrorCode::PublishFailed:
            return "PublishFailed";
        case ErrorCode::ConcurrentReload:
            return "ConcurrentReload";
    }
    return "Unknown";
}

/**
 * Value-or-error return type.
 *
 * Converts to true on success. Dereference for the value, error() for the
 * failure. Result<void> carries no value; `return {};` means success.
 */
template <typename T>
class Result {
  public:
    Result(const T& value) : storage_(value) {}
    Result(T&& value) : storage_(std::move(value)) {}
    Result(const Error& error) : storage_(error) {}
    Result(Error&& error) : storage_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(storage_); }
    [[nodiscard]] explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(storage_); }
    const T& value() const& { return std::get<T>(storage_); }
    T&& value() && { return std::get<T>(std::move(storage_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(storage_); }

  private:
    std::variant<T, Error> storage_;
};

template <>
class Result<void> {
  public:
    Result() = default;
    Result(const Error& error) : error_(error), ok_(false) {}
    Result(Error&& error) : error_(std::move(error)), ok_(false) {}

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] explicit operator bool() const { return ok_; }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_{ErrorCode::Unknown, ""};
    bool ok_ = true;
};

} // namespace vigil

// Propagate a failed Result<...> to the caller.
#define TRY(expr)                                                                                                      \
    do {                                                                                                               \
        auto _vigil_try_result = (expr);                                                                               \
        if (!_vigil_try_result) {                                                                                      \
            return _vigil_try_result.error();                                                                          \
        }                                                                                                              \
    } while (0)
