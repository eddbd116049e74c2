#pragma once

#include <string>
#include <utility>

namespace objfs {

enum class ErrorKind {
    Ok = 0,
    NotFound,          // object or range no longer exists
    PermissionDenied,
    ObjectChanged,     // version token mismatch, the handle must be reopened
    Transient,         // timeout or throttling, retried internally
    Unavailable,       // transient failure that outlived the retry budget
    Cancelled,         // waiter detached before completion
    InvalidArgument,
};

const char* ErrorKindName(ErrorKind kind);

/**
 * @class Status
 * @brief Result of a data path operation: either OK or an error kind with a
 * human readable message.
 */
class Status {
public:
    Status() = default;
    Status(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    static Status OK() { return Status(); }
    static Status NotFound(std::string msg) { return Status(ErrorKind::NotFound, std::move(msg)); }
    static Status PermissionDenied(std::string msg) { return Status(ErrorKind::PermissionDenied, std::move(msg)); }
    static Status ObjectChanged(std::string msg) { return Status(ErrorKind::ObjectChanged, std::move(msg)); }
    static Status Transient(std::string msg) { return Status(ErrorKind::Transient, std::move(msg)); }
    static Status Unavailable(std::string msg) { return Status(ErrorKind::Unavailable, std::move(msg)); }
    static Status Cancelled(std::string msg) { return Status(ErrorKind::Cancelled, std::move(msg)); }
    static Status InvalidArgument(std::string msg) { return Status(ErrorKind::InvalidArgument, std::move(msg)); }

    bool ok() const { return kind_ == ErrorKind::Ok; }
    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    ErrorKind kind_ = ErrorKind::Ok;
    std::string message_;
};

} // namespace objfs
