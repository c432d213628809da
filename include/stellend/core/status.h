// STELLEND - Protocol Status
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Result type returned by every protocol entry point.

#ifndef STELLEND_CORE_STATUS_H
#define STELLEND_CORE_STATUS_H

#include <string>

namespace stellend {

/**
 * Status returned by governance, oracle and flash-loan operations.
 *
 * Operations that produce a value take it as an out-parameter and only
 * write it when the status is OK.
 */
class Status {
public:
    enum Code {
        OK = 0,
        UNAUTHORIZED = 1,
        INVALID_AMOUNT = 2,
        NOT_FOUND = 3,
        EXTERNAL_CALL_FAILED = 4,
        REENTRANT_CALL = 5,
        STORAGE_ERROR = 6,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Unauthorized(const std::string& msg = "") { return Status(UNAUTHORIZED, msg); }
    static Status InvalidAmount(const std::string& msg = "") { return Status(INVALID_AMOUNT, msg); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status ExternalCallFailed(const std::string& msg = "") {
        return Status(EXTERNAL_CALL_FAILED, msg);
    }
    static Status ReentrantCall(const std::string& msg = "") { return Status(REENTRANT_CALL, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(STORAGE_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsUnauthorized() const { return code_ == UNAUTHORIZED; }
    bool IsInvalidAmount() const { return code_ == INVALID_AMOUNT; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsExternalCallFailed() const { return code_ == EXTERNAL_CALL_FAILED; }
    bool IsReentrantCall() const { return code_ == REENTRANT_CALL; }
    bool IsStorageError() const { return code_ == STORAGE_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

/// Name of a status code ("Unauthorized", "NotFound", ...)
const char* StatusCodeToString(Status::Code code);

} // namespace stellend

#endif // STELLEND_CORE_STATUS_H
