// STELLEND - Protocol Status Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/core/status.h"

namespace stellend {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK:                   return "OK";
        case Status::UNAUTHORIZED:         return "Unauthorized";
        case Status::INVALID_AMOUNT:       return "InvalidAmount";
        case Status::NOT_FOUND:            return "NotFound";
        case Status::EXTERNAL_CALL_FAILED: return "ExternalCallFailed";
        case Status::REENTRANT_CALL:       return "ReentrantCall";
        case Status::STORAGE_ERROR:        return "StorageError";
        default:                           return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = StatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace stellend
