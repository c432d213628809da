// STELLEND - Protocol Events Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/protocol/events.h"
#include "stellend/util/logging.h"

#include <sstream>

namespace stellend {
namespace protocol {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::FlashLoanInitiated: return "FlashLoanInitiated";
        case EventType::FlashLoanCompleted: return "FlashLoanCompleted";
        default: return "Unknown";
    }
}

std::string ProtocolEvent::ToString() const {
    std::ostringstream oss;
    oss << EventTypeToString(type)
        << "(initiator=" << initiator.ToShortString()
        << ", asset=" << asset.ToShortString()
        << ", amount=" << amount
        << ", fee=" << fee << ")";
    return oss.str();
}

void LoggingEventSink::Emit(const ProtocolEvent& event) {
    LOG_INFO(util::LogCategory::EVENT) << event.ToString();
}

void RecordingEventSink::Emit(const ProtocolEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<ProtocolEvent> RecordingEventSink::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t RecordingEventSink::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void RecordingEventSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

} // namespace protocol
} // namespace stellend
