// STELLEND - Protocol Events
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_PROTOCOL_EVENTS_H
#define STELLEND_PROTOCOL_EVENTS_H

#include "stellend/core/types.h"

#include <mutex>
#include <string>
#include <vector>

namespace stellend {
namespace protocol {

// ============================================================================
// Event Types
// ============================================================================

enum class EventType {
    FlashLoanInitiated,
    FlashLoanCompleted,
};

const char* EventTypeToString(EventType type);

/// An event published by a protocol operation
struct ProtocolEvent {
    EventType type;
    Address initiator;
    Address asset;
    Amount amount{0};
    Amount fee{0};

    std::string ToString() const;
};

// ============================================================================
// Event Sinks
// ============================================================================

/// Receiver of protocol events
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void Emit(const ProtocolEvent& event) = 0;
};

/// Writes every event to the logger under the "event" category
class LoggingEventSink : public EventSink {
public:
    void Emit(const ProtocolEvent& event) override;
};

/// Keeps events in memory, in emission order
class RecordingEventSink : public EventSink {
public:
    void Emit(const ProtocolEvent& event) override;

    std::vector<ProtocolEvent> GetEvents() const;
    size_t Count() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<ProtocolEvent> events_;
};

} // namespace protocol
} // namespace stellend

#endif // STELLEND_PROTOCOL_EVENTS_H
