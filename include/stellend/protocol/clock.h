// STELLEND - Ledger Clock
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_PROTOCOL_CLOCK_H
#define STELLEND_PROTOCOL_CLOCK_H

#include "stellend/core/types.h"

namespace stellend {
namespace protocol {

/// Source of the current ledger time in seconds since the epoch
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp Now() const = 0;
};

/// Wall clock; honours util mock time
class SystemClock : public Clock {
public:
    Timestamp Now() const override;
};

/// Clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp now = 0) : now_(now) {}

    Timestamp Now() const override { return now_; }

    void Set(Timestamp now) { now_ = now; }
    void Advance(uint64_t seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace protocol
} // namespace stellend

#endif // STELLEND_PROTOCOL_CLOCK_H
