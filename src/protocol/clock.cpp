// STELLEND - Ledger Clock Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/protocol/clock.h"
#include "stellend/util/time.h"

namespace stellend {
namespace protocol {

Timestamp SystemClock::Now() const {
    int64_t now = util::GetTime();
    return now > 0 ? static_cast<Timestamp>(now) : 0;
}

} // namespace protocol
} // namespace stellend
