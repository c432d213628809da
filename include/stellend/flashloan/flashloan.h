// STELLEND - Flash Loans
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Reentrancy-guarded call into a flash-loan receiver, announced by a pair of
// events. Token movement is settled by the receiver and is not modelled here.

#ifndef STELLEND_FLASHLOAN_FLASHLOAN_H
#define STELLEND_FLASHLOAN_FLASHLOAN_H

#include "stellend/core/status.h"
#include "stellend/core/types.h"

namespace stellend {

namespace protocol {
class AdminGate;
class EventSink;
class ReentrancyGuard;
}

namespace storage {
class KVStore;
}

namespace flashloan {

/// Default flash-loan fee (0.09%)
constexpr int64_t DEFAULT_FLASH_FEE_BPS = 9;

/**
 * Fee owed on a loan: amount * feeBps / 10000, truncating.
 * @return INVALID_AMOUNT when the product overflows
 */
Status ComputeFee(Amount amount, int64_t feeBps, Amount* fee);

/// Contract that borrows through a flash loan
class FlashLoanReceiver {
public:
    virtual ~FlashLoanReceiver() = default;

    /// Use the loan; a non-OK status fails the whole loan
    virtual Status OnFlashLoan(const Address& asset, Amount amount, Amount fee,
                               const Address& initiator) = 0;
};

class FlashLoanExecutor {
public:
    FlashLoanExecutor(storage::KVStore& kv,
                      const protocol::AdminGate& admin,
                      protocol::ReentrancyGuard& guard,
                      protocol::EventSink& events);

    FlashLoanExecutor(const FlashLoanExecutor&) = delete;
    FlashLoanExecutor& operator=(const FlashLoanExecutor&) = delete;

    /**
     * Run a flash loan with an explicit fee.
     *
     * Emits FlashLoanInitiated, calls the receiver, then emits
     * FlashLoanCompleted. The reentrancy guard is held for the whole call.
     */
    Status Execute(const Address& initiator, const Address& asset, Amount amount,
                   int64_t feeBps, FlashLoanReceiver& receiver);

    /// Run a flash loan with the stored fee
    Status Execute(const Address& initiator, const Address& asset, Amount amount,
                   FlashLoanReceiver& receiver);

    Status SetFeeBps(const Address& caller, int64_t feeBps);
    Status GetFeeBps(int64_t* out) const;

    /// Write the fee when it is not stored yet
    Status SeedFeeBps(int64_t feeBps);

private:
    storage::KVStore& kv_;
    const protocol::AdminGate& admin_;
    protocol::ReentrancyGuard& guard_;
    protocol::EventSink& events_;
};

} // namespace flashloan
} // namespace stellend

#endif // STELLEND_FLASHLOAN_FLASHLOAN_H
