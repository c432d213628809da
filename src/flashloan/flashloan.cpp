// STELLEND - Flash Loans Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/flashloan/flashloan.h"
#include "stellend/protocol/admin.h"
#include "stellend/protocol/events.h"
#include "stellend/protocol/reentrancy.h"
#include "stellend/storage/kvstore.h"
#include "stellend/util/logging.h"

namespace stellend {
namespace flashloan {

Status ComputeFee(Amount amount, int64_t feeBps, Amount* fee) {
    Amount product = 0;
    if (!CheckedMul(amount, feeBps, &product)) {
        return Status::InvalidAmount("fee computation overflows");
    }
    *fee = product / BPS_DENOMINATOR;
    return Status::Ok();
}

FlashLoanExecutor::FlashLoanExecutor(storage::KVStore& kv,
                                     const protocol::AdminGate& admin,
                                     protocol::ReentrancyGuard& guard,
                                     protocol::EventSink& events)
    : kv_(kv), admin_(admin), guard_(guard), events_(events) {}

Status FlashLoanExecutor::Execute(const Address& initiator, const Address& asset,
                                  Amount amount, int64_t feeBps,
                                  FlashLoanReceiver& receiver) {
    if (amount <= 0) {
        LOG_WARN(util::LogCategory::FLASH) << "Rejected flash loan of " << amount;
        return Status::InvalidAmount("loan amount must be positive");
    }
    if (feeBps < 0 || feeBps > BPS_DENOMINATOR) {
        return Status::InvalidAmount("fee must be within 0..10000 bps");
    }

    storage::Invocation inv(kv_);

    protocol::ReentrancyGuard::Scope scope(guard_);
    if (!scope.Entered()) {
        LOG_WARN(util::LogCategory::FLASH) << "Reentrant flash loan by "
                                           << initiator.ToShortString() << " rejected";
        return inv.Finish(Status::ReentrantCall("flash loan already in progress"));
    }

    Amount fee = 0;
    Status s = ComputeFee(amount, feeBps, &fee);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    protocol::ProtocolEvent event;
    event.type = protocol::EventType::FlashLoanInitiated;
    event.initiator = initiator;
    event.asset = asset;
    event.amount = amount;
    event.fee = fee;
    events_.Emit(event);

    s = receiver.OnFlashLoan(asset, amount, fee, initiator);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::FLASH) << "Flash loan receiver failed: " << s.ToString();
        return inv.Finish(Status::ExternalCallFailed(s.ToString()));
    }

    event.type = protocol::EventType::FlashLoanCompleted;
    events_.Emit(event);

    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::FLASH) << "Flash loan of " << amount << " "
                                           << asset.ToShortString() << " to "
                                           << initiator.ToShortString() << " completed, fee "
                                           << fee;
    }
    return s;
}

Status FlashLoanExecutor::Execute(const Address& initiator, const Address& asset,
                                  Amount amount, FlashLoanReceiver& receiver) {
    int64_t feeBps = 0;
    Status s = GetFeeBps(&feeBps);
    if (!s.ok()) {
        return s;
    }
    return Execute(initiator, asset, amount, feeBps, receiver);
}

Status FlashLoanExecutor::SetFeeBps(const Address& caller, int64_t feeBps) {
    storage::Invocation inv(kv_);

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    if (feeBps < 0 || feeBps > BPS_DENOMINATOR) {
        return inv.Finish(Status::InvalidAmount("fee must be within 0..10000 bps"));
    }

    kv_.Write(storage::keys::FlashFeeBps(), feeBps);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::FLASH) << "Flash-loan fee set to " << feeBps << " bps";
    }
    return s;
}

Status FlashLoanExecutor::GetFeeBps(int64_t* out) const {
    return kv_.ReadOr<int64_t>(storage::keys::FlashFeeBps(), DEFAULT_FLASH_FEE_BPS, out);
}

Status FlashLoanExecutor::SeedFeeBps(int64_t feeBps) {
    std::optional<int64_t> stored;
    Status s = kv_.Read(storage::keys::FlashFeeBps(), &stored);
    if (!s.ok()) {
        return s;
    }
    if (!stored) {
        kv_.Write(storage::keys::FlashFeeBps(), feeBps);
    }
    return Status::Ok();
}

} // namespace flashloan
} // namespace stellend
