// STELLEND - Reentrancy Guard
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_PROTOCOL_REENTRANCY_H
#define STELLEND_PROTOCOL_REENTRANCY_H

namespace stellend {
namespace protocol {

/**
 * Flag protecting an external call from being re-entered.
 *
 * The flash-loan executor and the oracle each own one, so a callee cannot
 * re-enter the operation that called it but may use the other.
 */
class ReentrancyGuard {
public:
    ReentrancyGuard() = default;

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool IsEntered() const { return entered_; }

    /**
     * Holds the guard for its lifetime.
     * Entered() is false when the guard was already held; such a scope
     * releases nothing.
     */
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard)
            : guard_(guard), entered_(!guard.entered_) {
            if (entered_) {
                guard_.entered_ = true;
            }
        }

        ~Scope() {
            if (entered_) {
                guard_.entered_ = false;
            }
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        bool Entered() const { return entered_; }

    private:
        ReentrancyGuard& guard_;
        bool entered_;
    };

private:
    bool entered_{false};
};

} // namespace protocol
} // namespace stellend

#endif // STELLEND_PROTOCOL_REENTRANCY_H
