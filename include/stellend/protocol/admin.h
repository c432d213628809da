// STELLEND - Admin Authorization
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_PROTOCOL_ADMIN_H
#define STELLEND_PROTOCOL_ADMIN_H

#include "stellend/core/status.h"
#include "stellend/core/types.h"
#include "stellend/storage/kvstore.h"

#include <optional>

namespace stellend {
namespace protocol {

/**
 * Authorization check for privileged operations.
 */
class AdminGate {
public:
    virtual ~AdminGate() = default;

    /// OK when caller is the protocol admin, UNAUTHORIZED otherwise
    virtual Status RequireAdmin(const Address& caller) const = 0;
};

/**
 * Admin gate backed by the "admin" storage key.
 *
 * With no admin stored, every privileged call is rejected.
 */
class StoredAdminGate : public AdminGate {
public:
    explicit StoredAdminGate(storage::KVStore& store);

    Status RequireAdmin(const Address& caller) const override;

    /// Store the admin; UNAUTHORIZED if one is already set
    Status InitializeAdmin(const Address& admin);

    /// Currently stored admin, if any
    Status GetAdmin(std::optional<Address>* out) const;

private:
    storage::KVStore& store_;
};

} // namespace protocol
} // namespace stellend

#endif // STELLEND_PROTOCOL_ADMIN_H
