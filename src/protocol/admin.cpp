// STELLEND - Admin Authorization Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/protocol/admin.h"
#include "stellend/util/logging.h"

namespace stellend {
namespace protocol {

StoredAdminGate::StoredAdminGate(storage::KVStore& store) : store_(store) {}

Status StoredAdminGate::RequireAdmin(const Address& caller) const {
    std::optional<Address> admin;
    Status s = GetAdmin(&admin);
    if (!s.ok()) {
        return s;
    }
    if (!admin) {
        LOG_WARN(util::LogCategory::DEFAULT) << "Privileged call by "
                                             << caller.ToShortString()
                                             << " rejected: no admin configured";
        return Status::Unauthorized("no admin configured");
    }
    if (*admin != caller) {
        LOG_WARN(util::LogCategory::DEFAULT) << "Privileged call by "
                                             << caller.ToShortString()
                                             << " rejected: not admin";
        return Status::Unauthorized("caller is not admin");
    }
    return Status::Ok();
}

Status StoredAdminGate::InitializeAdmin(const Address& admin) {
    std::optional<Address> current;
    Status s = GetAdmin(&current);
    if (!s.ok()) {
        return s;
    }
    if (current) {
        return Status::Unauthorized("admin already initialized");
    }
    store_.Write(storage::keys::Admin(), admin);
    LOG_INFO(util::LogCategory::DEFAULT) << "Admin set to " << admin.ToHex();
    return Status::Ok();
}

Status StoredAdminGate::GetAdmin(std::optional<Address>* out) const {
    return store_.Read(storage::keys::Admin(), out);
}

} // namespace protocol
} // namespace stellend
