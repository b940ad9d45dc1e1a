#include "launchpad/access.hpp"
#include "launchpad/errors.hpp"
#include <mutex>

namespace launchpad {

AllowList::AllowList(const Address& admin) : admin_(admin) {
    if (is_zero_address(admin)) {
        throw ValidationError("allow-list admin is the zero address", errors::ZERO_ADDRESS);
    }
}

void AllowList::authorize(const Address& admin, const Address& caller, bool allowed) {
    if (admin != admin_) {
        throw AuthorizationError("authorize called by non-admin " + to_hex(admin));
    }
    if (is_zero_address(caller)) {
        throw ValidationError("cannot authorize the zero address", errors::ZERO_ADDRESS);
    }

    std::unique_lock lock(mutex_);
    if (allowed) {
        allowed_.insert(caller);
    } else {
        allowed_.erase(caller);
    }
}

bool AllowList::is_authorized(const Address& caller) const {
    std::shared_lock lock(mutex_);
    return allowed_.count(caller) > 0;
}

void AllowList::require(const Address& caller) const {
    if (!is_authorized(caller)) {
        throw AuthorizationError("unauthorized caller " + to_hex(caller));
    }
}

std::vector<Address> AllowList::callers() const {
    std::shared_lock lock(mutex_);
    return {allowed_.begin(), allowed_.end()};
}

} // namespace launchpad
