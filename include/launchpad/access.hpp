#ifndef LAUNCHPAD_ACCESS_HPP
#define LAUNCHPAD_ACCESS_HPP

#include <set>
#include <shared_mutex>
#include <vector>

#include "types.hpp"

namespace launchpad {

// =============================================================================
// AllowList - caller identities permitted to drive callbacks
// =============================================================================

class AllowList {
public:
    explicit AllowList(const Address& admin);

    AllowList(const AllowList&) = delete;
    AllowList& operator=(const AllowList&) = delete;

    // Admin-only; throws AuthorizationError for any other `admin` and
    // ValidationError for the zero address
    void authorize(const Address& admin, const Address& caller, bool allowed);

    bool is_authorized(const Address& caller) const;

    // Throws AuthorizationError when `caller` is not on the list
    void require(const Address& caller) const;

    const Address& admin() const { return admin_; }
    std::vector<Address> callers() const;

private:
    Address admin_;
    std::set<Address> allowed_;
    mutable std::shared_mutex mutex_;
};

} // namespace launchpad

#endif // LAUNCHPAD_ACCESS_HPP
