#pragma once

#include "common/types.h"

#include <set>
#include <utility>

namespace tradeguard {
namespace market {

using common::Principal;

/**
 * Identity registration service (DID registry).
 * The engine only asks whether a principal is known.
 */
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;
    virtual bool is_registered(const Principal& principal) const = 0;
};

/**
 * Decides who may rule disputes.
 */
class IArbitratorEligibility {
public:
    virtual ~IArbitratorEligibility() = default;
    virtual bool is_eligible(const Principal& principal) const = 0;
};

/**
 * In-memory identity registry, populated from configuration
 */
class StaticIdentityRegistry : public IIdentityProvider {
public:
    explicit StaticIdentityRegistry(std::set<Principal> identities)
        : identities_(std::move(identities)) {}

    bool is_registered(const Principal& principal) const override;

private:
    std::set<Principal> identities_;
};

/**
 * Vetted arbitrators, seeded from configuration and maintained by the authority
 */
class ArbitratorRoster : public IArbitratorEligibility {
public:
    ArbitratorRoster() = default;
    explicit ArbitratorRoster(std::set<Principal> arbitrators)
        : arbitrators_(std::move(arbitrators)) {}

    bool is_eligible(const Principal& principal) const override;

    /// @return true if the roster changed
    bool add(const Principal& arbitrator);
    bool remove(const Principal& arbitrator);

    const std::set<Principal>& arbitrators() const { return arbitrators_; }
    void restore(std::set<Principal> arbitrators) { arbitrators_ = std::move(arbitrators); }

private:
    std::set<Principal> arbitrators_;
};

} // namespace market
} // namespace tradeguard
