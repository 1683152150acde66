#include "market/collaborators.h"

namespace tradeguard {
namespace market {

bool StaticIdentityRegistry::is_registered(const Principal& principal) const {
    return identities_.count(principal) > 0;
}

bool ArbitratorRoster::is_eligible(const Principal& principal) const {
    return arbitrators_.count(principal) > 0;
}

bool ArbitratorRoster::add(const Principal& arbitrator) {
    if (arbitrator.empty()) {
        return false;
    }
    return arbitrators_.insert(arbitrator).second;
}

bool ArbitratorRoster::remove(const Principal& arbitrator) {
    return arbitrators_.erase(arbitrator) > 0;
}

} // namespace market
} // namespace tradeguard
