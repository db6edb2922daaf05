#include "IpPresence.h"
#include "../core/NeighborTable.h"

namespace hostwatch {

// Substring match: 192.168.0.1 also matches a 192.168.0.10x entry.
bool IpPresence::evaluate(const NeighborSnapshot& snapshot){
    if(!ip_) return false;
    return snapshot.contains(*ip_);
}

}
