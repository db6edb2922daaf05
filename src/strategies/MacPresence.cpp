#include "MacPresence.h"
#include "../core/NeighborTable.h"

namespace hostwatch {

bool MacPresence::evaluate(const NeighborSnapshot& snapshot){
    if(!mac_) return false;
    return snapshot.contains(*mac_);
}

}
