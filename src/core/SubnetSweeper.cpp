#include "SubnetSweeper.h"

namespace hostwatch {

SubnetSweeper::SubnetSweeper(ProbeBatch& batch, NeighborSource& neighbors)
    : batch_(batch), neighbors_(neighbors) {}

NeighborSnapshot SubnetSweeper::sweep(const std::string& prefix){
    if(prefix.empty()) return NeighborSnapshot{};
    // Results only matter for their side effect on the kernel table.
    batch_.run(host_addresses(prefix), false);
    return neighbors_.snapshot().filtered(prefix);
}

}
