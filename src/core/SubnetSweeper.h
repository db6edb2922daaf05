#pragma once
#include "NeighborTable.h"
#include "ProbeBatch.h"
#include <string>

namespace hostwatch {

// Pings every host of a /24 prefix so the kernel refreshes its neighbor
// entries, then captures the table and keeps the lines for that prefix.
class SubnetSweeper {
public:
    SubnetSweeper(ProbeBatch& batch, NeighborSource& neighbors);

    // Empty prefix: no probes, no table query, empty snapshot.
    // Throws NeighborTableError when the table cannot be captured.
    NeighborSnapshot sweep(const std::string& prefix);
private:
    ProbeBatch& batch_;
    NeighborSource& neighbors_;
};

}
