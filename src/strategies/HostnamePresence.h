#pragma once
#include "../core/PresenceStrategy.h"
#include <optional>

namespace hostwatch {

class ProbeBatch;

// Neighbor tables rarely carry names, so this strategy runs its own sweep
// with reverse resolution and looks for the hostname in the ping output.
class HostnamePresence : public PresenceStrategy {
public:
    HostnamePresence(std::optional<std::string> hostname, std::string prefix, ProbeBatch& batch);
    std::string name() const override { return "hostname"; }
    std::string description() const override { return "Target hostname seen in resolved ping replies across the subnet"; }
    bool uses_snapshot() const override { return false; }
    bool evaluate(const NeighborSnapshot& snapshot) override;
private:
    std::optional<std::string> hostname_;
    std::string prefix_;
    ProbeBatch& batch_;
};

}
