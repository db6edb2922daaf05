#pragma once
#include "../core/PresenceStrategy.h"
#include <optional>

namespace hostwatch {

// Expects the MAC already normalized (Target does that); snapshot lines carry
// the same canonical form.
class MacPresence : public PresenceStrategy {
public:
    explicit MacPresence(std::optional<std::string> mac) : mac_(std::move(mac)) {}
    std::string name() const override { return "mac"; }
    std::string description() const override { return "Target hardware address listed in the neighbor table"; }
    bool uses_snapshot() const override { return true; }
    bool evaluate(const NeighborSnapshot& snapshot) override;
private:
    std::optional<std::string> mac_;
};

}
