#pragma once
#include "../core/PresenceStrategy.h"
#include <optional>

namespace hostwatch {

class IpPresence : public PresenceStrategy {
public:
    explicit IpPresence(std::optional<std::string> ip) : ip_(std::move(ip)) {}
    std::string name() const override { return "ip"; }
    std::string description() const override { return "Target IP listed in the neighbor table"; }
    bool uses_snapshot() const override { return true; }
    bool evaluate(const NeighborSnapshot& snapshot) override;
private:
    std::optional<std::string> ip_;
};

}
