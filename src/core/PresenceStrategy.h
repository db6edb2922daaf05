#pragma once
#include <string>
#include <memory>

namespace hostwatch {

struct NeighborSnapshot; // fwd

enum class PresenceState { Unknown, Present, Absent };

const char* presence_state_name(PresenceState s); // "unknown" | "present" | "absent"

class PresenceStrategy {
public:
    virtual ~PresenceStrategy() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    // false when the strategy ignores the neighbor snapshot and probes itself
    virtual bool uses_snapshot() const = 0;
    // "Is the target present?" A strategy lacking its identifying field
    // answers false.
    virtual bool evaluate(const NeighborSnapshot& snapshot) = 0;
};

using PresenceStrategyPtr = std::unique_ptr<PresenceStrategy>;

}
