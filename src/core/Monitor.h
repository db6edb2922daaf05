#pragma once
#include "PresenceStrategy.h"
#include "Target.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace hostwatch {

class SubnetSweeper;
class NeighborSource;
class CancellationToken;
class Logger;
struct NeighborSnapshot;

// Payload handed to the notification callback. On an absent signal the
// identity fields are all empty.
struct PresenceEvent {
    std::optional<std::string> ip;
    std::optional<std::string> mac;
    std::optional<std::string> hostname;
    PresenceState state = PresenceState::Unknown;
    PresenceState previous = PresenceState::Unknown;
    uint64_t tick = 0;
    std::chrono::system_clock::time_point timestamp{};
};

using PresenceCallback = std::function<void(const PresenceEvent&)>;

struct MonitorOptions {
    std::chrono::milliseconds interval{1000};
    bool change_only = false;           // false: fire on every tick
    bool notify_initial_absent = false; // count Unknown -> Absent as a change
    uint64_t max_ticks = 0;             // 0 = until cancelled
};

class Monitor {
public:
    Monitor(Target target, PresenceStrategyPtr strategy, SubnetSweeper& sweeper, NeighborSource& neighbors,
            MonitorOptions options, PresenceCallback callback, Logger& logger);

    // One sweep/evaluate/notify round. Returns false if cancelled before the
    // state could be decided; the state is left untouched in that case.
    bool tick(const CancellationToken& cancel);

    // Ticks and sleeps until cancelled or max_ticks rounds completed.
    void run(CancellationToken& cancel);

    PresenceState state() const { return state_; }
    uint64_t ticks() const { return ticks_; }
    const Target& target() const { return target_; }
    const PresenceStrategy& strategy() const { return *strategy_; }
private:
    NeighborSnapshot capture(const CancellationToken& cancel);
    bool should_fire(bool present) const;

    Target target_;
    PresenceStrategyPtr strategy_;
    SubnetSweeper& sweeper_;
    NeighborSource& neighbors_;
    MonitorOptions options_;
    PresenceCallback callback_;
    Logger& logger_;
    PresenceState state_ = PresenceState::Unknown;
    uint64_t ticks_ = 0;
};

}
