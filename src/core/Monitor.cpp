#include "Monitor.h"
#include "Cancellation.h"
#include "Logging.h"
#include "NeighborTable.h"
#include "SubnetSweeper.h"

namespace hostwatch {

const char* presence_state_name(PresenceState s){
    switch(s){
        case PresenceState::Unknown: return "unknown";
        case PresenceState::Present: return "present";
        case PresenceState::Absent: return "absent";
    }
    return "unknown";
}

Monitor::Monitor(Target target, PresenceStrategyPtr strategy, SubnetSweeper& sweeper, NeighborSource& neighbors,
                 MonitorOptions options, PresenceCallback callback, Logger& logger)
    : target_(std::move(target)), strategy_(std::move(strategy)), sweeper_(sweeper), neighbors_(neighbors),
      options_(options), callback_(std::move(callback)), logger_(logger) {}

NeighborSnapshot Monitor::capture(const CancellationToken& cancel){
    try {
        if(!target_.prefix().empty()) return sweeper_.sweep(target_.prefix());
        // No subnet to sweep; passive strategies still get the table as-is.
        if(strategy_->uses_snapshot()) return neighbors_.snapshot();
    } catch(const NeighborTableError& ex) {
        // A query killed by shutdown is not worth reporting.
        if(!cancel.cancelled()) logger_.error(std::string("neighbor table unavailable this tick: ") + ex.what());
    }
    return NeighborSnapshot{};
}

bool Monitor::should_fire(bool present) const {
    if(!callback_) return false;
    if(!options_.change_only) return true;
    if(present) return state_ != PresenceState::Present;
    if(state_ == PresenceState::Present) return true;
    return state_ == PresenceState::Unknown && options_.notify_initial_absent;
}

bool Monitor::tick(const CancellationToken& cancel){
    NeighborSnapshot snapshot = capture(cancel);
    if(cancel.cancelled()) return false;

    bool present = strategy_->evaluate(snapshot);
    if(cancel.cancelled()) return false;

    ++ticks_;
    PresenceEvent ev;
    ev.previous = state_;
    ev.tick = ticks_;
    ev.timestamp = std::chrono::system_clock::now();
    if(present){
        logger_.info(target_.fullname() + " is on the network");
        ev.state = PresenceState::Present;
        ev.ip = target_.ip(); ev.mac = target_.mac(); ev.hostname = target_.hostname();
    } else {
        logger_.info((target_.ip() ? *target_.ip() : target_.fullname()) + " is not on the network");
        ev.state = PresenceState::Absent;
    }
    bool fire = should_fire(present);
    state_ = ev.state;
    if(fire) callback_(ev);
    return true;
}

void Monitor::run(CancellationToken& cancel){
    logger_.debug("monitor started: strategy=" + strategy_->name() + " target=" + target_.fullname());
    while(!cancel.cancelled()){
        if(!tick(cancel)) break;
        if(options_.max_ticks && ticks_ >= options_.max_ticks) break;
        if(cancel.wait_for(options_.interval)) break;
    }
    logger_.debug("monitor stopped after " + std::to_string(ticks_) + " ticks");
}

}
