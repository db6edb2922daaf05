#include "StrategyFactory.h"
#include "Target.h"
#include "../strategies/IpPresence.h"
#include "../strategies/MacPresence.h"
#include "../strategies/HostnamePresence.h"

namespace hostwatch {

std::optional<StrategyKind> parse_strategy_kind(const std::string& name){
    if(name=="ip") return StrategyKind::Ip;
    if(name=="mac") return StrategyKind::Mac;
    if(name=="hostname") return StrategyKind::Hostname;
    return std::nullopt;
}

const char* strategy_kind_name(StrategyKind k){
    switch(k){
        case StrategyKind::Ip: return "ip";
        case StrategyKind::Mac: return "mac";
        case StrategyKind::Hostname: return "hostname";
    }
    return "ip";
}

std::vector<std::string> strategy_names(){ return {"ip", "mac", "hostname"}; }

PresenceStrategyPtr make_strategy(StrategyKind kind, const Target& target, ProbeBatch& batch){
    switch(kind){
        case StrategyKind::Ip: return std::make_unique<IpPresence>(target.ip());
        case StrategyKind::Mac: return std::make_unique<MacPresence>(target.mac());
        case StrategyKind::Hostname: return std::make_unique<HostnamePresence>(target.hostname(), target.prefix(), batch);
    }
    return nullptr;
}

}
