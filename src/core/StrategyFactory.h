#pragma once
#include "PresenceStrategy.h"
#include <optional>
#include <string>
#include <vector>

namespace hostwatch {

class Target;
class ProbeBatch;

enum class StrategyKind { Ip, Mac, Hostname };

std::optional<StrategyKind> parse_strategy_kind(const std::string& name);
const char* strategy_kind_name(StrategyKind k);
std::vector<std::string> strategy_names();

// The strategy copies the target field it needs. batch must outlive the
// returned strategy (HostnamePresence probes through it).
PresenceStrategyPtr make_strategy(StrategyKind kind, const Target& target, ProbeBatch& batch);

}
