#include "ConfigValidator.h"
#include "Logging.h"
#include "NeighborTable.h"
#include "StrategyFactory.h"
#include "Target.h"
#include <iostream>
#include <cmath>

namespace hostwatch {

// Keeps the millisecond interval far inside the range of the clock types.
static constexpr double MAX_INTERVAL_SECONDS = 86400.0 * 365;

bool ConfigValidator::validate(Config& cfg) {
    // --quiet wins over --log-level (documented behavior)
    if(cfg.quiet) cfg.log_level = "error";
    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)){
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(!parse_strategy_kind(cfg.strategy)){
        std::cerr << "Invalid --strategy value: " << cfg.strategy << " (expected ip, mac or hostname)\n";
        return false;
    }
    if(!make_neighbor_source(cfg.neighbor_source)){
        std::cerr << "Invalid --neighbor-source value: " << cfg.neighbor_source << " (expected ip, arp or proc)\n";
        return false;
    }

    if(!std::isfinite(cfg.interval_seconds) || cfg.interval_seconds < 0){
        std::cerr << "--interval must be a non-negative number of seconds\n";
        return false;
    }
    if(cfg.interval_seconds > MAX_INTERVAL_SECONDS){
        std::cerr << "--interval must be at most one year (31536000 seconds)\n";
        return false;
    }

    if(!validate_target(cfg)) return false;
    if(!validate_probe(cfg)) return false;
    if(!validate_output(cfg)) return false;

    if(cfg.notify_initial_absent && !cfg.change_only){
        logger_.warn("--notify-initial-absent has no effect without --change-only");
    }
    warn_configuration_gaps(cfg);
    return true;
}

bool ConfigValidator::validate_target(const Config& cfg) const {
    if(!cfg.mac.empty() && !is_valid_mac(cfg.mac)){
        std::cerr << "Invalid --mac value: " << cfg.mac << " (expected six hex pairs separated by ':' or '-')\n";
        return false;
    }
    if(!cfg.ip.empty() && subnet_prefix(cfg.ip).empty()){
        std::cerr << "Invalid --ip value: " << cfg.ip << " (expected dotted IPv4 address)\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_probe(const Config& cfg) const {
    if(cfg.probe_timeout_ms <= 0 || cfg.probe_timeout_ms > 60000){
        std::cerr << "--probe-timeout-ms must be between 1 and 60000\n";
        return false;
    }
    if(cfg.probe_concurrency < 1 || cfg.probe_concurrency > 254){
        std::cerr << "--probe-concurrency must be between 1 and 254\n";
        return false;
    }
    if(cfg.probe_command.empty()){
        std::cerr << "--probe-command cannot be empty\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_output(const Config& cfg) const {
    if(!cfg.notify_target.empty() && cfg.notify_command.empty()){
        std::cerr << "--notify-target requires --notify-cmd\n";
        return false;
    }
    if(cfg.notify_timeout_ms <= 0){
        std::cerr << "--notify-timeout-ms must be positive\n";
        return false;
    }
    return true;
}

void ConfigValidator::warn_configuration_gaps(const Config& cfg) const {
    auto kind = parse_strategy_kind(cfg.strategy);
    if(!kind) return;
    if(cfg.ip.empty() && cfg.mac.empty() && cfg.hostname.empty()){
        logger_.warn("no --ip, --mac or --hostname given: target will always be reported absent");
        return;
    }
    switch(*kind){
        case StrategyKind::Ip:
            if(cfg.ip.empty()) logger_.warn("strategy ip without --ip: target will always be reported absent");
            break;
        case StrategyKind::Mac:
            if(cfg.mac.empty()) logger_.warn("strategy mac without --mac: target will always be reported absent");
            if(cfg.ip.empty()) logger_.info("no --ip given: subnet sweep disabled, matching against the neighbor table as-is");
            break;
        case StrategyKind::Hostname:
            if(cfg.hostname.empty()) logger_.warn("strategy hostname without --hostname: target will always be reported absent");
            if(cfg.ip.empty()) logger_.warn("strategy hostname needs --ip to pick the subnet: target will always be reported absent");
            break;
    }
}

}
