#include "core/ArgumentParser.h"
#include "core/Cancellation.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include "core/Monitor.h"
#include "core/NeighborTable.h"
#include "core/NotifierRegistry.h"
#include "core/Privilege.h"
#include "core/ProbeBatch.h"
#include "core/Prober.h"
#include "core/StrategyFactory.h"
#include "core/SubnetSweeper.h"
#include "core/Target.h"
#include <atomic>
#include <cmath>
#include <csignal>
#include <iostream>
#include <optional>

using namespace hostwatch;

static std::atomic<CancellationToken*> g_cancel{nullptr};

static void on_signal(int){
    if(auto* c = g_cancel.load()) c->request_cancel();
}

static void install_signal_handlers(CancellationToken& cancel){
    g_cancel.store(&cancel);
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static std::optional<std::string> opt(const std::string& s){
    if(s.empty()) return std::nullopt;
    return s;
}

int main(int argc, char** argv) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Info);

    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    LogLevel lvl;
    if(parse_log_level(cfg.quiet ? "error" : cfg.log_level, lvl)) logger.set_level(lvl);
    ConfigValidator validator(logger);
    if(!validator.validate(cfg)) return 2;
    set_config(cfg);

    if(cfg.drop_priv && !drop_capabilities()){
        std::cerr << "Failed to drop capabilities\n";
        return 4;
    }

    CancellationToken cancel;
    install_signal_handlers(cancel);

    Target target(opt(cfg.ip), opt(cfg.mac), opt(cfg.hostname));
    PingProber prober(cfg.probe_command, std::chrono::milliseconds(cfg.probe_timeout_ms), &cancel);
    ProbeBatch batch(prober, static_cast<size_t>(cfg.probe_concurrency), logger, &cancel);
    NeighborSourcePtr neighbors = make_neighbor_source(cfg.neighbor_source, &cancel);
    SubnetSweeper sweeper(batch, *neighbors);
    PresenceStrategyPtr strategy = make_strategy(*parse_strategy_kind(cfg.strategy), target, batch);

    NotifierRegistry notifiers(logger, &cancel);
    try {
        notifiers.register_from_config(config());
    } catch(const NotifyError& ex) {
        std::cerr << ex.what() << "\n";
        return 2;
    }

    MonitorOptions opts;
    opts.interval = std::chrono::milliseconds(std::llround(cfg.interval_seconds * 1000.0));
    opts.change_only = cfg.change_only;
    opts.notify_initial_absent = cfg.notify_initial_absent;
    opts.max_ticks = cfg.max_ticks;

    Monitor monitor(target, std::move(strategy), sweeper, *neighbors, opts,
                    [&notifiers](const PresenceEvent& ev){ notifiers.dispatch(ev); }, logger);
    logger.info("watching " + target.fullname() + " (strategy=" + monitor.strategy().name()
             + ", neighbors=" + neighbors->name() + ", subnet=" + (target.prefix().empty() ? std::string("none") : target.prefix() + "0/24") + ")");
    try {
        monitor.run(cancel);
    } catch(const std::exception& ex) {
        logger.error(std::string("monitor loop aborted: ") + ex.what());
        return 1;
    }
    g_cancel.store(nullptr);
    return 0;
}
