#include "NotifierRegistry.h"
#include "Config.h"
#include "Logging.h"
#include "../notify/LogNotifier.h"
#include "../notify/CommandNotifier.h"
#include "../notify/EventStreamNotifier.h"
#include <iostream>

namespace hostwatch {

void NotifierRegistry::register_notifier(NotifierPtr notifier){
    notifiers_.push_back(std::move(notifier));
}

void NotifierRegistry::register_from_config(const Config& cfg){
    register_notifier(std::make_unique<LogNotifier>(logger_));
    if(!cfg.notify_command.empty()){
        register_notifier(std::make_unique<CommandNotifier>(cfg.notify_command, cfg.notify_target,
                                                            std::chrono::milliseconds(cfg.notify_timeout_ms), cancel_));
    }
    if(!cfg.output_file.empty()){
        register_notifier(std::make_unique<EventStreamNotifier>(cfg.output_file));
    } else if(cfg.ndjson){
        register_notifier(std::make_unique<EventStreamNotifier>(std::cout));
    }
}

void NotifierRegistry::dispatch(const PresenceEvent& event){
    for(auto& n : notifiers_){
        try {
            n->notify(event);
        } catch(const std::exception& ex) {
            logger_.warn("notifier " + n->name() + " failed: " + ex.what());
        }
    }
}

}
