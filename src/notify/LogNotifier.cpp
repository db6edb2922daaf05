#include "LogNotifier.h"
#include "../core/Logging.h"
#include "../core/Monitor.h"

namespace hostwatch {

void LogNotifier::notify(const PresenceEvent& event){
    auto f = [](const std::optional<std::string>& v){ return v ? *v : std::string("None"); };
    logger_.info("cb: " + f(event.ip) + " " + f(event.mac) + " " + f(event.hostname));
}

}
