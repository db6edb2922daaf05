#include "EventStreamNotifier.h"
#include "../core/JsonUtil.h"
#include "../core/Monitor.h"
#include <sstream>

namespace hostwatch {

std::string format_event_json(const PresenceEvent& event){
    using jsonutil::quote_or_null;
    std::ostringstream os;
    os << '{'
       << "\"ts\":\"" << jsonutil::time_to_iso(event.timestamp) << "\","
       << "\"tick\":" << event.tick << ','
       << "\"state\":\"" << presence_state_name(event.state) << "\","
       << "\"previous\":\"" << presence_state_name(event.previous) << "\","
       << "\"ip\":" << quote_or_null(event.ip) << ','
       << "\"mac\":" << quote_or_null(event.mac) << ','
       << "\"hostname\":" << quote_or_null(event.hostname)
       << '}';
    return os.str();
}

EventStreamNotifier::EventStreamNotifier(const std::string& path)
    : file_(path, std::ios::out | std::ios::app), out_(&file_) {
    if(!file_.is_open()) throw NotifyError("cannot open event output " + path);
}

void EventStreamNotifier::notify(const PresenceEvent& event){
    (*out_) << format_event_json(event) << '\n';
    out_->flush();
    if(!(*out_)) throw NotifyError("event stream write failed");
}

}
