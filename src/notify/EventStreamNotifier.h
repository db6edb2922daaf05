#pragma once
#include "../core/Notifier.h"
#include <fstream>
#include <ostream>

namespace hostwatch {

// Single-line JSON object for one event; missing identity fields are null.
std::string format_event_json(const PresenceEvent& event);

// NDJSON stream of presence events, to a caller-owned stream or an
// append-mode file.
class EventStreamNotifier : public Notifier {
public:
    explicit EventStreamNotifier(std::ostream& out) : out_(&out) {}
    explicit EventStreamNotifier(const std::string& path);
    std::string name() const override { return "ndjson"; }
    void notify(const PresenceEvent& event) override;
private:
    std::ofstream file_;
    std::ostream* out_;
};

}
