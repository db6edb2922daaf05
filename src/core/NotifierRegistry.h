#pragma once
#include "Notifier.h"
#include <vector>

namespace hostwatch {

class CancellationToken;
class Logger;
struct Config;

class NotifierRegistry {
public:
    // cancel is handed to notifiers that run external programs.
    explicit NotifierRegistry(Logger& logger, const CancellationToken* cancel = nullptr)
        : logger_(logger), cancel_(cancel) {}

    void register_notifier(NotifierPtr notifier);
    // Log sink always; command and event-stream sinks when configured.
    void register_from_config(const Config& cfg);

    // Delivers to every notifier. A failing notifier is logged and skipped;
    // nothing is retried.
    void dispatch(const PresenceEvent& event);

    size_t size() const { return notifiers_.size(); }
private:
    Logger& logger_;
    const CancellationToken* cancel_;
    std::vector<NotifierPtr> notifiers_;
};

}
