#pragma once
#include "../core/Notifier.h"

namespace hostwatch {

class Logger;

class LogNotifier : public Notifier {
public:
    explicit LogNotifier(Logger& logger) : logger_(logger) {}
    std::string name() const override { return "log"; }
    void notify(const PresenceEvent& event) override;
private:
    Logger& logger_;
};

}
