#pragma once
#include "../core/Notifier.h"
#include <chrono>
#include <string>

namespace hostwatch {

class CancellationToken;

// "IP: <ip> MAC: <mac> Hostname: <hostname>", "None" for missing fields.
std::string notification_body(const PresenceEvent& event);

// Hands each event to an external sender as
//   <program> <title> <body> [<target>]
// where target names the receiving device or channel. The sender is killed
// when cancel fires.
class CommandNotifier : public Notifier {
public:
    static constexpr const char* TITLE = "Network Callback";

    CommandNotifier(std::string program, std::string target, std::chrono::milliseconds timeout,
                    const CancellationToken* cancel = nullptr);
    std::string name() const override { return "command"; }
    void notify(const PresenceEvent& event) override;
private:
    std::string program_;
    std::string target_;
    std::chrono::milliseconds timeout_;
    const CancellationToken* cancel_;
};

}
