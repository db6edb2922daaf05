#include "CommandNotifier.h"
#include "../core/Monitor.h"
#include "../core/ProcessRunner.h"
#include <vector>

namespace hostwatch {

std::string notification_body(const PresenceEvent& event){
    auto f = [](const std::optional<std::string>& v){ return v ? *v : std::string("None"); };
    return "IP: " + f(event.ip) + " MAC: " + f(event.mac) + " Hostname: " + f(event.hostname);
}

CommandNotifier::CommandNotifier(std::string program, std::string target, std::chrono::milliseconds timeout,
                                 const CancellationToken* cancel)
    : program_(std::move(program)), target_(std::move(target)), timeout_(timeout), cancel_(cancel) {}

void CommandNotifier::notify(const PresenceEvent& event){
    std::vector<std::string> argv = {program_, TITLE, notification_body(event)};
    if(!target_.empty()) argv.push_back(target_);
    ProcessResult pr = run_process(argv, timeout_, cancel_);
    if(pr.spawn_failed || pr.timed_out || pr.cancelled) throw NotifyError(pr.error);
    if(pr.term_signal) throw NotifyError(program_ + " killed by signal " + std::to_string(pr.term_signal));
    if(pr.exit_code != 0){
        std::string msg = program_ + " exited with " + std::to_string(pr.exit_code);
        if(!pr.err.empty()) msg += ": " + pr.err;
        throw NotifyError(msg);
    }
}

}
