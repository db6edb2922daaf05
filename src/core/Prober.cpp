#include "Prober.h"
#include "ProcessRunner.h"
#include <vector>

namespace hostwatch {

// ping's own -W only takes whole seconds on older iputils; the runner
// enforces the exact deadline, so -W just has to be at least as long.
static std::string wait_seconds(std::chrono::milliseconds t){
    long long s = (t.count() + 999) / 1000;
    if(s < 1) s = 1;
    return std::to_string(s);
}

PingProber::PingProber(std::string program, std::chrono::milliseconds timeout, const CancellationToken* cancel)
    : program_(std::move(program)), timeout_(timeout), cancel_(cancel) {}

ProbeResult PingProber::probe(const std::string& address, bool resolve_name){
    std::vector<std::string> argv = {program_, "-c", "1", "-W", wait_seconds(timeout_)};
    if(!resolve_name) argv.push_back("-n");
    argv.push_back(address);

    // Small grace on top of the probe timeout for process start and reaping.
    ProcessResult pr = run_process(argv, timeout_ + std::chrono::milliseconds(50), cancel_);
    if(pr.spawn_failed || pr.cancelled) return ProbeResult::failure(pr.error);
    if(pr.timed_out) return ProbeResult::failure(address + ": " + pr.error);
    if(!pr.err.empty()) return ProbeResult::failure(pr.err);
    return ProbeResult::success(std::move(pr.out));
}

}
