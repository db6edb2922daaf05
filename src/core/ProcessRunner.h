#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace hostwatch {

class CancellationToken;

struct ProcessResult {
    int exit_code = -1;        // valid when the child exited normally
    int term_signal = 0;       // non-zero when killed by a signal
    bool spawn_failed = false; // fork/pipe/exec failure; see error
    bool timed_out = false;
    bool cancelled = false;
    std::string out;
    std::string err;
    std::string error;         // runner-side diagnostic

    bool exited_ok() const { return !spawn_failed && !timed_out && !cancelled && term_signal==0 && exit_code==0 && error.empty(); }
};

// Runs argv[0] (PATH lookup, no shell) with stdout/stderr captured. The child
// is killed once timeout elapses or cancel fires, and is always reaped before
// returning. A zero timeout means no deadline.
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout,
                          const CancellationToken* cancel = nullptr);

}
