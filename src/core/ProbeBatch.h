#pragma once
#include "Prober.h"
#include <string>
#include <vector>

namespace hostwatch {

class CancellationToken;
class Logger;

// prefix+"1" .. prefix+"254"; nothing for an empty prefix.
std::vector<std::string> host_addresses(const std::string& prefix);

// Bounded task group: runs one probe per address with at most
// max_concurrency in flight and returns only after every worker joined.
// Results are in address order. Probe failures stay in their slot.
class ProbeBatch {
public:
    static constexpr size_t DEFAULT_CONCURRENCY = 254;

    ProbeBatch(Prober& prober, size_t max_concurrency, Logger& logger, const CancellationToken* cancel = nullptr);

    std::vector<ProbeResult> run(const std::vector<std::string>& addresses, bool resolve_name);

    size_t max_concurrency() const { return max_concurrency_; }
private:
    Prober& prober_;
    size_t max_concurrency_;
    Logger& logger_;
    const CancellationToken* cancel_;
};

}
