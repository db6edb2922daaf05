#include "ProbeBatch.h"
#include "Cancellation.h"
#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <optional>
#include <system_error>
#include <thread>

namespace hostwatch {

std::vector<std::string> host_addresses(const std::string& prefix){
    std::vector<std::string> out;
    if(prefix.empty()) return out;
    out.reserve(254);
    for(int i=1;i<=254;++i) out.push_back(prefix + std::to_string(i));
    return out;
}

ProbeBatch::ProbeBatch(Prober& prober, size_t max_concurrency, Logger& logger, const CancellationToken* cancel)
    : prober_(prober), max_concurrency_(max_concurrency==0 ? 1 : max_concurrency), logger_(logger), cancel_(cancel) {}

std::vector<ProbeResult> ProbeBatch::run(const std::vector<std::string>& addresses, bool resolve_name){
    // Each worker writes only the slots it claimed through next.
    std::vector<std::optional<ProbeResult>> slots(addresses.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> failures{0};

    auto worker = [&](){
        while(true){
            if(cancel_ && cancel_->cancelled()) return;
            size_t i = next.fetch_add(1);
            if(i >= addresses.size()) return;
            try {
                slots[i] = prober_.probe(addresses[i], resolve_name);
            } catch(const std::exception& ex) {
                slots[i] = ProbeResult::failure(ex.what());
            }
            if(!slots[i]->ok()){
                failures.fetch_add(1);
                logger_.debug("probe " + addresses[i] + " failed: " + slots[i]->error());
            }
        }
    };

    size_t n_threads = std::min(max_concurrency_, addresses.size());
    std::vector<std::thread> threads;
    threads.reserve(n_threads);
    for(size_t t=0;t<n_threads;++t){
        try {
            threads.emplace_back(worker);
        } catch(const std::system_error& ex) {
            logger_.warn(std::string("probe batch limited to ") + std::to_string(threads.size()) + " workers: " + ex.what());
            break;
        }
    }
    if(threads.empty() && !addresses.empty()) worker();
    for(auto& th : threads) th.join();

    std::vector<ProbeResult> results;
    results.reserve(addresses.size());
    for(auto& s : slots) results.push_back(s ? std::move(*s) : ProbeResult::failure("cancelled"));
    logger_.trace("probe batch of " + std::to_string(addresses.size()) + " finished, " + std::to_string(failures.load()) + " failed");
    return results;
}

}
