#include "HostnamePresence.h"
#include "../core/NeighborTable.h"
#include "../core/ProbeBatch.h"

namespace hostwatch {

HostnamePresence::HostnamePresence(std::optional<std::string> hostname, std::string prefix, ProbeBatch& batch)
    : hostname_(std::move(hostname)), prefix_(std::move(prefix)), batch_(batch) {}

bool HostnamePresence::evaluate(const NeighborSnapshot&){
    if(!hostname_ || prefix_.empty()) return false;
    // Full barrier: every probe finishes before any output is inspected.
    auto results = batch_.run(host_addresses(prefix_), true);
    // ping may report the resolved name on stderr, so failures count too.
    for(const auto& r : results){
        const std::string& text = r.ok() ? r.output() : r.error();
        if(text.find(*hostname_) != std::string::npos) return true;
    }
    return false;
}

}
