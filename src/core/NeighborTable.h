#pragma once
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostwatch {

class CancellationToken;

// Raised when the neighbor (ARP) table cannot be read.
class NeighborTableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One capture of the neighbor table. Only resolved entries survive, with
// their hardware address rewritten to normalize_mac() form.
struct NeighborSnapshot {
    std::vector<std::string> lines;
    std::chrono::system_clock::time_point captured_at{};

    bool empty() const { return lines.empty(); }
    // Plain substring search over every line, case-sensitive.
    bool contains(const std::string& needle) const;
    NeighborSnapshot filtered(const std::string& needle) const;
};

// Keeps lines carrying a non-zero hardware address and rewrites that address
// to the canonical lower-case dash form.
std::vector<std::string> canonicalize_neighbor_lines(const std::string& text);

// /proc/net/arp body -> "ip mac dev" lines, skipping incomplete entries.
std::vector<std::string> parse_proc_net_arp(const std::string& text);

class NeighborSource {
public:
    virtual ~NeighborSource() = default;
    virtual std::string name() const = 0;
    virtual NeighborSnapshot snapshot() = 0;
};

using NeighborSourcePtr = std::unique_ptr<NeighborSource>;

// Dumps the table through an external command ("ip neigh show", "arp -an").
class CommandNeighborSource : public NeighborSource {
public:
    CommandNeighborSource(std::string name, std::vector<std::string> argv,
                          std::chrono::milliseconds timeout, const CancellationToken* cancel = nullptr);
    std::string name() const override { return name_; }
    NeighborSnapshot snapshot() override;
private:
    std::string name_;
    std::vector<std::string> argv_;
    std::chrono::milliseconds timeout_;
    const CancellationToken* cancel_;
};

class ProcNeighborSource : public NeighborSource {
public:
    explicit ProcNeighborSource(std::string path = "/proc/net/arp");
    std::string name() const override { return "proc"; }
    NeighborSnapshot snapshot() override;
private:
    std::string path_;
};

// "ip", "arp" or "proc"; nullptr for anything else.
NeighborSourcePtr make_neighbor_source(const std::string& kind, const CancellationToken* cancel = nullptr);

}
