#pragma once
#include <string>
#include <chrono>
#include <memory>

namespace hostwatch {

class CancellationToken;

// Outcome of one reachability probe: captured output (possibly empty) or
// failure text, never both. An unreachable host is a successful probe whose
// output says so.
class ProbeResult {
public:
    static ProbeResult success(std::string output){ return ProbeResult(true, std::move(output)); }
    static ProbeResult failure(std::string error){ return ProbeResult(false, std::move(error)); }

    bool ok() const { return ok_; }
    const std::string& output() const { static const std::string none; return ok_ ? text_ : none; }
    const std::string& error() const { static const std::string none; return ok_ ? none : text_; }
private:
    ProbeResult(bool ok, std::string text) : ok_(ok), text_(std::move(text)) {}
    bool ok_;
    std::string text_;
};

class Prober {
public:
    virtual ~Prober() = default;
    virtual ProbeResult probe(const std::string& address, bool resolve_name) = 0;
};

using ProberPtr = std::unique_ptr<Prober>;

// One echo request per call through the system ping utility.
class PingProber : public Prober {
public:
    PingProber(std::string program, std::chrono::milliseconds timeout, const CancellationToken* cancel = nullptr);
    ProbeResult probe(const std::string& address, bool resolve_name) override;

    std::chrono::milliseconds timeout() const { return timeout_; }
private:
    std::string program_;
    std::chrono::milliseconds timeout_;
    const CancellationToken* cancel_;
};

}
