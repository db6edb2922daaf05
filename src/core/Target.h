#pragma once
#include <string>
#include <optional>

namespace hostwatch {

// Lower-case, ':' replaced by '-'. Idempotent.
std::string normalize_mac(const std::string& mac);

// Six hex pairs separated by ':' or '-' (mixed allowed, case-insensitive).
bool is_valid_mac(const std::string& mac);

// "a.b.c.d" -> "a.b.c." when the first three parts are decimal octets; the
// last part is not inspected ("192.168.0.x" is fine). Empty otherwise.
std::string subnet_prefix(const std::string& ip);

// Identity of the watched host. Empty strings count as absent. The MAC is
// normalized here and nowhere else.
class Target {
public:
    Target() = default;
    Target(std::optional<std::string> ip, std::optional<std::string> mac, std::optional<std::string> hostname);

    const std::optional<std::string>& ip() const { return ip_; }
    const std::optional<std::string>& mac() const { return mac_; }
    const std::optional<std::string>& hostname() const { return hostname_; }

    // Empty when the IP is absent or malformed: the subnet cannot be swept.
    const std::string& prefix() const { return prefix_; }

    bool empty() const { return !ip_ && !mac_ && !hostname_; }

    // ip, mac and hostname joined by tabs ("None" for missing fields).
    std::string fullname() const;
private:
    std::optional<std::string> ip_;
    std::optional<std::string> mac_;
    std::optional<std::string> hostname_;
    std::string prefix_;
};

}
