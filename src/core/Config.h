#pragma once
#include <string>
#include <cstdint>

namespace hostwatch {

struct Config {
    // Target identity (any subset)
    std::string ip;
    std::string mac;
    std::string hostname;
    std::string strategy = "ip"; // ip | mac | hostname
    // Polling
    double interval_seconds = 1.0;
    bool change_only = false; // default fires the callback on every tick
    bool notify_initial_absent = false; // with change_only: Unknown -> Absent also fires
    uint64_t max_ticks = 0; // 0 = run until interrupted
    // Probing
    int probe_timeout_ms = 100;
    int probe_concurrency = 254; // probes in flight per sweep (1..254)
    std::string probe_command = "ping";
    std::string neighbor_source = "ip"; // ip | arp | proc
    // Notification
    std::string notify_command; // program invoked as: cmd <title> <body> [<target>]
    std::string notify_target; // device / channel passed as last argument
    int notify_timeout_ms = 10000;
    bool ndjson = false; // event stream on stdout
    std::string output_file; // event stream appended to FILE (wins over --ndjson)
    // Process
    std::string log_level = "info";
    bool quiet = false;
    bool drop_priv = false;
};

Config& config();
void set_config(const Config& c);

}
