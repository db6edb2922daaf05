#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace hostwatch {

namespace {

bool to_int(const std::string& v, int& out){
    try { size_t pos=0; int n = std::stoi(v, &pos); if(pos!=v.size()) return false; out = n; return true; }
    catch(const std::exception&) { return false; }
}

bool to_u64(const std::string& v, uint64_t& out){
    if(v.empty() || v[0]=='-') return false;
    try { size_t pos=0; unsigned long long n = std::stoull(v, &pos); if(pos!=v.size()) return false; out = n; return true; }
    catch(const std::exception&) { return false; }
}

bool to_double(const std::string& v, double& out){
    try { size_t pos=0; double d = std::stod(v, &pos); if(pos!=v.size()) return false; out = d; return true; }
    catch(const std::exception&) { return false; }
}

}

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--ip", ArgKind::String, "Target IP address (also selects the /24 to sweep)", [](const std::string& v, Config& c){ c.ip = v; return true; }},
        {"--mac", ArgKind::String, "Target hardware address", [](const std::string& v, Config& c){ c.mac = v; return true; }},
        {"--hostname", ArgKind::String, "Target hostname (substring of resolved ping replies)", [](const std::string& v, Config& c){ c.hostname = v; return true; }},
        {"--strategy", ArgKind::String, "Presence check: ip | mac | hostname (default ip)", [](const std::string& v, Config& c){ c.strategy = v; return true; }},
        {"--interval", ArgKind::Double, "Seconds between ticks (default 1)", [](const std::string& v, Config& c){ return to_double(v, c.interval_seconds); }},
        {"--change-only", ArgKind::None, "Notify only when presence changes", [](const std::string&, Config& c){ c.change_only = true; return true; }},
        {"--notify-initial-absent", ArgKind::None, "With --change-only, also notify an initial absence", [](const std::string&, Config& c){ c.notify_initial_absent = true; return true; }},
        {"--max-ticks", ArgKind::Int, "Stop after N ticks (default 0 = run until interrupted)", [](const std::string& v, Config& c){ return to_u64(v, c.max_ticks); }},
        {"--probe-timeout-ms", ArgKind::Int, "Per-probe timeout in ms (default 100)", [](const std::string& v, Config& c){ return to_int(v, c.probe_timeout_ms); }},
        {"--probe-concurrency", ArgKind::Int, "Probes in flight per sweep, 1-254 (default 254)", [](const std::string& v, Config& c){ return to_int(v, c.probe_concurrency); }},
        {"--probe-command", ArgKind::String, "Ping program (default ping)", [](const std::string& v, Config& c){ c.probe_command = v; return true; }},
        {"--neighbor-source", ArgKind::String, "Neighbor table source: ip | arp | proc (default ip)", [](const std::string& v, Config& c){ c.neighbor_source = v; return true; }},
        {"--notify-cmd", ArgKind::String, "Program run per notification: PROG <title> <body> [<target>]", [](const std::string& v, Config& c){ c.notify_command = v; return true; }},
        {"--notify-target", ArgKind::String, "Device or channel passed to --notify-cmd", [](const std::string& v, Config& c){ c.notify_target = v; return true; }},
        {"--notify-timeout-ms", ArgKind::Int, "Timeout for --notify-cmd (default 10000)", [](const std::string& v, Config& c){ return to_int(v, c.notify_timeout_ms); }},
        {"--ndjson", ArgKind::None, "Emit presence events as NDJSON on stdout", [](const std::string&, Config& c){ c.ndjson = true; return true; }},
        {"--output", ArgKind::String, "Append NDJSON presence events to FILE", [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--log-level", ArgKind::String, "error | warn | info | debug | trace (default info)", [](const std::string& v, Config& c){ c.log_level = v; return true; }},
        {"--quiet", ArgKind::None, "Only log errors", [](const std::string&, Config& c){ c.quiet = true; return true; }},
        {"--drop-priv", ArgKind::None, "Drop Linux capabilities at startup", [](const std::string&, Config& c){ c.drop_priv = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag==s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_help(std::ostream& os) const {
    os << "hostwatch options:\n";
    auto line = [&](const std::string& name, const std::string& help){
        os << "  " << name;
        if(name.size() < 28) for(size_t i=name.size(); i<28; ++i) os << ' '; else os << ' ';
        os << help << "\n";
    };
    for(const auto& s : specs_){
        std::string name = s.name;
        switch(s.kind){
            case ArgKind::None: break;
            case ArgKind::String: name += " VALUE"; break;
            case ArgKind::Int: name += " N"; break;
            case ArgKind::Double: name += " SECONDS"; break;
        }
        line(name, s.help);
    }
    line("--version", "Print version & exit");
    line("--help", "Show this help");
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    for(int i=1;i<argc;++i){
        std::string a = argv[i] ? argv[i] : "";
        if(a=="--help"){ print_help(std::cout); return false; }
        if(a=="--version"){
            std::cout << "hostwatch " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
                      << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
                      << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            return false;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1 >= argc || !argv[i+1]){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val, cfg)){
            std::cerr << "Invalid value for " << a << ": " << val << "\n";
            exit_code_ = 2;
            return false;
        }
    }
    return true;
}

}
