#include "NeighborTable.h"
#include "ProcessRunner.h"
#include "Target.h"
#include <fstream>
#include <regex>
#include <sstream>

namespace hostwatch {

namespace {

const std::regex& hw_addr_re(){
    static const std::regex re("([0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}");
    return re;
}

bool is_zero_mac(const std::string& canon){ return canon == "00-00-00-00-00-00"; }

}

bool NeighborSnapshot::contains(const std::string& needle) const {
    for(const auto& l : lines) if(l.find(needle) != std::string::npos) return true;
    return false;
}

NeighborSnapshot NeighborSnapshot::filtered(const std::string& needle) const {
    NeighborSnapshot out; out.captured_at = captured_at;
    for(const auto& l : lines) if(l.find(needle) != std::string::npos) out.lines.push_back(l);
    return out;
}

std::vector<std::string> canonicalize_neighbor_lines(const std::string& text){
    std::vector<std::string> out;
    std::istringstream iss(text); std::string line;
    while(std::getline(iss, line)){
        if(!line.empty() && line.back()=='\r') line.pop_back();
        std::smatch m;
        if(!std::regex_search(line, m, hw_addr_re())) continue; // incomplete / failed entry
        std::string canon = normalize_mac(m.str(0));
        if(is_zero_mac(canon)) continue;
        out.push_back(line.substr(0, m.position(0)) + canon + line.substr(m.position(0) + m.length(0)));
    }
    return out;
}

std::vector<std::string> parse_proc_net_arp(const std::string& text){
    std::vector<std::string> out;
    std::istringstream iss(text); std::string line;
    std::getline(iss, line); // header
    while(std::getline(iss, line)){
        std::istringstream ls(line);
        std::string ip, hw_type, flags, mac, mask, dev;
        if(!(ls >> ip >> hw_type >> flags >> mac >> mask >> dev)) continue;
        if(flags == "0x0") continue; // ATF_COM unset: never resolved
        std::string canon = normalize_mac(mac);
        if(is_zero_mac(canon)) continue;
        out.push_back(ip + " " + canon + " " + dev);
    }
    return out;
}

CommandNeighborSource::CommandNeighborSource(std::string name, std::vector<std::string> argv,
                                             std::chrono::milliseconds timeout, const CancellationToken* cancel)
    : name_(std::move(name)), argv_(std::move(argv)), timeout_(timeout), cancel_(cancel) {}

NeighborSnapshot CommandNeighborSource::snapshot(){
    ProcessResult pr = run_process(argv_, timeout_, cancel_);
    if(pr.spawn_failed || pr.timed_out || pr.cancelled)
        throw NeighborTableError(name_ + " neighbor query failed: " + pr.error);
    if(pr.exit_code != 0 || pr.term_signal != 0){
        std::string detail = pr.err.empty() ? ("exit " + std::to_string(pr.exit_code)) : pr.err;
        throw NeighborTableError(name_ + " neighbor query failed: " + detail);
    }
    NeighborSnapshot s;
    s.captured_at = std::chrono::system_clock::now();
    s.lines = canonicalize_neighbor_lines(pr.out);
    return s;
}

ProcNeighborSource::ProcNeighborSource(std::string path) : path_(std::move(path)) {}

NeighborSnapshot ProcNeighborSource::snapshot(){
    std::ifstream f(path_);
    if(!f.is_open()) throw NeighborTableError("cannot read " + path_);
    std::stringstream buf; buf << f.rdbuf();
    NeighborSnapshot s;
    s.captured_at = std::chrono::system_clock::now();
    s.lines = parse_proc_net_arp(buf.str());
    return s;
}

NeighborSourcePtr make_neighbor_source(const std::string& kind, const CancellationToken* cancel){
    const auto timeout = std::chrono::milliseconds(5000);
    if(kind == "ip") return std::make_unique<CommandNeighborSource>("ip", std::vector<std::string>{"ip", "neigh", "show"}, timeout, cancel);
    if(kind == "arp") return std::make_unique<CommandNeighborSource>("arp", std::vector<std::string>{"arp", "-an"}, timeout, cancel);
    if(kind == "proc") return std::make_unique<ProcNeighborSource>();
    return nullptr;
}

}
