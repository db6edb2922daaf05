#include "Target.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace hostwatch {

namespace {

std::optional<std::string> non_empty(std::optional<std::string> v){
    if(v && v->empty()) return std::nullopt;
    return v;
}

bool is_octet(const std::string& s){
    if(s.empty() || s.size() > 3) return false;
    for(char c : s) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    return std::stoi(s) <= 255;
}

}

std::string normalize_mac(const std::string& mac){
    std::string out = mac;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    std::replace(out.begin(), out.end(), ':', '-');
    return out;
}

bool is_valid_mac(const std::string& mac){
    if(mac.size() != 17) return false;
    for(size_t i=0;i<mac.size();++i){
        char c = mac[i];
        if(i % 3 == 2){ if(c!=':' && c!='-') return false; }
        else if(!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string subnet_prefix(const std::string& ip){
    std::vector<std::string> parts; std::string cur;
    for(char c : ip){ if(c=='.'){ parts.push_back(cur); cur.clear(); } else cur.push_back(c); }
    parts.push_back(cur);
    if(parts.size() != 4) return "";
    for(size_t i=0;i<3;++i) if(!is_octet(parts[i])) return "";
    return parts[0] + "." + parts[1] + "." + parts[2] + ".";
}

Target::Target(std::optional<std::string> ip, std::optional<std::string> mac, std::optional<std::string> hostname)
    : ip_(non_empty(std::move(ip))), mac_(non_empty(std::move(mac))), hostname_(non_empty(std::move(hostname))) {
    if(mac_) mac_ = normalize_mac(*mac_);
    if(ip_) prefix_ = subnet_prefix(*ip_);
}

std::string Target::fullname() const {
    auto f = [](const std::optional<std::string>& v){ return v ? *v : std::string("None"); };
    return f(ip_) + "\t" + f(mac_) + "\t" + f(hostname_);
}

}
