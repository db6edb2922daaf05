#include "JsonUtil.h"
#include <ctime>
#include <cstdio>

namespace hostwatch {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size()+8);
    for(unsigned char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if(c < 0x20){ char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04x", c); out += buf; }
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    if(tp.time_since_epoch().count()==0) return "";
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if(!gmtime_r(&t, &tm)) return "";
    char buf[32];
    if(std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm)==0) return "";
    return buf;
}

std::string quote_or_null(const std::optional<std::string>& v){
    if(!v) return "null";
    return "\"" + escape(*v) + "\"";
}

}
}
