#include "Logging.h"
#include "JsonUtil.h"
#include <iostream>
#include <algorithm>
#include <chrono>

namespace hostwatch {

bool parse_log_level(const std::string& s, LogLevel& out){
    std::string v = s; std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if(v=="error") { out = LogLevel::Error; return true; }
    if(v=="warn" || v=="warning") { out = LogLevel::Warn; return true; }
    if(v=="info") { out = LogLevel::Info; return true; }
    if(v=="debug") { out = LogLevel::Debug; return true; }
    if(v=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

const char* log_level_name(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

Logger& Logger::instance(){
    static Logger logger(std::cerr);
    return logger;
}

Logger::Logger(std::ostream& out) : out_(&out) {}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(!enabled(lvl)) return;
    std::string line = jsonutil::time_to_iso(std::chrono::system_clock::now());
    line += " ["; line += log_level_name(lvl); line += "] ";
    line += msg;
    line += '\n';
    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << line;
    out_->flush();
}

}
