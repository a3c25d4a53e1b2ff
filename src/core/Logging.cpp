#include "Logging.h"
#include <iostream>
#include <algorithm>

namespace sb_modsign {

Logger& Logger::instance(){ static Logger inst; return inst; }

void Logger::set_stream(std::ostream* os){
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = os;
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl){
        case LogLevel::Error: return "[error] ";
        case LogLevel::Warn: return "[warn] ";
        case LogLevel::Info: return "[info] ";
        case LogLevel::Debug: return "[debug] ";
        case LogLevel::Trace: return "[trace] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level())) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& os = out_ ? *out_ : std::cerr;
    os << prefix(lvl) << msg << '\n';
}

bool parse_log_level(const std::string& s, LogLevel& out){
    std::string v=s; std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if(v=="error") { out = LogLevel::Error; return true; }
    if(v=="warn" || v=="warning") { out = LogLevel::Warn; return true; }
    if(v=="info") { out = LogLevel::Info; return true; }
    if(v=="debug") { out = LogLevel::Debug; return true; }
    if(v=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
