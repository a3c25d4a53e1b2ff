#include "Utils.h"
#include "Logging.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <chrono>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sb_modsign {
namespace utils {

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> lines;
    std::ifstream f(path);
    if(!f.is_open()) return lines;
    std::string line;
    while(std::getline(f, line)) lines.push_back(line);
    return lines;
}

bool read_file(const std::string& path, std::string& out){
    std::ifstream f(path, std::ios::binary);
    if(!f.is_open()) return false;
    std::ostringstream ss; ss << f.rdbuf();
    out = ss.str();
    return true;
}

bool is_regular_file(const std::string& path){
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_directory(const std::string& path){
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split_ws(const std::string& s){
    std::vector<std::string> out; std::istringstream iss(s); std::string tok;
    while(iss >> tok) out.push_back(tok);
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix){
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string basename(const std::string& path){
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

int version_compare(const std::string& a, const std::string& b){
    size_t i = 0, j = 0;
    while(i < a.size() && j < b.size()){
        bool da = std::isdigit(static_cast<unsigned char>(a[i])), db = std::isdigit(static_cast<unsigned char>(b[j]));
        if(da && db){
            // skip leading zeros, then longer run wins, then lexical on equal length
            while(i < a.size() && a[i] == '0') ++i;
            while(j < b.size() && b[j] == '0') ++j;
            size_t si = i, sj = j;
            while(i < a.size() && std::isdigit(static_cast<unsigned char>(a[i]))) ++i;
            while(j < b.size() && std::isdigit(static_cast<unsigned char>(b[j]))) ++j;
            size_t la = i - si, lb = j - sj;
            if(la != lb) return la < lb ? -1 : 1;
            int c = a.compare(si, la, b, sj, lb);
            if(c != 0) return c < 0 ? -1 : 1;
        } else if(da != db){
            // digits sort after non-digits (end of a dotted component)
            return da ? 1 : -1;
        } else {
            if(a[i] != b[j]) return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j]) ? -1 : 1;
            ++i; ++j;
        }
    }
    if(i < a.size()) return 1;
    if(j < b.size()) return -1;
    return 0;
}

bool version_less(const std::string& a, const std::string& b){ return version_compare(a, b) < 0; }

std::vector<std::string> list_subdirectories(const std::string& dir){
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if(ec) return out;
    for(; it != fs::directory_iterator(); it.increment(ec)){
        if(ec) break;
        std::error_code sec;
        if(it->is_directory(sec)) out.push_back(it->path().filename().string());
    }
    return out;
}

std::string greatest_version_subdir(const std::string& dir){
    std::vector<std::string> names;
    for(auto& n : list_subdirectories(dir)){
        // DKMS also keeps kernel-<kver>-<arch> symlinks and a source link here
        if(!n.empty() && std::isdigit(static_cast<unsigned char>(n[0]))) names.push_back(std::move(n));
    }
    if(names.empty()) return {};
    return *std::max_element(names.begin(), names.end(), version_less);
}

ScratchFile::ScratchFile(const std::string& dir, const std::string& stem, const std::string& ext){
    static std::atomic<unsigned> seq{0};
    std::string tmpl = dir + "/" + stem + "_XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if(!mkdtemp(buf.data())){
        Logger::instance().warn("could not create scratch directory under " + dir + ": " + strerror(errno));
        return;
    }
    dir_ = buf.data();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    path_ = dir_ + "/" + stem + "_" + std::to_string(secs) + "_" + std::to_string(getpid()) + "_" + std::to_string(seq++) + ext;
}

ScratchFile::~ScratchFile(){
    if(dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if(ec) Logger::instance().warn("could not remove scratch directory " + dir_ + ": " + ec.message());
    else Logger::instance().trace("removed scratch directory " + dir_);
}

}
}
