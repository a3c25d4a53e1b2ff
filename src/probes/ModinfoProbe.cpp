#include "ModinfoProbe.h"
#include "../core/RunContext.h"
#include "../core/Compression.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <filesystem>
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace sb_modsign {

std::vector<std::string> ModinfoProbe::find_candidates(const std::string& root, const std::vector<std::string>& names){
    std::vector<std::string> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if(ec) return out;
    for(; it != fs::recursive_directory_iterator(); it.increment(ec)){
        if(ec) break;
        std::error_code fec;
        if(!it->is_regular_file(fec)) continue;
        std::string fname = it->path().filename().string();
        for(const auto& n : names){
            std::string ko = n + ".ko";
            if(fname == ko || utils::starts_with(fname, ko + ".")){ out.push_back(it->path().string()); break; }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string ModinfoProbe::parse_version_output(const std::string& out){
    std::istringstream iss(out); std::string line;
    while(std::getline(iss, line)){
        line = utils::trim(line);
        if(utils::starts_with(line, "version:")) line = utils::trim(line.substr(8));
        if(!line.empty()) return line;
    }
    return {};
}

std::optional<std::string> ModinfoProbe::probe(RunContext& context){
    const auto& cfg = context.config;
    auto candidates = find_candidates(cfg.modules_root, cfg.version_probe_modules);
    if(candidates.empty()) return std::nullopt;
    const std::string& module = candidates.front();
    Logger::instance().debug("modinfo probe using " + module);

    Codec codec = CompressionUtils::codec_for_path(module);
    if(codec == Codec::None){
        auto r = context.runner.run({"modinfo", "-F", "version", module});
        if(!r.ok()) return std::nullopt;
        std::string v = parse_version_output(r.output);
        if(v.empty()) return std::nullopt;
        return v;
    }

    utils::ScratchFile scratch(cfg.temp_dir, cfg.driver_name + "_temp", ".ko");
    if(!scratch.valid()) return std::nullopt;
    if(!CompressionUtils::decompress_file(codec, module, scratch.path(), context.runner)){
        Logger::instance().debug("modinfo probe: could not decompress " + module);
        return std::nullopt;
    }
    auto r = context.runner.run({"modinfo", "-F", "version", scratch.path()});
    if(!r.ok()) return std::nullopt;
    std::string v = parse_version_output(r.output);
    if(v.empty()) return std::nullopt;
    return v;
}

}
