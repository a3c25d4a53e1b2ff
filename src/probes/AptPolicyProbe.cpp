#include "AptPolicyProbe.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace sb_modsign {

std::string AptPolicyProbe::parse_candidate(const std::string& policy_output){
    std::istringstream iss(policy_output); std::string line;
    while(std::getline(iss, line)){
        auto toks = utils::split_ws(line);
        if(toks.size() < 2 || toks[0] != "Candidate:") continue;
        if(toks[1] == "(none)") return {};
        return toks[1].substr(0, toks[1].find('-'));
    }
    return {};
}

std::optional<std::string> AptPolicyProbe::probe(RunContext& context){
    if(!context.runner.available("apt-cache")) return std::nullopt;
    auto r = context.runner.run({"apt-cache", "policy", context.config.driver_package});
    if(!r.ok()) return std::nullopt;
    std::string v = parse_candidate(r.output);
    if(v.empty()) return std::nullopt;
    return v;
}

std::string AptSearchProbe::parse_search(const std::string& search_output, const std::string& package){
    std::string prefix = package + "-";
    std::vector<std::string> versions;
    std::istringstream iss(search_output); std::string line;
    while(std::getline(iss, line)){
        auto toks = utils::split_ws(line);
        if(toks.empty() || !utils::starts_with(toks[0], prefix)) continue;
        std::string rest = toks[0].substr(prefix.size());
        if(rest.empty() || !std::all_of(rest.begin(), rest.end(), [](unsigned char c){ return std::isdigit(c); })) continue;
        versions.push_back(rest);
    }
    if(versions.empty()) return {};
    return *std::max_element(versions.begin(), versions.end(), utils::version_less);
}

std::optional<std::string> AptSearchProbe::probe(RunContext& context){
    if(!context.runner.available("apt-cache")) return std::nullopt;
    auto r = context.runner.run({"apt-cache", "search", context.config.driver_package});
    if(!r.ok()) return std::nullopt;
    std::string v = parse_search(r.output, context.config.driver_package);
    if(v.empty()) return std::nullopt;
    return v;
}

}
