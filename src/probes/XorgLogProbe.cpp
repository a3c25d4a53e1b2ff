#include "XorgLogProbe.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"
#include <regex>

namespace sb_modsign {

std::string XorgLogProbe::parse_lines(const std::vector<std::string>& lines){
    static const std::regex banner("NVIDIA.*Driver");
    static const std::regex version("[0-9]+\\.[0-9]+(\\.[0-9]+)*");
    for(const auto& l : lines){
        std::smatch b;
        if(!std::regex_search(l, b, banner)) continue;
        // Xorg prefixes lines with a "[  20.123]" timestamp; only look past the banner
        std::string rest = b.suffix().str();
        std::smatch m;
        if(std::regex_search(rest, m, version)) return m.str(0);
    }
    return {};
}

std::optional<std::string> XorgLogProbe::probe(RunContext& context){
    const auto& path = context.config.xorg_log;
    if(!utils::is_regular_file(path)) return std::nullopt;
    std::string v = parse_lines(utils::read_lines(path));
    if(v.empty()) return std::nullopt;
    return v;
}

}
