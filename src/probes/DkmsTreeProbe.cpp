#include "DkmsTreeProbe.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"

namespace sb_modsign {

std::optional<std::string> DkmsTreeProbe::probe(RunContext& context){
    std::string dir = context.config.dkms_driver_dir();
    if(!utils::is_directory(dir)) return std::nullopt;
    std::string v = utils::greatest_version_subdir(dir);
    if(v.empty()) return std::nullopt;
    return v;
}

}
