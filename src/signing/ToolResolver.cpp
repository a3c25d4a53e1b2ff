#include "ToolResolver.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"
#include "../core/Logging.h"

namespace sb_modsign {

std::vector<std::string> ToolResolver::candidates(const Config& cfg){
    return {
        cfg.headers_root + "/linux-headers-" + cfg.kernel_version + "/scripts/sign-file",
        cfg.kernel_modules_dir() + "/build/scripts/sign-file",
        cfg.kernel_modules_dir() + "/source/scripts/sign-file",
    };
}

std::optional<std::string> ToolResolver::find_existing(const Config& cfg){
    for(const auto& c : candidates(cfg)){
        if(utils::is_regular_file(c)) return c;
        Logger::instance().trace("sign-file not at " + c);
    }
    return std::nullopt;
}

std::optional<std::string> ToolResolver::resolve(){
    if(auto found = find_existing(ctx_.config)) return found;

    auto& console = ctx_.console;
    console.error("Could not find sign-file script");
    console.error("Trying to reinstall linux-headers...");
    Command cmd{"apt-get", "install", "--reinstall", "-y", "linux-headers-" + ctx_.config.kernel_version};
    cmd.env["DEBIAN_FRONTEND"] = "noninteractive";
    auto r = ctx_.runner.run(cmd);
    if(!r.ok()) Logger::instance().warn("headers reinstall exited with " + std::to_string(r.exit_code));

    std::string primary = candidates(ctx_.config).front();
    if(utils::is_regular_file(primary)) return primary;
    return std::nullopt;
}

}
