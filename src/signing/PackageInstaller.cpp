#include "PackageInstaller.h"
#include "../core/RunContext.h"
#include "../core/Logging.h"

namespace sb_modsign {

const std::vector<std::string>& PackageInstaller::required_packages(){
    static const std::vector<std::string> pkgs = {"openssl", "mokutil", "kmod", "sbsigntool", "zstd", "xz-utils"};
    return pkgs;
}

bool PackageInstaller::install(){
    auto& console = ctx_.console;
    auto& runner = ctx_.runner;
    if(!runner.available("apt-get")){
        console.warning("apt-get not found; assuming required tools are installed");
        return false;
    }
    auto apt = [](std::vector<std::string> args){
        Command c; c.argv = {"apt-get"};
        c.argv.insert(c.argv.end(), args.begin(), args.end());
        c.env["DEBIAN_FRONTEND"] = "noninteractive";
        return c;
    };

    auto upd = runner.run(apt({"update", "-qq"}));
    if(!upd.ok()) Logger::instance().debug("apt-get update exited with " + std::to_string(upd.exit_code));

    std::vector<std::string> args = {"install", "-y"};
    args.insert(args.end(), required_packages().begin(), required_packages().end());
    bool ok = runner.run(apt(args)).ok();
    if(!ok) console.warning("Some required packages could not be installed");

    if(!runner.run(apt({"install", "-y", "linux-headers-" + ctx_.config.kernel_version})).ok())
        console.warning("Could not install linux-headers, will try to find sign-file from existing sources");
    if(ok) console.success("Required packages installed");
    return ok;
}

}
