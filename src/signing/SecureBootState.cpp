#include "SecureBootState.h"
#include "../core/RunContext.h"

namespace sb_modsign {

SecureBootMode query_secure_boot(RunContext& ctx){
    auto r = ctx.runner.run({"mokutil", "--sb-state"});
    if(!r.started) return SecureBootMode::Unknown;
    if(r.output.find("SecureBoot enabled") != std::string::npos) return SecureBootMode::Enabled;
    if(r.output.find("SecureBoot disabled") != std::string::npos) return SecureBootMode::Disabled;
    return SecureBootMode::Unknown;
}

void report_secure_boot(RunContext& ctx){
    auto& console = ctx.console;
    if(query_secure_boot(ctx) == SecureBootMode::Enabled){
        console.warning("Secure Boot is currently ENABLED");
        console.warning("Note: On some systems, Secure Boot can be enabled for signing process");
        console.warning("The script will attempt to sign modules anyway");
    } else {
        console.success("Secure Boot is currently disabled (recommended for signing process)");
    }
}

}
