#include "ProbeChain.h"
#include "RunContext.h"
#include "Logging.h"
#include "../probes/DkmsTreeProbe.h"
#include "../probes/ModinfoProbe.h"
#include "../probes/AptPolicyProbe.h"
#include "../probes/XorgLogProbe.h"

namespace sb_modsign {

const char* const UNKNOWN_VERSION = "unknown";

void ProbeChain::register_probe(VersionProbePtr probe) {
    probes_.push_back(std::move(probe));
}

void ProbeChain::register_all_default() {
    register_probe(std::make_unique<DkmsTreeProbe>());
    register_probe(std::make_unique<ModinfoProbe>());
    register_probe(std::make_unique<AptPolicyProbe>());
    register_probe(std::make_unique<XorgLogProbe>());
}

std::string ProbeChain::run_first(RunContext& context) {
    last_source_.clear();
    for(auto& p : probes_) {
        Logger::instance().debug("Trying version probe: " + p->name());
        std::optional<std::string> v;
        try {
            v = p->probe(context);
        } catch(const std::exception& ex) {
            Logger::instance().warn("version probe " + p->name() + " failed: " + ex.what());
            continue;
        }
        if(v && !v->empty()) {
            Logger::instance().debug("Version " + *v + " from probe " + p->name());
            last_source_ = p->name();
            return *v;
        }
    }
    return UNKNOWN_VERSION;
}

}
