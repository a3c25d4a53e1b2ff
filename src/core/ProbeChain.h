#pragma once
#include "VersionProbe.h"
#include <vector>

namespace sb_modsign {

// Ordered probes; the first non-empty answer wins.
class ProbeChain {
public:
    void register_probe(VersionProbePtr probe);
    void register_all_default();
    std::string run_first(RunContext& context); // UNKNOWN_VERSION if all fail
    // Name of the probe that produced the last answer (empty if none).
    const std::string& last_source() const { return last_source_; }
    size_t size() const { return probes_.size(); }
private:
    std::vector<VersionProbePtr> probes_;
    std::string last_source_;
};

}
