#pragma once
#include "../core/VersionProbe.h"

namespace sb_modsign {

// Candidate version of the driver package from `apt-cache policy`.
class AptPolicyProbe : public VersionProbe {
public:
    std::string name() const override { return "apt-policy"; }
    std::string description() const override { return "Candidate version in the package index"; }
    std::optional<std::string> probe(RunContext& context) override;

    // "Candidate: 535.183.01-1" -> "535.183.01"; empty for "(none)" or no line.
    static std::string parse_candidate(const std::string& policy_output);
};

// Fallback used once the default chain has come up empty: the highest
// <package>-<N> name listed by `apt-cache search <package>`.
class AptSearchProbe : public VersionProbe {
public:
    std::string name() const override { return "apt-search"; }
    std::string description() const override { return "Highest versioned driver package available"; }
    std::optional<std::string> probe(RunContext& context) override;

    static std::string parse_search(const std::string& search_output, const std::string& package);
};

}
