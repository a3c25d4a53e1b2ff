#pragma once
#include "../core/VersionProbe.h"
#include <vector>

namespace sb_modsign {

// Reads the version field of an installed driver module with modinfo,
// decompressing it to a scratch file first when needed.
class ModinfoProbe : public VersionProbe {
public:
    std::string name() const override { return "modinfo"; }
    std::string description() const override { return "Version embedded in an installed driver module"; }
    std::optional<std::string> probe(RunContext& context) override;

    // Sorted candidate files under root named <n>.ko or <n>.ko.* for any n in names.
    static std::vector<std::string> find_candidates(const std::string& root, const std::vector<std::string>& names);
    // First "version" value from `modinfo -F version` output.
    static std::string parse_version_output(const std::string& out);
};

}
