#pragma once
#include "../core/VersionProbe.h"

namespace sb_modsign {

// Greatest version directory under <dkms_root>/<driver>/.
class DkmsTreeProbe : public VersionProbe {
public:
    std::string name() const override { return "dkms"; }
    std::string description() const override { return "Newest driver version registered with DKMS"; }
    std::optional<std::string> probe(RunContext& context) override;
};

}
