#pragma once
#include "../core/VersionProbe.h"
#include <vector>

namespace sb_modsign {

// "NVIDIA ... Driver" banner line in the X server log.
class XorgLogProbe : public VersionProbe {
public:
    std::string name() const override { return "xorg-log"; }
    std::string description() const override { return "Driver banner in the X server log"; }
    std::optional<std::string> probe(RunContext& context) override;

    static std::string parse_lines(const std::vector<std::string>& lines);
};

}
