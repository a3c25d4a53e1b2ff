#pragma once
#include <string>
#include <memory>
#include <optional>

namespace sb_modsign {

struct RunContext; // fwd

// One strategy for discovering the installed driver version.
class VersionProbe {
public:
    virtual ~VersionProbe() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    // nullopt (or an empty string) means "no answer, try the next probe".
    virtual std::optional<std::string> probe(RunContext& context) = 0;
};

using VersionProbePtr = std::unique_ptr<VersionProbe>;

extern const char* const UNKNOWN_VERSION; // "unknown"

}
