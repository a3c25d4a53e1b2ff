#pragma once
#include <string>
#include <vector>

namespace sb_modsign {

struct RunContext;

// apt-get installation of the tools the run shells out to.
class PackageInstaller {
public:
    explicit PackageInstaller(RunContext& ctx) : ctx_(ctx) {}
    static const std::vector<std::string>& required_packages();
    // Returns false if the tool packages could not be installed; the headers
    // package failing only produces a warning. Never fatal on its own.
    bool install();
private:
    RunContext& ctx_;
};

}
