#pragma once
#include <string>
#include <vector>
#include <optional>

namespace sb_modsign {

struct RunContext;
struct Config;

// Finds the kernel's scripts/sign-file for the target kernel.
class ToolResolver {
public:
    explicit ToolResolver(RunContext& ctx) : ctx_(ctx) {}
    static std::vector<std::string> candidates(const Config& cfg);
    // First existing candidate, without any recovery.
    static std::optional<std::string> find_existing(const Config& cfg);
    // find_existing, else reinstall the headers package and re-check the
    // headers location once.
    std::optional<std::string> resolve();
private:
    RunContext& ctx_;
};

}
