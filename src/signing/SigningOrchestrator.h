#pragma once
#include "ModuleLocator.h"
#include "../core/Process.h"
#include <string>
#include <vector>

namespace sb_modsign {

struct RunContext;
class Console;

enum class SignStatus { Signed, Failed, Skipped };
const char* to_string(SignStatus s);

struct SigningOutcome {
    ModulePath module;
    SignStatus status = SignStatus::Skipped;
    std::string detail;
    bool restored = true; // compressed original rewritten (trivially true if uncompressed); false implies Failed
};

struct SigningSummary {
    std::vector<SigningOutcome> outcomes;
    size_t count(SignStatus s) const;
    size_t total() const { return outcomes.size(); }
    bool all_signed() const { return count(SignStatus::Signed) == total(); }
};

// Holds a compressed module in uncompressed form for the duration of a
// signing step. The destructor recompresses to the original path with the
// original codec and removes the intermediate file if restore() was not
// called, so every exit path leaves the module in its original form.
class ModuleWorkspace {
public:
    ModuleWorkspace(const ModulePath& module, CommandRunner& runner);
    ~ModuleWorkspace();
    ModuleWorkspace(const ModuleWorkspace&) = delete;
    ModuleWorkspace& operator=(const ModuleWorkspace&) = delete;

    bool ready() const { return ready_; }
    bool compressed() const { return module_.codec != Codec::None; }
    const std::string& target() const { return target_; } // file to hand to sign-file
    bool restore();
private:
    ModulePath module_;
    CommandRunner& runner_;
    std::string target_;
    bool ready_ = false;
    bool owed_ = false;
};

class SigningOrchestrator {
public:
    SigningOrchestrator(RunContext& ctx, std::string sign_file) : ctx_(ctx), sign_file_(std::move(sign_file)) {}
    SigningOutcome sign_one(const ModulePath& module);
    SigningSummary sign_all(const ModuleSet& modules);
    // `sign-file sha256 <priv> <der> <file>`
    Command sign_command(const std::string& file) const;
private:
    RunContext& ctx_;
    std::string sign_file_;
};

void print_signing_summary(Console& console, const SigningSummary& summary);

}
