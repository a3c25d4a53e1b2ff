#pragma once
#include "../core/ProbeChain.h"
#include "SigningOrchestrator.h"
#include "PersistenceConfigurer.h"
#include "EnrollmentRequester.h"
#include <string>

namespace sb_modsign {

struct RunContext;

// Exit codes returned by Workflow::run / Workflow::resign.
enum ExitCode { EXIT_OK = 0, EXIT_FATAL = 1, EXIT_USAGE = 2 };

// The single sequential pass: packages, Secure Boot state, version, modules,
// keys, sign-file, signing, DKMS, enrollment, re-sign helper.
class Workflow {
public:
    explicit Workflow(RunContext& ctx);
    int run();
    // Reduced pass for the re-sign helper: fixed keys, glob module search.
    int resign();

    std::string detect_version();
    ProbeChain& probes() { return probes_; }
    void set_self_executable(std::string path) { self_exe_ = std::move(path); }

    const std::string& driver_version() const { return version_; }
    const SigningSummary& summary() const { return summary_; }
private:
    int finish_exit_code() const;
    void print_final_summary(size_t module_count);

    RunContext& ctx_;
    ProbeChain probes_;
    std::string self_exe_;
    std::string version_;
    SigningSummary summary_;
    PersistenceConfigurer::DkmsResult dkms_ = PersistenceConfigurer::DkmsResult::Failed;
    EnrollmentRequester::Result enrollment_ = EnrollmentRequester::Result::Failed;
};

}
