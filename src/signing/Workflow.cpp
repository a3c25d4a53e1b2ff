#include "Workflow.h"
#include "../core/RunContext.h"
#include "../core/Logging.h"
#include "../probes/AptPolicyProbe.h"
#include "ModuleLocator.h"
#include "KeyManager.h"
#include "ToolResolver.h"
#include "PersistenceConfigurer.h"
#include "EnrollmentRequester.h"
#include "SecureBootState.h"
#include "PackageInstaller.h"

namespace sb_modsign {

Workflow::Workflow(RunContext& ctx) : ctx_(ctx) {
    probes_.register_all_default();
    self_exe_ = PersistenceConfigurer::self_executable();
}

std::string Workflow::detect_version(){
    auto& console = ctx_.console;
    std::string v = probes_.run_first(ctx_);
    if(v != UNKNOWN_VERSION) return v;

    console.warning("Could not automatically detect NVIDIA driver version");
    console.status("Attempting manual detection from installed packages...");
    AptSearchProbe fallback;
    auto found = fallback.probe(ctx_);
    if(found && !found->empty()) return *found;
    return UNKNOWN_VERSION;
}

int Workflow::finish_exit_code() const {
    if(ctx_.config.strict && !summary_.all_signed()){
        ctx_.console.error("Strict mode: " + std::to_string(summary_.total() - summary_.count(SignStatus::Signed)) + " module(s) not signed");
        return EXIT_FATAL;
    }
    return EXIT_OK;
}

int Workflow::run(){
    const auto& cfg = ctx_.config;
    auto& console = ctx_.console;

    console.status("NVIDIA Secure Boot Signing Automation");
    console.rule();
    console.line();

    console.status("Step 1: Installing required packages...");
    if(cfg.install_packages) PackageInstaller(ctx_).install();
    else console.status("Package installation skipped (--no-install)");
    console.line();

    console.status("Step 2: Checking Secure Boot status...");
    report_secure_boot(ctx_);
    console.line();

    console.status("Step 3: Detecting NVIDIA driver version from filesystem...");
    version_ = detect_version();
    if(version_ == UNKNOWN_VERSION){
        console.error("Could not detect NVIDIA driver version");
        console.error("Please run: dpkg -l | grep nvidia");
        console.error("and check that the NVIDIA driver is installed");
        return EXIT_FATAL;
    }
    console.status("Detected NVIDIA Driver Version: " + version_);
    console.status("Kernel Version: " + cfg.kernel_version);
    console.line();

    console.status("Step 4: Locating NVIDIA kernel modules...");
    ModuleSet modules = ModuleLocator(cfg).locate();
    if(modules.empty()){
        console.error("No NVIDIA kernel modules found!");
        console.error("This might mean:");
        console.error("  - NVIDIA driver is not installed");
        console.error("  - Modules are in an unexpected location");
        console.error("");
        console.error("Try running: find " + cfg.modules_root + " -name 'nvidia*.ko*'");
        return EXIT_FATAL;
    }
    console.success("Found " + std::to_string(modules.size()) + " NVIDIA kernel module(s):");
    for(const auto& m : modules) console.line("  - " + m.path);
    console.line();

    console.status("Step 5: Generating Machine Owner Key (MOK)...");
    if(KeyManager(ctx_).ensure() == KeyManager::Result::Failed){
        console.error("Failed to generate MOK keys in " + cfg.mok_dir);
        return EXIT_FATAL;
    }
    console.line();

    console.status("Step 6: Locating sign-file script...");
    auto sign_file = ToolResolver(ctx_).resolve();
    if(!sign_file){
        console.error("Failed to find or install sign-file script");
        return EXIT_FATAL;
    }
    console.success("Found sign-file at: " + *sign_file);
    console.line();

    console.status("Step 7: Signing NVIDIA kernel modules...");
    summary_ = SigningOrchestrator(ctx_, *sign_file).sign_all(modules);
    print_signing_summary(console, summary_);
    console.line();

    console.status("Step 8: Configuring DKMS for automatic module signing...");
    PersistenceConfigurer persist(ctx_);
    dkms_ = persist.configure_dkms();
    console.line();

    console.status("Step 9: Enrolling MOK key into system firmware...");
    enrollment_ = EnrollmentRequester(ctx_).request();
    console.line();

    console.status("Step 10: Creating helper scripts...");
    persist.write_resign_helper(self_exe_);
    console.line();

    print_final_summary(modules.size());
    return finish_exit_code();
}

void Workflow::print_final_summary(size_t module_count){
    auto& console = ctx_.console;
    console.rule();
    console.success("NVIDIA Secure Boot signing process COMPLETE!");
    console.rule();
    console.line();
    console.status("Summary of what was done:");
    console.line("  - Detected NVIDIA driver version: " + version_);
    console.line("  - Signed " + std::to_string(summary_.count(SignStatus::Signed)) + "/" + std::to_string(module_count) + " kernel module(s)");
    console.line("  - MOK key pair in " + ctx_.config.mok_dir);
    switch(dkms_){
        case PersistenceConfigurer::DkmsResult::Created:
        case PersistenceConfigurer::DkmsResult::Appended: console.line("  - Configured DKMS for automatic signing"); break;
        case PersistenceConfigurer::DkmsResult::AlreadyConfigured: console.line("  - DKMS was already configured for signing"); break;
        case PersistenceConfigurer::DkmsResult::Failed: console.line("  - DKMS signing configuration FAILED (see above)"); break;
    }
    switch(enrollment_){
        case EnrollmentRequester::Result::Requested: console.line("  - Imported MOK key for enrollment"); break;
        case EnrollmentRequester::Result::AlreadyEnrolled: console.line("  - MOK key was already enrolled"); break;
        case EnrollmentRequester::Result::Failed: console.line("  - MOK key import FAILED (see above)"); break;
    }
    console.line();
    console.status("NEXT STEPS:");
    console.line("  1. Reboot your system: sudo reboot");
    console.line("  2. During boot, enroll MOK key in the blue MOK Manager screen");
    console.line("  3. After enrolling, enable Secure Boot in BIOS/UEFI");
    console.line("  4. Boot back and verify: mokutil --sb-state");
    console.line();
    console.status("To verify modules are signed:");
    console.line("  modinfo nvidia | grep sig_id");
    console.line();
    console.status("After NVIDIA driver updates, re-sign modules with:");
    console.line("  sudo " + ctx_.config.resign_helper_path);
    console.line();
}

int Workflow::resign(){
    const auto& cfg = ctx_.config;
    auto& console = ctx_.console;
    console.status("Re-signing NVIDIA kernel modules...");

    if(!KeyManager(ctx_).keys_present()){
        console.error("MOK keys not found in " + cfg.mok_dir);
        return EXIT_FATAL;
    }
    auto sign_file = ToolResolver::find_existing(cfg);
    if(!sign_file){
        console.error("sign-file script not found");
        return EXIT_FATAL;
    }
    ModuleSet modules = ModuleLocator::find_matching(cfg.kernel_modules_dir(), cfg.resign_glob_prefix);
    if(modules.empty()) console.warning("No " + cfg.resign_glob_prefix + "*.ko* modules under " + cfg.kernel_modules_dir());

    SigningOrchestrator orch(ctx_, *sign_file);
    for(const auto& m : modules){
        console.status("Processing: " + m.path);
        summary_.outcomes.push_back(orch.sign_one(m));
    }
    if(!modules.empty()) print_signing_summary(console, summary_);
    console.success("Re-signing complete!");
    return finish_exit_code();
}

}
