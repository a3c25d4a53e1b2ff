#include "core/Config.h"
#include "core/Logging.h"
#include "core/Console.h"
#include "core/Privilege.h"
#include "core/Process.h"
#include "core/Prompt.h"
#include "core/RunContext.h"
#include "signing/Workflow.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>
#include <functional>
#include <vector>
#include <unistd.h>

using namespace sb_modsign;

static void print_help(){
    std::cout << "sb-modsign: sign NVIDIA kernel modules for UEFI Secure Boot and enroll the MOK\n";
    std::cout << "usage: sudo sb-modsign [options]\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--resign", "Only re-sign installed modules with existing keys"},
        {"--kernel VER", "Target kernel version (default: running kernel)"},
        {"--mok-dir DIR", "Key directory (default /var/lib/shim-signed/mok)"},
        {"--no-install", "Skip apt-get installation of required packages"},
        {"--strict", "Exit non-zero if any module was not signed"},
        {"--assume-yes", "Do not prompt; reuse existing keys"},
        {"--log-level LVL", "error|warn|info|debug|trace"},
        {"--no-color", "Plain status prefixes"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){ std::cout << "  " << l.name; if(l.name.size() < 20) for(size_t i=l.name.size(); i<20; ++i) std::cout << ' '; else std::cout<<' '; std::cout << l.help << "\n"; }
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    enum class ArgKind { None, String };
    struct FlagSpec { const char* name; ArgKind kind; std::function<bool(const std::string&)> apply; };
    std::vector<FlagSpec> specs = {
        {"--resign", ArgKind::None, [&](const std::string&){ cfg.resign = true; return true; }},
        {"--kernel", ArgKind::String, [&](const std::string& v){ cfg.kernel_version = v; return !v.empty(); }},
        {"--mok-dir", ArgKind::String, [&](const std::string& v){ cfg.mok_dir = v; return !v.empty(); }},
        {"--no-install", ArgKind::None, [&](const std::string&){ cfg.install_packages = false; return true; }},
        {"--strict", ArgKind::None, [&](const std::string&){ cfg.strict = true; return true; }},
        {"--assume-yes", ArgKind::None, [&](const std::string&){ cfg.assume_yes = true; return true; }},
        {"--no-color", ArgKind::None, [&](const std::string&){ cfg.color = false; return true; }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ LogLevel lvl; if(!parse_log_level(v, lvl)) return false; Logger::instance().set_level(lvl); return true; }},
    };
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return EXIT_OK; }
        if(a=="--version"){ std::cout << "sb-modsign " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n"; return EXIT_OK; }
        auto* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: "<<a<<"\n"; print_help(); return EXIT_USAGE; }
        std::string val;
        if(spec->kind == ArgKind::String){
            if(i+1>=argc){ std::cerr << "Missing value for "<<a<<"\n"; return EXIT_USAGE; }
            val = argv[++i];
        }
        if(!spec->apply(val)){ std::cerr << "Invalid value for "<<a<<": "<<val<<"\n"; return EXIT_USAGE; }
    }
    if(!isatty(STDOUT_FILENO)) cfg.color = false;
    fill_system_defaults(cfg);
    set_config(cfg);

    Console console(std::cout, cfg.color);
    if(!has_root_privilege()){
        console.error("Please run as root (use sudo)");
        return EXIT_FATAL;
    }
    if(cfg.kernel_version.empty() || cfg.arch.empty()){
        console.error("Could not determine kernel version; pass --kernel");
        return EXIT_FATAL;
    }

    ProcessRunner runner;
    StreamPrompter stdin_prompter(std::cin, std::cout);
    DefaultPrompter default_prompter;
    Prompter& prompter = cfg.assume_yes ? static_cast<Prompter&>(default_prompter) : static_cast<Prompter&>(stdin_prompter);
    RunContext ctx(config(), runner, console, prompter);

    try {
        Workflow wf(ctx);
        return cfg.resign ? wf.resign() : wf.run();
    } catch(const std::exception& ex) {
        console.error(std::string("Unexpected failure: ") + ex.what());
        return EXIT_FATAL;
    }
}
