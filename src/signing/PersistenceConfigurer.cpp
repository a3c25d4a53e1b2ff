#include "PersistenceConfigurer.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sb_modsign {

static const char* DKMS_MARKER = "mok_signing_key";

const char* to_string(PersistenceConfigurer::DkmsResult r){
    switch(r){
        case PersistenceConfigurer::DkmsResult::Created: return "created";
        case PersistenceConfigurer::DkmsResult::Appended: return "appended";
        case PersistenceConfigurer::DkmsResult::AlreadyConfigured: return "already-configured";
        case PersistenceConfigurer::DkmsResult::Failed: return "failed";
    }
    return "?";
}

std::string PersistenceConfigurer::dkms_block(const std::string& priv, const std::string& der){
    return "mok_signing_key=\"" + priv + "\"\nmok_certificate=\"" + der + "\"\n";
}

std::string PersistenceConfigurer::shell_quote(const std::string& s){
    std::string out = "'";
    for(char c : s){ if(c == '\'') out += "'\\''"; else out.push_back(c); }
    out += "'";
    return out;
}

std::string PersistenceConfigurer::helper_script(const std::string& self_exe, const std::string& mok_dir){
    return "#!/bin/sh\n"
           "# Re-sign NVIDIA modules after driver updates\n"
           "exec " + shell_quote(self_exe) + " --resign --mok-dir " + shell_quote(mok_dir) + " \"$@\"\n";
}

std::string PersistenceConfigurer::self_executable(){
    char pathbuf[4096];
    ssize_t n = readlink("/proc/self/exe", pathbuf, sizeof(pathbuf)-1);
    if(n <= 0) return {};
    pathbuf[n] = 0;
    return pathbuf;
}

PersistenceConfigurer::DkmsResult PersistenceConfigurer::configure_dkms(){
    const auto& cfg = ctx_.config;
    auto& console = ctx_.console;
    const std::string block = dkms_block(cfg.mok_priv(), cfg.mok_der());

    if(utils::is_regular_file(cfg.dkms_config)){
        std::string existing;
        if(!utils::read_file(cfg.dkms_config, existing)){
            console.error("Cannot read " + cfg.dkms_config);
            return DkmsResult::Failed;
        }
        if(existing.find(DKMS_MARKER) != std::string::npos){
            console.warning("DKMS already configured for signing");
            return DkmsResult::AlreadyConfigured;
        }
        std::ofstream f(cfg.dkms_config, std::ios::app);
        if(f) f << "\n# MOK signing configuration for Secure Boot\n" << block;
        if(!f){
            console.error("Cannot append to " + cfg.dkms_config);
            return DkmsResult::Failed;
        }
        console.success("DKMS configuration updated");
        return DkmsResult::Appended;
    }

    std::error_code ec;
    fs::create_directories(fs::path(cfg.dkms_config).parent_path(), ec);
    if(ec){
        console.error("Cannot create " + fs::path(cfg.dkms_config).parent_path().string() + ": " + ec.message());
        return DkmsResult::Failed;
    }
    std::ofstream f(cfg.dkms_config, std::ios::trunc);
    if(f) f << "# DKMS configuration for automatic module signing\n" << block;
    if(!f){
        console.error("Cannot write " + cfg.dkms_config);
        return DkmsResult::Failed;
    }
    console.success("DKMS configuration created");
    return DkmsResult::Created;
}

bool PersistenceConfigurer::write_resign_helper(const std::string& self_exe){
    const auto& cfg = ctx_.config;
    auto& console = ctx_.console;
    if(self_exe.empty()){
        console.error("Cannot determine own executable path; re-sign helper not written");
        return false;
    }
    std::error_code ec;
    fs::create_directories(fs::path(cfg.resign_helper_path).parent_path(), ec);
    {
        std::ofstream f(cfg.resign_helper_path, std::ios::trunc);
        if(f) f << helper_script(self_exe, cfg.mok_dir);
        if(!f){
            console.error("Cannot write " + cfg.resign_helper_path);
            return false;
        }
    }
    fs::permissions(cfg.resign_helper_path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if(ec){
        console.error("Cannot make " + cfg.resign_helper_path + " executable: " + ec.message());
        return false;
    }
    console.success("Helper script created");
    return true;
}

}
