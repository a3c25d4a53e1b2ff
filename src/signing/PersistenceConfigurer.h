#pragma once
#include <string>

namespace sb_modsign {

struct RunContext;

// DKMS framework.conf signing entries and the standalone re-sign helper.
class PersistenceConfigurer {
public:
    enum class DkmsResult { Created, Appended, AlreadyConfigured, Failed };

    explicit PersistenceConfigurer(RunContext& ctx) : ctx_(ctx) {}

    DkmsResult configure_dkms();
    // Executable /bin/sh wrapper that execs `<self_exe> --resign`.
    bool write_resign_helper(const std::string& self_exe);

    static std::string dkms_block(const std::string& priv, const std::string& der);
    static std::string helper_script(const std::string& self_exe, const std::string& mok_dir);
    static std::string shell_quote(const std::string& s);
    // Path of the running binary (/proc/self/exe), empty if unreadable.
    static std::string self_executable();
private:
    RunContext& ctx_;
};

const char* to_string(PersistenceConfigurer::DkmsResult r);

}
