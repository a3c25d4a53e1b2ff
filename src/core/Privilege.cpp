#include "Privilege.h"
#include "Logging.h"
#include <unistd.h>
#ifdef SB_MODSIGN_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace sb_modsign {

void log_capabilities(const std::string& context) {
#ifdef SB_MODSIGN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }

    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    } else {
        Logger::instance().warn("Failed to convert capabilities to text for " + context);
    }

    cap_free(caps);
#else
    Logger::instance().debug("Capabilities logging not available (libcap not compiled in)");
#endif
}

bool is_capability_logging_available(){
#ifdef SB_MODSIGN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool has_root_privilege(){
    log_capabilities("at startup");
    return geteuid() == 0;
}

}
