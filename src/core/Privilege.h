// Linux privilege helpers
#pragma once
#include <string>

namespace sb_modsign {
// Effective uid 0; the capability set is logged at debug level when libcap is compiled in.
bool has_root_privilege();
void log_capabilities(const std::string& context);
bool is_capability_logging_available();
}
