#include "Config.h"
#include <sys/utsname.h>

namespace sb_modsign {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

void fill_system_defaults(Config& c){
    if(!c.kernel_version.empty() && !c.arch.empty()) return;
    struct utsname u{};
    if(uname(&u) != 0) return;
    if(c.kernel_version.empty()) c.kernel_version = u.release;
    if(c.arch.empty()) c.arch = u.machine;
}
}
