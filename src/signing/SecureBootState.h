#pragma once

namespace sb_modsign {

struct RunContext;

enum class SecureBootMode { Enabled, Disabled, Unknown };

// `mokutil --sb-state`; informational only.
SecureBootMode query_secure_boot(RunContext& ctx);
void report_secure_boot(RunContext& ctx);

}
