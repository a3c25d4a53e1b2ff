#pragma once
#include <string>

namespace sb_modsign {

struct RunContext;

// Private key + DER/PEM certificate at the configured MOK directory.
class KeyManager {
public:
    enum class Result { Generated, Regenerated, Reused, Failed };

    explicit KeyManager(RunContext& ctx) : ctx_(ctx) {}

    // Reuse or (re)create key material, asking the operator when keys exist.
    Result ensure();
    bool keys_present() const;
    // Unconditionally create the key pair and both certificate encodings.
    bool generate();
private:
    RunContext& ctx_;
};

const char* to_string(KeyManager::Result r);

}
