#pragma once
#include <string>
#include <vector>
#include <map>

namespace sb_modsign {

struct Command {
    std::vector<std::string> argv; // argv[0] resolved via PATH
    std::map<std::string, std::string> env; // added to the inherited environment
    // Interactive commands inherit stdin/stdout/stderr (mokutil password prompt).
    bool interactive = false;
    Command() = default;
    Command(std::initializer_list<std::string> args) : argv(args) {}
    std::string str() const;
};

struct CommandResult {
    bool started = false; // false if fork/exec failed or argv empty
    int exit_code = -1;   // 128+N when killed by signal N
    std::string output;   // captured stdout (non-interactive only)
    bool ok() const { return started && exit_code == 0; }
};

// Seam for every external tool invocation (apt, mokutil, modinfo, zstd, sign-file).
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const Command& cmd) = 0;
    // True if the tool is executable (absolute path) or found on PATH.
    virtual bool available(const std::string& tool) = 0;
};

// fork/execvp implementation; no shell is involved.
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const Command& cmd) override;
    bool available(const std::string& tool) override;
};

}
