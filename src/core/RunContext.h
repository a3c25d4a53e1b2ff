#pragma once
#include "Config.h"
#include "Console.h"
#include "Process.h"
#include "Prompt.h"

namespace sb_modsign {

// Everything a step needs, passed explicitly instead of read from globals.
struct RunContext {
    const Config& config;
    CommandRunner& runner;
    Console& console;
    Prompter& prompter;

    RunContext(const Config& cfg, CommandRunner& r, Console& c, Prompter& p)
        : config(cfg), runner(r), console(c), prompter(p) {}
};

}
