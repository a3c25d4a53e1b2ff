#pragma once
#include <string>
#include <istream>
#include <ostream>

namespace sb_modsign {

class Prompter {
public:
    virtual ~Prompter() = default;
    // Yes/no question; empty input or end of input yields default_yes.
    virtual bool confirm(const std::string& question, bool default_yes) = 0;
};

class StreamPrompter : public Prompter {
public:
    StreamPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}
    bool confirm(const std::string& question, bool default_yes) override;
private:
    std::istream& in_;
    std::ostream& out_;
};

// Non-interactive (--assume-yes): always answers the default.
class DefaultPrompter : public Prompter {
public:
    bool confirm(const std::string&, bool default_yes) override { return default_yes; }
};

}
