#pragma once
#include <string>
#include <ostream>

namespace sb_modsign {

// Operator-facing status output: [INFO] / [SUCCESS] / [WARNING] / [ERROR].
class Console {
public:
    explicit Console(std::ostream& out, bool color = true) : out_(out), color_(color) {}
    void status(const std::string& msg) { emit("\033[0;34m", "[INFO]", msg); }
    void success(const std::string& msg) { emit("\033[0;32m", "[SUCCESS]", msg); }
    void warning(const std::string& msg) { emit("\033[1;33m", "[WARNING]", msg); }
    void error(const std::string& msg) { emit("\033[0;31m", "[ERROR]", msg); }
    // Unprefixed line (lists, summaries)
    void line(const std::string& msg = "") { out_ << msg << '\n'; }
    void rule() { out_ << std::string(62, '=') << '\n'; }
    std::ostream& stream() { return out_; }
private:
    void emit(const char* color, const char* tag, const std::string& msg);
    std::ostream& out_;
    bool color_;
};

}
