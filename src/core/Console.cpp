#include "Console.h"

namespace sb_modsign {

void Console::emit(const char* color, const char* tag, const std::string& msg){
    if(color_) out_ << color << tag << "\033[0m " << msg << '\n';
    else out_ << tag << ' ' << msg << '\n';
    out_.flush();
}

}
