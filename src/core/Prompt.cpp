#include "Prompt.h"
#include "Utils.h"

namespace sb_modsign {

bool StreamPrompter::confirm(const std::string& question, bool default_yes){
    out_ << question << (default_yes ? " [Y/n]: " : " [y/N]: ");
    out_.flush();
    std::string reply;
    if(!std::getline(in_, reply)) { out_ << '\n'; return default_yes; }
    reply = utils::trim(reply);
    if(reply.empty()) return default_yes;
    if(reply[0] == 'y' || reply[0] == 'Y') return true;
    if(reply[0] == 'n' || reply[0] == 'N') return false;
    return default_yes;
}

}
