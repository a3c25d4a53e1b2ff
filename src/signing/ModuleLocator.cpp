#include "ModuleLocator.h"
#include "../core/Config.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace sb_modsign {

std::vector<std::string> ModuleLocator::search_directories() const {
    const std::string kdir = cfg_.kernel_modules_dir();
    std::vector<std::string> dirs = {
        kdir + "/updates/dkms",
        kdir + "/kernel/drivers/video",
        kdir + "/extra",
        kdir + "/updates",
    };
    std::string dkms_version = utils::greatest_version_subdir(cfg_.dkms_driver_dir());
    if(!dkms_version.empty())
        dirs.push_back(cfg_.dkms_driver_dir() + "/" + dkms_version + "/" + cfg_.kernel_version + "/" + cfg_.arch + "/module");
    return dirs;
}

ModuleSet ModuleLocator::locate() const {
    static const char* suffixes[] = {".ko", ".ko.zst", ".ko.xz"};
    ModuleSet found;
    for(const auto& dir : search_directories()){
        if(!utils::is_directory(dir)) { Logger::instance().trace("skip missing " + dir); continue; }
        for(const auto& name : cfg_.module_names){
            for(const char* sfx : suffixes){
                std::string p = dir + "/" + name + sfx;
                if(utils::is_regular_file(p)) found.insert(ModulePath(p));
            }
        }
    }
    Logger::instance().debug("module locator found " + std::to_string(found.size()) + " file(s)");
    return found;
}

ModuleSet ModuleLocator::find_matching(const std::string& root, const std::string& prefix){
    ModuleSet found;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if(ec) return found;
    for(; it != fs::recursive_directory_iterator(); it.increment(ec)){
        if(ec) break;
        std::error_code fec;
        if(!it->is_regular_file(fec)) continue;
        std::string name = it->path().filename().string();
        if(!utils::starts_with(name, prefix) || name.find(".ko", prefix.size()) == std::string::npos) continue;
        ModulePath m(it->path().string());
        if(m.codec == Codec::None && !utils::ends_with(name, ".ko")){
            Logger::instance().debug("skipping unsupported module file " + m.path);
            continue;
        }
        found.insert(std::move(m));
    }
    return found;
}

}
