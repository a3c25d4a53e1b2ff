#pragma once
#include "../core/Compression.h"
#include <string>
#include <vector>
#include <set>

namespace sb_modsign {

struct Config;

struct ModulePath {
    std::string path;
    Codec codec = Codec::None;

    ModulePath() = default;
    explicit ModulePath(std::string p) : path(std::move(p)), codec(CompressionUtils::codec_for_path(path)) {}
    bool operator<(const ModulePath& o) const { return path < o.path; }
    bool operator==(const ModulePath& o) const { return path == o.path; }
};

using ModuleSet = std::set<ModulePath>;

class ModuleLocator {
public:
    explicit ModuleLocator(const Config& cfg) : cfg_(cfg) {}
    // Directories probed, in order: per-kernel module dirs, then DKMS build output.
    std::vector<std::string> search_directories() const;
    // Existing <dir>/<name>.ko{,.zst,.xz} for every directory and module name.
    ModuleSet locate() const;
    // Recursive `<prefix>*.ko*` search used by the re-sign pass. Only
    // uncompressed, zstd and xz modules are returned.
    static ModuleSet find_matching(const std::string& root, const std::string& prefix);
private:
    const Config& cfg_;
};

}
