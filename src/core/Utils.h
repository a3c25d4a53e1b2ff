#pragma once
#include <string>
#include <vector>

namespace sb_modsign {
namespace utils {

std::vector<std::string> read_lines(const std::string& path);
bool read_file(const std::string& path, std::string& out);
bool is_regular_file(const std::string& path);
bool is_directory(const std::string& path);
std::string trim(const std::string& s);
std::vector<std::string> split_ws(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
std::string basename(const std::string& path);

// Version-aware comparison in the manner of `sort -V`: digit runs compare
// numerically, everything else byte-wise. Returns <0, 0, >0.
int version_compare(const std::string& a, const std::string& b);
bool version_less(const std::string& a, const std::string& b);

// Names of immediate subdirectories of dir (empty if dir is unreadable).
std::vector<std::string> list_subdirectories(const std::string& dir);
// Greatest version-named (leading digit) subdirectory by version_compare,
// empty if none.
std::string greatest_version_subdir(const std::string& dir);

// Time-suffixed path inside a fresh mkdtemp(3) directory (mode 0700) under
// dir. The directory and anything written to it are removed when the guard
// goes out of scope. valid() is false if the directory could not be created.
class ScratchFile {
public:
    ScratchFile(const std::string& dir, const std::string& stem, const std::string& ext);
    ~ScratchFile();
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;
    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& directory() const { return dir_; }
private:
    std::string dir_;
    std::string path_;
};

}
}
