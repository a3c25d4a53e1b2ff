#pragma once
#include <string>
#include <cstdint>

namespace sb_modsign {

class CommandRunner;

enum class Codec { None, Zstd, Xz };

class CompressionUtils {
public:
    static Codec codec_for_path(const std::string& path);
    static const char* suffix(Codec c); // ".zst", ".xz", ""
    static const char* codec_name(Codec c);
    static bool is_compressed(const std::string& path) { return codec_for_path(path) != Codec::None; }
    // "/x/nvidia.ko.zst" -> "/x/nvidia.ko"; unchanged if uncompressed
    static std::string strip_suffix(const std::string& path);

    // Both write dst completely or leave it absent. xz is done in process with
    // liblzma; zstd is delegated to the zstd tool through the runner.
    static bool decompress_file(Codec c, const std::string& src, const std::string& dst, CommandRunner& runner);
    static bool compress_file(Codec c, const std::string& src, const std::string& dst, CommandRunner& runner);

    static bool xz_decompress(const std::string& src, const std::string& dst);
    // CRC32 check: the in-kernel xz decoder does not support CRC64.
    static bool xz_compress(const std::string& src, const std::string& dst, uint32_t preset = 6);
};

}
