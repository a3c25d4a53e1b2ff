#include "Compression.h"
#include "Process.h"
#include "Utils.h"
#include "Logging.h"
#include <lzma.h>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <memory>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace sb_modsign {

namespace {

struct FileCloser { void operator()(FILE* f) const { if(f) fclose(f); } };
using FilePtr = std::unique_ptr<FILE, FileCloser>;

struct LzmaStream {
    lzma_stream strm = LZMA_STREAM_INIT;
    ~LzmaStream(){ lzma_end(&strm); }
};

const size_t BUF_SIZE = 64 * 1024;

// Pumps src through an initialised lzma stream into tmp, then renames to dst.
bool run_lzma(lzma_stream& strm, const std::string& src, const std::string& dst){
    FilePtr in(fopen(src.c_str(), "rb"));
    if(!in){ Logger::instance().debug("xz: cannot open " + src); return false; }
    std::string tmp = dst + ".part";
    // never follow or reuse whatever already sits at the temporary name
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644);
    if(fd < 0){ Logger::instance().debug("xz: cannot create " + tmp + ": " + strerror(errno)); return false; }
    FilePtr out(fdopen(fd, "wb"));
    if(!out){ close(fd); std::error_code ec; fs::remove(tmp, ec); return false; }

    std::vector<uint8_t> inbuf(BUF_SIZE), outbuf(BUF_SIZE);
    lzma_action action = LZMA_RUN;
    strm.next_out = outbuf.data();
    strm.avail_out = outbuf.size();
    bool ok = false;
    for(;;){
        if(strm.avail_in == 0 && action == LZMA_RUN){
            size_t n = fread(inbuf.data(), 1, inbuf.size(), in.get());
            if(ferror(in.get())) break;
            strm.next_in = inbuf.data();
            strm.avail_in = n;
            if(feof(in.get())) action = LZMA_FINISH;
        }
        lzma_ret ret = lzma_code(&strm, action);
        if(strm.avail_out == 0 || ret == LZMA_STREAM_END){
            size_t have = outbuf.size() - strm.avail_out;
            if(fwrite(outbuf.data(), 1, have, out.get()) != have) break;
            strm.next_out = outbuf.data();
            strm.avail_out = outbuf.size();
        }
        if(ret == LZMA_STREAM_END){ ok = true; break; }
        if(ret != LZMA_OK){
            Logger::instance().debug("xz: lzma_code error " + std::to_string(static_cast<int>(ret)) + " on " + src);
            break;
        }
    }
    if(fclose(out.release()) != 0) ok = false;
    std::error_code ec;
    if(ok){
        fs::rename(tmp, dst, ec);
        if(ec){ Logger::instance().debug("xz: rename failed: " + ec.message()); ok = false; }
    }
    if(!ok) fs::remove(tmp, ec);
    return ok;
}

}

Codec CompressionUtils::codec_for_path(const std::string& path){
    if(utils::ends_with(path, ".zst")) return Codec::Zstd;
    if(utils::ends_with(path, ".xz")) return Codec::Xz;
    return Codec::None;
}

const char* CompressionUtils::suffix(Codec c){
    switch(c){ case Codec::Zstd: return ".zst"; case Codec::Xz: return ".xz"; case Codec::None: break; }
    return "";
}

const char* CompressionUtils::codec_name(Codec c){
    switch(c){ case Codec::Zstd: return "zstd"; case Codec::Xz: return "xz"; case Codec::None: break; }
    return "none";
}

std::string CompressionUtils::strip_suffix(const std::string& path){
    std::string sfx = suffix(codec_for_path(path));
    return path.substr(0, path.size() - sfx.size());
}

bool CompressionUtils::xz_decompress(const std::string& src, const std::string& dst){
    LzmaStream s;
    if(lzma_stream_decoder(&s.strm, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) return false;
    return run_lzma(s.strm, src, dst);
}

bool CompressionUtils::xz_compress(const std::string& src, const std::string& dst, uint32_t preset){
    LzmaStream s;
    if(lzma_easy_encoder(&s.strm, preset, LZMA_CHECK_CRC32) != LZMA_OK) return false;
    return run_lzma(s.strm, src, dst);
}

bool CompressionUtils::decompress_file(Codec c, const std::string& src, const std::string& dst, CommandRunner& runner){
    switch(c){
        case Codec::Xz: return xz_decompress(src, dst);
        case Codec::Zstd: {
            auto r = runner.run({"zstd", "-q", "-d", "-f", src, "-o", dst});
            return r.ok() && utils::is_regular_file(dst);
        }
        case Codec::None: break;
    }
    return false;
}

bool CompressionUtils::compress_file(Codec c, const std::string& src, const std::string& dst, CommandRunner& runner){
    switch(c){
        case Codec::Xz: return xz_compress(src, dst);
        case Codec::Zstd: {
            auto r = runner.run({"zstd", "-q", "-f", src, "-o", dst});
            return r.ok() && utils::is_regular_file(dst);
        }
        case Codec::None: break;
    }
    return false;
}

}
