#include "KeyManager.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/pem.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <filesystem>
#include <memory>
#include <vector>
#include <utility>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sb_modsign {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
struct FileCloser { void operator()(FILE* f) const { if(f) fclose(f); } };
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Extended key usage accepted by shim/MokManager and by the kernel keyring
// for module signing (Microsoft kernel-mode code signing, Red Hat module signing).
const char* MOK_EKU = "codeSigning,1.3.6.1.4.1.311.10.3.6,1.3.6.1.4.1.2312.16.1.2";

void log_openssl_errors(const std::string& what){
    unsigned long e; bool any = false;
    while((e = ERR_get_error()) != 0){
        char buf[256]; ERR_error_string_n(e, buf, sizeof(buf));
        Logger::instance().error(what + ": " + buf);
        any = true;
    }
    if(!any) Logger::instance().error(what + " failed");
}

PkeyPtr generate_rsa(int bits){
    PkeyPtr none(nullptr, EVP_PKEY_free);
    PkeyCtxPtr kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
    if(!kctx || EVP_PKEY_keygen_init(kctx.get()) <= 0 || EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), bits) <= 0){
        log_openssl_errors("RSA keygen setup"); return none;
    }
    EVP_PKEY* raw = nullptr;
    if(EVP_PKEY_keygen(kctx.get(), &raw) <= 0){ log_openssl_errors("RSA keygen"); return none; }
    return PkeyPtr(raw, EVP_PKEY_free);
}

bool add_ext(X509* cert, int nid, const char* value){
    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value);
    if(!ext){ log_openssl_errors(std::string("extension ") + OBJ_nid2sn(nid)); return false; }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}

X509Ptr make_certificate(EVP_PKEY* pkey, const std::string& cn, int days){
    X509Ptr none(nullptr, X509_free);
    X509Ptr cert(X509_new(), X509_free);
    if(!cert) return none;
    X509_set_version(cert.get(), 2);

    BnPtr serial(BN_new(), BN_free);
    if(!serial || !BN_rand(serial.get(), 63, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) ||
       !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get()))){
        log_openssl_errors("certificate serial"); return none;
    }
    if(!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
       !X509_time_adj_ex(X509_getm_notAfter(cert.get()), days, 0, nullptr)){
        log_openssl_errors("certificate validity"); return none;
    }
    if(X509_set_pubkey(cert.get(), pkey) != 1){ log_openssl_errors("certificate public key"); return none; }

    X509_NAME* name = X509_get_subject_name(cert.get());
    if(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8, reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0) != 1 ||
       X509_set_issuer_name(cert.get(), name) != 1){
        log_openssl_errors("certificate subject"); return none;
    }

    if(!add_ext(cert.get(), NID_basic_constraints, "critical,CA:FALSE") ||
       !add_ext(cert.get(), NID_subject_key_identifier, "hash") ||
       !add_ext(cert.get(), NID_authority_key_identifier, "keyid:always") ||
       !add_ext(cert.get(), NID_ext_key_usage, MOK_EKU)) return none;

    if(X509_sign(cert.get(), pkey, EVP_sha256()) <= 0){ log_openssl_errors("certificate signing"); return none; }
    return cert;
}

FilePtr open_with_mode(const std::string& path, mode_t mode){
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, mode);
    if(fd < 0) return FilePtr(nullptr);
    FILE* f = fdopen(fd, "wb");
    if(!f){ close(fd); return FilePtr(nullptr); }
    return FilePtr(f);
}

// Key material is staged as <path>.new for every file and only renamed into
// place once all of them were written, so a failed regeneration never leaves
// a new key next to an old certificate.
class StagedFiles {
public:
    ~StagedFiles(){ discard(); }

    template<typename Writer>
    bool stage(const std::string& path, fs::perms perms, Writer write){
        std::string tmp = path + ".new";
        FilePtr f = open_with_mode(tmp, 0600);
        if(!f){ Logger::instance().error("cannot create " + tmp + ": " + strerror(errno)); return false; }
        staged_.emplace_back(tmp, path);
        if(!write(f.get())){ log_openssl_errors("writing " + path); return false; }
        if(fclose(f.release()) != 0){ Logger::instance().error("cannot write " + tmp); return false; }
        std::error_code ec;
        fs::permissions(tmp, perms, fs::perm_options::replace, ec);
        if(ec){ Logger::instance().error("cannot set mode on " + tmp + ": " + ec.message()); return false; }
        return true;
    }

    bool commit(){
        for(const auto& s : staged_){
            std::error_code ec;
            fs::rename(s.first, s.second, ec);
            if(ec){ Logger::instance().error("installing " + s.second + ": " + ec.message()); return false; }
        }
        staged_.clear();
        return true;
    }

    void discard(){
        for(const auto& s : staged_){ std::error_code ec; fs::remove(s.first, ec); }
        staged_.clear();
    }
private:
    std::vector<std::pair<std::string, std::string>> staged_; // tmp, final
};

}

const char* to_string(KeyManager::Result r){
    switch(r){
        case KeyManager::Result::Generated: return "generated";
        case KeyManager::Result::Regenerated: return "regenerated";
        case KeyManager::Result::Reused: return "reused";
        case KeyManager::Result::Failed: return "failed";
    }
    return "?";
}

bool KeyManager::keys_present() const {
    return utils::is_regular_file(ctx_.config.mok_priv()) && utils::is_regular_file(ctx_.config.mok_der());
}

bool KeyManager::generate(){
    const auto& cfg = ctx_.config;
    std::error_code ec;
    fs::create_directories(cfg.mok_dir, ec);
    if(ec){ Logger::instance().error("cannot create " + cfg.mok_dir + ": " + ec.message()); return false; }

    PkeyPtr pkey = generate_rsa(cfg.mok_key_bits);
    if(!pkey) return false;
    X509Ptr cert = make_certificate(pkey.get(), cfg.mok_subject_cn, cfg.mok_validity_days);
    if(!cert) return false;

    const auto priv_perms = fs::perms::owner_read | fs::perms::owner_write;
    const auto pub_perms = priv_perms | fs::perms::group_read | fs::perms::others_read;
    StagedFiles files;
    bool ok = files.stage(cfg.mok_priv(), priv_perms, [&](FILE* f){
                  return PEM_write_PrivateKey(f, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1; })
           && files.stage(cfg.mok_der(), pub_perms, [&](FILE* f){ return i2d_X509_fp(f, cert.get()) == 1; })
           && files.stage(cfg.mok_pem(), pub_perms, [&](FILE* f){ return PEM_write_X509(f, cert.get()) == 1; })
           && files.commit();
    if(ok) Logger::instance().debug("wrote MOK key material to " + cfg.mok_dir);
    return ok;
}

KeyManager::Result KeyManager::ensure(){
    auto& console = ctx_.console;
    if(keys_present()){
        console.warning("MOK keys already exist at " + ctx_.config.mok_dir);
        if(ctx_.prompter.confirm("Do you want to use existing keys?", true)){
            console.success("Using existing MOK keys");
            return Result::Reused;
        }
        console.status("Generating new MOK keys...");
        if(!generate()) return Result::Failed;
        console.success("New MOK keys generated");
        return Result::Regenerated;
    }
    console.status("Generating new MOK keys...");
    if(!generate()) return Result::Failed;
    console.success("MOK keys generated successfully");
    return Result::Generated;
}

}
