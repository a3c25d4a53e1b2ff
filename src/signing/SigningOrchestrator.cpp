#include "SigningOrchestrator.h"
#include "../core/RunContext.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <filesystem>
#include <algorithm>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sb_modsign {

const char* to_string(SignStatus s){
    switch(s){
        case SignStatus::Signed: return "signed";
        case SignStatus::Failed: return "failed";
        case SignStatus::Skipped: return "skipped";
    }
    return "?";
}

size_t SigningSummary::count(SignStatus s) const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(), [s](const SigningOutcome& o){ return o.status == s; }));
}

ModuleWorkspace::ModuleWorkspace(const ModulePath& module, CommandRunner& runner)
    : module_(module), runner_(runner) {
    if(!compressed()){
        target_ = module_.path;
        ready_ = true;
        return;
    }
    target_ = CompressionUtils::strip_suffix(module_.path);
    // An uncompressed copy may sit beside the compressed one and is signed on
    // its own; never clobber or delete it.
    if(utils::is_regular_file(target_)) target_ += "." + std::to_string(getpid()) + ".unpacked";
    ready_ = CompressionUtils::decompress_file(module_.codec, module_.path, target_, runner_);
    if(ready_) owed_ = true;
    else { std::error_code ec; fs::remove(target_, ec); }
}

ModuleWorkspace::~ModuleWorkspace(){
    if(owed_) restore();
}

bool ModuleWorkspace::restore(){
    if(!owed_) return true;
    owed_ = false;
    bool ok = CompressionUtils::compress_file(module_.codec, target_, module_.path, runner_);
    if(!ok) Logger::instance().error("recompression with " + std::string(CompressionUtils::codec_name(module_.codec)) + " failed for " + module_.path);
    std::error_code ec;
    fs::remove(target_, ec);
    if(ec) Logger::instance().warn("could not remove " + target_ + ": " + ec.message());
    return ok;
}

Command SigningOrchestrator::sign_command(const std::string& file) const {
    return Command{sign_file_, "sha256", ctx_.config.mok_priv(), ctx_.config.mok_der(), file};
}

SigningOutcome SigningOrchestrator::sign_one(const ModulePath& module){
    auto& console = ctx_.console;
    SigningOutcome out;
    out.module = module;

    ModuleWorkspace ws(module, ctx_.runner);
    if(ws.compressed()) console.status("Decompressing " + module.path + "...");
    if(!ws.ready()){
        console.error("Failed to decompress " + module.path + ", skipping");
        out.status = SignStatus::Skipped;
        out.detail = "decompression failed";
        return out;
    }

    console.status("Signing: " + utils::basename(ws.target()));
    auto r = ctx_.runner.run(sign_command(ws.target()));
    if(r.ok()){
        console.success("Signed successfully");
        out.status = SignStatus::Signed;
    } else {
        console.error("Failed to sign " + ws.target());
        out.status = SignStatus::Failed;
        out.detail = r.started ? "sign-file exited with " + std::to_string(r.exit_code) : "sign-file could not be run";
    }

    if(ws.compressed()){
        console.status(std::string("Recompressing with ") + CompressionUtils::codec_name(module.codec) + "...");
        out.restored = ws.restore();
        if(!out.restored){
            // the original path still holds the unsigned module
            console.error("Recompression failed for " + module.path);
            out.status = SignStatus::Failed;
            if(!out.detail.empty()) out.detail += "; ";
            out.detail += "recompression failed";
        }
    }
    console.success("Completed: " + utils::basename(module.path));
    return out;
}

SigningSummary SigningOrchestrator::sign_all(const ModuleSet& modules){
    SigningSummary summary;
    for(const auto& m : modules) summary.outcomes.push_back(sign_one(m));
    return summary;
}

void print_signing_summary(Console& console, const SigningSummary& summary){
    size_t ok = summary.count(SignStatus::Signed);
    std::string msg = "Signed " + std::to_string(ok) + "/" + std::to_string(summary.total()) + " module(s)";
    if(summary.all_signed()) console.success(msg);
    else console.warning(msg);
    for(const auto& o : summary.outcomes){
        if(o.status == SignStatus::Signed) continue;
        console.line(std::string("  ") + to_string(o.status) + ": " + o.module.path + (o.detail.empty() ? "" : " (" + o.detail + ")"));
    }
}

}
