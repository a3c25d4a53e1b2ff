#include "EnrollmentRequester.h"
#include "../core/RunContext.h"

namespace sb_modsign {

const char* to_string(EnrollmentRequester::Result r){
    switch(r){
        case EnrollmentRequester::Result::AlreadyEnrolled: return "already-enrolled";
        case EnrollmentRequester::Result::Requested: return "requested";
        case EnrollmentRequester::Result::Failed: return "failed";
    }
    return "?";
}

bool EnrollmentRequester::already_enrolled(){
    auto r = ctx_.runner.run({"mokutil", "--list-enrolled"});
    if(!r.started) return false;
    return r.output.find(ctx_.config.enroll_marker) != std::string::npos;
}

EnrollmentRequester::Result EnrollmentRequester::request(){
    auto& console = ctx_.console;
    if(already_enrolled()){
        console.warning("MOK key appears to be already enrolled");
        return Result::AlreadyEnrolled;
    }
    console.status("Importing MOK key...");
    Command cmd{"mokutil", "--import", ctx_.config.mok_der()};
    cmd.interactive = true; // mokutil asks for the one-time enrollment password
    auto r = ctx_.runner.run(cmd);
    if(!r.ok()){
        console.error("Failed to import MOK key");
        return Result::Failed;
    }
    console.success("MOK key import request created");
    console.line();
    console.warning("IMPORTANT: On next reboot, you will see a blue MOK Manager screen");
    console.warning("Follow these steps:");
    console.warning("  1. Select 'Enroll MOK'");
    console.warning("  2. Select 'Continue'");
    console.warning("  3. Select 'Yes' to enroll the key");
    console.warning("  4. Enter the password you just set");
    console.warning("  5. Select 'Reboot'");
    return Result::Requested;
}

}
