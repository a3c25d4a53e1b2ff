#pragma once
#include <string>

namespace sb_modsign {

struct RunContext;

// Queues the DER certificate for MokManager enrollment at next boot.
class EnrollmentRequester {
public:
    enum class Result { AlreadyEnrolled, Requested, Failed };
    explicit EnrollmentRequester(RunContext& ctx) : ctx_(ctx) {}
    bool already_enrolled();
    Result request();
private:
    RunContext& ctx_;
};

const char* to_string(EnrollmentRequester::Result r);

}
