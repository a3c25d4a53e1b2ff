#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/signing/EnrollmentRequester.h"
#include "../src/signing/SecureBootState.h"
#include "../src/signing/PackageInstaller.h"
#include "TestSupport.h"

namespace sb_modsign {

using namespace testing_support;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;

class EnrollmentTest : public ::testing::Test {
protected:
    TempTree tree{"enroll"};
    ::testing::StrictMock<MockCommandRunner> runner;
    TestHarness h{tree.config(), runner};
};

TEST_F(EnrollmentTest, AlreadyEnrolledSkipsImport) {
    EXPECT_CALL(runner, run(HasArg(std::string("--list-enrolled"))))
        .WillOnce(Return(result(0, "[key 1]\nSubject: CN=NVIDIA Secure Boot MOK\n")));
    EXPECT_EQ(EnrollmentRequester(h.ctx).request(), EnrollmentRequester::Result::AlreadyEnrolled);
    EXPECT_NE(h.output().find("[WARNING] MOK key appears to be already enrolled"), std::string::npos);
}

TEST_F(EnrollmentTest, ImportRequestedInteractively) {
    InSequence seq;
    EXPECT_CALL(runner, run(HasArg(std::string("--list-enrolled")))).WillOnce(Return(result(0, "[key 1]\nSubject: CN=Canonical\n")));
    EXPECT_CALL(runner, run(AllOf(Invokes(std::string("mokutil")), HasArg(std::string("--import")),
                                  HasArg(h.cfg.mok_der()), Field(&Command::interactive, true))))
        .WillOnce(Return(result(0)));
    EXPECT_EQ(EnrollmentRequester(h.ctx).request(), EnrollmentRequester::Result::Requested);
    std::string out = h.output();
    EXPECT_NE(out.find("MOK key import request created"), std::string::npos);
    EXPECT_NE(out.find("1. Select 'Enroll MOK'"), std::string::npos);
    EXPECT_NE(out.find("5. Select 'Reboot'"), std::string::npos);
}

TEST_F(EnrollmentTest, ListingUnavailableStillImports) {
    EXPECT_CALL(runner, run(HasArg(std::string("--list-enrolled")))).WillOnce(Return(not_found()));
    EXPECT_CALL(runner, run(HasArg(std::string("--import")))).WillOnce(Return(result(0)));
    EXPECT_EQ(EnrollmentRequester(h.ctx).request(), EnrollmentRequester::Result::Requested);
}

TEST_F(EnrollmentTest, ImportFailureReported) {
    EXPECT_CALL(runner, run(HasArg(std::string("--list-enrolled")))).WillOnce(Return(result(1)));
    EXPECT_CALL(runner, run(HasArg(std::string("--import")))).WillOnce(Return(result(1)));
    EXPECT_EQ(EnrollmentRequester(h.ctx).request(), EnrollmentRequester::Result::Failed);
    EXPECT_NE(h.output().find("[ERROR] Failed to import MOK key"), std::string::npos);
    EXPECT_EQ(h.output().find("Enroll MOK"), std::string::npos);
}

TEST_F(EnrollmentTest, SecureBootStates) {
    EXPECT_CALL(runner, run(HasArg(std::string("--sb-state"))))
        .WillOnce(Return(result(0, "SecureBoot enabled\n")))
        .WillOnce(Return(result(0, "SecureBoot disabled\n")))
        .WillOnce(Return(result(1, "EFI variables are not supported on this system\n")))
        .WillOnce(Return(not_found()));
    EXPECT_EQ(query_secure_boot(h.ctx), SecureBootMode::Enabled);
    EXPECT_EQ(query_secure_boot(h.ctx), SecureBootMode::Disabled);
    EXPECT_EQ(query_secure_boot(h.ctx), SecureBootMode::Unknown);
    EXPECT_EQ(query_secure_boot(h.ctx), SecureBootMode::Unknown);
}

TEST_F(EnrollmentTest, SecureBootReportIsInformational) {
    EXPECT_CALL(runner, run(HasArg(std::string("--sb-state")))).WillOnce(Return(result(0, "SecureBoot enabled\n")));
    report_secure_boot(h.ctx);
    EXPECT_NE(h.output().find("[WARNING] Secure Boot is currently ENABLED"), std::string::npos);
}

class PackageInstallerTest : public EnrollmentTest {};

TEST_F(PackageInstallerTest, InstallsToolsThenHeaders) {
    EXPECT_CALL(runner, available("apt-get")).WillOnce(Return(true));
    InSequence seq;
    EXPECT_CALL(runner, run(HasArg(std::string("update")))).WillOnce(Return(result(100)));
    EXPECT_CALL(runner, run(AllOf(HasArg(std::string("install")), HasArg(std::string("sbsigntool")),
                                  HasArg(std::string("xz-utils")), HasArg(std::string("mokutil")))))
        .WillOnce(::testing::Invoke([](const Command& c){
            EXPECT_EQ(c.env.at("DEBIAN_FRONTEND"), "noninteractive");
            return result(0);
        }));
    EXPECT_CALL(runner, run(HasArg(std::string("linux-headers-6.8.0-45-generic")))).WillOnce(Return(result(100)));
    EXPECT_TRUE(PackageInstaller(h.ctx).install());
    EXPECT_NE(h.output().find("Could not install linux-headers"), std::string::npos);
    EXPECT_NE(h.output().find("Required packages installed"), std::string::npos);
}

TEST_F(PackageInstallerTest, ToolInstallFailureIsNotFatal) {
    EXPECT_CALL(runner, available("apt-get")).WillOnce(Return(true));
    EXPECT_CALL(runner, run(_)).WillOnce(Return(result(0))).WillOnce(Return(result(100))).WillOnce(Return(result(0)));
    EXPECT_FALSE(PackageInstaller(h.ctx).install());
    EXPECT_NE(h.output().find("Some required packages could not be installed"), std::string::npos);
}

TEST_F(PackageInstallerTest, NoAptGet) {
    EXPECT_CALL(runner, available("apt-get")).WillOnce(Return(false));
    EXPECT_FALSE(PackageInstaller(h.ctx).install());
}

TEST_F(PackageInstallerTest, RequiredPackageList) {
    EXPECT_THAT(PackageInstaller::required_packages(),
                ::testing::ElementsAre("openssl", "mokutil", "kmod", "sbsigntool", "zstd", "xz-utils"));
}

}
