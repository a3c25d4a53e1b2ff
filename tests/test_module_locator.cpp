#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/signing/ModuleLocator.h"
#include "TestSupport.h"

namespace sb_modsign {

using namespace testing_support;

class ModuleLocatorTest : public ::testing::Test {
protected:
    std::filesystem::path kdir() const { return tree / ("lib/modules/" + cfg.kernel_version); }
    std::string touch(const std::filesystem::path& p) { write_file(p, "m"); return p.string(); }
    std::vector<std::string> paths(const ModuleSet& s) {
        std::vector<std::string> out;
        for (const auto& m : s) out.push_back(m.path);
        return out;
    }

    TempTree tree{"locator"};
    Config cfg = tree.config();
};

TEST_F(ModuleLocatorTest, SearchDirectoriesWithoutDkms) {
    auto dirs = ModuleLocator(cfg).search_directories();
    ASSERT_EQ(dirs.size(), 4u);
    EXPECT_EQ(dirs[0], (kdir() / "updates/dkms").string());
    EXPECT_EQ(dirs[1], (kdir() / "kernel/drivers/video").string());
    EXPECT_EQ(dirs[2], (kdir() / "extra").string());
    EXPECT_EQ(dirs[3], (kdir() / "updates").string());
}

TEST_F(ModuleLocatorTest, SearchDirectoriesIncludeNewestDkmsBuild) {
    for (const char* v : {"70.1", "450.10"}) std::filesystem::create_directories(tree / "var/lib/dkms/nvidia" / v);
    auto dirs = ModuleLocator(cfg).search_directories();
    ASSERT_EQ(dirs.size(), 5u);
    EXPECT_EQ(dirs[4], (tree / "var/lib/dkms/nvidia/450.10" / cfg.kernel_version / "x86_64/module").string());
}

TEST_F(ModuleLocatorTest, FindsExactlyExistingFiles) {
    std::vector<std::string> expected = {
        touch(kdir() / "updates/dkms/nvidia.ko.zst"),
        touch(kdir() / "updates/dkms/nvidia-drm.ko.xz"),
        touch(kdir() / "updates/dkms/nvidia-uvm.ko"),
        touch(kdir() / "extra/nvidia-peermem.ko"),
        touch(kdir() / "kernel/drivers/video/nvidia-modeset.ko.xz"),
        touch(tree / "var/lib/dkms/nvidia/535.183.01" / cfg.kernel_version / "x86_64/module/nvidia.ko"),
    };
    // noise that must not be picked up
    touch(kdir() / "updates/dkms/nvidia.ko.gz");
    touch(kdir() / "updates/dkms/nvidiafb.ko");
    touch(kdir() / "updates/dkms/sub/nvidia.ko");
    touch(kdir() / "kernel/drivers/gpu/nvidia.ko");
    touch(tree / "lib/modules/5.15.0-1-generic/updates/dkms/nvidia.ko");
    std::filesystem::create_directories(kdir() / "extra/nvidia-uvm.ko"); // a directory, not a file

    std::sort(expected.begin(), expected.end());
    auto found = ModuleLocator(cfg).locate();
    EXPECT_EQ(paths(found), expected);
}

TEST_F(ModuleLocatorTest, DeduplicatesOverlappingDirectories) {
    // updates/ and updates/dkms are both searched; a file is found once
    touch(kdir() / "updates/nvidia.ko");
    touch(kdir() / "updates/dkms/nvidia.ko");
    auto found = ModuleLocator(cfg).locate();
    EXPECT_EQ(found.size(), 2u);
    ModuleSet twice = found;
    for (const auto& m : found) twice.insert(ModulePath(m.path));
    EXPECT_EQ(twice.size(), 2u);
}

TEST_F(ModuleLocatorTest, CodecInferredFromSuffix) {
    touch(kdir() / "updates/dkms/nvidia.ko");
    touch(kdir() / "updates/dkms/nvidia.ko.zst");
    touch(kdir() / "updates/dkms/nvidia.ko.xz");
    auto found = ModuleLocator(cfg).locate();
    ASSERT_EQ(found.size(), 3u);
    auto it = found.begin();
    EXPECT_EQ(it->codec, Codec::None); ++it;
    EXPECT_EQ(it->codec, Codec::Xz); ++it;
    EXPECT_EQ(it->codec, Codec::Zstd);
}

TEST_F(ModuleLocatorTest, EmptyWhenNothingInstalled) {
    EXPECT_TRUE(ModuleLocator(cfg).locate().empty());
}

TEST_F(ModuleLocatorTest, GlobSearchForResign) {
    std::vector<std::string> expected = {
        touch(kdir() / "updates/dkms/nvidia.ko.zst"),
        touch(kdir() / "kernel/drivers/video/nvidiafb.ko"),
        touch(kdir() / "extra/deep/nvidia-uvm.ko.xz"),
    };
    touch(kdir() / "updates/dkms/nvidia.ko.gz");   // unsupported codec
    touch(kdir() / "updates/dkms/nouveau.ko");
    touch(kdir() / "modules.dep");
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(paths(ModuleLocator::find_matching(kdir().string(), "nvidia")), expected);
}

}
