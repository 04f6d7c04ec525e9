#include <gtest/gtest.h>
#include <filesystem>
#include "core/Platform.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

using namespace proclient;
using namespace proclient::test::utils;

class PlatformTest : public ::testing::Test {
protected:
    void SetUp() override { tempDir = createTempDir(); }
    void TearDown() override { removeDir(tempDir); }

    fs::path tempDir;
};

TEST_F(PlatformTest, ParseOsRelease) {
    auto data = Platform::parseOsRelease(
        "NAME=\"Ubuntu\"\n"
        "VERSION_ID='22.04'\n"
        "# comment\n"
        "EMPTY=\n"
        "ID=ubuntu\r\n");
    EXPECT_EQ(data["NAME"], "Ubuntu");
    EXPECT_EQ(data["VERSION_ID"], "22.04");
    EXPECT_EQ(data["ID"], "ubuntu");
    EXPECT_EQ(data.count("EMPTY"), 0u);
}

// Test: Series taken from the codename in VERSION
TEST_F(PlatformTest, DetectFromVersion) {
    fs::path f = createFile(tempDir, "os-release", "NAME=\"Ubuntu\"\nVERSION=\"20.04.4 LTS (Focal Fossa)\"\n");
    PlatformInfo info = Platform::detect(f);
    EXPECT_EQ(info.distribution, "Ubuntu");
    EXPECT_EQ(info.version, "20.04 LTS (Focal Fossa)");
    EXPECT_EQ(info.release, "20.04");
    EXPECT_EQ(info.series, "focal");
}

TEST_F(PlatformTest, CodenameOverridesVersion) {
    fs::path f = createFile(tempDir, "os-release",
                            "NAME=\"Ubuntu\"\nVERSION=\"22.10 (Kinetic Kudu)\"\nVERSION_CODENAME=kinetic\n");
    PlatformInfo info = Platform::detect(f);
    EXPECT_EQ(info.release, "22.10");
    EXPECT_EQ(info.series, "kinetic");
}

TEST_F(PlatformTest, UnknownPlatform) {
    PlatformInfo missing = Platform::detect(tempDir / "absent");
    EXPECT_EQ(missing.series, "unknown");

    fs::path f = createFile(tempDir, "os-release", "NAME=Other\nVERSION_ID=7\n");
    PlatformInfo other = Platform::detect(f);
    EXPECT_EQ(other.series, "unknown");
    EXPECT_EQ(other.release, "7");
}

TEST_F(PlatformTest, RebootRequiredMarker) {
    EXPECT_FALSE(Platform::rebootRequired(tempDir / "reboot-required"));
    createFile(tempDir, "reboot-required");
    EXPECT_TRUE(Platform::rebootRequired(tempDir / "reboot-required"));
    EXPECT_FALSE(Platform::rebootRequired(fs::path()));
}

// Test: Machine id is non-empty and stable between calls
TEST_F(PlatformTest, MachineIdIsStable) {
    std::string first = Platform::machineId(tempDir);
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(Platform::machineId(tempDir), first);
}
