#include <gtest/gtest.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "core/AttachmentState.hpp"
#include "core/Config.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace proclient;
using namespace proclient::test::utils;

/**
 * @brief End-to-end runs through the file-backed collaborators
 *
 * Configuration, os-release, contracts and the machine token all live in
 * a temporary directory.
 */
class ProWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        CommandFactory::registerBuiltins();
        tempDir = createTempDir();

        createFile(tempDir, "os-release", "NAME=\"Ubuntu\"\nVERSION=\"20.04.6 LTS (Focal Fossa)\"\n");
        createFile(tempDir, "data/contracts.json", R"json({
            "pro-token": {
                "name": "Ubuntu Pro (free)",
                "entitlements": ["esm-apps", "esm-infra", "livepatch", "ros", "fips"],
                "enable_by_default": ["esm-infra", "livepatch"]
            }
        })json");
        fs::path conf = createFile(tempDir, "uaclient.conf",
            "data_dir: " + (tempDir / "data").string() + "\n" +
            "log_file: " + (tempDir / "pro.log").string() + "\n" +
            "os_release_file: " + (tempDir / "os-release").string() + "\n" +
            "reboot_required_file: " + (tempDir / "reboot-required").string() + "\n");

        auto cfg = Config::parse(readFile(conf), conf);
        ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
        ctx = AppContext::fromConfig(cfg.value());
        ctx.isRoot = [] { return true; };
    }

    void TearDown() override { removeDir(tempDir); }

    /// Invoke a command by name, capturing stdout
    Expected<void> pro(const std::string& command, const std::vector<std::string>& args) {
        auto cmd = CommandFactory::instance().create(command);
        EXPECT_NE(cmd, nullptr);
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        auto res = invoker.invoke(*cmd, ctx, args);
        out = testing::internal::GetCapturedStdout();
        err = testing::internal::GetCapturedStderr();
        return res;
    }

    AttachmentState stored() {
        auto s = FileAttachmentStore(tempDir / "data").load();
        EXPECT_TRUE(s.has_value());
        return s.value();
    }

    fs::path tempDir;
    AppContext ctx;
    CommandInvoker invoker;
    std::string out;
    std::string err;
};

// Test: attach -> enable -> disable -> detach
TEST_F(ProWorkflowTest, FullLifecycle) {
    EXPECT_EQ(ctx.platform.series, "focal");

    ASSERT_FALSE(pro("enable", {"esm-infra", "--assume-yes", "--format", "json"}).has_value());
    EXPECT_EQ(json::parse(out)["errors"][0]["message_code"], "valid-service-failure-unattached");

    ASSERT_TRUE(pro("attach", {"pro-token", "--format", "json"}).has_value()) << out << err;
    EXPECT_EQ(json::parse(out)["processed_services"], json::array({"esm-infra", "livepatch"}));
    EXPECT_TRUE(fs::exists(tempDir / "data" / "private" / "machine-token.json"));
    EXPECT_TRUE(stored().attached);

    // ros pulls in esm-apps; fips is entitled and needs a reboot
    ASSERT_TRUE(pro("enable", {"ros", "fips", "--assume-yes", "--format", "json"}).has_value()) << out;
    json enabled = json::parse(out);
    EXPECT_EQ(enabled["processed_services"], json::array({"ros", "fips"}));
    EXPECT_EQ(enabled["needs_reboot"], true);
    ASSERT_EQ(enabled["warnings"].size(), 1u);
    EXPECT_EQ(enabled["warnings"][0]["message_code"], "enabling-required-service");
    EXPECT_EQ(stored().enabledServices,
              (std::set<std::string>{"esm-apps", "esm-infra", "fips", "livepatch", "ros"}));

    auto partial = pro("disable", {"livepatch", "cis", "bogus", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(partial.has_value());
    json disabled = json::parse(out);
    EXPECT_EQ(disabled["processed_services"], json::array({"livepatch"}));
    EXPECT_EQ(disabled["failed_services"], json::array({"cis"}));
    ASSERT_EQ(disabled["errors"].size(), 2u);
    EXPECT_EQ(disabled["errors"][0]["message_code"], "invalid-service-or-failure");
    EXPECT_EQ(disabled["errors"][1]["service"], "cis");
    EXPECT_FALSE(stored().isEnabled("livepatch"));

    ASSERT_TRUE(pro("status", {"--format", "json"}).has_value());
    EXPECT_EQ(json::parse(out)["contract"], "Ubuntu Pro (free)");

    ASSERT_TRUE(pro("detach", {"--assume-yes", "--format", "json"}).has_value()) << out;
    EXPECT_EQ(json::parse(out)["processed_services"], json::array({"ros", "esm-apps", "esm-infra", "fips"}));
    EXPECT_FALSE(fs::exists(tempDir / "data" / "private" / "machine-token.json"));
    EXPECT_FALSE(stored().attached);
}

// Test: A corrupt token file surfaces as an error, not a crash
TEST_F(ProWorkflowTest, CorruptStateFile) {
    createFile(tempDir, "data/private/machine-token.json", "{ broken");
    auto res = pro("enable", {"esm-infra", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::CorruptState);
    EXPECT_NE(err.find("Invalid machine token file"), std::string::npos);
}

TEST_F(ProWorkflowTest, InvalidTokenLeavesMachineUnattached) {
    auto res = pro("attach", {"wrong-token"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(err, "Invalid token. See https://ubuntu.com/pro\n");
    EXPECT_FALSE(stored().attached);
}
