#include <gtest/gtest.h>
#include <filesystem>
#include "cli/commands/RefreshCommand.hpp"
#include "test_utils.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace proclient;
using namespace proclient::test::utils;

class RefreshCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        savedLevel = Logger::instance().level();
    }
    void TearDown() override {
        Logger::instance().setLevel(savedLevel);
        removeDir(tempDir);
    }

    Expected<void> run(const std::vector<std::string>& args) {
        AppContext ctx = makeContext(tempDir, store, contracts);
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        auto res = cmd.execute(ctx, args);
        out = testing::internal::GetCapturedStdout();
        err = testing::internal::GetCapturedStderr();
        return res;
    }

    fs::path tempDir;
    LogLevel savedLevel{LogLevel::Debug};
    std::shared_ptr<MemoryAttachmentStore> store = std::make_shared<MemoryAttachmentStore>();
    std::shared_ptr<MemoryContractSource> contracts = std::make_shared<MemoryContractSource>();
    RefreshCommand cmd;
    std::string out;
    std::string err;
};

// Test: Lost entitlements disable the service
TEST_F(RefreshCommandTest, ContractDropsEntitlement) {
    store = std::make_shared<MemoryAttachmentStore>(
        attachedState({"esm-infra", "livepatch"}, {"esm-infra", "livepatch"}));
    contracts->add("test-token", Contract{"Renamed Contract", {"esm-infra", "cis"}, {}});

    auto res = run({"contract"});
    ASSERT_TRUE(res.has_value()) << err;
    EXPECT_EQ(out, "Successfully refreshed your subscription.\n");
    EXPECT_EQ(err, "Livepatch is no longer entitled and has been disabled.\n");

    const AttachmentState& s = store->current();
    EXPECT_EQ(s.contractName, "Renamed Contract");
    EXPECT_EQ(s.entitlements, (std::set<std::string>{"cis", "esm-infra"}));
    EXPECT_EQ(s.enabledServices, std::set<std::string>{"esm-infra"});
}

// Test: Dependents disabled with a lost service are reported too
TEST_F(RefreshCommandTest, LostEntitlementDisablesDependent) {
    store = std::make_shared<MemoryAttachmentStore>(
        attachedState({"esm-apps", "esm-infra", "ros"}, {"esm-apps", "esm-infra", "ros"}));
    contracts->add("test-token", Contract{"Test Contract", {"esm-infra", "ros"}, {}});

    auto res = run({"contract"});
    ASSERT_TRUE(res.has_value()) << err;
    EXPECT_EQ(err,
              "Disabling dependent service: ROS ESM Security Updates\n"
              "ESM Apps is no longer entitled and has been disabled.\n");
    EXPECT_EQ(store->current().enabledServices, std::set<std::string>{"esm-infra"});
}

TEST_F(RefreshCommandTest, DefaultTargetIsContract) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    contracts->add("test-token", Contract{"Test Contract", {"esm-infra"}, {}});
    auto res = run({});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(out, "Successfully refreshed your subscription.\n");
}

TEST_F(RefreshCommandTest, ContractRequiresAttachment) {
    auto res = run({"contract"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotAttached);
}

TEST_F(RefreshCommandTest, RevokedToken) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    auto res = run({"contract"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidToken);
    EXPECT_EQ(store->saveCount(), 0);
}

TEST_F(RefreshCommandTest, ConfigReload) {
    createFile(tempDir, "uaclient.conf", "log_level: error\n");
    auto res = run({"config"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(out, "Successfully processed your pro configuration.\n");
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);
}

TEST_F(RefreshCommandTest, InvalidTarget) {
    auto res = run({"everything"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
}
