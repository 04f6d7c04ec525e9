#include <gtest/gtest.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "cli/commands/EnableCommand.hpp"
#include "test_utils.hpp"
#include "util/FileLock.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace proclient;
using namespace proclient::test::utils;

class EnableCommandTest : public ::testing::Test {
protected:
    void SetUp() override { tempDir = createTempDir(); }
    void TearDown() override { removeDir(tempDir); }

    /// Run enable and capture both streams
    Expected<void> run(const std::vector<std::string>& args) {
        AppContext ctx = makeContext(tempDir, store);
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        auto res = cmd.execute(ctx, args);
        out = testing::internal::GetCapturedStdout();
        err = testing::internal::GetCapturedStderr();
        return res;
    }

    fs::path tempDir;
    std::shared_ptr<MemoryAttachmentStore> store = std::make_shared<MemoryAttachmentStore>();
    EnableCommand cmd;
    std::string out;
    std::string err;
};

// Test: Known service on an unattached machine
TEST_F(EnableCommandTest, KnownServiceUnattachedJson) {
    auto res = run({"esm-infra", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().message, "");

    json j = json::parse(out);
    EXPECT_EQ(j["_schema_version"], "0.1");
    EXPECT_EQ(j["result"], "failure");
    EXPECT_EQ(j["processed_services"], json::array());
    EXPECT_EQ(j["failed_services"], json::array());
    EXPECT_EQ(j["warnings"], json::array());
    EXPECT_EQ(j["needs_reboot"], false);
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["message"],
              "To use 'esm-infra' you need an Ubuntu Pro subscription\n"
              "Personal and community subscriptions are available at no charge\n"
              "See https://ubuntu.com/pro");
    EXPECT_EQ(j["errors"][0]["message_code"], "valid-service-failure-unattached");
    EXPECT_TRUE(j["errors"][0]["service"].is_null());
    EXPECT_EQ(j["errors"][0]["type"], "system");
    EXPECT_EQ(store->saveCount(), 0);
}

// Test: Unknown service on an unattached machine
TEST_F(EnableCommandTest, UnknownServiceUnattachedJson) {
    auto res = run({"unknown", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(res.has_value());
    json j = json::parse(out);
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["message"], "Cannot enable unknown service 'unknown'.\nSee https://ubuntu.com/pro");
    EXPECT_EQ(j["errors"][0]["message_code"], "invalid-service-or-failure");
}

// Test: Mixed names on an unattached machine
TEST_F(EnableCommandTest, MixedServicesUnattachedJson) {
    auto res = run({"esm-infra", "unknown", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(res.has_value());
    json j = json::parse(out);
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["message_code"], "mixed-services-failure-unattached");
    EXPECT_EQ(j["errors"][0]["message"],
              "Cannot enable unknown service 'unknown'.\nSee https://ubuntu.com/pro\n\n"
              "To use 'esm-infra' you need an Ubuntu Pro subscription\n"
              "Personal and community subscriptions are available at no charge\n"
              "See https://ubuntu.com/pro");
}

// Test: Attached and entitled
TEST_F(EnableCommandTest, AttachedEntitledJson) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    auto res = run({"esm-infra", "--assume-yes", "--format", "json"});
    ASSERT_TRUE(res.has_value()) << err;

    json j = json::parse(out);
    EXPECT_EQ(j["result"], "success");
    EXPECT_EQ(j["processed_services"], json::array({"esm-infra"}));
    EXPECT_EQ(j["failed_services"], json::array());
    EXPECT_EQ(j["errors"], json::array());
    EXPECT_TRUE(store->current().isEnabled("esm-infra"));
    EXPECT_EQ(store->saveCount(), 1);
}

// Test: Partial success keeps the successful change
TEST_F(EnableCommandTest, PartialSuccessJson) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    auto res = run({"esm-infra", "livepatch", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(res.has_value());

    json j = json::parse(out);
    EXPECT_EQ(j["result"], "failure");
    EXPECT_EQ(j["processed_services"], json::array({"esm-infra"}));
    EXPECT_EQ(j["failed_services"], json::array({"livepatch"}));
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["service"], "livepatch");
    EXPECT_EQ(j["errors"][0]["type"], "service");
    EXPECT_TRUE(store->current().isEnabled("esm-infra"));
}

// Test: Text rendering of the unattached case
TEST_F(EnableCommandTest, KnownServiceUnattachedText) {
    auto res = run({"esm-infra"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(out, "");
    EXPECT_EQ(err,
              "To use 'esm-infra' you need an Ubuntu Pro subscription\n"
              "Personal and community subscriptions are available at no charge\n"
              "See https://ubuntu.com/pro\n");
}

TEST_F(EnableCommandTest, AttachedText) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra", "livepatch"}));
    auto res = run({"livepatch", "esm-infra"});
    ASSERT_TRUE(res.has_value()) << err;
    EXPECT_EQ(out, "Livepatch enabled\nESM Infra enabled\n");
    EXPECT_EQ(err, "");
}

// Test: JSON output without consent is refused before any work
TEST_F(EnableCommandTest, JsonRequiresAssumeYes) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    auto res = run({"esm-infra", "--format", "json"});
    ASSERT_FALSE(res.has_value());
    json j = json::parse(out);
    EXPECT_EQ(j["result"], "failure");
    EXPECT_EQ(j["errors"][0]["message_code"], "json-format-require-assume-yes");
    EXPECT_FALSE(store->current().isEnabled("esm-infra"));
}

TEST_F(EnableCommandTest, NoServiceNames) {
    auto res = run({"--assume-yes"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(res.error().message, "At least one service name is required: sudo pro enable <service> [<service>]");
}

// Test: Beta services need --beta
TEST_F(EnableCommandTest, BetaServiceNeedsFlag) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState(allServices()));
    auto hidden = run({"realtime-kernel", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(hidden.has_value());
    EXPECT_EQ(json::parse(out)["errors"][0]["message_code"], "invalid-service-or-failure");

    auto shown = run({"realtime-kernel", "--beta", "--assume-yes", "--format", "json"});
    ASSERT_TRUE(shown.has_value()) << out;
    json j = json::parse(out);
    EXPECT_EQ(j["processed_services"], json::array({"realtime-kernel"}));
    EXPECT_EQ(j["needs_reboot"], true);
}

TEST_F(EnableCommandTest, RebootMarkerSetsNeedsReboot) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    createFile(tempDir, "reboot-required");
    auto res = run({"esm-infra", "--assume-yes", "--format", "json"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(json::parse(out)["needs_reboot"], true);
}

// Test: A concurrent pro process blocks the batch
TEST_F(EnableCommandTest, LockHeld) {
    store = std::make_shared<MemoryAttachmentStore>(attachedState({"esm-infra"}));
    auto held = FileLock::acquire(tempDir / "lock");
    ASSERT_TRUE(held.has_value());

    auto res = run({"esm-infra", "--assume-yes", "--format", "json"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(json::parse(out)["errors"][0]["message_code"], "lock-held");
    EXPECT_FALSE(store->current().isEnabled("esm-infra"));
}
