#include <gtest/gtest.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "cli/CommandFactory.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace proclient;
using namespace proclient::test::utils;

class HelpCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        CommandFactory::registerBuiltins();
        tempDir = createTempDir();
    }
    void TearDown() override { removeDir(tempDir); }

    Expected<void> run(const std::vector<std::string>& args, const std::string& series = "jammy") {
        AppContext ctx = makeContext(tempDir, std::make_shared<MemoryAttachmentStore>(), nullptr, series);
        testing::internal::CaptureStdout();
        auto res = cmd.execute(ctx, args);
        out = testing::internal::GetCapturedStdout();
        return res;
    }

    fs::path tempDir;
    HelpCommand cmd;
    std::string out;
};

TEST_F(HelpCommandTest, ServiceHelpText) {
    auto res = run({"livepatch"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(out.rfind("Name:\nlivepatch\n\nAvailable:\nyes\n\nHelp:\nLivepatch provides", 0), 0u);
}

// Test: Availability reflects the release, not the attachment
TEST_F(HelpCommandTest, ServiceHelpJsonOnUnsupportedRelease) {
    auto res = run({"esm-infra", "--format", "json"}, "kinetic");
    ASSERT_TRUE(res.has_value());
    json j = json::parse(out);
    EXPECT_EQ(j["name"], "esm-infra");
    EXPECT_EQ(j["available"], "no");
    EXPECT_FALSE(j["help"].get<std::string>().empty());
}

TEST_F(HelpCommandTest, CommandHelp) {
    auto res = run({"enable"});
    ASSERT_TRUE(res.has_value());
    EXPECT_NE(out.find("SYNOPSIS:"), std::string::npos);
    EXPECT_NE(out.find("--assume-yes"), std::string::npos);
}

TEST_F(HelpCommandTest, UnknownTopic) {
    auto res = run({"nonsense"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::HelpNotFound);
    EXPECT_EQ(res.error().message, "No help available for 'nonsense'");
    EXPECT_EQ(out, "");
}

TEST_F(HelpCommandTest, Overview) {
    auto res = run({});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(out.rfind("usage: pro <command> [<args>]", 0), 0u);
    EXPECT_NE(out.find("  attach\t"), std::string::npos);
    EXPECT_NE(out.find("  status\t"), std::string::npos);
    EXPECT_NE(out.find("  esm-infra\n"), std::string::npos);
}
