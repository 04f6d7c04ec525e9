#include <gtest/gtest.h>
#include <filesystem>
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

using namespace proclient;
using namespace proclient::test::utils;

namespace {

class RecordingCommand : public ICommand {
public:
    explicit RecordingCommand(Expected<void> outcome) : outcome(std::move(outcome)) {}

    Expected<void> execute(const AppContext&, const std::vector<std::string>& args) override {
        ++calls;
        lastArgs = args;
        return outcome;
    }
    const char* name() const override { return "record"; }
    const char* description() const override { return "Record invocations"; }
    const char* helpNameLine() const override { return "record - Record invocations"; }
    const char* helpSynopsis() const override { return "pro record"; }
    const char* helpDescription() const override { return ""; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }

    int calls{0};
    std::vector<std::string> lastArgs;

private:
    Expected<void> outcome;
};

/// Store that fails the test if it is touched
class UntouchableStore : public IAttachmentStore {
public:
    Expected<AttachmentState> load() const override {
        ADD_FAILURE() << "store consulted";
        return AttachmentState{};
    }
    Expected<void> save(const AttachmentState&) override {
        ADD_FAILURE() << "store written";
        return {};
    }
    Expected<void> clear() override {
        ADD_FAILURE() << "store cleared";
        return {};
    }
};

}

class CommandInvokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        ctx = makeContext(tempDir, std::make_shared<MemoryAttachmentStore>());
    }
    void TearDown() override { removeDir(tempDir); }

    fs::path tempDir;
    AppContext ctx;
    CommandInvoker invoker;
};

// Test: Non-root is rejected before the command runs
TEST_F(CommandInvokerTest, NonRootRejected) {
    ctx.isRoot = [] { return false; };
    RecordingCommand cmd{Expected<void>()};

    testing::internal::CaptureStderr();
    auto res = invoker.invoke(cmd, ctx, {"esm-infra"});
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::PermissionDenied);
    EXPECT_EQ(err, "This command must be run as root (try using sudo).\n");
    EXPECT_EQ(cmd.calls, 0);
}

// Test: A real command as non-root never reaches the attachment state
TEST_F(CommandInvokerTest, NonRootNeverLoadsState) {
    CommandFactory::registerBuiltins();
    ctx.isRoot = [] { return false; };
    ctx.store = std::make_shared<UntouchableStore>();

    for (const char* name : {"enable", "disable", "attach", "auto-attach", "detach", "refresh", "status", "help"}) {
        auto cmd = CommandFactory::instance().create(name);
        ASSERT_NE(cmd, nullptr) << name;
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        auto res = invoker.invoke(*cmd, ctx, {"esm-infra", "--format", "json"});
        std::string out = testing::internal::GetCapturedStdout();
        testing::internal::GetCapturedStderr();
        EXPECT_FALSE(res.has_value()) << name;
        EXPECT_EQ(out, "") << name;
    }
}

TEST_F(CommandInvokerTest, SuccessPassesArgs) {
    RecordingCommand cmd{Expected<void>()};
    auto res = invoker.invoke(cmd, ctx, {"a", "b"});
    EXPECT_TRUE(res.has_value());
    EXPECT_EQ(cmd.calls, 1);
    EXPECT_EQ(cmd.lastArgs, (std::vector<std::string>{"a", "b"}));
}

// Test: Plain failures are printed, rendered ones are not
TEST_F(CommandInvokerTest, FailureMessages) {
    RecordingCommand plain{Error{ErrorCode::InvalidArgs, "unrecognized arguments: --x"}};
    testing::internal::CaptureStderr();
    auto res = invoker.invoke(plain, ctx, {});
    std::string err = testing::internal::GetCapturedStderr();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(err, "unrecognized arguments: --x\n");

    RecordingCommand rendered{Error{ErrorCode::OperationFailed, ""}};
    testing::internal::CaptureStderr();
    auto res2 = invoker.invoke(rendered, ctx, {});
    err = testing::internal::GetCapturedStderr();
    ASSERT_FALSE(res2.has_value());
    EXPECT_EQ(err, "");
}

TEST(CommandFactoryTest, BuiltinsRegistered) {
    CommandFactory::registerBuiltins();
    for (const char* name : {"enable", "disable", "attach", "auto-attach", "detach", "refresh", "status", "help"}) {
        EXPECT_TRUE(CommandFactory::instance().has(name)) << name;
    }
    EXPECT_EQ(CommandFactory::instance().create("frobnicate"), nullptr);

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);
    ASSERT_GE(cmds.size(), 8u);
    EXPECT_STREQ(cmds.front()->name(), "attach");
}
