#include <gtest/gtest.h>
#include "cli/Router.hpp"
#include "errors/errors.hpp"
#include "errors/RemoteError.hpp"

using namespace dm;
using namespace dm::cli;

class CliRouterTest : public ::testing::Test {
protected:
    Router router;
    CommandCall last;

    void SetUp() override {
        router.registerSwitch("no-wait");
        router.registerCommand("echo", "echo [args]", "Echo the call", [this](const CommandCall& c) {
            last = c;
            return ok("done\n");
        });
    }

    template <typename E>
    void registerThrowing(const std::string& name, E error) {
        router.registerCommand(name, name, "Throws", [error](const CommandCall&) -> CommandResult { throw error; });
    }
};

TEST_F(CliRouterTest, ParsesOptionsAndPositionals) {
    const auto call = router.parse({"echo", "1", "--category=guides", "--take", "10", "--no-wait", "file.md", "--null", "name"});
    EXPECT_EQ(call.name, "echo");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"1", "file.md"}));
    EXPECT_EQ(optVal(call, "category"), "guides");
    EXPECT_EQ(optVal(call, "take"), "10");
    EXPECT_TRUE(hasFlag(call, "no-wait"));
    EXPECT_FALSE(optVal(call, "no-wait"));
    EXPECT_EQ(optVal(call, "null"), "name");
}

TEST_F(CliRouterTest, TrailingOptionHasNoValue) {
    const auto call = router.parse({"echo", "--verbose"});
    EXPECT_TRUE(hasFlag(call, "verbose"));
    EXPECT_FALSE(optVal(call, "verbose"));
}

TEST_F(CliRouterTest, ExecutesRegisteredHandler) {
    const auto res = router.execute({"echo", "x"});
    EXPECT_EQ(res.exit_code, exit_code::OK);
    EXPECT_EQ(res.stdout_text, "done\n");
    EXPECT_EQ(last.positionals, std::vector<std::string>{"x"});
}

TEST_F(CliRouterTest, UnknownCommandIsUsageError) {
    const auto res = router.execute({"nope"});
    EXPECT_EQ(res.exit_code, exit_code::USAGE);
    EXPECT_NE(res.stderr_text.find("Unknown command 'nope'"), std::string::npos);
}

TEST_F(CliRouterTest, MapsErrorsToExitCodes) {
    registerThrowing("missing", errors::NotFound("Document 7 does not exist"));
    registerThrowing("busy", errors::Conflict("Document 7 is in flight"));
    registerThrowing("bad", std::invalid_argument("Missing document id"));
    registerThrowing("gone", remote::NotFound("Store x not found"));
    registerThrowing("down", remote::Error(503, "Service unavailable"));
    registerThrowing("boom", std::runtime_error("disk full"));

    EXPECT_EQ(router.execute({"missing"}).exit_code, exit_code::NOT_FOUND);
    EXPECT_EQ(router.execute({"busy"}).exit_code, exit_code::CONFLICT);
    EXPECT_EQ(router.execute({"gone"}).exit_code, exit_code::NOT_FOUND);
    EXPECT_EQ(router.execute({"down"}).exit_code, exit_code::FAILURE);

    const auto bad = router.execute({"bad"});
    EXPECT_EQ(bad.exit_code, exit_code::USAGE);
    EXPECT_NE(bad.stderr_text.find("usage: docmirror bad"), std::string::npos);

    const auto boom = router.execute({"boom"});
    EXPECT_EQ(boom.exit_code, exit_code::FAILURE);
    EXPECT_NE(boom.stderr_text.find("disk full"), std::string::npos);
}

TEST(CliHelpers, ParseUIntIsStrict) {
    EXPECT_EQ(parseUInt("42"), 42u);
    EXPECT_FALSE(parseUInt(""));
    EXPECT_FALSE(parseUInt("-1"));
    EXPECT_FALSE(parseUInt("4x"));
    EXPECT_FALSE(parseUInt("12345678901"));
}
