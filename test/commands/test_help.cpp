#include <gtest/gtest.h>

#include "cli/CommandFactory.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "test_utils.hpp"

using namespace chuck;
using namespace chuck::test::utils;

TEST(HelpCommandTest, ListsAllCommands) {
    OutputCapture capture;
    HelpCommand cmd;
    AppContext ctx;

    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    const std::string out = capture.out();
    for (const char* name : {"categories", "help", "random", "search"}) {
        EXPECT_NE(out.find(std::string("  ") + name + "\t"), std::string::npos) << name;
    }
    EXPECT_NE(out.find("--json"), std::string::npos);
    EXPECT_NE(out.find("--verbose"), std::string::npos);
}

TEST(HelpCommandTest, CommandDetail) {
    OutputCapture capture;
    HelpCommand cmd;
    AppContext ctx;

    ASSERT_TRUE(cmd.execute(ctx, {"search"}).has_value());
    EXPECT_NE(capture.out().find("SYNOPSIS:"), std::string::npos);
    EXPECT_NE(capture.out().find("--limit <n>"), std::string::npos);
}

TEST(HelpCommandTest, UnknownTopicFallsBackToOverview) {
    OutputCapture capture;
    HelpCommand cmd;
    AppContext ctx;

    ASSERT_TRUE(cmd.execute(ctx, {"nope"}).has_value());
    EXPECT_NE(capture.err().find("Unknown help topic: nope"), std::string::npos);
    EXPECT_NE(capture.out().find("Commands:"), std::string::npos);
}

TEST(CommandFactoryTest, CreatesRegisteredCommands) {
    auto& f = CommandFactory::instance();
    EXPECT_TRUE(f.contains("random"));
    EXPECT_FALSE(f.contains("joke"));
    EXPECT_TRUE(f.create("joke") == nullptr);

    auto cmd = f.create("categories");
    ASSERT_TRUE(cmd != nullptr);
    EXPECT_STREQ(cmd->name(), "categories");

    auto all = f.createAll();
    ASSERT_GE(all.size(), 4u);
    for (size_t i = 1; i < all.size(); ++i) {
        EXPECT_LT(std::string(all[i - 1]->name()), std::string(all[i]->name()));
    }
}
