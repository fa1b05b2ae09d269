#include <gtest/gtest.h>
#include "runtime/CommandLine.hpp"
#include "support/Errors.hpp"

#include <vector>

using namespace gm::runtime;
using namespace gm::types;
using gm::test::kindOf;

namespace {

CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "gitmount");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

}

TEST(CommandLineTest, PositionalsOnly) {
    const auto cmd = parse({"/srv/repo", "/mnt/repo"});
    EXPECT_EQ(cmd.gitPath, "/srv/repo");
    EXPECT_EQ(cmd.mountPath, "/mnt/repo");
    EXPECT_FALSE(cmd.reference.has_value());
    EXPECT_FALSE(cmd.configPath.has_value());
    EXPECT_FALSE(cmd.debug);
    EXPECT_FALSE(cmd.help);
}

TEST(CommandLineTest, ShortAndLongOptions) {
    const auto a = parse({"-r", "v1.0", "-d", "-c", "/tmp/gm.yaml", "repo", "mnt"});
    EXPECT_EQ(a.reference, "v1.0");
    EXPECT_TRUE(a.debug);
    EXPECT_EQ(a.configPath, std::filesystem::path("/tmp/gm.yaml"));

    const auto b = parse({"repo", "--ref=feature/x", "mnt", "--config", "cfg.yaml", "--debug"});
    EXPECT_EQ(b.reference, "feature/x");
    EXPECT_EQ(b.configPath, std::filesystem::path("cfg.yaml"));
    EXPECT_TRUE(b.debug);
    EXPECT_EQ(b.gitPath, "repo");
    EXPECT_EQ(b.mountPath, "mnt");
}

TEST(CommandLineTest, DoubleDashEndsOptions) {
    const auto cmd = parse({"--", "-weird-repo", "mnt"});
    EXPECT_EQ(cmd.gitPath, "-weird-repo");
    EXPECT_EQ(cmd.mountPath, "mnt");
}

TEST(CommandLineTest, HelpNeedsNoPositionals) {
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_TRUE(parse({"-h", "only-one"}).help);
}

TEST(CommandLineTest, RejectsBadInput) {
    EXPECT_EQ(kindOf([] { (void)parse({"repo"}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([] { (void)parse({"a", "b", "c"}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([] { (void)parse({"--bogus", "a", "b"}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([] { (void)parse({"a", "b", "-r"}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([] { (void)parse({"--ref=", "a", "b"}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kindOf([] { (void)parse({"--refs", "x", "a", "b"}); }), ErrorKind::InvalidArgument);
}

TEST(CommandLineTest, UsageNamesProgram) {
    const auto text = usage("gitmount");
    EXPECT_EQ(text.rfind("Usage: gitmount [options] <git_path> <mount_path>", 0), 0u);
    EXPECT_NE(text.find("--ref"), std::string::npos);
}
