#include <gtest/gtest.h>

#include "../../common/grammar.h"
#include "../../common/test_helpers.h"
#include "../../../src/cli/commands/analysis_options.h"
#include <exflow/cli/exflow_cli.h>

using namespace exflow;
using namespace exflow::cli;
using exflow::test::ScopedEnvVar;
using exflow::test::TempDir;
using exflow::test::write_file;

namespace {

int runCli(std::vector<std::string> args) {
    args.insert(args.begin(), "exflow");
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    ExflowCLI cli;
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

class ExflowCliTest : public ::testing::Test {
protected:
    TempDir dir_{"exflow_cli_"};
    // Keep the user's configuration out of the way.
    ScopedEnvVar xdg_{"XDG_CONFIG_HOME", (dir_ / "xdg").string()};
    ScopedEnvVar config_{"EXFLOW_CONFIG", std::nullopt};
    ScopedEnvVar noColor_{"NO_COLOR", std::string("1")};
};

TEST(MergeAnalysisOptionsTest, FlagsOverrideConfig) {
    config::AnalyzerConfig cfg;
    cfg.maxDepth = 5;
    cfg.ignore = {"HTTPException"};

    auto merged = mergeAnalysisOptions(cfg, "", {"ValueError"});
    ASSERT_TRUE(merged);
    EXPECT_EQ(merged.value().maxDepth, 5);
    EXPECT_EQ(merged.value().ignore, (std::set<std::string>{"HTTPException", "ValueError"}));

    auto deeper = mergeAnalysisOptions(cfg, "7");
    ASSERT_TRUE(deeper);
    EXPECT_EQ(deeper.value().maxDepth, 7);

    auto bad = mergeAnalysisOptions(cfg, "deep");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(bad.error().message.rfind("--depth: ", 0), 0u);
}

TEST(ExitCodeTest, UsageErrorsMapToTwo) {
    EXPECT_EQ(ExflowCLI::exitCodeFor(Error{ErrorCode::InvalidArgument}), kExitUsage);
    EXPECT_EQ(ExflowCLI::exitCodeFor(Error{ErrorCode::FileNotFound}), kExitUsage);
    EXPECT_EQ(ExflowCLI::exitCodeFor(Error{ErrorCode::NotFound}), kExitUsage);
    EXPECT_EQ(ExflowCLI::exitCodeFor(Error{ErrorCode::NotSupported}), kExitUsage);
    EXPECT_EQ(ExflowCLI::exitCodeFor(Error{ErrorCode::IOError}), kExitIssues);
}

TEST_F(ExflowCliTest, VersionFlagSucceeds) {
    EXPECT_EQ(runCli({"--version"}), kExitOk);
}

TEST_F(ExflowCliTest, MissingSubcommandIsAUsageError) {
    EXPECT_NE(runCli({}), kExitOk);
}

TEST_F(ExflowCliTest, NonexistentPathIsRejected) {
    EXPECT_NE(runCli({"check", (dir_ / "missing").string()}), kExitOk);
}

TEST_F(ExflowCliTest, InvalidDepthExitsTwo) {
    auto file = write_file(dir_ / "app.py", "x = 1\n");
    EXPECT_EQ(runCli({"check", "--depth=deep", file.string()}), kExitUsage);
}

TEST_F(ExflowCliTest, InvalidConfigExitsTwo) {
    auto file = write_file(dir_ / "app.py", "x = 1\n");
    auto cfg = write_file(dir_ / "bad.toml", "[output]\nformat = \"yaml\"\n");
    EXPECT_EQ(runCli({"--config", cfg.string(), "list", file.string()}), kExitUsage);
}

TEST_F(ExflowCliTest, CheckReportsUndeclaredExceptions) {
    std::string why;
    auto parser = test::try_python_parser(&why);
    GRAMMAR_MISSING_SKIP(parser, why);

    auto routes = write_file(dir_ / "app/routes.py",
                             "def guard():\n"
                             "    raise Forbidden()\n"
                             "\n"
                             "@router.get(\"/items\", exceptions=[NotFound])\n"
                             "def list_items():\n"
                             "    guard()\n");
    EXPECT_EQ(runCli({"check", "-q", routes.string()}), kExitIssues);
    EXPECT_EQ(runCli({"check", "-q", "--ignore", "Forbidden", routes.string()}), kExitOk);
    EXPECT_EQ(runCli({"check", "-q", "--depth", "0", routes.string()}), kExitOk);
    EXPECT_EQ(runCli({"list", routes.string()}), kExitOk);
    EXPECT_EQ(runCli({"suggest", "--format", "diff", routes.string()}), kExitOk);
}

TEST_F(ExflowCliTest, StrictFailsOnUnparsableFiles) {
    std::string why;
    auto parser = test::try_python_parser(&why);
    GRAMMAR_MISSING_SKIP(parser, why);

    write_file(dir_ / "src/broken.py", "def nope(:\n");
    EXPECT_EQ(runCli({"check", "-q", (dir_ / "src").string()}), kExitOk);
    EXPECT_EQ(runCli({"check", "-q", "--strict", (dir_ / "src").string()}), kExitIssues);

    auto cfg = write_file(dir_ / "strict.toml", "[output]\nstrict = true\n");
    EXPECT_EQ(runCli({"--config", cfg.string(), "check", "-q", (dir_ / "src").string()}),
              kExitIssues);
}
