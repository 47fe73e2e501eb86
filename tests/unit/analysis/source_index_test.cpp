#include <memory>
#include <gtest/gtest.h>

#include "../../common/fake_source_parser.h"
#include "../../common/test_helpers.h"
#include <exflow/analysis/source_discovery.h>
#include <exflow/analysis/source_index.h>
#include <exflow/analysis/transitive_analyzer.h>

using namespace exflow;
using namespace exflow::analysis;
using exflow::test::FakeSourceParser;
using exflow::test::FunctionBuilder;
using exflow::test::TempDir;
using exflow::test::write_file;

class SourceIndexTest : public ::testing::Test {
protected:
    void SetUp() override { parser_ = std::make_shared<FakeSourceParser>(); }

    std::shared_ptr<FakeSourceParser> parser_;
    TempDir dir_{"exflow_index_"};
};

TEST_F(SourceIndexTest, RegistersEveryFunctionOfAFile) {
    parser_->add("helpers.py", {FunctionBuilder("check", 3).build(),
                                FunctionBuilder("nested", 5).build()});
    auto file = write_file(dir_ / "helpers.py", "def check(): ...\n");

    SourceIndex index(parser_);
    index.registerFile(file);

    EXPECT_TRUE(index.isRegistered(file));
    EXPECT_EQ(index.functionCount(), 2u);

    auto found = index.lookup("nested");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->file, file);
    EXPECT_EQ(found->function->loc.line, 5u);
    EXPECT_FALSE(index.lookup("missing").has_value());
}

TEST_F(SourceIndexTest, RegistrationIsIdempotent) {
    parser_->add("a.py", {FunctionBuilder("f").build()});
    auto file = write_file(dir_ / "a.py", "x");

    SourceIndex index(parser_);
    index.registerFile(file);
    index.registerFile(file);
    ASSERT_TRUE(index.load(file));

    EXPECT_EQ(parser_->parseCalls, 1);
}

TEST_F(SourceIndexTest, LastRegistrationWins) {
    parser_->add("first.py", {FunctionBuilder("helper", 10).build()});
    parser_->add("second.py", {FunctionBuilder("helper", 20).build()});
    auto first = write_file(dir_ / "first.py", "x");
    auto second = write_file(dir_ / "second.py", "x");

    SourceIndex index(parser_);
    index.registerFile(first);
    index.registerFile(second);

    auto found = index.lookup("helper");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->file, second);
    EXPECT_EQ(found->function->loc.line, 20u);
}

TEST_F(SourceIndexTest, SameNameInOneFileResolvesToLaterDefinition) {
    parser_->add("a.py", {FunctionBuilder("save", 2).build(), FunctionBuilder("save", 9).build()});
    auto file = write_file(dir_ / "a.py", "x");

    SourceIndex index(parser_);
    index.registerFile(file);

    auto found = index.lookup("save");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->function->loc.line, 9u);
}

TEST_F(SourceIndexTest, SyntaxErrorsAreCachedAndNotRegistered) {
    auto file = write_file(dir_ / "broken.py", "#!syntax-error\ndef (:\n");

    SourceIndex index(parser_);
    index.registerFile(file);
    EXPECT_FALSE(index.isRegistered(file));

    auto loaded = index.load(file);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::ParseError);
    EXPECT_EQ(parser_->parseCalls, 1);
}

TEST_F(SourceIndexTest, InvalidUtf8IsAnEncodingError) {
    auto file = write_file(dir_ / "latin1.py", std::string("name = 'caf\xe9'\n"));

    SourceIndex index(parser_);
    auto loaded = index.load(file);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::EncodingError);
    EXPECT_NE(loaded.error().message.find("0xe9"), std::string::npos);
    EXPECT_NE(loaded.error().message.find("position 11"), std::string::npos);
    EXPECT_EQ(parser_->parseCalls, 0);
}

TEST_F(SourceIndexTest, MissingFileIsAReadError) {
    SourceIndex index(parser_);
    auto loaded = index.load(dir_ / "nope.py");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::IOError);
}

TEST_F(SourceIndexTest, InMemoryModulesAreResolvable) {
    SourceIndex index(nullptr);
    index.registerModule(std::make_shared<const syntax::ModuleSyntax>(
        exflow::test::make_module("mem.py", {FunctionBuilder("helper").build()})));

    EXPECT_TRUE(index.isRegistered("mem.py"));
    ASSERT_TRUE(index.lookup("helper").has_value());
    EXPECT_TRUE(index.load("mem.py"));
}

TEST_F(SourceIndexTest, ReRegisteringAModuleReplacesItsFunctions) {
    using exflow::test::make_module;
    SourceIndex index(nullptr);
    index.registerModule(std::make_shared<const syntax::ModuleSyntax>(make_module(
        "other.py", {FunctionBuilder("shared", 1).build(), FunctionBuilder("kept", 2).build()})));
    index.registerModule(std::make_shared<const syntax::ModuleSyntax>(make_module(
        "api.py", {FunctionBuilder("helper", 3).raises("Old", 4).build(),
                   FunctionBuilder("shared", 6).build()})));

    auto replacement = std::make_shared<const syntax::ModuleSyntax>(make_module(
        "api.py", {FunctionBuilder("endpoint", 1).calls("helper", 2).build()}));
    index.registerModule(replacement);

    EXPECT_FALSE(index.lookup("helper").has_value());
    EXPECT_FALSE(index.lookup("shared").has_value());
    ASSERT_TRUE(index.lookup("kept").has_value());
    EXPECT_EQ(index.lookup("kept")->file, std::filesystem::path("other.py"));
    EXPECT_EQ(index.functionCount(), 2u);

    auto endpoint = index.lookup("endpoint");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->function, &replacement->functions[0]);

    TransitiveAnalyzer traversal(index);
    EXPECT_TRUE(traversal.analyzeEndpoint("api.py", *endpoint->function).empty());
    EXPECT_EQ(traversal.stats().unresolvedCalls, 1u);
}

TEST_F(SourceIndexTest, LoadWithoutParserFails) {
    SourceIndex index(nullptr);
    auto loaded = index.load(write_file(dir_ / "a.py", "x"));
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::NotInitialized);
}

TEST(SourceDiscoveryTest, FindsPythonFilesRecursivelyInSortedOrder) {
    TempDir dir("exflow_discovery_");
    write_file(dir / "b.py", "");
    write_file(dir / "a.py", "");
    write_file(dir / "pkg/sub/c.py", "");
    write_file(dir / ".hidden/d.py", "");
    write_file(dir / "notes.txt", "");
    write_file(dir / "script.pyi", "");

    auto files = discoverSourceFiles(dir.path());

    std::vector<std::filesystem::path> expected{dir / ".hidden/d.py", dir / "a.py", dir / "b.py",
                                                dir / "pkg/sub/c.py"};
    EXPECT_EQ(files, expected);
}

TEST(SourceDiscoveryTest, SingleFileIsReturnedAsIs) {
    TempDir dir("exflow_discovery_");
    auto file = write_file(dir / "routes.txt", "");

    auto files = discoverSourceFiles(file);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], file);
}

TEST(SourceDiscoveryTest, MissingPathYieldsNothing) {
    TempDir dir("exflow_discovery_");
    EXPECT_TRUE(discoverSourceFiles(dir / "does-not-exist").empty());
}

TEST(SourceDiscoveryTest, ReadSourceFileReturnsBytes) {
    TempDir dir("exflow_discovery_");
    auto file = write_file(dir / "a.py", std::string("x = 1\n\0y", 9));

    auto read = readSourceFile(file);
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value().size(), 9u);
    EXPECT_FALSE(readSourceFile(dir / "missing.py"));
}
