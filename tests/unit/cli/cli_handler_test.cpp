#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "../../common/utilities_test.hpp"
#include "codequery_cli/cli_handler.hpp"

namespace codequery_cli {

using codequery_tests::TestUtilities;
using ::testing::HasSubstr;

namespace {

// Builds a mutable argv for parse_arguments
class Args {
 public:
  Args(std::initializer_list<std::string> args) : storage_(args) {
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
  }

  int argc() const { return static_cast<int>(pointers_.size()); }
  char** argv() { return pointers_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

}  // namespace

class CliHandlerTest : public codequery_tests::TempDirectoryTestBase {
 protected:
  void SetUp() override {
    TempDirectoryTestBase::SetUp();
    handler_ = std::make_unique<CliHandler>(TestUtilities::create_sparse_config(), nullptr);
  }

  CliOptions parse(std::initializer_list<std::string> args) {
    Args built(args);
    return handler_->parse_arguments(built.argc(), built.argv());
  }

  std::unique_ptr<CliHandler> handler_;
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({"codequery"}).command, Command::Help);
  EXPECT_EQ(parse({"codequery", "--help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, ParsesIndexCommand) {
  auto options = parse({"codequery", "index", "--dir", "/repo", "--out", "/tmp/idx"});
  EXPECT_EQ(options.command, Command::Index);
  EXPECT_EQ(options.directory, "/repo");
  EXPECT_EQ(options.index_path, "/tmp/idx");
}

TEST_F(CliHandlerTest, IndexRequiresDirectory) {
  EXPECT_THROW(parse({"codequery", "index"}), CliError);
  EXPECT_THROW(parse({"codequery", "index", "--out", "/tmp/idx"}), CliError);
}

TEST_F(CliHandlerTest, ParsesSearchCommand) {
  auto options = parse({"codequery", "s", "-q", "socket handling", "-k", "7", "-i", "/idx"});
  EXPECT_EQ(options.command, Command::Search);
  EXPECT_EQ(options.query, "socket handling");
  EXPECT_EQ(options.top_k, 7);
  EXPECT_EQ(options.index_path, "/idx");
}

TEST_F(CliHandlerTest, ParsesAskCommandWithDefaults) {
  auto options = parse({"codequery", "ask", "--query", "what does it do"});
  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.top_k, 0);
  EXPECT_TRUE(options.index_path.empty());
}

TEST_F(CliHandlerTest, RejectsBadInput) {
  EXPECT_THROW(parse({"codequery", "search"}), CliError);
  EXPECT_THROW(parse({"codequery", "search", "--query", "x", "--top-k", "many"}), CliError);
  EXPECT_THROW(parse({"codequery", "search", "--query", "x", "--top-k", "0"}), CliError);
  EXPECT_THROW(parse({"codequery", "search", "--query"}), CliError);
  EXPECT_THROW(parse({"codequery", "search", "--query", "x", "--verbose", "1"}), CliError);
  EXPECT_THROW(parse({"codequery", "frobnicate"}), CliError);
}

TEST_F(CliHandlerTest, IndexThenSearchThroughTheCli) {
  const auto repo = temp_dir_ / "repo";
  const auto index = temp_dir_ / "index";
  for (const auto& document : TestUtilities::create_test_corpus()) {
    TestUtilities::write_file(repo / document.filepath, document.content);
  }

  handler_->execute_command(
      parse({"codequery", "index", "--dir", repo.string(), "--out", index.string()}));
  ASSERT_TRUE(std::filesystem::exists(index / "chunks.db"));

  testing::internal::CaptureStdout();
  handler_->execute_command(parse(
      {"codequery", "search", "--query", "storage pages cache", "--top-k", "1", "--index",
       index.string()}));
  std::string output = testing::internal::GetCapturedStdout();

  EXPECT_THAT(output, HasSubstr("1. src/storage.cpp"));
}

TEST_F(CliHandlerTest, AskWithoutModelServicePrintsError) {
  const auto repo = temp_dir_ / "repo";
  const auto index = temp_dir_ / "index";
  for (const auto& document : TestUtilities::create_test_corpus()) {
    TestUtilities::write_file(repo / document.filepath, document.content);
  }
  handler_->execute_command(
      parse({"codequery", "index", "--dir", repo.string(), "--out", index.string()}));

  testing::internal::CaptureStdout();
  handler_->execute_command(
      parse({"codequery", "ask", "--query", "how is the parser built", "--index", index.string()}));
  std::string output = testing::internal::GetCapturedStdout();

  EXPECT_THAT(output, HasSubstr("Error generating answer"));
  EXPECT_THAT(output, HasSubstr("retrieved chunks"));
}

TEST_F(CliHandlerTest, SearchWithoutIndexThrows) {
  EXPECT_THROW(handler_->execute_command(parse(
                   {"codequery", "search", "--query", "x", "--index",
                    (temp_dir_ / "missing").string()})),
               codequery_core::ChunkArchiveError);
}

}  // namespace codequery_cli
