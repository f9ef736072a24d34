#include "passage_cli/cli_handler.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace passage_cli {

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "passage_cli");
    std::vector<char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  CliHandler handler_{"http://127.0.0.1:3030"};
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, ParsesCommandsAndAliases) {
  EXPECT_EQ(parse({"ingest"}).command, Command::Ingest);
  EXPECT_EQ(parse({"i"}).command, Command::Ingest);
  EXPECT_EQ(parse({"documents"}).command, Command::Documents);
  EXPECT_EQ(parse({"d"}).command, Command::Documents);
  EXPECT_EQ(parse({"stats"}).command, Command::Stats);
  EXPECT_EQ(parse({"s", "-q", "bail"}).command, Command::Search);
  EXPECT_EQ(parse({"c", "-q", "bail"}).command, Command::Context);
  EXPECT_EQ(parse({"a", "-q", "bail"}).command, Command::Ask);
}

TEST_F(CliHandlerTest, ParsesSearchFlags) {
  auto options = parse({"search", "--query", "punishment for murder", "--top-k", "3", "--json"});
  EXPECT_EQ(options.command, Command::Search);
  EXPECT_EQ(options.query, "punishment for murder");
  EXPECT_EQ(options.top_k, 3);
  EXPECT_TRUE(options.raw_json);
  EXPECT_EQ(options.max_chars, 3000);
}

TEST_F(CliHandlerTest, ParsesContextBudget) {
  auto options = parse({"context", "-q", "bail", "-m", "1200", "-k", "7"});
  EXPECT_EQ(options.max_chars, 1200);
  EXPECT_EQ(options.top_k, 7);
  EXPECT_FALSE(options.raw_json);
}

TEST_F(CliHandlerTest, RejectsBadInput) {
  EXPECT_THROW(parse({"frobnicate"}), CliError);
  EXPECT_THROW(parse({"search"}), CliError);
  EXPECT_THROW(parse({"search", "--query"}), CliError);
  EXPECT_THROW(parse({"search", "-q", "x", "--verbose", "1"}), CliError);
  EXPECT_THROW(parse({"search", "-q", "x", "-k", "three"}), CliError);
  EXPECT_THROW(parse({"search", "-q", "x", "-k", "3x"}), CliError);
  EXPECT_THROW(parse({"search", "-q", "x", "-k", "0"}), CliError);
}

TEST_F(CliHandlerTest, BuildUrlAddsSchemeAndTrimsSlashes) {
  EXPECT_EQ(handler_.build_url("/search"), "http://127.0.0.1:3030/search");

  handler_.set_api_base_url("localhost:8080/");
  EXPECT_EQ(handler_.get_api_base_url(), "localhost:8080/");
  EXPECT_EQ(handler_.build_url("/ask"), "http://localhost:8080/ask");

  handler_.set_api_base_url("https://passage.example.com//");
  EXPECT_EQ(handler_.build_url("/stats"), "https://passage.example.com/stats");
}

TEST_F(CliHandlerTest, MovedHandlerKeepsBaseUrl) {
  CliHandler moved(std::move(handler_));
  EXPECT_EQ(moved.get_api_base_url(), "http://127.0.0.1:3030");
  EXPECT_EQ(moved.build_url("/"), "http://127.0.0.1:3030/");
}

}  // namespace passage_cli
