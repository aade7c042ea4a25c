#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "voxrag_cli/cli_handler.hpp"

namespace voxrag_cli {

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "voxrag_cli");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  CliHandler handler_{"http://127.0.0.1:3030"};
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, ParsesAsk) {
  CliOptions options = parse({"ask", "--session", "caller-1", "--query", "What are your hours?", "-v"});

  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.session_id, "caller-1");
  EXPECT_EQ(options.query, "What are your hours?");
  EXPECT_TRUE(options.verbose);
}

TEST_F(CliHandlerTest, ParsesRetrieveWithTopK) {
  CliOptions options = parse({"retrieve", "-q", "password", "-k", "5"});

  EXPECT_EQ(options.command, Command::Retrieve);
  EXPECT_EQ(options.query, "password");
  EXPECT_EQ(options.top_k, 5);
}

TEST_F(CliHandlerTest, RetrieveDefaultsTopKToThree) {
  EXPECT_EQ(parse({"retrieve", "--query", "hours"}).top_k, 3);
}

TEST_F(CliHandlerTest, ParsesSessionCommands) {
  EXPECT_EQ(parse({"start", "--session", "s"}).command, Command::Start);
  EXPECT_EQ(parse({"history", "--session", "s"}).command, Command::History);
  EXPECT_EQ(parse({"end", "-s", "s"}).command, Command::End);
}

TEST_F(CliHandlerTest, MissingRequiredOptionsThrow) {
  EXPECT_THROW(parse({"ask", "--query", "hi"}), CliError);
  EXPECT_THROW(parse({"ask", "--session", "s"}), CliError);
  EXPECT_THROW(parse({"retrieve"}), CliError);
  EXPECT_THROW(parse({"history"}), CliError);
}

TEST_F(CliHandlerTest, MalformedOptionsThrow) {
  EXPECT_THROW(parse({"frobnicate"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query", "x", "--top-k", "many"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query", "x", "--top-k", "0"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query", "x", "--colour", "red"}), CliError);
}

TEST_F(CliHandlerTest, ApiBaseUrlCanBeChanged) {
  EXPECT_EQ(handler_.get_api_base_url(), "http://127.0.0.1:3030");
  handler_.set_api_base_url("http://10.0.0.5:8080");
  EXPECT_EQ(handler_.get_api_base_url(), "http://10.0.0.5:8080");
}

}  // namespace voxrag_cli
