#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "voxrag_core/errors.hpp"
#include "voxrag_core/services/conversation_state.hpp"
#include "voxrag_core/services/prompt_builder.hpp"
#include "../../common/utilities_test.hpp"

namespace voxrag_core {

using testing::HasSubstr;
using testing::Not;

class PromptBuilderTest : public ::testing::Test {
 protected:
  RetrievalResult retrieved(const std::vector<std::pair<std::string, std::string>>& sources) {
    RetrievalResult result;
    float distance = 0.5f;
    for (const auto& [path, text] : sources) {
      result.hits.push_back(
          {voxrag_tests::TestUtilities::create_test_document(path + "#0", text, path), distance});
      distance += 0.25f;
    }
    return result;
  }

  std::vector<ConversationTurn> turns(size_t count) {
    std::vector<ConversationTurn> history;
    for (size_t i = 0; i < count; ++i) {
      ConversationRole role = i % 2 == 0 ? ConversationRole::User : ConversationRole::Agent;
      history.push_back(ConversationState::make_turn(role, "turn " + std::to_string(i)));
    }
    return history;
  }
};

TEST_F(PromptBuilderTest, InvalidBudgetsThrow) {
  EXPECT_THROW(PromptBuilder(0, 6, 400), std::invalid_argument);
  EXPECT_THROW(PromptBuilder(4000, 6, 0), std::invalid_argument);
}

TEST_F(PromptBuilderTest, RendersContextConversationAndQuestion) {
  PromptBuilder builder(4000, 6, 400);
  std::vector<ConversationTurn> history = {
      ConversationState::make_turn(ConversationRole::User, "Hi"),
      ConversationState::make_turn(ConversationRole::Agent, "Hello! How can I help?"),
  };

  AssembledPrompt prompt = builder.build(
      retrieved({{"hours.txt", "Support hours: Mon-Fri 9am-6pm EST."}}), history, "When are you open?");

  EXPECT_EQ(prompt.text,
            "Context:\n"
            "[Source 1: hours.txt]\n"
            "Support hours: Mon-Fri 9am-6pm EST.\n\n"
            "Conversation:\n"
            "user: Hi\n"
            "agent: Hello! How can I help?\n\n"
            "Question: When are you open?\n\n"
            "Answer briefly:");
  EXPECT_EQ(prompt.documents_used, 1u);
  EXPECT_EQ(prompt.turns_used, 2u);
  EXPECT_FALSE(prompt.trimmed);
}

TEST_F(PromptBuilderTest, OmitsEmptySections) {
  PromptBuilder builder(4000, 6, 400);

  AssembledPrompt prompt = builder.build(RetrievalResult{}, {}, "Hello?");

  EXPECT_EQ(prompt.text, "Question: Hello?\n\nAnswer briefly:");
  EXPECT_EQ(prompt.documents_used, 0u);
}

TEST_F(PromptBuilderTest, SourcesAreNumberedInRankOrder) {
  PromptBuilder builder(4000, 6, 400);

  AssembledPrompt prompt =
      builder.build(retrieved({{"a.txt", "Alpha."}, {"b.txt", "Beta."}}), {}, "q");

  EXPECT_LT(prompt.text.find("[Source 1: a.txt]\nAlpha."), prompt.text.find("[Source 2: b.txt]\nBeta."));
}

TEST_F(PromptBuilderTest, OnlyMostRecentTurnsWithinTurnBudget) {
  PromptBuilder builder(4000, 2, 400);

  AssembledPrompt prompt = builder.build(RetrievalResult{}, turns(6), "q");

  EXPECT_EQ(prompt.turns_used, 2u);
  EXPECT_THAT(prompt.text, Not(HasSubstr("turn 3")));
  EXPECT_LT(prompt.text.find("user: turn 4"), prompt.text.find("agent: turn 5"));
}

TEST_F(PromptBuilderTest, ZeroTurnBudgetDropsConversation) {
  PromptBuilder builder(4000, 0, 400);

  AssembledPrompt prompt = builder.build(RetrievalResult{}, turns(4), "q");

  EXPECT_EQ(prompt.turns_used, 0u);
  EXPECT_THAT(prompt.text, Not(HasSubstr("Conversation:")));
}

TEST_F(PromptBuilderTest, LongDocumentsAreCutToContextLimit) {
  PromptBuilder builder(4000, 6, 400);

  AssembledPrompt prompt = builder.build(retrieved({{"long.txt", std::string(1000, 'x')}}), {}, "q");

  EXPECT_THAT(prompt.text, HasSubstr(std::string(400, 'x') + "\n\n"));
  EXPECT_THAT(prompt.text, Not(HasSubstr(std::string(401, 'x'))));
}

TEST_F(PromptBuilderTest, NeverExceedsBudgetAndKeepsQueryVerbatim) {
  const std::string query = "What are your business hours on public holidays?";
  auto documents = retrieved({{"a.txt", std::string(300, 'a')},
                              {"b.txt", std::string(300, 'b')},
                              {"c.txt", std::string(300, 'c')}});
  auto history = turns(6);

  for (size_t budget = 80; budget <= 1400; budget += 37) {
    PromptBuilder builder(budget, 6, 400);
    AssembledPrompt prompt = builder.build(documents, history, query);

    EXPECT_LE(prompt.text.size(), budget) << "budget " << budget;
    EXPECT_THAT(prompt.text, HasSubstr("Question: " + query + "\n\nAnswer briefly:"));
  }
}

TEST_F(PromptBuilderTest, TrimsLastRankedDocumentFirst) {
  auto documents = retrieved({{"a.txt", std::string(200, 'a')}, {"b.txt", std::string(200, 'b')}});
  PromptBuilder full_builder(4000, 6, 400);
  const size_t full_size = full_builder.build(documents, {}, "q").text.size();

  PromptBuilder builder(full_size - 50, 6, 400);
  AssembledPrompt prompt = builder.build(documents, {}, "q");

  EXPECT_TRUE(prompt.trimmed);
  EXPECT_EQ(prompt.documents_used, 2u);
  EXPECT_THAT(prompt.text, HasSubstr(std::string(200, 'a')));
  EXPECT_THAT(prompt.text, HasSubstr(std::string(150, 'b')));
  EXPECT_THAT(prompt.text, Not(HasSubstr(std::string(151, 'b'))));
  EXPECT_EQ(prompt.text.size(), full_size - 50);
}

TEST_F(PromptBuilderTest, DropsDocumentsBeforeTurns) {
  auto documents = retrieved({{"a.txt", std::string(300, 'a')}});
  auto history = turns(2);
  PromptBuilder no_context_builder(4000, 6, 400);
  const size_t without_context = no_context_builder.build(RetrievalResult{}, history, "q").text.size();

  PromptBuilder builder(without_context, 6, 400);
  AssembledPrompt prompt = builder.build(documents, history, "q");

  EXPECT_EQ(prompt.documents_used, 0u);
  EXPECT_EQ(prompt.turns_used, 2u);
  EXPECT_EQ(prompt.text.size(), without_context);
}

TEST_F(PromptBuilderTest, QueryAloneOverBudgetThrows) {
  PromptBuilder builder(64, 6, 400);

  EXPECT_THROW(builder.build(RetrievalResult{}, {}, std::string(100, 'q')), PromptTooLargeError);
}

TEST_F(PromptBuilderTest, TrimmingKeepsUtf8Intact) {
  std::string accented;
  for (int i = 0; i < 100; ++i) {
    accented += "\xC3\xA9";
  }
  auto documents = retrieved({{"fr.txt", accented}});
  PromptBuilder full_builder(4000, 6, 400);
  const size_t full_size = full_builder.build(documents, {}, "q").text.size();

  PromptBuilder builder(full_size - 3, 6, 400);
  AssembledPrompt prompt = builder.build(documents, {}, "q");

  EXPECT_LE(prompt.text.size(), full_size - 3);
  const size_t start = prompt.text.find("\xC3\xA9");
  const size_t end = prompt.text.find("\n\nQuestion:");
  ASSERT_NE(start, std::string::npos);
  EXPECT_EQ((end - start) % 2, 0u);
}

}  // namespace voxrag_core
