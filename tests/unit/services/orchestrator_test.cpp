#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "voxrag_core/errors.hpp"
#include "voxrag_core/llm/hashing_embedder.hpp"
#include "voxrag_core/services/orchestrator.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace voxrag_core {

using testing::_;
using testing::HasSubstr;
using testing::Invoke;
using testing::Return;
using testing::SaveArg;
using testing::StrictMock;
using testing::Throw;

class OrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<HashingEmbedder>();
    index_ = std::make_shared<EmbeddingIndex>();
    index_->build(voxrag_tests::TestUtilities::create_test_documents(
                      {"Support hours: Mon-Fri 9am-6pm EST.", "Pricing: Starter $99/mo."}),
                  *embedder_);
    retriever_ = std::make_shared<Retriever>(index_, embedder_);
    generator_ = std::make_shared<StrictMock<voxrag_tests::MockResponseGenerator>>();
    options_.generation_timeout_ms = 2000;
  }

  std::unique_ptr<Orchestrator> make_orchestrator() {
    return std::make_unique<Orchestrator>(retriever_, generator_, options_);
  }

  std::shared_ptr<HashingEmbedder> embedder_;
  std::shared_ptr<EmbeddingIndex> index_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<StrictMock<voxrag_tests::MockResponseGenerator>> generator_;
  RagOptions options_;
};

TEST_F(OrchestratorTest, NullRetrieverThrows) {
  EXPECT_THROW(Orchestrator(nullptr, generator_, options_), std::invalid_argument);
}

TEST_F(OrchestratorTest, SuccessfulQueryAppendsUserAndAgentTurns) {
  auto orchestrator = make_orchestrator();
  std::string prompt;
  EXPECT_CALL(*generator_, generate(_, _))
      .WillOnce(testing::DoAll(SaveArg<0>(&prompt), Return("  We are open Monday to Friday, 9am to 6pm.\n")));

  QueryOutcome outcome = orchestrator->process_query_detailed("What are your business hours?");

  EXPECT_EQ(outcome.state, QueryState::Complete);
  EXPECT_EQ(outcome.response, "We are open Monday to Friday, 9am to 6pm.");
  EXPECT_TRUE(outcome.used_context);
  EXPECT_FALSE(outcome.error.has_value());
  ASSERT_FALSE(outcome.retrieval.empty());
  EXPECT_EQ(outcome.retrieval.hits[0].document->text, "Support hours: Mon-Fri 9am-6pm EST.");
  EXPECT_THAT(prompt, HasSubstr("Support hours: Mon-Fri 9am-6pm EST."));
  EXPECT_THAT(prompt, HasSubstr("Question: What are your business hours?"));

  auto history = orchestrator->history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].role, ConversationRole::User);
  EXPECT_EQ(history[0].text, "What are your business hours?");
  EXPECT_EQ(history[1].role, ConversationRole::Agent);
  EXPECT_EQ(history[1].text, "We are open Monday to Friday, 9am to 6pm.");
}

TEST_F(OrchestratorTest, GenerationFailureReturnsFallbackAndAppendsOnlyUserTurn) {
  auto orchestrator = make_orchestrator();
  EXPECT_CALL(*generator_, generate(_, _))
      .WillOnce(Throw(GenerationUnavailableError("connection refused")));

  std::string response = orchestrator->process_query("What are your business hours?");

  EXPECT_EQ(response, options_.fallback_response_text);
  auto history = orchestrator->history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].role, ConversationRole::User);
  EXPECT_EQ(orchestrator->failure_count(), 1u);
  ASSERT_TRUE(orchestrator->last_failure().has_value());
  EXPECT_THAT(*orchestrator->last_failure(), HasSubstr("connection refused"));
}

TEST_F(OrchestratorTest, FailureOutcomeIsReported) {
  auto orchestrator = make_orchestrator();
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Throw(GenerationRejectedError("blocked")));

  QueryOutcome outcome = orchestrator->process_query_detailed("What are your business hours?");

  EXPECT_EQ(outcome.state, QueryState::Failed);
  ASSERT_TRUE(outcome.generation_status.has_value());
  EXPECT_EQ(*outcome.generation_status, GenerationStatus::Rejected);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_THAT(*outcome.error, HasSubstr("blocked"));
  EXPECT_EQ(outcome.retrieval.size(), 2u);
}

TEST_F(OrchestratorTest, WhitespaceOnlyAnswerIsTreatedAsRejected) {
  auto orchestrator = make_orchestrator();
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Return(" \n "));

  QueryOutcome outcome = orchestrator->process_query_detailed("Pricing?");

  EXPECT_EQ(outcome.state, QueryState::Failed);
  EXPECT_EQ(outcome.response, options_.fallback_response_text);
  EXPECT_EQ(orchestrator->history().size(), 1u);
}

TEST_F(OrchestratorTest, SlowGenerationTimesOutIntoFallback) {
  options_.generation_timeout_ms = 50;
  auto slow = std::make_shared<voxrag_tests::SlowResponseGenerator>(
      std::chrono::milliseconds(500), "late answer");
  Orchestrator orchestrator(retriever_, slow, options_);

  QueryOutcome outcome = orchestrator.process_query_detailed("What are your business hours?");

  EXPECT_EQ(outcome.state, QueryState::Failed);
  EXPECT_EQ(outcome.response, options_.fallback_response_text);
  ASSERT_TRUE(outcome.generation_status.has_value());
  EXPECT_EQ(*outcome.generation_status, GenerationStatus::Timeout);
  EXPECT_EQ(orchestrator.history().size(), 1u);
}

TEST_F(OrchestratorTest, PromptTooLargeSkipsGeneration) {
  options_.prompt_char_budget = 64;
  auto orchestrator = make_orchestrator();
  EXPECT_CALL(*generator_, generate(_, _)).Times(0);

  QueryOutcome outcome = orchestrator->process_query_detailed(std::string(100, 'q'));

  EXPECT_EQ(outcome.state, QueryState::Failed);
  EXPECT_EQ(outcome.response, options_.fallback_response_text);
  EXPECT_EQ(orchestrator->history().size(), 1u);
  EXPECT_EQ(orchestrator->failure_count(), 1u);
}

TEST_F(OrchestratorTest, RetrievalFailureReturnsFallback) {
  auto unbuilt = std::make_shared<EmbeddingIndex>();
  auto retriever = std::make_shared<Retriever>(unbuilt, embedder_);
  Orchestrator orchestrator(retriever, generator_, options_);
  EXPECT_CALL(*generator_, generate(_, _)).Times(0);

  QueryOutcome outcome = orchestrator.process_query_detailed("What are your business hours?");

  EXPECT_EQ(outcome.state, QueryState::Failed);
  EXPECT_EQ(outcome.response, options_.fallback_response_text);
  EXPECT_TRUE(outcome.retrieval.empty());
  EXPECT_FALSE(outcome.used_context);
  ASSERT_EQ(orchestrator.history().size(), 1u);
  EXPECT_EQ(orchestrator.history()[0].role, ConversationRole::User);
}

TEST_F(OrchestratorTest, ContextualFallbackUsesTopDocument) {
  options_.contextual_fallback = true;
  auto orchestrator = make_orchestrator();
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Throw(GenerationTimeoutError("timed out")));

  std::string response = orchestrator->process_query("What are your business hours?");

  EXPECT_EQ(response, "Support hours: Mon-Fri 9am-6pm EST.");
}

TEST_F(OrchestratorTest, ContextualFallbackKeepsWholeSentencesOnly) {
  options_.contextual_fallback = true;
  auto index = std::make_shared<EmbeddingIndex>();
  index->build(voxrag_tests::TestUtilities::create_test_documents(
                   {"Our business hours are nine to six. " + std::string(250, 'z')}),
               *embedder_);
  Orchestrator orchestrator(std::make_shared<Retriever>(index, embedder_), generator_, options_);
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Throw(GenerationUnavailableError("down")));

  EXPECT_EQ(orchestrator.process_query("business hours?"), "Our business hours are nine to six.");
}

TEST_F(OrchestratorTest, PreviousTurnsReachTheNextPrompt) {
  auto orchestrator = make_orchestrator();
  std::string second_prompt;
  EXPECT_CALL(*generator_, generate(_, _))
      .WillOnce(Return("We open at 9am."))
      .WillOnce(testing::DoAll(SaveArg<0>(&second_prompt), Return("Until 6pm.")));

  orchestrator->process_query("When do you open?");
  orchestrator->process_query("And close?");

  EXPECT_THAT(second_prompt, HasSubstr("user: When do you open?\nagent: We open at 9am."));
  EXPECT_EQ(orchestrator->history().size(), 4u);
}

TEST_F(OrchestratorTest, EmptyQueryThrowsInEveryState) {
  auto orchestrator = make_orchestrator();

  // Fresh session
  EXPECT_THROW(orchestrator->process_query(""), EmptyQueryError);
  EXPECT_THROW(orchestrator->process_query("   \t\n"), EmptyQueryError);
  EXPECT_TRUE(orchestrator->history().empty());

  // After a completed query
  EXPECT_CALL(*generator_, generate(_, _))
      .WillOnce(Return("Answer."))
      .WillOnce(Throw(GenerationUnavailableError("down")));
  orchestrator->process_query("Pricing?");
  EXPECT_THROW(orchestrator->process_query(" "), EmptyQueryError);
  EXPECT_EQ(orchestrator->history().size(), 2u);

  // After a failed query
  orchestrator->process_query("Pricing again?");
  EXPECT_THROW(orchestrator->process_query(""), EmptyQueryError);
  EXPECT_EQ(orchestrator->history().size(), 3u);
  EXPECT_EQ(orchestrator->failure_count(), 1u);
}

TEST_F(OrchestratorTest, ConcurrentQueriesKeepTurnPairsTogether) {
  auto slow = std::make_shared<voxrag_tests::SlowResponseGenerator>(
      std::chrono::milliseconds(20), "answer");
  Orchestrator orchestrator(retriever_, slow, options_);

  constexpr int kThreads = 8;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&orchestrator, i]() {
      orchestrator.process_query("question " + std::to_string(i));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto history = orchestrator.history();
  ASSERT_EQ(history.size(), static_cast<size_t>(kThreads * 2));
  for (size_t i = 0; i < history.size(); i += 2) {
    EXPECT_EQ(history[i].role, ConversationRole::User);
    EXPECT_EQ(history[i + 1].role, ConversationRole::Agent);
  }
}

TEST_F(OrchestratorTest, SlowerEarlierQueriesKeepArrivalOrder) {
  std::atomic<int> started{0};
  EXPECT_CALL(*generator_, generate(_, _))
      .Times(3)
      .WillRepeatedly(Invoke([&started](const std::string& prompt, const GenerationOptions&) {
        ++started;
        // q0 finishes last, q2 first
        for (int i = 0; i < 3; ++i) {
          if (prompt.find("Question: q" + std::to_string(i)) != std::string::npos) {
            std::this_thread::sleep_for(std::chrono::milliseconds(150 - 60 * i));
            return "answer " + std::to_string(i);
          }
        }
        return std::string("unknown");
      }));
  auto orchestrator = make_orchestrator();

  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&orchestrator, i]() {
      orchestrator->process_query("q" + std::to_string(i));
    });
    // Next query arrives only once this one is generating
    while (started.load() < i + 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto history = orchestrator->history();
  ASSERT_EQ(history.size(), 6u);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(history[2 * i].role, ConversationRole::User);
    EXPECT_EQ(history[2 * i].text, "q" + std::to_string(i));
    EXPECT_EQ(history[2 * i + 1].role, ConversationRole::Agent);
    EXPECT_EQ(history[2 * i + 1].text, "answer " + std::to_string(i));
  }
  // User turns are stamped on arrival
  EXPECT_LE(history[0].timestamp, history[2].timestamp);
  EXPECT_LE(history[2].timestamp, history[4].timestamp);
  EXPECT_LE(history[0].timestamp, history[1].timestamp);
}

TEST_F(OrchestratorTest, SharedGeneratorAtCapacityFallsBack) {
  options_.generation_timeout_ms = 20;
  auto slow = std::make_shared<voxrag_tests::SlowResponseGenerator>(
      std::chrono::milliseconds(300), "late answer");
  auto bounded = std::make_shared<BoundedGenerator>(slow, 1);
  Orchestrator first(retriever_, bounded, options_);
  Orchestrator second(retriever_, bounded, options_);

  QueryOutcome timed_out = first.process_query_detailed("What are your business hours?");
  QueryOutcome refused = second.process_query_detailed("Pricing?");

  ASSERT_TRUE(timed_out.generation_status.has_value());
  EXPECT_EQ(*timed_out.generation_status, GenerationStatus::Timeout);
  EXPECT_EQ(refused.state, QueryState::Failed);
  ASSERT_TRUE(refused.generation_status.has_value());
  EXPECT_EQ(*refused.generation_status, GenerationStatus::Unavailable);
  EXPECT_EQ(refused.response, options_.fallback_response_text);
  ASSERT_EQ(second.history().size(), 1u);
  EXPECT_EQ(second.history()[0].text, "Pricing?");
  EXPECT_TRUE(bounded->wait_until_idle(std::chrono::milliseconds(5000)));
  EXPECT_EQ(slow->calls(), 1);
}

TEST(QueryStateTest, ToString) {
  EXPECT_EQ(to_string(QueryState::Idle), "IDLE");
  EXPECT_EQ(to_string(QueryState::Complete), "COMPLETE");
  EXPECT_EQ(to_string(QueryState::Failed), "FAILED");
}

}  // namespace voxrag_core
