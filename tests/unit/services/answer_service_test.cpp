#include "passage_core/services/answer_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/mocks_test.hpp"

namespace passage_core {

using passage_tests::MockOllamaClient;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class AnswerServiceTest : public ::testing::Test {
 protected:
  const std::string context_ =
      "[Source 1: indian penal code, Page 3]\nWhoever commits murder shall be punished with "
      "death or imprisonment for life.\n";
};

TEST_F(AnswerServiceTest, PromptCarriesQuestionAndContext) {
  const std::string prompt = AnswerService::build_prompt("What is the punishment?", context_);
  EXPECT_THAT(prompt, HasSubstr(context_));
  EXPECT_THAT(prompt, HasSubstr("What is the punishment?"));
  EXPECT_LT(prompt.find(context_), prompt.find("What is the punishment?"));
}

TEST_F(AnswerServiceTest, GeneratesWithModel) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>("llama3");
  EXPECT_CALL(*client, generate(HasSubstr("punishment for murder")))
      .WillOnce(Return("Death or life imprisonment (Source 1, Page 3)."));
  AnswerService service(client);

  EXPECT_TRUE(service.generation_available());
  EXPECT_EQ(service.answer("What is the punishment for murder?", context_),
            "Death or life imprisonment (Source 1, Page 3).");
}

TEST_F(AnswerServiceTest, WithoutModelQuotesContext) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>();
  EXPECT_CALL(*client, generate(_)).Times(0);
  AnswerService service(client);

  EXPECT_FALSE(service.generation_available());
  const std::string answer = service.answer("punishment?", context_);
  EXPECT_EQ(answer, AnswerService::fallback_answer("punishment?", context_));
  EXPECT_THAT(answer, HasSubstr(context_));
}

TEST_F(AnswerServiceTest, ShortContextMeansNothingFound) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>("llama3");
  EXPECT_CALL(*client, generate(_)).Times(0);
  AnswerService service(client);

  const std::string answer = service.answer("anything?", "   tiny context   ");
  EXPECT_THAT(answer, HasSubstr(AnswerService::NO_CONTEXT_MESSAGE));
  EXPECT_THAT(service.answer("anything?", ""), HasSubstr(AnswerService::NO_CONTEXT_MESSAGE));
}

TEST_F(AnswerServiceTest, GenerationFailureFallsBack) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>("llama3");
  EXPECT_CALL(*client, generate(_)).WillOnce([](const std::string &) -> std::string {
    throw OllamaError("model not found");
  });
  AnswerService service(client);

  EXPECT_EQ(service.answer("q", context_), AnswerService::fallback_answer("q", context_));
}

TEST_F(AnswerServiceTest, BlankGenerationFallsBack) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>("llama3");
  EXPECT_CALL(*client, generate(_)).WillOnce(Return("  \n "));
  AnswerService service(client);

  EXPECT_EQ(service.answer("q", context_), AnswerService::fallback_answer("q", context_));
}

TEST_F(AnswerServiceTest, QuickAnswerWithoutModelExplainsSetup) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>();
  AnswerService service(client);
  EXPECT_EQ(service.quick_answer("what is bail?"), AnswerService::setup_instructions());
}

TEST_F(AnswerServiceTest, QuickAnswerUsesModel) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>("llama3");
  EXPECT_CALL(*client, generate(HasSubstr("what is bail?"))).WillOnce(Return("Release pending trial."));
  AnswerService service(client);
  EXPECT_EQ(service.quick_answer("what is bail?"), "Release pending trial.");
}

TEST_F(AnswerServiceTest, QuickAnswerReportsFailures) {
  auto client = std::make_shared<NiceMock<MockOllamaClient>>("llama3");
  EXPECT_CALL(*client, generate(_))
      .WillOnce(Return(""))
      .WillOnce([](const std::string &) -> std::string { throw OllamaError("timeout"); });
  AnswerService service(client);

  EXPECT_EQ(service.quick_answer("q"), "Unable to generate an answer. Please try again.");
  EXPECT_THAT(service.quick_answer("q"), HasSubstr("Error generating answer: timeout"));
}

}  // namespace passage_core
