#pragma once

#include <gmock/gmock.h>

#include <memory>

#include "passage_core/llm/ollama_client.hpp"
#include "passage_core/retrieval/retriever.hpp"
#include "passage_core/services/answer_service.hpp"
#include "passage_core/services/embedding_service.hpp"
#include "utilities_test.hpp"

namespace passage_tests {

/**
 * Mock class for OllamaClient. By default embeddings come from
 * TestUtilities::fake_embedding so no server is needed.
 */
class MockOllamaClient : public passage_core::OllamaClient {
 public:
  explicit MockOllamaClient(const std::string& generation_model = "",
                            size_t dimension = 8)
      : passage_core::OllamaClient("http://localhost:11434", "test-embed", generation_model) {
    ON_CALL(*this, get_embedding(testing::_))
        .WillByDefault([dimension](const std::string& text) {
          return TestUtilities::fake_embedding(text, dimension);
        });
    ON_CALL(*this, get_embeddings(testing::_))
        .WillByDefault([dimension](const std::vector<std::string>& texts) {
          std::vector<std::vector<float>> vectors;
          for (const auto& text : texts) {
            vectors.push_back(TestUtilities::fake_embedding(text, dimension));
          }
          return vectors;
        });
    ON_CALL(*this, is_server_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string& text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, get_embeddings,
              (const std::vector<std::string>& texts), (override));
  MOCK_METHOD(std::string, generate, (const std::string& prompt), (override));
  MOCK_METHOD(bool, is_server_available, (), (override));
};

class MockEmbeddingService : public passage_core::EmbeddingService {
 public:
  MockEmbeddingService()
      : passage_core::EmbeddingService(std::make_shared<testing::NiceMock<MockOllamaClient>>()) {}

  MOCK_METHOD(void, ensure_ready, (), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, embed, (const std::vector<std::string>& texts),
              (override));
  MOCK_METHOD(std::vector<float>, embed_one, (const std::string& text), (override));
  MOCK_METHOD(size_t, dimension, (), (override));
  MOCK_METHOD(std::string, model_name, (), (const, override));
};

class MockRetriever : public passage_core::Retriever {
 public:
  MockRetriever() : passage_core::Retriever(nullptr) {}

  MOCK_METHOD(std::vector<passage_core::RetrievalResult>, search,
              (const std::string& query, int top_k), (override));
};

class MockAnswerService : public passage_core::AnswerService {
 public:
  MockAnswerService()
      : passage_core::AnswerService(std::make_shared<testing::NiceMock<MockOllamaClient>>()) {}

  MOCK_METHOD(std::string, answer, (const std::string& query, const std::string& context),
              (override));
  MOCK_METHOD(std::string, quick_answer, (const std::string& query), (override));
};

namespace MockUtilities {

inline passage_core::RetrievalResult create_result(int slot_id,
                                                   const std::string& text,
                                                   float score,
                                                   int rank,
                                                   const std::string& document = "doc.txt",
                                                   int page = 1) {
  passage_core::RetrievalResult result;
  result.slot_id = slot_id;
  result.document = document;
  result.document_title = passage_core::title_from_filename(document);
  result.page = page;
  result.text = text;
  result.score = score;
  result.rank = rank;
  return result;
}

}  // namespace MockUtilities

}  // namespace passage_tests
