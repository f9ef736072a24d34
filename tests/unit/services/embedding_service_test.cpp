#include "passage_core/services/embedding_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "passage_core/errors.hpp"

namespace passage_core {

using passage_tests::MockOllamaClient;
using passage_tests::TestUtilities;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;

class EmbeddingServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockOllamaClient>>();
  }

  std::shared_ptr<NiceMock<MockOllamaClient>> client_;
};

TEST_F(EmbeddingServiceTest, RejectsMissingClientAndZeroBatch) {
  EXPECT_THROW(EmbeddingService(nullptr), std::invalid_argument);
  EXPECT_THROW(EmbeddingService(client_, 0), std::invalid_argument);
}

TEST_F(EmbeddingServiceTest, AsksForDimensionOnce) {
  EXPECT_CALL(*client_, get_embedding("dimension probe")).Times(1);
  EmbeddingService service(client_);

  EXPECT_EQ(service.dimension(), 8u);
  service.ensure_ready();
  EXPECT_EQ(service.dimension(), 8u);
}

TEST_F(EmbeddingServiceTest, ConcurrentInitializationLoadsModelOnce) {
  std::atomic<int> loads{0};
  EXPECT_CALL(*client_, get_embedding(_)).Times(::testing::AnyNumber());
  EXPECT_CALL(*client_, get_embedding("dimension probe"))
      .Times(1)
      .WillOnce([&loads](const std::string &text) {
        ++loads;
        // Slow model load: every caller arrives while it is running
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return TestUtilities::fake_embedding(text);
      });
  EmbeddingService service(client_);

  std::promise<void> start;
  std::shared_future<void> started = start.get_future().share();
  std::vector<std::future<std::vector<float>>> calls;
  for (int i = 0; i < 8; ++i) {
    calls.push_back(std::async(std::launch::async, [&service, started, i]() {
      started.wait();
      return service.embed_one("query " + std::to_string(i));
    }));
  }
  start.set_value();

  for (size_t i = 0; i < calls.size(); ++i) {
    EXPECT_EQ(calls[i].get(), TestUtilities::fake_embedding("query " + std::to_string(i)));
  }
  EXPECT_EQ(loads.load(), 1);
  EXPECT_EQ(service.dimension(), 8u);
}

TEST_F(EmbeddingServiceTest, ConcurrentCallersRetryAfterFailedModelLoad) {
  std::atomic<int> loads{0};
  EXPECT_CALL(*client_, get_embedding("dimension probe"))
      .WillOnce([&loads](const std::string &) -> std::vector<float> {
        ++loads;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        throw OllamaError("connection refused");
      })
      .WillRepeatedly([&loads](const std::string &text) {
        ++loads;
        return TestUtilities::fake_embedding(text);
      });
  EmbeddingService service(client_);

  std::vector<std::future<bool>> calls;
  for (int i = 0; i < 4; ++i) {
    calls.push_back(std::async(std::launch::async, [&service]() {
      try {
        service.ensure_ready();
        return true;
      } catch (const OllamaError &) {
        return false;
      }
    }));
  }
  int ready = 0;
  for (auto &call : calls) {
    ready += call.get() ? 1 : 0;
  }

  // Exactly one caller saw the failure; the next one to take the gate loaded again
  EXPECT_EQ(ready, 3);
  EXPECT_EQ(loads.load(), 2);
  EXPECT_EQ(service.dimension(), 8u);
}

TEST_F(EmbeddingServiceTest, FailedProbeIsRetried) {
  EXPECT_CALL(*client_, get_embedding("dimension probe"))
      .WillOnce([](const std::string &) -> std::vector<float> {
        throw OllamaError("connection refused");
      })
      .WillOnce(Return(std::vector<float>(4, 1.0f)));
  EmbeddingService service(client_);

  EXPECT_THROW(service.ensure_ready(), OllamaError);
  EXPECT_EQ(service.dimension(), 4u);
}

TEST_F(EmbeddingServiceTest, EmptyProbeVectorFails) {
  ON_CALL(*client_, get_embedding("dimension probe")).WillByDefault(Return(std::vector<float>{}));
  EmbeddingService service(client_);
  EXPECT_THROW(service.ensure_ready(), OllamaError);
}

TEST_F(EmbeddingServiceTest, EmbedSplitsIntoBatchesAndKeepsOrder) {
  EXPECT_CALL(*client_, get_embeddings(SizeIs(2))).Times(2);
  EXPECT_CALL(*client_, get_embeddings(SizeIs(1))).Times(1);
  EmbeddingService service(client_, 2);

  std::vector<std::string> texts = {"one", "two", "three", "four", "five"};
  auto vectors = service.embed(texts);

  ASSERT_EQ(vectors.size(), texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    EXPECT_EQ(vectors[i], TestUtilities::fake_embedding(texts[i])) << texts[i];
  }
}

TEST_F(EmbeddingServiceTest, BatchSizeDoesNotChangeVectors) {
  std::vector<std::string> texts;
  for (int i = 0; i < 10; ++i) {
    texts.push_back(TestUtilities::make_words(i + 1));
  }
  EmbeddingService one_at_a_time(client_, 1);
  EmbeddingService all_at_once(client_, 32);
  EXPECT_EQ(one_at_a_time.embed(texts), all_at_once.embed(texts));
}

TEST_F(EmbeddingServiceTest, EmbedEmptyListMakesNoRequests) {
  EXPECT_CALL(*client_, get_embeddings(_)).Times(0);
  EmbeddingService service(client_);
  EXPECT_TRUE(service.embed({}).empty());
}

TEST_F(EmbeddingServiceTest, ShortBatchResponseFails) {
  ON_CALL(*client_, get_embeddings(_))
      .WillByDefault(Return(std::vector<std::vector<float>>{std::vector<float>(8, 0.5f)}));
  EmbeddingService service(client_);
  EXPECT_THROW(service.embed({"a", "b"}), OllamaError);
}

TEST_F(EmbeddingServiceTest, EmbedOneRejectsWrongDimension) {
  EmbeddingService service(client_);
  service.ensure_ready();

  EXPECT_CALL(*client_, get_embedding("query")).WillOnce(Return(std::vector<float>(4, 0.1f)));
  try {
    service.embed_one("query");
    FAIL() << "Expected DimensionMismatchError";
  } catch (const DimensionMismatchError &e) {
    EXPECT_EQ(e.expected(), 8u);
    EXPECT_EQ(e.actual(), 4u);
  }
}

TEST_F(EmbeddingServiceTest, EmbedOneRejectsEmptyVector) {
  EmbeddingService service(client_);
  service.ensure_ready();
  EXPECT_CALL(*client_, get_embedding("query")).WillOnce(Return(std::vector<float>{}));
  EXPECT_THROW(service.embed_one("query"), OllamaError);
}

TEST_F(EmbeddingServiceTest, ModelNameComesFromClient) {
  EmbeddingService service(client_);
  EXPECT_EQ(service.model_name(), "test-embed");
}

}  // namespace passage_core
