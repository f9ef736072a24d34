#include "passage_core/retrieval/context_assembler.hpp"

#include <gtest/gtest.h>

#include "../../common/mocks_test.hpp"

namespace passage_core {

using passage_tests::MockUtilities::create_result;

class ContextAssemblerTest : public ::testing::Test {
 protected:
  std::vector<RetrievalResult> three_results() {
    return {create_result(4, "alpha text", 0.1f, 1, "ipc.pdf", 1),
            create_result(5, "beta text", 0.2f, 2, "crpc.pdf", 7),
            create_result(3, "gamma text", 0.3f, 3, "notes.md", 1)};
  }
};

TEST_F(ContextAssemblerTest, RendersProvenanceHeader) {
  auto result = create_result(0, "body", 0.0f, 1, "indian_penal_code.pdf", 12);
  EXPECT_EQ(ContextAssembler::render_block(result, 1),
            "[Source 1: indian penal code, Page 12]\nbody\n");
}

TEST_F(ContextAssemblerTest, FallsBackToFilenameWithoutTitle) {
  auto result = create_result(0, "body", 0.0f, 1, "ipc.pdf", 3);
  result.document_title.clear();
  EXPECT_EQ(ContextAssembler::render_block(result, 2), "[Source 2: ipc.pdf, Page 3]\nbody\n");
}

TEST_F(ContextAssemblerTest, JoinsBlocksInRankOrder) {
  auto results = three_results();
  const std::string expected = ContextAssembler::render_block(results[0], 1) + "\n" +
                               ContextAssembler::render_block(results[1], 2) + "\n" +
                               ContextAssembler::render_block(results[2], 3);
  EXPECT_EQ(ContextAssembler::assemble(results, 100000), expected);
}

TEST_F(ContextAssemblerTest, EmptyResultsGiveEmptyContext) {
  EXPECT_EQ(ContextAssembler::assemble({}, 3000), "");
}

TEST_F(ContextAssemblerTest, TwoEightyCharBlocksWithBudgetHundredKeepsOnlyFirst) {
  std::vector<RetrievalResult> results = {create_result(0, "", 0.1f, 1, "a.txt", 1),
                                          create_result(1, "", 0.2f, 2, "b.txt", 1)};
  // Pad the texts so each rendered block is exactly 80 characters
  for (auto &result : results) {
    const size_t header = ContextAssembler::render_block(result, result.rank).size();
    result.text = std::string(80 - header, 'x');
    ASSERT_EQ(ContextAssembler::render_block(result, result.rank).size(), 80u);
  }

  const std::string context = ContextAssembler::assemble(results, 100);
  EXPECT_EQ(context, ContextAssembler::render_block(results[0], 1));
  EXPECT_EQ(context.size(), 80u);
}

TEST_F(ContextAssemblerTest, StopsAtFirstBlockThatDoesNotFit) {
  std::vector<RetrievalResult> results = {create_result(0, "short", 0.1f, 1),
                                          create_result(1, std::string(500, 'y'), 0.2f, 2),
                                          create_result(2, "tiny", 0.3f, 3)};
  const std::string first = ContextAssembler::render_block(results[0], 1);
  // The third block would fit on its own, but assembly stops at the second
  EXPECT_EQ(ContextAssembler::assemble(results, first.size() + 100), first);
}

TEST_F(ContextAssemblerTest, FirstBlockLargerThanBudgetGivesEmptyContext) {
  std::vector<RetrievalResult> results = {create_result(0, std::string(200, 'z'), 0.1f, 1)};
  EXPECT_EQ(ContextAssembler::assemble(results, 50), "");
}

TEST_F(ContextAssemblerTest, OutputIsPrefixOfUnboundedAndWithinBudget) {
  auto results = three_results();
  const std::string full = ContextAssembler::assemble(results, 1000000);
  for (size_t budget = 0; budget <= full.size() + 5; ++budget) {
    const std::string context = ContextAssembler::assemble(results, budget);
    EXPECT_LE(context.size(), budget);
    EXPECT_EQ(full.compare(0, context.size(), context), 0) << "budget " << budget;
  }
}

TEST_F(ContextAssemblerTest, SummariesTruncateLongText) {
  std::vector<RetrievalResult> results = {create_result(0, std::string(300, 'a'), 0.5f, 1, "x.pdf", 4),
                                          create_result(1, "short", 0.6f, 2, "y.pdf", 2)};
  auto summaries = ContextAssembler::summarize_sources(results, 200);
  ASSERT_EQ(summaries.size(), 2u);
  EXPECT_EQ(summaries[0].document, "x.pdf");
  EXPECT_EQ(summaries[0].page, 4);
  EXPECT_FLOAT_EQ(summaries[0].score, 0.5f);
  EXPECT_EQ(summaries[0].text, std::string(200, 'a') + "...");
  EXPECT_EQ(summaries[1].text, "short");
}

TEST_F(ContextAssemblerTest, SummaryTruncationKeepsUtf8Whole) {
  // Each character is three bytes; a cut at byte 4 backs off to byte 3
  std::vector<RetrievalResult> results = {create_result(0, "धारा", 0.1f, 1)};
  auto summaries = ContextAssembler::summarize_sources(results, 4);
  ASSERT_EQ(summaries.size(), 1u);
  EXPECT_EQ(summaries[0].text, std::string("धारा").substr(0, 3) + "...");
}

}  // namespace passage_core
