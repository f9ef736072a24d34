#include "passage_core/extractors/markdown_extractor.hpp"

#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"

namespace passage_core {

class MarkdownExtractorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = passage_tests::TestUtilities::create_temp_dir("markdown_tests");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir_);
  }

  std::filesystem::path create_test_file(const std::string &filename, const std::string &content) {
    return passage_tests::TestUtilities::write_file(test_dir_, filename, content);
  }

  MarkdownExtractor extractor_;
  std::filesystem::path test_dir_;
};

TEST_F(MarkdownExtractorTest, CanHandle_MarkdownExtensions) {
  EXPECT_TRUE(extractor_.can_handle("a.md"));
  EXPECT_TRUE(extractor_.can_handle("a.markdown"));
  EXPECT_FALSE(extractor_.can_handle("a.txt"));
  EXPECT_FALSE(extractor_.can_handle("a.MD"));
}

TEST_F(MarkdownExtractorTest, WholeFileIsPageOne) {
  auto file = create_test_file("notes.md", "# Bail\n\nParagraph one.\n\n## Anticipatory\n\nMore.");
  auto pages = extractor_.extract_pages(file);
  ASSERT_EQ(pages.size(), 1u);
  EXPECT_EQ(pages[0].page_number, 1);
}

TEST_F(MarkdownExtractorTest, StripsHeadingsEmphasisAndLinks) {
  auto file = create_test_file(
      "markup.md",
      "## Section 438\n\nThe **High Court** may grant *bail*. See [the code](http://x.y/z).\n");
  auto pages = extractor_.extract_pages(file);
  ASSERT_EQ(pages.size(), 1u);
  const std::string &text = pages[0].text;
  EXPECT_EQ(text.find('#'), std::string::npos);
  EXPECT_EQ(text.find('*'), std::string::npos);
  EXPECT_EQ(text.find("http://"), std::string::npos);
  EXPECT_NE(text.find("Section 438"), std::string::npos);
  EXPECT_NE(text.find("The High Court may grant bail."), std::string::npos);
  EXPECT_NE(text.find("See the code."), std::string::npos);
}

TEST_F(MarkdownExtractorTest, DropsFenceLinesButKeepsCode) {
  auto file = create_test_file("code.md", "Intro\n\n```cpp\nint main() {}\n```\n");
  auto pages = extractor_.extract_pages(file);
  ASSERT_EQ(pages.size(), 1u);
  EXPECT_EQ(pages[0].text.find("```"), std::string::npos);
  EXPECT_NE(pages[0].text.find("int main() {}"), std::string::npos);
}

TEST_F(MarkdownExtractorTest, EmptyOrBlankFileHasNoPages) {
  EXPECT_TRUE(extractor_.extract_pages(create_test_file("empty.md", "")).empty());
  EXPECT_TRUE(extractor_.extract_pages(create_test_file("blank.md", "\n\n   \n")).empty());
}

}  // namespace passage_core
