#include <gtest/gtest.h>

#include <string>

#include "finbot_core/extractors/delimited_text_extractor.hpp"
#include "common/utilities_test.hpp"

namespace finbot_core {

class DelimitedTextExtractorTest : public ::testing::Test {
 protected:
  DelimitedTextExtractor extractor_;
};

TEST_F(DelimitedTextExtractorTest, HandlesCsvAndTsv) {
  EXPECT_TRUE(extractor_.can_handle("rates.csv"));
  EXPECT_TRUE(extractor_.can_handle("rates.TSV"));
  EXPECT_FALSE(extractor_.can_handle("rates.txt"));
}

TEST_F(DelimitedTextExtractorTest, QuestionAnswerRows) {
  std::string content =
      "Category,Question,Answer\n"
      "Loans,What is the minimum loan amount?,\"PKR 50,000\"\n"
      ",Is there a processing fee?,No\n";
  auto documents = extractor_.extract_from_string(content, "faq_sheet");

  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].text, "Question: What is the minimum loan amount?\nAnswer: PKR 50,000");
  EXPECT_EQ(documents[0].category, "Loans");
  EXPECT_EQ(documents[1].category, "faq_sheet");
}

TEST_F(DelimitedTextExtractorTest, ProductRows) {
  std::string content =
      "product,description,features\n"
      "Gold Card,Premium credit card,Lounge access\n"
      "Basic Saver,,Free cheque book\n"
      "Empty Product,,\n";
  auto documents = extractor_.extract_from_string(content, "products");

  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].text,
            "Product: Gold Card\nDescription: Premium credit card\nFeatures: Lounge access");
  EXPECT_EQ(documents[1].text, "Product: Basic Saver\nFeatures: Free cheque book");
}

TEST_F(DelimitedTextExtractorTest, GenericRowsBecomeColumnLines) {
  std::string content = "Branch,City,Hours\nF-7,Islamabad,9-5\n";
  auto documents = extractor_.extract_from_string(content, "branches");
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].text, "branch: F-7\ncity: Islamabad\nhours: 9-5");
}

TEST_F(DelimitedTextExtractorTest, SniffsTabDelimiter) {
  std::string content = "question\tanswer\nDo you offer lockers?\tYes, in major branches.\n";
  auto documents = extractor_.extract_from_string(content, "tsv");
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].text, "Question: Do you offer lockers?\nAnswer: Yes, in major branches.");
}

TEST_F(DelimitedTextExtractorTest, ParsesQuotedFields) {
  auto rows = DelimitedTextExtractor::parse_rows(
      "a,b\r\n\"x, y\",\"line1\nline2 \"\"quoted\"\"\"\r\n", ',');
  ASSERT_EQ(rows.size(), 2u);
  ASSERT_EQ(rows[1].size(), 2u);
  EXPECT_EQ(rows[1][0], "x, y");
  EXPECT_EQ(rows[1][1], "line1\nline2 \"quoted\"");
}

TEST_F(DelimitedTextExtractorTest, SkipsBlankLines) {
  auto rows = DelimitedTextExtractor::parse_rows("a,b\n\n1,2\n\n", ',');
  EXPECT_EQ(rows.size(), 2u);
}

TEST_F(DelimitedTextExtractorTest, UnterminatedQuoteThrows) {
  EXPECT_THROW(DelimitedTextExtractor::parse_rows("a,b\n\"open,2\n", ','), ContentExtractorError);
}

TEST_F(DelimitedTextExtractorTest, StripsByteOrderMark) {
  std::string content = "\xEF\xBB\xBFquestion,answer\nQ1,A1\n";
  auto documents = extractor_.extract_from_string(content, "bom");
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].text, "Question: Q1\nAnswer: A1");
}

TEST_F(DelimitedTextExtractorTest, HeaderOnlyYieldsNothing) {
  EXPECT_TRUE(extractor_.extract_from_string("question,answer\n", "x").empty());
  EXPECT_TRUE(extractor_.extract_from_string("", "x").empty());
}

TEST_F(DelimitedTextExtractorTest, TsvExtensionForcesTabDelimiter) {
  auto dir = finbot_tests::TestUtilities::create_temp_dir("delimited_extractor");
  auto file = finbot_tests::TestUtilities::write_file(
      dir / "rates.tsv", "question\tanswer\nIs the rate 5,5%?\tYes\n");
  auto documents = extractor_.extract(file);
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].text, "Question: Is the rate 5,5%?\nAnswer: Yes");
  EXPECT_EQ(documents[0].category, "rates");
  std::filesystem::remove_all(dir);
}

}  // namespace finbot_core
