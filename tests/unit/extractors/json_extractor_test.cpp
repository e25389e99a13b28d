#include <gtest/gtest.h>

#include <string>

#include "finbot_core/extractors/json_extractor.hpp"

namespace finbot_core {

class JsonExtractorTest : public ::testing::Test {
 protected:
  JsonExtractor extractor_;
};

TEST_F(JsonExtractorTest, HandlesJsonExtensionOnly) {
  EXPECT_TRUE(extractor_.can_handle("faq.json"));
  EXPECT_TRUE(extractor_.can_handle("FAQ.Json"));
  EXPECT_FALSE(extractor_.can_handle("faq.csv"));
}

TEST_F(JsonExtractorTest, ReadsCategoriesLayout) {
  std::string content = R"({
    "bank": "NUST",
    "categories": [
      {"category": "Loans", "questions": [
        {"question": "What is the minimum loan amount?", "answer": "PKR 50,000."},
        {"question": "Max tenure?", "answer": "Five years."}
      ]},
      {"category": "Cards", "questions": [
        {"question": "How do I block my card?", "answer": "Call the helpline."}
      ]}
    ]
  })";

  auto documents = extractor_.extract_from_string(content, "bank_faqs");
  ASSERT_EQ(documents.size(), 3u);
  EXPECT_EQ(documents[0].text, "Question: What is the minimum loan amount?\nAnswer: PKR 50,000.");
  EXPECT_EQ(documents[0].category, "Loans");
  EXPECT_EQ(documents[2].category, "Cards");
}

TEST_F(JsonExtractorTest, CategoryWithoutNameIsUncategorized) {
  std::string content = R"({"categories": [{"questions": [{"question": "Q", "answer": "A"}]}]})";
  auto documents = extractor_.extract_from_string(content, "stem");
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].category, "Uncategorized");
}

TEST_F(JsonExtractorTest, ReadsFlatArrayWithDefaultCategory) {
  std::string content = R"([
    {"category": "Accounts", "question": "Minimum balance?", "answer": "None."},
    {"question": "Opening hours?", "answer": "9 to 5."}
  ])";
  auto documents = extractor_.extract_from_string(content, "branch_info");
  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].category, "Accounts");
  EXPECT_EQ(documents[1].category, "branch_info");
}

TEST_F(JsonExtractorTest, SkipsIncompleteEntries) {
  std::string content = R"([
    {"question": "Only a question"},
    {"answer": "Only an answer"},
    {"question": "", "answer": "Empty question"},
    {"question": 42, "answer": "Wrong type"},
    {"question": "Good?", "answer": "Yes."}
  ])";
  auto documents = extractor_.extract_from_string(content, "mixed");
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].text, "Question: Good?\nAnswer: Yes.");
}

TEST_F(JsonExtractorTest, InvalidJsonThrows) {
  EXPECT_THROW(extractor_.extract_from_string("{\"categories\": [", "x"), ContentExtractorError);
}

TEST_F(JsonExtractorTest, UnknownLayoutThrows) {
  EXPECT_THROW(extractor_.extract_from_string(R"({"faq": []})", "x"), ContentExtractorError);
  EXPECT_THROW(extractor_.extract_from_string(R"({"categories": "loans"})", "x"),
               ContentExtractorError);
  EXPECT_THROW(extractor_.extract_from_string("42", "x"), ContentExtractorError);
}

TEST_F(JsonExtractorTest, EmptyArrayYieldsNothing) {
  EXPECT_TRUE(extractor_.extract_from_string("[]", "x").empty());
}

}  // namespace finbot_core
