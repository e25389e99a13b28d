#include <gtest/gtest.h>

#include <string>

#include "finbot_core/prompt/prompt_composer.hpp"
#include "finbot_core/validation/response_validator.hpp"

namespace finbot_core {

class ResponseValidatorTest : public ::testing::Test {
 protected:
  ResponseValidatorTest()
      : validator_({PromptComposer::default_system_instructions()},
                   {"I don't have enough information", "contact our customer service"}) {}

  ResponseValidator validator_;
};

TEST_F(ResponseValidatorTest, PassesOrdinaryAnswersThrough) {
  auto result = validator_.validate("  You can open an account at any branch.  ");
  EXPECT_EQ(result.text, "You can open an account at any branch.");
  EXPECT_FALSE(result.stripped_instructions);
  EXPECT_EQ(result.redactions, 0u);
}

TEST_F(ResponseValidatorTest, StripsEchoedInstructions) {
  auto result = validator_.validate(
      "Use the following pieces of bank information to answer the question at the end. "
      "The minimum loan amount is PKR 50,000.");
  EXPECT_EQ(result.text, "The minimum loan amount is PKR 50,000.");
  EXPECT_TRUE(result.stripped_instructions);
}

TEST_F(ResponseValidatorTest, EchoDetectionIgnoresCase) {
  auto result = validator_.validate(
      "DON'T TRY TO MAKE UP AN ANSWER.\nBranches open at 9am.");
  EXPECT_EQ(result.text, "Branches open at 9am.");
  EXPECT_TRUE(result.stripped_instructions);
}

TEST_F(ResponseValidatorTest, KeepsScriptedFallbackAnswer) {
  std::string fallback =
      "I don't have enough information to answer this question. Please contact our customer "
      "service at +92 (51) 111 000 494 for assistance.";
  auto result = validator_.validate(fallback);
  EXPECT_EQ(result.text, fallback);
  EXPECT_FALSE(result.stripped_instructions);
}

TEST_F(ResponseValidatorTest, ShortSentencesAreNeverTreatedAsEchoes) {
  auto result = validator_.validate("Yes. The bank.");
  EXPECT_EQ(result.text, "Yes. The bank.");
  EXPECT_FALSE(result.stripped_instructions);
}

TEST_F(ResponseValidatorTest, RedactsAccountNumbers) {
  auto result = validator_.validate("Your account 12345678901 is active.");
  EXPECT_EQ(result.text, "Your account [REDACTED_ACCOUNT_NUMBER] is active.");
  EXPECT_EQ(result.redactions, 1u);
}

TEST_F(ResponseValidatorTest, ResponseMadeOnlyOfEchoesBecomesEmpty) {
  auto result = validator_.validate(
      "Use the following pieces of bank information to answer the question at the end.");
  EXPECT_TRUE(result.text.empty());
  EXPECT_TRUE(result.stripped_instructions);
}

TEST_F(ResponseValidatorTest, UntouchedAnswerKeepsItsLayout) {
  const std::string answer = "\nSteps:\n1. Visit a branch.\n2. Bring your CNIC.\n\n";
  auto result = validator_.validate(answer);
  EXPECT_EQ(result.text, answer);
  EXPECT_FALSE(result.stripped_instructions);
}

TEST_F(ResponseValidatorTest, BlankAnswerBecomesEmpty) {
  auto result = validator_.validate(" \n\t ");
  EXPECT_TRUE(result.text.empty());
  EXPECT_FALSE(result.stripped_instructions);
}

}  // namespace finbot_core
