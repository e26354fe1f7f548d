#include <string>
#include <gtest/gtest.h>
#include "policy/intent_rules.hpp"
#include "policy/intent_validator.hpp"

namespace {

using cmdtrust::policy::IntentRules;
using cmdtrust::policy::IntentValidator;

TEST(IntentRulesTest, NormalisesIntentNames) {
    EXPECT_EQ(cmdtrust::policy::intent_key("LINT_CMD"), "lint");
    EXPECT_EQ(cmdtrust::policy::intent_key("Lint"), "lint");
    EXPECT_EQ(cmdtrust::policy::intent_key(" test "), "test");
    EXPECT_EQ(cmdtrust::policy::intent_type("lint"), "LINT_CMD");
    EXPECT_EQ(cmdtrust::policy::intent_type("FORMAT_CMD"), "FORMAT_CMD");
}

TEST(IntentRulesTest, UnknownIntentGetsDefaultRules) {
    EXPECT_FALSE(cmdtrust::policy::has_rules("deploy"));
    EXPECT_TRUE(cmdtrust::policy::has_rules("COVERAGE_CMD"));

    const auto& rules = cmdtrust::policy::rules_for("deploy");
    EXPECT_TRUE(rules.must_contain.empty());
    EXPECT_EQ(rules.min_duration_ms, 10);
    EXPECT_EQ(rules.max_duration_ms, 600000);
    EXPECT_FALSE(rules.modifies_files);
}

TEST(IntentRulesTest, StandardIntentsAllHaveRules) {
    for (const auto& intent : cmdtrust::policy::standard_intents()) {
        EXPECT_TRUE(cmdtrust::policy::has_rules(intent)) << intent;
    }
    EXPECT_TRUE(cmdtrust::policy::rules_for("format").modifies_files);
    EXPECT_FALSE(cmdtrust::policy::rules_for("lint").modifies_files);
}

TEST(IntentValidatorTest, AcceptsCommandMatchingIntent) {
    const IntentValidator validator;
    const auto result = validator.validate("uv run pytest -q", "test");
    EXPECT_TRUE(result.safe);
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.reason.has_value());
}

TEST(IntentValidatorTest, RejectsUnrelatedCommand) {
    const IntentValidator validator;
    const auto result = validator.validate("ls -la", "lint");
    EXPECT_TRUE(result.safe);
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.reason.has_value());
    EXPECT_NE(result.reason->find("doesn't appear to be a lint or check"), std::string::npos);
}

TEST(IntentValidatorTest, RejectsForbiddenKeyword) {
    const IntentValidator validator;
    const auto result = validator.validate("pytest && pip install foo", "test");
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.reason.has_value());
    EXPECT_EQ(*result.reason, "Command contains forbidden keyword: install");
}

TEST(IntentValidatorTest, ForbiddenKeywordsMatchWholeWordsOnly) {
    const IntentValidator validator;
    // The "rm" inside "format" is not a standalone word.
    EXPECT_TRUE(validator.validate("npm run format", "format").valid);
    EXPECT_TRUE(validator.validate("eslint . --format stylish", "lint").valid);

    const auto result = validator.validate("ruff check . && rm cache.db", "lint");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(*result.reason, "Command contains forbidden keyword: rm");
}

TEST(IntentValidatorTest, RequiredKeywordsAreCaseInsensitiveSubstrings) {
    const IntentValidator validator;
    EXPECT_TRUE(validator.validate("PyTest tests/", "test").valid);
    EXPECT_TRUE(validator.validate("npx eslint src", "LINT_CMD").valid);
}

TEST(IntentValidatorTest, ValidatesAgainstExplicitRules) {
    IntentRules rules;
    rules.must_contain = {"deploy"};
    rules.must_not_contain = {"prod"};

    const IntentValidator validator;
    EXPECT_TRUE(validator.validate("make deploy-staging", rules).valid);
    EXPECT_FALSE(validator.validate("make deploy prod", rules).valid);
    EXPECT_FALSE(validator.validate("make release", rules).valid);
}

TEST(IntentValidatorTest, ContainsWordHonoursBoundaries) {
    EXPECT_TRUE(IntentValidator::contains_word("rm -f x", "rm"));
    EXPECT_TRUE(IntentValidator::contains_word("a;rm", "rm"));
    EXPECT_FALSE(IntentValidator::contains_word("format", "rm"));
    EXPECT_FALSE(IntentValidator::contains_word("rm_tmp", "rm"));
    EXPECT_FALSE(IntentValidator::contains_word("anything", ""));
}

}  // namespace
