#include <gtest/gtest.h>

#include "../RuleForm.hpp"
#include "TestHelpers.hpp"

TEST(RuleFormTest, BuildsMoveRuleWithTypesAndDates) {
  RuleForm form;
  form.action_index = 0;
  form.destination = " images ";
  form.types = "JPG, .png  gif";
  form.modified_start = "2024-01-01";
  form.modified_end = "2024-01-31T23:59:59";

  std::string error;
  auto rule = form.to_rule(error);

  ASSERT_TRUE(rule.has_value()) << error;
  EXPECT_EQ(rule->action, ActionType::MOVE);
  EXPECT_EQ(rule->destination, "images");
  ASSERT_TRUE(rule->types.has_value());
  EXPECT_EQ(*rule->types, (std::vector<std::string>{"jpg", "png", "gif"}));
  ASSERT_TRUE(rule->date_range.has_value());
  ASSERT_TRUE(rule->date_range->modified.has_value());
  EXPECT_EQ(rule->date_range->modified->start, "2024-01-01");
  EXPECT_EQ(rule->date_range->modified->end, "2024-01-31T23:59:59");
  EXPECT_FALSE(rule->date_range->created.has_value());
}

TEST(RuleFormTest, EmptyFieldsMeanNoCondition) {
  RuleForm form;
  form.action_index = 1;
  form.destination = "ignored";

  std::string error;
  auto rule = form.to_rule(error);

  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->action, ActionType::DELETE);
  EXPECT_FALSE(rule->destination.has_value());
  EXPECT_FALSE(rule->types.has_value());
  EXPECT_FALSE(rule->date_range.has_value());
}

TEST(RuleFormTest, MoveNeedsDestination) {
  RuleForm form;
  form.action_index = 0;
  form.destination = "   ";

  std::string error;
  EXPECT_FALSE(form.to_rule(error).has_value());
  EXPECT_NE(error.find("destination"), std::string::npos);
}

TEST(RuleFormTest, RejectsUnparseableDate) {
  RuleForm form;
  form.action_index = 2;
  form.created_end = "31/12/2024";

  std::string error;
  EXPECT_FALSE(form.to_rule(error).has_value());
  EXPECT_NE(error.find("31/12/2024"), std::string::npos);
}

TEST(RuleFormTest, OpenEndedCreatedWindow) {
  RuleForm form;
  form.action_index = 2;
  form.created_start = "2020-06-01T12:00";

  std::string error;
  auto rule = form.to_rule(error);

  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->action, ActionType::COMPRESS);
  ASSERT_TRUE(rule->date_range->created.has_value());
  EXPECT_EQ(rule->date_range->created->start, "2020-06-01T12:00");
  EXPECT_FALSE(rule->date_range->created->end.has_value());
}
