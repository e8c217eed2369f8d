#include <gtest/gtest.h>

#include <sstream>

#include "../IOManager.hpp"
#include "../Organizer.hpp"
#include "../Scanner.hpp"
#include "TestHelpers.hpp"

// End-to-end runs: rules as they come out of a config file, a real directory,
// and a scripted answer to the deletion prompt.
class OrganizerTest : public TempDirTest {
 protected:
  RunReport Run(std::string_view rules_json, bool dry_run,
                std::string answer = "yes", bool auto_confirm = false) {
    auto rules = IOManager::parse_rules(rules_json);
    if (!rules) throw std::invalid_argument("bad test rules");

    RunContext context{test_dir, *rules, dry_run, auto_confirm};
    auto confirm = [this, answer](std::size_t pending) {
      std::istringstream in(answer);
      std::ostringstream out;
      prompts.push_back(pending);
      return IOManager::confirm_deletions(in, out, pending);
    };
    return run_organizer(context, sink, confirm, filesystem);
  }

  RecordingSink sink;
  RealFileSystem filesystem;
  std::vector<std::size_t> prompts;
};

TEST_F(OrganizerTest, MovesJanuaryPhotoIntoImages) {
  CreateFile("a.jpg", "jpegdata");
  SetModified("a.jpg", utc("2024-01-05T10:00:00"));

  auto report = Run(R"([{
      "types": ["jpg"],
      "date_range": {"modified": {"start": "2024-01-01T00:00:00",
                                  "end": "2024-01-31T23:59:59"}},
      "action": "move",
      "destination": "images"}])",
                    false);

  EXPECT_TRUE(fs::exists(test_dir / "images" / "a.jpg"));
  EXPECT_FALSE(fs::exists(test_dir / "a.jpg"));
  EXPECT_EQ(report.summary.moved, 1);
  EXPECT_EQ(report.summary.total_size_bytes, 8);
}

TEST_F(OrganizerTest, AnsweringNoKeepsFilesInPlace) {
  CreateFile("doomed.txt");

  auto report = Run(R"([{"action": "delete"}])", false, "no");

  ASSERT_EQ(prompts.size(), 1);
  EXPECT_TRUE(fs::exists(test_dir / "doomed.txt"));
  EXPECT_EQ(report.summary.deleted, 0);
  EXPECT_GE(sink.count(LogLevel::WARNING), 1);
}

TEST_F(OrganizerTest, AnswerIsCaseInsensitive) {
  CreateFile("doomed.txt");

  auto report = Run(R"([{"action": "delete"}])", false, "  YeS \n");

  EXPECT_FALSE(fs::exists(test_dir / "doomed.txt"));
  EXPECT_EQ(report.summary.deleted, 1);
}

TEST_F(OrganizerTest, ClosedInputCancelsDeletions) {
  CreateFile("doomed.txt");

  auto report = Run(R"([{"action": "delete"}])", false, "");

  EXPECT_TRUE(fs::exists(test_dir / "doomed.txt"));
  EXPECT_EQ(report.summary.deleted, 0);
}

TEST_F(OrganizerTest, MoveWithoutDestinationCreatesNothing) {
  CreateFile("a.jpg");

  auto report = Run(R"([{"action": "move", "types": ["jpg"]}])", false);

  ASSERT_EQ(report.matches.size(), 1);
  EXPECT_EQ(report.summary, Summary{});
  EXPECT_EQ(ListNames(test_dir), std::vector<std::string>{"a.jpg"});
  EXPECT_TRUE(sink.contains(LogLevel::WARNING, "a.jpg"));
}

TEST_F(OrganizerTest, InvalidDateSkipsRuleForAllFiles) {
  CreateFile("a.jpg");
  CreateFile("b.png");

  auto report = Run(R"([
      {"action": "delete", "date_range": {"modified": {"start": "01/02/2024"}}},
      {"action": "move", "destination": "pictures", "types": ["jpg", "png"]}])",
                    false);

  ASSERT_EQ(report.matches.size(), 2);
  for (const auto& match : report.matches) EXPECT_EQ(match.rule_index, 1);
  EXPECT_TRUE(prompts.empty());
  EXPECT_EQ(report.summary.moved, 2);
  EXPECT_EQ(report.summary.deleted, 0);
}

TEST_F(OrganizerTest, EmptyDirectoryGivesZeroSummary) {
  auto report = Run(R"([{"action": "delete"}])", false);

  EXPECT_TRUE(report.files.empty());
  EXPECT_TRUE(report.matches.empty());
  EXPECT_EQ(report.summary, Summary{});
  EXPECT_TRUE(prompts.empty());
}

TEST_F(OrganizerTest, RepeatedDryRunsAgree) {
  CreateFile("a.jpg", "12");
  CreateFile("b.tmp", "345");
  CreateFile("c.doc", "6");
  constexpr std::string_view rules = R"([
      {"action": "move", "destination": "images", "types": ["JPG"]},
      {"action": "delete", "types": [".tmp"]}])";

  auto first = Run(rules, true);
  auto second = Run(rules, true);

  ASSERT_EQ(first.matches.size(), second.matches.size());
  for (std::size_t i = 0; i < first.matches.size(); ++i) {
    EXPECT_EQ(first.matches[i].file.path(), second.matches[i].file.path());
    EXPECT_EQ(first.matches[i].rule_index, second.matches[i].rule_index);
  }
  EXPECT_EQ(first.summary, second.summary);
  EXPECT_EQ(first.summary.moved, 1);
  EXPECT_EQ(first.summary.deleted, 1);
  EXPECT_EQ(first.summary.total_size_bytes, 5);
  EXPECT_EQ(ListNames(test_dir),
            (std::vector<std::string>{"a.jpg", "b.tmp", "c.doc"}));
}

TEST_F(OrganizerTest, MissingTargetDirectoryIsFatal) {
  RunContext context{test_dir / "nope", {}, false, false};
  EXPECT_THROW(run_organizer(context, sink, nullptr, filesystem), ScanError);
}
