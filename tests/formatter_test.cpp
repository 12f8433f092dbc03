#include "report/formatter.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <vector>

namespace {

using smellscan::analysis::FileReport;
using smellscan::detection::Finding;
using smellscan::detection::Severity;
using ::testing::HasSubstr;
using ::testing::Not;

Finding LongMethod(Severity severity) {
  return Finding{"long_method", severity, {3, 0}, "process",
                 "Function is 120 lines long (threshold: 50)",
                 {{"line_count", 120}, {"threshold", 50}}};
}

Finding TooManyParameters() {
  return Finding{"too_many_parameters", Severity::Medium, {2, 4}, "send",
                 "Function has 6 parameters (threshold: 5)",
                 {{"param_count", 6}, {"threshold", 5}}};
}

std::vector<FileReport> SampleReports() {
  return {
      FileReport{"src/jobs.py", "python",
                 {LongMethod(Severity::High), TooManyParameters()}, {}},
      FileReport{"src/clean.py", "python", {}, {}},
      FileReport{"src/broken.py", "", {}, std::string("cannot read file")},
  };
}

std::string Text(const std::vector<FileReport> &reports) {
  std::string out;
  llvm::raw_string_ostream os(out);
  smellscan::report::write_text(reports, os);
  os.flush();
  return out;
}

std::string Json(const std::vector<FileReport> &reports) {
  std::string out;
  llvm::raw_string_ostream os(out);
  smellscan::report::write_json(reports, os);
  os.flush();
  return out;
}

TEST(FormatterTest, SummaryCountsBySeverityAndFailures) {
  const auto summary = smellscan::report::summarize(SampleReports());

  EXPECT_EQ(3u, summary.files_analyzed);
  EXPECT_EQ(1u, summary.files_failed);
  EXPECT_EQ(2u, summary.total_findings);
  EXPECT_EQ(1u, summary.high);
  EXPECT_EQ(1u, summary.medium);
  EXPECT_EQ(0u, summary.low);
}

TEST(FormatterTest, GateComparesAgainstMinimumSeverity) {
  const auto reports = SampleReports();
  EXPECT_TRUE(smellscan::report::exceeds_gate(reports, Severity::High));
  EXPECT_TRUE(smellscan::report::exceeds_gate(reports, Severity::Low));

  const std::vector<FileReport> medium_only{
      FileReport{"a.py", "python", {TooManyParameters()}, {}}};
  EXPECT_FALSE(smellscan::report::exceeds_gate(medium_only, Severity::High));
  EXPECT_TRUE(smellscan::report::exceeds_gate(medium_only, Severity::Medium));
  EXPECT_FALSE(smellscan::report::exceeds_gate({}, Severity::Low));
}

TEST(FormatterTest, TextReportListsFindingsAndFailures) {
  const auto text = Text(SampleReports());

  EXPECT_THAT(text, HasSubstr("CODE SMELL DETECTION REPORT"));
  EXPECT_THAT(text, HasSubstr("Total files analyzed: 3"));
  EXPECT_THAT(text, HasSubstr("Total code smells found: 2 (high: 1, medium: 1, low: 0)"));
  EXPECT_THAT(text, HasSubstr("File: src/jobs.py\n   Found 2 smell(s)"));
  EXPECT_THAT(text, HasSubstr("   [HIGH] LONG_METHOD\n"
                              "      Function: process\n"
                              "      Location: Line 3, Column 0\n"));
  EXPECT_THAT(text, HasSubstr("[MEDIUM] TOO_MANY_PARAMETERS"));
  EXPECT_THAT(text, HasSubstr("File: src/broken.py\n   Error: cannot read file"));
  EXPECT_THAT(text, Not(HasSubstr("src/clean.py")));
  EXPECT_THAT(text, Not(HasSubstr("No code smells detected!")));
}

TEST(FormatterTest, TextReportWithoutFindings) {
  const std::vector<FileReport> reports{FileReport{"a.py", "python", {}, {}}};
  EXPECT_THAT(Text(reports), HasSubstr("No code smells detected!"));
}

TEST(FormatterTest, JsonReportIsParseableAndComplete) {
  auto parsed = llvm::json::parse(Json(SampleReports()));
  ASSERT_TRUE(static_cast<bool>(parsed)) << llvm::toString(parsed.takeError());

  const auto *root = parsed->getAsObject();
  ASSERT_NE(nullptr, root);

  const auto *summary = root->getObject("summary");
  ASSERT_NE(nullptr, summary);
  EXPECT_EQ(3, summary->getInteger("files_analyzed").getValueOr(-1));
  EXPECT_EQ(1, summary->getInteger("files_failed").getValueOr(-1));
  EXPECT_EQ(1, summary->getInteger("high").getValueOr(-1));

  const auto *files = root->getArray("files");
  ASSERT_NE(nullptr, files);
  ASSERT_EQ(3u, files->size());

  const auto *jobs = (*files)[0].getAsObject();
  ASSERT_NE(nullptr, jobs);
  EXPECT_EQ("src/jobs.py", jobs->getString("file").getValueOr(""));
  EXPECT_EQ(nullptr, jobs->get("error"));

  const auto *findings = jobs->getArray("findings");
  ASSERT_NE(nullptr, findings);
  ASSERT_EQ(2u, findings->size());

  const auto *first = (*findings)[0].getAsObject();
  ASSERT_NE(nullptr, first);
  EXPECT_EQ("long_method", first->getString("smell_type").getValueOr(""));
  EXPECT_EQ("high", first->getString("severity").getValueOr(""));
  EXPECT_EQ("process", first->getString("function").getValueOr(""));
  EXPECT_EQ(3, first->getInteger("line").getValueOr(-1));
  const auto *details = first->getObject("details");
  ASSERT_NE(nullptr, details);
  EXPECT_EQ(120, details->getInteger("line_count").getValueOr(-1));
  EXPECT_EQ(50, details->getInteger("threshold").getValueOr(-1));

  const auto *broken = (*files)[2].getAsObject();
  ASSERT_NE(nullptr, broken);
  EXPECT_EQ("cannot read file", broken->getString("error").getValueOr(""));
}

TEST(FormatterTest, JsonReportRepairsInvalidUtf8) {
  Finding finding = TooManyParameters();
  finding.subject_name = "caf\xe9";
  const std::vector<FileReport> reports{
      FileReport{"src/caf\xe9.py", "python", {finding}, {}},
      FileReport{"src/\xff.py", "", {}, std::string("cannot read \xff")}};

  auto parsed = llvm::json::parse(Json(reports));
  ASSERT_TRUE(static_cast<bool>(parsed)) << llvm::toString(parsed.takeError());

  const auto *files = parsed->getAsObject()->getArray("files");
  ASSERT_NE(nullptr, files);
  ASSERT_EQ(2u, files->size());

  const auto *cafe = (*files)[0].getAsObject();
  ASSERT_NE(nullptr, cafe);
  EXPECT_EQ("src/caf\xef\xbf\xbd.py", cafe->getString("file").getValueOr(""));
  const auto *first = (*cafe->getArray("findings"))[0].getAsObject();
  ASSERT_NE(nullptr, first);
  EXPECT_EQ("caf\xef\xbf\xbd", first->getString("function").getValueOr(""));

  const auto *unreadable = (*files)[1].getAsObject();
  ASSERT_NE(nullptr, unreadable);
  EXPECT_EQ("cannot read \xef\xbf\xbd",
            unreadable->getString("error").getValueOr(""));
}

TEST(FormatterTest, TextReportPassesBytesThrough) {
  const std::vector<FileReport> reports{
      FileReport{"src/caf\xe9.py", "python", {LongMethod(Severity::High)}, {}}};
  EXPECT_THAT(Text(reports), HasSubstr("File: src/caf\xe9.py"));
}

} // namespace
