#include <catch2/catch_all.hpp>

#include "table_extractor.hpp"

#include <string>
#include <vector>

namespace {

const TableRow kRiskHeader = {"Raised by", "Description", "Impact", "Date risk becomes issue", "Status", "Owner",
                              "Impact rating", "Likelihood", "Mitigation", "Comments", "Risk rating"};

const TableRow kTaskHeader = {"Bucket Name", "Task Name", "Progress", "Due Date", "Priority", "Assigned To", "Labels"};

} // namespace

TEST_CASE("classifyTable looks at the first row only", "[table]") {
  Table grid(5, TableRow{"", "", ""});
  REQUIRE(classifyTable(grid) == TableShape::StatusGrid);
  REQUIRE(classifyTable(Table(4, TableRow{"", "", ""})) == TableShape::Unrecognized);

  REQUIRE(classifyTable(Table{kRiskHeader}) == TableShape::Register);
  REQUIRE(classifyTable(Table{kTaskHeader}) == TableShape::TaskBucket);
  REQUIRE(classifyTable(Table{TableRow(11, "x")}) == TableShape::Unrecognized);
  REQUIRE(classifyTable(Table{TableRow(7, "x")}) == TableShape::Unrecognized);
  REQUIRE(classifyTable(Table{}) == TableShape::Unrecognized);
}

TEST_CASE("extractStatusGrid reads overall, summary and category statuses", "[table]") {
  Table table = {
    {"Amber", "STATUS OVERALL", ""},
    {"RED", "Overall Status", ""},
    {"Pipeline recovering", "STATUS OVERALL", ""},
    {"Ignored second summary", "Status overall", ""},
    {"", "Open Opps", "GREEN"},
    {"RED", "Big Plays", ""},
    {"", "Account Goals", "REQUIRED"},
    {"", "Relationships: n/a", ""},
    {"", "Research", ""},
    {"Extra note", "", ""},
  };

  StatusGrid grid = extractStatusGrid(table);

  REQUIRE(grid.overallStatus == "AMBER");
  REQUIRE(grid.summary == "Pipeline recovering\nExtra note");
  REQUIRE(grid.categoryStatus[static_cast<size_t>(StatusCategory::OpenOpportunities)] == "GREEN");
  REQUIRE(grid.categoryStatus[static_cast<size_t>(StatusCategory::BigPlays)] == "RED");
  REQUIRE(grid.categoryStatus[static_cast<size_t>(StatusCategory::AccountGoals)].empty());
  REQUIRE(grid.categoryStatus[static_cast<size_t>(StatusCategory::Relationships)] == "N/A");
  REQUIRE(grid.categoryStatus[static_cast<size_t>(StatusCategory::Research)].empty());
}

TEST_CASE("extractStatusGrid leaves overall status empty without a token", "[table]") {
  Table table = {{"Pending review", "", ""}, {"", "Open Opps", ""}};

  StatusGrid grid = extractStatusGrid(table);

  REQUIRE(grid.overallStatus.empty());
  REQUIRE(grid.summary.empty());
}

TEST_CASE("extractRegisterRows maps columns and skips unusable rows", "[table]") {
  Table table = {
    kRiskHeader,
    {"Ann", "Budget freeze", "Delay", "1/9/2024", "Open", "Bob", "High", "Likely", "Escalate", "None", "RED"},
    {"", "", "", "", "", "", "", "", "", "", ""},
    {"Bob", "", "Orphan", "", "", "", "", "", "", "", ""},
    {"", "People Process", "", "", "", "", "", "", "", "", ""},
    {"Cy", "Short row"},
  };

  auto risks = extractRegisterRows(table);

  REQUIRE(risks.size() == 2);
  const Risk& r = risks[0];
  REQUIRE(r.raisedBy == "Ann");
  REQUIRE(r.description == "Budget freeze");
  REQUIRE(r.impact == "Delay");
  REQUIRE(r.dateBecomesIssue == "1/9/2024");
  REQUIRE(r.status == "Open");
  REQUIRE(r.owner == "Bob");
  REQUIRE(r.impactRating == "High");
  REQUIRE(r.likelihood == "Likely");
  REQUIRE(r.mitigation == "Escalate");
  REQUIRE(r.comments == "None");
  REQUIRE(r.ratingColor == "RED");
  REQUIRE(r.kind == RiskKind::Risk);

  REQUIRE(risks[1].raisedBy == "Cy");
  REQUIRE(risks[1].description == "Short row");
  REQUIRE(risks[1].ratingColor.empty());
}

TEST_CASE("extractRegisterRows marks issue registers", "[table]") {
  TableRow header = kRiskHeader;
  header[10] = "Issue Rating";
  Table table = {header, {"Ann", "Vendor exit", "", "", "", "", "", "", "", "", "AMBER"}};

  auto issues = extractRegisterRows(table);

  REQUIRE(issues.size() == 1);
  REQUIRE(issues[0].kind == RiskKind::Issue);
  REQUIRE(std::string(riskKindName(issues[0].kind)) == "issue");
}

TEST_CASE("extractTaskRows carries the bucket down", "[table]") {
  Table table = {
    kTaskHeader,
    {"Sales", "Close deal", "50", "2024-07-01", "High", "Alice", "GREEN"},
    {"", "Follow up", "", "", "", "", ""},
    {"Delivery", "", "", "", "", "", ""},
    {"", "Ship pilot", "0", "", "Low", "", ""},
  };

  auto tasks = extractTaskRows(table);

  REQUIRE(tasks.size() == 3);
  REQUIRE(tasks[0].bucketName == "Sales");
  REQUIRE(tasks[0].progress == "50");
  REQUIRE(tasks[0].labels == "GREEN");
  REQUIRE(tasks[1].bucketName == "Sales");
  REQUIRE(tasks[1].taskName == "Follow up");
  REQUIRE(tasks[2].bucketName == "Delivery");
  REQUIRE(tasks[2].taskName == "Ship pilot");
  REQUIRE(extractTaskRows(Table{kTaskHeader}).empty());
}

TEST_CASE("extractTaskRows fills blank buckets from the row above", "[table]") {
  Table table = {kTaskHeader};
  for (const char* bucket : {"Dev", "", "", "QA", ""}) {
    table.push_back({bucket, "Task", "", "", "", "", ""});
  }

  auto tasks = extractTaskRows(table);

  REQUIRE(tasks.size() == 5);
  std::vector<std::string> buckets;
  for (const auto& t : tasks) buckets.push_back(t.bucketName);
  REQUIRE(buckets == std::vector<std::string>{"Dev", "Dev", "Dev", "QA", "QA"});
}

TEST_CASE("extractStatusGrid takes the overall status from the first cell", "[table]") {
  Table table = {{"GREEN", "STATUS OVERALL", ""}, {"", "Open Opps", ""}, {"", "Big Plays", ""},
                 {"", "Account Goals", ""}, {"", "Research", ""}};

  REQUIRE(classifyTable(table) == TableShape::StatusGrid);
  REQUIRE(extractStatusGrid(table).overallStatus == "GREEN");
}
