#include <doctest/doctest.h>

#include <sstream>

#include "r4mtool/log_summary.hpp"
#include "r4mw4tch/io/csv.hpp"

namespace {

std::string sample_log() {
  std::string text = std::string(r4mw4tch::csv::event_header) + "\n";
  text += "1700000000000,iwram,6,03000010,00000000,0000002A,1,080001C4,A,A,1,0\n";
  text += "1700000000000,iwram,6,03000014,00000000,00000001,1,080001C4,A,A,1,0\n";
  text += "1700000000100,iwram,11,03000010,0000002A,0000002B,2,080001C4,\"A | B,C\",B,2,0\n";
  text += "1700000000200,ewram,12,02000000,00000000,00000003,1,080001D0,None,None,2,0\n";
  text += "garbage,row\n";
  text += "1700000000300,iwram,16,03000010,0000002B,0000002C,3,080001C4,None,None,3,0\n";
  return text;
}

} // namespace

TEST_CASE("log summary aggregates events per region and address") {
  std::istringstream input(sample_log());
  auto result = r4mtool::summarize_log(input, {});
  REQUIRE(result.ok());

  const auto& summary = result.value;
  CHECK(summary.events == 5);
  CHECK(summary.malformed_rows == 1);
  CHECK(summary.first_frame == 6);
  CHECK(summary.last_frame == 16);
  CHECK(summary.frame_sets == 3);
  CHECK(summary.distinct_addresses == 3);
  CHECK(summary.events_by_region.at("iwram") == 4);
  CHECK(summary.events_by_region.at("ewram") == 1);

  REQUIRE(summary.hottest.size() == 3);
  CHECK(summary.hottest[0].address == 0x03000010);
  CHECK(summary.hottest[0].events == 3);
  CHECK(summary.hottest[0].peak_freq == 3);
  CHECK(summary.hottest[0].first_frame == 6);
  CHECK(summary.hottest[0].last_frame == 16);
  CHECK(summary.hottest[1].address == 0x02000000);
}

TEST_CASE("log summary filters by region and limits the hot list") {
  std::istringstream input(sample_log());
  r4mtool::summary_options options;
  options.top = 1;
  options.region_filter = "iwram";

  auto result = r4mtool::summarize_log(input, options);
  REQUIRE(result.ok());
  CHECK(result.value.events == 4);
  CHECK(result.value.events_by_region.count("ewram") == 0);
  REQUIRE(result.value.hottest.size() == 1);
  CHECK(result.value.hottest[0].address == 0x03000010);
}

TEST_CASE("log summary accepts a log without a header") {
  std::istringstream input("1700000000000,ewram,3,02000004,00000000,00000001,1,00000000,None,None,0,1\n");
  auto result = r4mtool::summarize_log(input, {});
  REQUIRE(result.ok());
  CHECK(result.value.events == 1);
  CHECK(result.value.malformed_rows == 0);
}
