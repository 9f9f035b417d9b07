#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "AnalyticsReporter.h"
#include "test_support.hh"

using namespace std::chrono_literals;

namespace {

ClickEvent click(const std::string& source) {
  ClickEvent event;
  event.source = source;
  event.user_agent = "Mozilla/5.0";
  event.ip = "198.51.100.7";
  event.geo = "Unknown Location";
  return event;
}

class AnalyticsReporterTest : public ::testing::Test {
protected:
  ManualClock clock;
  CodeGenerator generator{6};
  LinkRegistry registry{generator, clock.source()};
  AnalyticsReporter reporter{registry};
};

} // namespace

TEST_F(AnalyticsReporterTest, ReportsRecordAndAggregates) {
  LinkRecord created = registry.create("https://example.com/report", 45, std::string("stat1"));
  registry.recordClick("stat1", click("direct"));
  registry.recordClick("stat1", click("https://ref.example"));

  LinkStats stats = reporter.report("stat1");
  EXPECT_EQ(stats.shortcode, "stat1");
  EXPECT_EQ(stats.original_url, "https://example.com/report");
  EXPECT_EQ(stats.created_at, created.created_at);
  EXPECT_EQ(stats.expires_at, created.created_at + 45min);
  EXPECT_EQ(stats.total_clicks, 2u);
  ASSERT_EQ(stats.clicks.size(), 2u);
  EXPECT_EQ(stats.clicks[0].source, "direct");
  EXPECT_EQ(stats.clicks[1].source, "https://ref.example");
  EXPECT_FALSE(stats.is_expired);
}

TEST_F(AnalyticsReporterTest, ExpiryIsComputedAtCallTime) {
  registry.create("https://example.com", 10, std::string("stat1"));
  EXPECT_FALSE(reporter.report("stat1").is_expired);

  clock.advance(10min);
  EXPECT_TRUE(reporter.report("stat1").is_expired);
}

TEST_F(AnalyticsReporterTest, UnknownCodeIsNotFound) {
  try {
    reporter.report("missing");
    FAIL() << "expected NotFound";
  } catch (const RegistryError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NotFound);
  }
}

TEST_F(AnalyticsReporterTest, RepeatedReportsAreIdenticalAndReadOnly) {
  registry.create("https://example.com", 10, std::string("stat1"));
  registry.recordClick("stat1", click("direct"));

  LinkStats first = reporter.report("stat1");
  LinkStats second = reporter.report("stat1");
  EXPECT_EQ(first.total_clicks, second.total_clicks);
  EXPECT_EQ(first.is_expired, second.is_expired);
  EXPECT_EQ(first.clicks[0].timestamp, second.clicks[0].timestamp);
  EXPECT_EQ(registry.get("stat1").clicks.size(), 1u);
}

// The full click list is returned, not a window
TEST_F(AnalyticsReporterTest, ReturnsFullClickList) {
  registry.create("https://example.com", 10, std::string("stat1"));
  for (int i = 0; i < 300; i++) {
    registry.recordClick("stat1", click("src" + std::to_string(i)));
  }

  LinkStats stats = reporter.report("stat1");
  ASSERT_EQ(stats.clicks.size(), 300u);
  EXPECT_EQ(stats.total_clicks, 300u);
  EXPECT_EQ(stats.clicks.front().source, "src0");
  EXPECT_EQ(stats.clicks.back().source, "src299");
}
