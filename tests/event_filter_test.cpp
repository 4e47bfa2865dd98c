#include "event_filter.hpp"

#include <gtest/gtest.h>

#include "test_events.hpp"

namespace process_miner {
namespace {

using testing::At;
using testing::kBaseMs;

std::vector<Event> sampleEvents() {
  return {
      At("c1", "Review Application", 0.0, "alice"),
      At("c1", "Make Decision", 10.0, "bob"),
      At("c2", "Review Application", 30.0, "bobby"),
      At("c2", "Complete Process", 50.0, "carol"),
  };
}

TEST(EventFilterTest, EmptyFilterKeepsEverything) {
  EventFilter filter;
  EXPECT_TRUE(filter.IsEmpty());
  EXPECT_EQ(filter.Apply(sampleEvents()), sampleEvents());
}

TEST(EventFilterTest, DateBoundsAreInclusive) {
  EventFilter filter;
  filter.fromMs = kBaseMs + 10 * static_cast<int64_t>(kMsPerHour);
  filter.toMs = kBaseMs + 30 * static_cast<int64_t>(kMsPerHour);
  EXPECT_FALSE(filter.IsEmpty());

  auto kept = filter.Apply(sampleEvents());
  ASSERT_EQ(kept.size(), 2u);
  EXPECT_EQ(kept[0].activity, "Make Decision");
  EXPECT_EQ(kept[1].caseId, "c2");
}

TEST(EventFilterTest, MatchesActivitySubstring) {
  EventFilter filter;
  filter.activity = "Review";
  auto kept = filter.Apply(sampleEvents());
  ASSERT_EQ(kept.size(), 2u);
  EXPECT_EQ(kept[0].caseId, "c1");
  EXPECT_EQ(kept[1].caseId, "c2");
}

TEST(EventFilterTest, CombinesCriteria) {
  EventFilter filter;
  filter.resource = "bob";
  filter.activity = "Review";
  auto kept = filter.Apply(sampleEvents());
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(kept[0].resource, "bobby");
}

TEST(EventFilterTest, CanRemoveEverything) {
  EventFilter filter;
  filter.toMs = kBaseMs - 1;
  EXPECT_TRUE(filter.Apply(sampleEvents()).empty());
  EXPECT_FALSE(filter.Matches(sampleEvents()[0]));
}

}  // namespace
}  // namespace process_miner
