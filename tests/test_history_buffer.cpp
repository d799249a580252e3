#include "minitest.hpp"
#include "core/HistoryBuffer.hpp"
#include "util/Errors.hpp"

using vigil::core::HistoryBuffer;
using vigil::model::DataPoint;

static DataPoint point(double cpu) {
  DataPoint p;
  p.cpu_usage_pct = cpu;
  return p;
}

TEST(history_keeps_last_capacity_points_in_order) {
  HistoryBuffer h(3);
  for (int i = 1; i <= 5; ++i) h.push(point(i));
  ASSERT_EQ(h.size(), 3u);
  auto all = h.all();
  ASSERT_EQ(all.size(), 3u);
  ASSERT_EQ(all[0].cpu_usage_pct, 3.0);
  ASSERT_EQ(all[2].cpu_usage_pct, 5.0);
}

TEST(history_recent_is_bounded_by_size) {
  HistoryBuffer h(10);
  ASSERT_TRUE(h.recent(4).empty());
  h.push(point(1));
  h.push(point(2));
  auto r = h.recent(5);
  ASSERT_EQ(r.size(), 2u);
  ASSERT_EQ(r[0].cpu_usage_pct, 1.0);
  auto last = h.recent(1);
  ASSERT_EQ(last.size(), 1u);
  ASSERT_EQ(last[0].cpu_usage_pct, 2.0);
  ASSERT_TRUE(h.recent(0).empty());
}

TEST(history_clear_empties) {
  HistoryBuffer h(2);
  h.push(point(1));
  h.clear();
  ASSERT_TRUE(h.empty());
  h.push(point(7));
  ASSERT_EQ(h.all().front().cpu_usage_pct, 7.0);
}

TEST(history_shrink_keeps_most_recent) {
  HistoryBuffer h(5);
  for (int i = 1; i <= 7; ++i) h.push(point(i));
  h.set_capacity(2);
  auto all = h.all();
  ASSERT_EQ(all.size(), 2u);
  ASSERT_EQ(all[0].cpu_usage_pct, 6.0);
  ASSERT_EQ(all[1].cpu_usage_pct, 7.0);
  h.set_capacity(4);
  h.push(point(8));
  ASSERT_EQ(h.size(), 3u);
  ASSERT_EQ(h.all().back().cpu_usage_pct, 8.0);
}

TEST(history_rejects_zero_capacity) {
  ASSERT_THROWS(HistoryBuffer(0), vigil::InvalidConfig);
  HistoryBuffer h(1);
  ASSERT_THROWS(h.set_capacity(0), vigil::InvalidConfig);
}
