#include "minitest.hpp"
#include "core/AlertEvaluator.hpp"
#include "util/Errors.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;
using vigil::core::AlertEvaluator;
using vigil::model::AlertEventKind;
using vigil::model::AlertLevel;
using vigil::model::AlertRule;
using vigil::model::DataPoint;

static std::chrono::system_clock::time_point t0() {
  return std::chrono::system_clock::time_point{} + 1000h;
}

static DataPoint cpu_point(double cpu, int i) {
  DataPoint p;
  p.cpu_usage_pct = cpu;
  p.timestamp = t0() + std::chrono::seconds(5 * i);
  return p;
}

static AlertRule cpu_rule(const std::string& id, double limit, AlertLevel level = AlertLevel::Warning) {
  AlertRule r;
  r.id = id;
  r.level = level;
  r.predicate = [limit](const DataPoint& p){ return p.cpu_usage_pct >= limit; };
  r.message = [](const DataPoint& p){ return "cpu at " + std::to_string(static_cast<int>(p.cpu_usage_pct)); };
  return r;
}

TEST(alerts_are_edge_triggered) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("cpu.warning", 80));
  int raised = 0, resolved = 0;
  double series[] = {85, 90, 95, 99, 10};
  for (int i = 0; i < 5; ++i) {
    for (const auto& e : ev.evaluate(cpu_point(series[i], i))) {
      if (e.kind == AlertEventKind::Raised) ++raised; else ++resolved;
    }
  }
  ASSERT_EQ(raised, 1);
  ASSERT_EQ(resolved, 1);
}

TEST(alerts_threshold_scenario_raises_and_resolves_once) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("cpu.warning", 80));
  double series[] = {70, 75, 85, 90, 78, 60};
  std::vector<std::pair<int, AlertEventKind>> seen;
  for (int i = 0; i < 6; ++i) {
    for (const auto& e : ev.evaluate(cpu_point(series[i], i))) seen.emplace_back(i, e.kind);
  }
  ASSERT_EQ(seen.size(), 2u);
  ASSERT_EQ(seen[0].first, 2);
  ASSERT_TRUE(seen[0].second == AlertEventKind::Raised);
  ASSERT_EQ(seen[1].first, 4);
  ASSERT_TRUE(seen[1].second == AlertEventKind::Resolved);

  auto all = ev.alerts();
  ASSERT_EQ(all.size(), 1u);
  ASSERT_TRUE(all[0].resolved);
  ASSERT_TRUE(all[0].first_fired_at == cpu_point(0, 2).timestamp);
  ASSERT_TRUE(all[0].resolved_at.has_value());
  ASSERT_TRUE(*all[0].resolved_at == cpu_point(0, 4).timestamp);
  ASSERT_EQ(all[0].message, std::string("cpu at 85"));
  ASSERT_TRUE(ev.active().empty());
}

TEST(alerts_refire_starts_a_new_episode) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("cpu.warning", 80));
  (void)ev.evaluate(cpu_point(90, 0));
  (void)ev.evaluate(cpu_point(10, 1));
  auto events = ev.evaluate(cpu_point(95, 2));
  ASSERT_EQ(events.size(), 1u);
  ASSERT_TRUE(events[0].kind == AlertEventKind::Raised);
  ASSERT_TRUE(events[0].alert.first_fired_at == cpu_point(0, 2).timestamp);
  ASSERT_TRUE(!events[0].alert.resolved_at.has_value());
  ASSERT_EQ(ev.alerts().size(), 1u);
  ASSERT_EQ(ev.active().size(), 1u);
}

TEST(alerts_events_follow_rule_order) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("zeta", 50, AlertLevel::Info));
  ev.add_rule(cpu_rule("alpha", 60, AlertLevel::Critical));
  auto events = ev.evaluate(cpu_point(70, 0));
  ASSERT_EQ(events.size(), 2u);
  ASSERT_EQ(events[0].alert.rule_id, std::string("zeta"));
  ASSERT_EQ(events[1].alert.rule_id, std::string("alpha"));
  ASSERT_TRUE(events[1].alert.level == AlertLevel::Critical);
}

TEST(alerts_throwing_predicate_fails_open) {
  AlertEvaluator ev;
  AlertRule bad;
  bad.id = "broken";
  bad.predicate = [](const DataPoint&) -> bool { throw std::runtime_error("boom"); };
  ev.add_rule(bad);
  ev.add_rule(cpu_rule("cpu.warning", 80));
  auto events = ev.evaluate(cpu_point(90, 0));
  ASSERT_EQ(events.size(), 1u);
  ASSERT_EQ(events[0].alert.rule_id, std::string("cpu.warning"));
  ASSERT_EQ(ev.evaluation_failures(), 1u);
}

TEST(alerts_reject_bad_rules) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("cpu.warning", 80));
  ASSERT_THROWS(ev.add_rule(cpu_rule("cpu.warning", 90)), vigil::InvalidConfig);
  ASSERT_THROWS(ev.add_rule(cpu_rule("", 90)), vigil::InvalidConfig);
  AlertRule no_pred;
  no_pred.id = "nothing";
  ASSERT_THROWS(ev.add_rule(no_pred), vigil::InvalidConfig);
  ASSERT_EQ(ev.rule_count(), 1u);
}

TEST(alerts_dropped_rule_is_resolved) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("a", 50));
  ev.add_rule(cpu_rule("b", 50));
  (void)ev.evaluate(cpu_point(90, 0));
  auto now = t0() + 1h;
  std::vector<AlertRule> next{cpu_rule("a", 50)};
  auto events = ev.set_rules(next, now);
  ASSERT_EQ(events.size(), 1u);
  ASSERT_EQ(events[0].alert.rule_id, std::string("b"));
  ASSERT_TRUE(events[0].kind == AlertEventKind::Resolved);
  ASSERT_TRUE(*events[0].alert.resolved_at == now);
  // Record of the dropped rule is kept, listed after registered rules
  auto all = ev.alerts();
  ASSERT_EQ(all.size(), 2u);
  ASSERT_EQ(all[0].rule_id, std::string("a"));
  ASSERT_EQ(all[1].rule_id, std::string("b"));
  ASSERT_EQ(ev.active().size(), 1u);
}

TEST(alerts_invalid_rule_set_leaves_state_untouched) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("a", 50));
  std::vector<AlertRule> dup{cpu_rule("x", 1), cpu_rule("x", 2)};
  ASSERT_THROWS(ev.set_rules(dup, t0()), vigil::InvalidConfig);
  ASSERT_EQ(ev.rule_count(), 1u);
}

TEST(alerts_clear_forgets_records) {
  AlertEvaluator ev;
  ev.add_rule(cpu_rule("a", 50));
  (void)ev.evaluate(cpu_point(90, 0));
  ev.clear();
  ASSERT_TRUE(ev.alerts().empty());
  // Still firing after clear: a new episode is raised
  auto events = ev.evaluate(cpu_point(90, 1));
  ASSERT_EQ(events.size(), 1u);
}
