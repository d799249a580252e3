#include "core/AlertEvaluator.hpp"
#include "util/Errors.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <unordered_set>

namespace vigil::core {

using vigil::model::Alert;
using vigil::model::AlertEvent;
using vigil::model::AlertEventKind;
using vigil::model::AlertRule;
using vigil::model::DataPoint;

void AlertEvaluator::add_rule(AlertRule rule) {
  if (rule.id.empty()) throw vigil::InvalidConfig("alert rule id must not be empty");
  if (!rule.predicate) throw vigil::InvalidConfig("alert rule '" + rule.id + "' has no predicate");
  for (const auto& r : rules_) {
    if (r.id == rule.id) throw vigil::InvalidConfig("duplicate alert rule id '" + rule.id + "'");
  }
  rules_.push_back(std::move(rule));
}

std::vector<AlertEvent> AlertEvaluator::set_rules(std::vector<AlertRule> rules,
                                                  std::chrono::system_clock::time_point now) {
  // Validate the whole set before touching state
  AlertEvaluator staged;
  for (auto& r : rules) staged.add_rule(std::move(r));

  std::unordered_set<std::string> kept;
  for (const auto& r : staged.rules_) kept.insert(r.id);

  std::vector<AlertEvent> events;
  for (const auto& r : rules_) {
    if (kept.count(r.id)) continue;
    auto it = records_.find(r.id);
    if (it == records_.end() || it->second.resolved) continue;
    it->second.resolved = true;
    it->second.resolved_at = now;
    events.push_back(AlertEvent{AlertEventKind::Resolved, it->second});
  }
  rules_ = std::move(staged.rules_);
  return events;
}

bool AlertEvaluator::holds(const AlertRule& rule, const DataPoint& point) {
  try {
    return rule.predicate(point);
  } catch (const std::exception& e) {
    ++failures_;
    std::fprintf(stderr, "vigil: AlertEvaluator: rule '%s' evaluation failed: %s\n", rule.id.c_str(), e.what());
  } catch (...) {
    ++failures_;
    std::fprintf(stderr, "vigil: AlertEvaluator: rule '%s' evaluation failed: unknown exception\n", rule.id.c_str());
  }
  return false;
}

std::string AlertEvaluator::describe(const AlertRule& rule, const DataPoint& point) {
  if (!rule.message) return rule.id;
  try {
    return rule.message(point);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "vigil: AlertEvaluator: rule '%s' message failed: %s\n", rule.id.c_str(), e.what());
  }
  return rule.id;
}

std::vector<AlertEvent> AlertEvaluator::evaluate(const DataPoint& point) {
  std::vector<AlertEvent> events;
  for (const auto& rule : rules_) {
    bool hit = holds(rule, point);
    auto it = records_.find(rule.id);
    bool firing = it != records_.end() && !it->second.resolved;
    if (hit && !firing) {
      Alert& a = records_[rule.id];
      a.rule_id = rule.id;
      a.level = rule.level;
      a.message = describe(rule, point);
      a.first_fired_at = point.timestamp;
      a.resolved = false;
      a.resolved_at.reset();
      events.push_back(AlertEvent{AlertEventKind::Raised, a});
    } else if (!hit && firing) {
      it->second.resolved = true;
      it->second.resolved_at = point.timestamp;
      events.push_back(AlertEvent{AlertEventKind::Resolved, it->second});
    }
  }
  return events;
}

std::vector<Alert> AlertEvaluator::alerts() const {
  std::vector<Alert> out;
  out.reserve(records_.size());
  std::unordered_set<std::string> listed;
  for (const auto& rule : rules_) {
    auto it = records_.find(rule.id);
    if (it == records_.end()) continue;
    out.push_back(it->second);
    listed.insert(rule.id);
  }
  // Records of rules that were since removed, by id
  size_t tail = out.size();
  for (const auto& [id, a] : records_) {
    if (!listed.count(id)) out.push_back(a);
  }
  std::sort(out.begin() + static_cast<std::ptrdiff_t>(tail), out.end(),
            [](const Alert& a, const Alert& b){ return a.rule_id < b.rule_id; });
  return out;
}

std::vector<Alert> AlertEvaluator::active() const {
  auto all = alerts();
  std::erase_if(all, [](const Alert& a){ return a.resolved; });
  return all;
}

} // namespace vigil::core
