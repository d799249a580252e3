#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "model/Alert.hpp"

namespace vigil::core {

// Edge-triggered threshold state machine, one record per rule id:
// INACTIVE -> FIRING -> RESOLVED -> FIRING ...
// Events are emitted only on transitions, in rule registration order.
class AlertEvaluator {
public:
  AlertEvaluator() = default;

  // Throws InvalidConfig on an empty or duplicate id or a missing predicate.
  void add_rule(vigil::model::AlertRule rule);

  // Replace the rule set. Records survive; a still-firing record whose rule
  // was dropped is resolved at `now` and reported in the returned events.
  std::vector<vigil::model::AlertEvent> set_rules(std::vector<vigil::model::AlertRule> rules,
                                                  std::chrono::system_clock::time_point now);

  // A predicate that throws counts as false for this point (fail-open).
  [[nodiscard]] std::vector<vigil::model::AlertEvent> evaluate(const vigil::model::DataPoint& point);

  // Every record (firing and resolved), registered rules first in order.
  [[nodiscard]] std::vector<vigil::model::Alert> alerts() const;
  [[nodiscard]] std::vector<vigil::model::Alert> active() const;
  void clear() { records_.clear(); }

  [[nodiscard]] size_t rule_count() const { return rules_.size(); }
  [[nodiscard]] uint64_t evaluation_failures() const { return failures_; }

private:
  bool holds(const vigil::model::AlertRule& rule, const vigil::model::DataPoint& point);
  std::string describe(const vigil::model::AlertRule& rule, const vigil::model::DataPoint& point);

  std::vector<vigil::model::AlertRule> rules_;
  std::unordered_map<std::string, vigil::model::Alert> records_;
  uint64_t failures_{0};
};

} // namespace vigil::core
