#pragma once
#include <cstddef>
#include <utility>
#include <optional>
#include <vector>
#include <gcx/encoder.hpp>
#include <gcx/plan.hpp>
#include <gcx/planner.hpp>
#include <gcx/snapshot.hpp>

namespace gcx {

// Plans once per episode and replays the result one action per control step.
class PlanningAgent {
public:
  explicit PlanningAgent(PlannerConfig cfg = {}) : cfg_(std::move(cfg)) {}

  // Encodes the snapshot, runs the planner and translates its plan.
  // Throws EncodingError / PlanParseError; planner problems are reported
  // through the returned status.
  PlanStatus initialize(const WorldSnapshot& snapshot);

  // Next action, or nullopt once the plan is exhausted (or none was found).
  std::optional<EnvAction> step();

  const std::vector<EnvAction>& actions() const { return actions_; }
  const std::vector<PlanStep>& plan() const { return steps_; }
  const PlannerResult& last_result() const { return result_; }
  std::size_t time_step() const { return time_step_; }

private:
  PlannerConfig cfg_;
  PlannerResult result_;
  std::vector<PlanStep> steps_;
  std::vector<EnvAction> actions_;
  std::size_t time_step_{0};
};

} // namespace gcx
