#include <gcx/agent.hpp>
#include <gcx/log.hpp>

namespace gcx {

PlanStatus PlanningAgent::initialize(const WorldSnapshot& snapshot) {
  steps_.clear();
  actions_.clear();
  time_step_ = 0;

  const PlanningModel model = build_model(snapshot);
  const Encoding enc = encode(model);
  result_ = run_planner(cfg_, enc);
  if (result_.status != PlanStatus::Found) return result_.status;

  steps_ = parse_plan(result_.plan_lines);
  actions_ = translate(steps_, snapshot.agent);
  log::get()->info("agent: {} actions queued", actions_.size());
  return result_.status;
}

std::optional<EnvAction> PlanningAgent::step() {
  if (time_step_ >= actions_.size()) return std::nullopt;
  return actions_[time_step_++];
}

} // namespace gcx
