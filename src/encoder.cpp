#include <gcx/encoder.hpp>
#include <gcx/log.hpp>
#include <algorithm>

namespace gcx {

std::string car_object(CarId id) { return "car" + std::to_string(id); }

std::string speed_object(int speed) { return std::to_string(speed); }

static std::vector<int> agent_speeds(const AgentSnapshot& a) {
  std::vector<int> out;
  for (int s = a.speed_max; s >= a.speed_min; --s) out.push_back(s);   // -1, -2, -3
  return out;
}

PlanningModel build_model(const WorldSnapshot& snapshot) {
  validate_snapshot(snapshot);

  PlanningModel m;
  m.snapshot = snapshot;
  m.grid = GridIndex(snapshot.width, snapshot.lanes);
  m.horizon = planning_horizon(snapshot);
  m.speeds = agent_speeds(snapshot.agent);
  m.timeline = OccupancyTimeline::build(snapshot.cars, m.grid, m.horizon, snapshot.agent.pos);
  m.transitions = TransitionTable::generate(m.timeline, m.speeds);
  m.goal = build_goal(snapshot.finish, m.grid, m.horizon);

  log::get()->debug("model: {}x{} grid, {} cars, horizon {}",
                    snapshot.width, snapshot.lanes, snapshot.cars.size(), m.horizon);
  return m;
}

// ---- Domain ----

static pddl::ActionSchema move_action(const std::string& name, const std::string& successor, bool with_speed) {
  pddl::ActionSchema a;
  a.name = name;
  a.params = {{"pt1", "gridcell"}, {"pt2", "gridcell"}, {"t1", "time"}, {"t2", "time"}};
  std::vector<std::string> succ_args{"?pt1", "?pt2", "?t2"};
  if (with_speed) {
    a.params.push_back({"s", "speed"});
    succ_args.push_back("?s");
  }
  a.precondition = {
    {"at", {"?pt1", "?t1", kAgentObject}},
    {successor, succ_args},
    {"blocked", {"?pt2", "?t2"}, true},
    {"next_instant", {"?t1", "?t2"}},
  };
  a.effect = {{"at", {"?pt2", "?t2", kAgentObject}}};
  return a;
}

pddl::Domain make_domain() {
  pddl::DomainBuilder b(kDomainName);
  b.requirement(":strips")
   .requirement(":typing")
   .requirement(":negative-preconditions")
   .requirement(":disjunctive-preconditions");

  b.type("car").type("agent", "car").type("gridcell").type("time").type("speed");

  b.predicate("at", {{"pt1", "gridcell"}, {"t", "time"}, {"car", "car"}})
   .predicate("up_next", {{"pt1", "gridcell"}, {"pt2", "gridcell"}, {"t", "time"}})
   .predicate("down_next", {{"pt1", "gridcell"}, {"pt2", "gridcell"}, {"t", "time"}})
   .predicate("forward_next", {{"pt1", "gridcell"}, {"pt2", "gridcell"}, {"t", "time"}, {"s", "speed"}})
   .predicate("next_instant", {{"t1", "time"}, {"t2", "time"}})
   .predicate("blocked", {{"pt1", "gridcell"}, {"t", "time"}});

  b.action(move_action("UP", "up_next", false))
   .action(move_action("DOWN", "down_next", false))
   .action(move_action("FORWARD", "forward_next", true));
  return b.build();
}

// ---- Problem ----

static const char* successor_predicate(MoveKind k) {
  switch (k) {
    case MoveKind::Up:      return "up_next";
    case MoveKind::Down:    return "down_next";
    case MoveKind::Forward: return "forward_next";
  }
  return "forward_next";
}

pddl::Problem make_problem(const PlanningModel& model, const pddl::Domain& domain) {
  const auto& grid = model.grid;
  pddl::ProblemBuilder b(kProblemName, domain);

  std::vector<std::string> cars;
  cars.reserve(model.snapshot.cars.size());
  for (const auto& c : model.snapshot.cars) cars.push_back(car_object(c.id));

  std::vector<std::string> instants;
  for (int t = 0; t <= model.horizon; ++t) instants.push_back(std::to_string(t));

  std::vector<std::string> speeds;
  for (int s : model.speeds) speeds.push_back(speed_object(s));

  b.objects("agent", {kAgentObject})
   .objects("car", cars)
   .objects("time", instants)
   .objects("speed", speeds)
   .objects("gridcell", grid.names());

  const auto& tl = model.timeline;
  for (const auto& p : tl.presences()) {
    b.fact({"at", {grid.name_of(p.cell), std::to_string(p.instant), car_object(p.car)}});
  }
  for (const auto& blk : tl.blocks()) {
    b.fact({"blocked", {grid.name_of(blk.cell), std::to_string(blk.instant)}});
  }
  for (int t = 1; t < model.horizon; ++t) {
    for (const auto& c : tl.free_cells(t)) {
      b.fact({"blocked", {grid.name_of(c), std::to_string(t)}, true});
    }
  }

  b.fact({"at", {grid.name_of(model.snapshot.agent.pos), "0", kAgentObject}});

  for (const auto& f : model.transitions.facts()) {
    pddl::Atom a{successor_predicate(f.kind), {grid.name_of(f.from), grid.name_of(f.to), std::to_string(f.instant)}};
    if (f.kind == MoveKind::Forward) a.args.push_back(speed_object(f.speed));
    b.fact(std::move(a));
  }

  for (int t = 0; t < model.horizon; ++t) {
    b.fact({"next_instant", {std::to_string(t), std::to_string(t + 1)}});
  }

  pddl::Condition goal{pddl::Connective::Or, {}};
  const auto& finish = grid.name_of(model.goal.finish);
  for (int t : model.goal.instants) {
    goal.atoms.push_back({"at", {finish, std::to_string(t), kAgentObject}});
  }
  b.goal(std::move(goal));

  return b.build();
}

Encoding encode(const PlanningModel& model) {
  pddl::Domain d = make_domain();
  pddl::Problem p = make_problem(model, d);
  log::get()->debug("encoding: {} objects groups, {} init facts, {} goal disjuncts",
                    p.objects().size(), p.init().size(), p.goal().atoms.size());
  return Encoding{std::move(d), std::move(p)};
}

} // namespace gcx
