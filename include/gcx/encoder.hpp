#pragma once
#include <string>
#include <vector>
#include <gcx/goal.hpp>
#include <gcx/grid.hpp>
#include <gcx/occupancy.hpp>
#include <gcx/pddl.hpp>
#include <gcx/snapshot.hpp>
#include <gcx/transitions.hpp>

namespace gcx {

// Object and action names shared by the encoder and the plan translator.
inline constexpr const char* kAgentObject = "agent1";
inline constexpr const char* kDomainName = "grid_world";
inline constexpr const char* kProblemName = "crossing";

// Everything derived from one snapshot, before any text is produced.
struct PlanningModel {
  WorldSnapshot snapshot;
  GridIndex grid;
  int horizon = 0;
  std::vector<int> speeds;   // signed agent forward speeds, smallest magnitude first
  OccupancyTimeline timeline;
  TransitionTable transitions;
  Goal goal;
};

struct Encoding {
  pddl::Domain domain;
  pddl::Problem problem;
};

// Validates the snapshot (EncodingError) and derives the model.
PlanningModel build_model(const WorldSnapshot& snapshot);

// The fixed grid-driving domain: types, predicates, UP / DOWN / FORWARD.
pddl::Domain make_domain();

// Objects, init facts and goal of one model, checked against `domain`.
pddl::Problem make_problem(const PlanningModel& model, const pddl::Domain& domain);

Encoding encode(const PlanningModel& model);

std::string car_object(CarId id);      // "car<id>"
std::string speed_object(int speed);   // signed, e.g. "-3"

} // namespace gcx
