#pragma once
#include <vector>
#include <gcx/grid.hpp>

namespace gcx {

// Reach `finish` at any of `instants` (a disjunction, not an exact-time match).
struct Goal {
  Cell finish{};
  std::vector<int> instants;   // 0 .. horizon-1
};

// Throws EncodingError if finish is outside the grid.
Goal build_goal(const Cell& finish, const GridIndex& grid, int horizon);

// history[t] is the agent's cell at instant t.
bool goal_satisfied(const Goal& g, const std::vector<Cell>& history);

} // namespace gcx
