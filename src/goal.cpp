#include <gcx/goal.hpp>
#include <gcx/errors.hpp>
#include <string>

namespace gcx {

Goal build_goal(const Cell& finish, const GridIndex& grid, int horizon) {
  if (!grid.contains(finish)) {
    throw EncodingError("finish cell (" + std::to_string(finish.x) + "," +
                        std::to_string(finish.y) + ") outside grid");
  }
  Goal g;
  g.finish = finish;
  g.instants.reserve(horizon > 0 ? static_cast<std::size_t>(horizon) : 0u);
  for (int t = 0; t < horizon; ++t) g.instants.push_back(t);
  return g;
}

bool goal_satisfied(const Goal& g, const std::vector<Cell>& history) {
  for (int t : g.instants) {
    if (t >= 0 && static_cast<std::size_t>(t) < history.size() && history[t] == g.finish) return true;
  }
  return false;
}

} // namespace gcx
