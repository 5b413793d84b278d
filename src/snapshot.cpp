#include <gcx/snapshot.hpp>
#include <gcx/errors.hpp>
#include <string>

namespace gcx {

static std::string where(const Cell& c) {
  return "(" + std::to_string(c.x) + "," + std::to_string(c.y) + ")";
}

void validate_snapshot(const WorldSnapshot& s) {
  if (s.width <= 0) throw EncodingError("grid width must be positive, got " + std::to_string(s.width));
  if (s.lanes <= 0) throw EncodingError("lane count must be positive, got " + std::to_string(s.lanes));

  const GridIndex grid(s.width, s.lanes);
  if (!grid.contains(s.agent.pos)) throw EncodingError("agent cell " + where(s.agent.pos) + " outside grid");
  if (!grid.contains(s.finish)) throw EncodingError("finish cell " + where(s.finish) + " outside grid");

  // The agent only ever moves toward x = 0.
  if (s.agent.speed_min > s.agent.speed_max || s.agent.speed_max >= 0) {
    throw EncodingError("agent speed range [" + std::to_string(s.agent.speed_min) + ", " +
                        std::to_string(s.agent.speed_max) + "] must be non-empty and negative");
  }

  for (const auto& c : s.cars) {
    if (!grid.contains(c.pos)) {
      throw EncodingError("car " + std::to_string(c.id) + " cell " + where(c.pos) + " outside grid");
    }
  }
}

int min_speed_magnitude(const AgentSnapshot& a) {
  return a.speed_max < 0 ? -a.speed_max : a.speed_max;
}

int planning_horizon(const WorldSnapshot& s) {
  const int m = min_speed_magnitude(s.agent);
  if (m <= 0 || s.width <= 0) return 1;
  return (s.width + m - 1) / m + 1;
}

} // namespace gcx
