#pragma once
#include <cstdint>
#include <vector>
#include <gcx/grid.hpp>

namespace gcx {

using CarId = std::uint32_t;

struct CarSnapshot {
  CarId id = 0;
  Cell pos{};       // lane (pos.y) is fixed for the car's lifetime
  int speed = -1;   // signed cells per instant, negative moves left
};

struct AgentSnapshot {
  Cell pos{};
  int speed_min = -3;   // signed range, e.g. [-3, -1]
  int speed_max = -1;
};

// Single immutable sample of the grid world, read once per planning episode.
struct WorldSnapshot {
  int width = 0;
  int lanes = 0;
  AgentSnapshot agent;
  std::vector<CarSnapshot> cars;
  Cell finish{};
};

// Throws EncodingError naming the first offending field.
void validate_snapshot(const WorldSnapshot& s);

// Smallest speed magnitude in the agent's allowed range.
int min_speed_magnitude(const AgentSnapshot& a);

// ceil(width / min magnitude) + 1
int planning_horizon(const WorldSnapshot& s);

} // namespace gcx
