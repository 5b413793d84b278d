#include <gcx/trajectory.hpp>
#include <vector>

namespace gcx {

Cell project(const CarSnapshot& car, int instant, int width) {
  const long long shift = static_cast<long long>(car.speed) * static_cast<long long>(instant);
  return Cell{wrap_x(static_cast<long long>(car.pos.x) + shift, width), car.pos.y};
}

std::vector<Cell> sweep(const CarSnapshot& car, int instant, int width) {
  std::vector<Cell> out;
  const int mag = car.speed < 0 ? -car.speed : car.speed;
  if (mag <= 1 || instant <= 0) {
    out.push_back(project(car, instant, width));
    return out;
  }

  const Cell from = project(car, instant - 1, width);
  const int dir = car.speed < 0 ? -1 : 1;
  const int steps = mag < width ? mag : width - 1;
  out.reserve(static_cast<std::size_t>(steps) + 1);
  for (int k = 0; k <= steps; ++k) {
    out.push_back(Cell{wrap_x(static_cast<long long>(from.x) + dir * k, width), from.y});
  }
  return out;
}

} // namespace gcx
