#pragma once
#include <vector>
#include <gcx/grid.hpp>
#include <gcx/snapshot.hpp>

namespace gcx {

// Reduce any integer into [0, width). width must be positive.
inline int wrap_x(long long x, int width) {
  const long long w = width;
  long long r = x % w;
  if (r < 0) r += w;
  return static_cast<int>(r);
}

// Constant-speed horizontal motion with wraparound: x(t) = wrap(x0 + v*t).
// The lane never changes. Total for every t >= 0.
Cell project(const CarSnapshot& car, int instant, int width);

// Cells a car passes through between instant t-1 and t, both endpoints
// included, walked in its direction of travel. A car with |speed| <= 1 only
// yields its instant-t cell; |speed| >= width yields the whole lane once.
std::vector<Cell> sweep(const CarSnapshot& car, int instant, int width);

} // namespace gcx
