#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <numeric>
#include <vector>

#include <gcx/trajectory.hpp>

using namespace gcx;

TEST_CASE("wrap_x reduces into [0, width)") {
  REQUIRE(wrap_x(0, 5) == 0);
  REQUIRE(wrap_x(-1, 5) == 4);
  REQUIRE(wrap_x(-12, 5) == 3);
  REQUIRE(wrap_x(7, 5) == 2);
}

TEST_CASE("project moves left and wraps around") {
  CarSnapshot car{0, {3, 1}, -1};
  REQUIRE(project(car, 0, 5) == Cell{3, 1});
  REQUIRE(project(car, 1, 5) == Cell{2, 1});
  REQUIRE(project(car, 3, 5) == Cell{0, 1});
  REQUIRE(project(car, 4, 5) == Cell{4, 1});   // wrapped
  REQUIRE(project(car, 5, 5) == Cell{3, 1});
}

TEST_CASE("project with zero speed never moves") {
  CarSnapshot parked{2, {2, 0}, 0};
  for (int t = 0; t <= 20; ++t) {
    REQUIRE(project(parked, t, 7) == project(parked, 0, 7));
  }
}

TEST_CASE("project is periodic with width / gcd(speed, width)") {
  for (int w : {5, 6, 7, 12}) {
    for (int s = 1; s <= 6; ++s) {
      const int period = w / std::gcd(s, w);
      for (int x0 = 0; x0 < w; ++x0) {
        CarSnapshot car{0, {x0, 0}, -s};
        for (int t = 0; t <= 10; ++t) {
          REQUIRE(project(car, t, w).x == project(car, t + period, w).x);
        }
      }
    }
  }
}

TEST_CASE("sweep covers every cell passed through") {
  SECTION("speed 3 from x=4 to x=1 covers 4,3,2,1") {
    CarSnapshot car{0, {4, 0}, -3};
    auto cells = sweep(car, 1, 6);
    REQUIRE(cells == std::vector<Cell>{{4, 0}, {3, 0}, {2, 0}, {1, 0}});
  }

  SECTION("sweep follows wraparound") {
    CarSnapshot car{0, {1, 1}, -3};
    auto cells = sweep(car, 1, 6);
    REQUIRE(cells == std::vector<Cell>{{1, 1}, {0, 1}, {5, 1}, {4, 1}});
  }

  SECTION("slow cars only occupy their new cell") {
    CarSnapshot car{0, {3, 2}, -1};
    auto cells = sweep(car, 2, 5);
    REQUIRE(cells == std::vector<Cell>{{1, 2}});
  }

  SECTION("a car faster than the width sweeps the whole lane once") {
    CarSnapshot car{0, {2, 0}, -7};
    auto cells = sweep(car, 1, 5);
    REQUIRE(cells.size() == 5);
    std::vector<int> xs;
    for (const auto& c : cells) xs.push_back(c.x);
    std::sort(xs.begin(), xs.end());
    REQUIRE(xs == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("rightward motion sweeps to the right") {
    CarSnapshot car{0, {4, 0}, 2};
    auto cells = sweep(car, 1, 6);
    REQUIRE(cells == std::vector<Cell>{{4, 0}, {5, 0}, {0, 0}});
  }
}
