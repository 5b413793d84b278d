#include <catch2/catch_test_macros.hpp>
#include <gcx/grid.hpp>

using namespace gcx;

TEST_CASE("GridIndex enumerates cells x-major, lane-minor") {
  GridIndex g(5, 3);
  REQUIRE(g.size() == 15);
  REQUIRE(g.cells()[0] == Cell{0, 0});
  REQUIRE(g.cells()[1] == Cell{0, 1});
  REQUIRE(g.cells()[3] == Cell{1, 0});
  REQUIRE(g.names()[0] == "pt0pt0");
  REQUIRE(g.name_of(Cell{4, 2}) == "pt4pt2");

  for (std::size_t i = 0; i < g.size(); ++i) {
    REQUIRE(g.index_of(g.cell_at(i)) == i);
  }
}

TEST_CASE("GridIndex bounds") {
  GridIndex g(5, 3);
  REQUIRE(g.contains(Cell{0, 0}));
  REQUIRE(g.contains(Cell{4, 2}));
  REQUIRE_FALSE(g.contains(Cell{5, 0}));
  REQUIRE_FALSE(g.contains(Cell{0, 3}));
  REQUIRE_FALSE(g.contains(Cell{-1, 0}));

  SECTION("negative dimensions give an empty grid") {
    GridIndex empty(-1, 3);
    REQUIRE(empty.size() == 0);
  }
}

TEST_CASE("cell names round trip") {
  REQUIRE(cell_name(Cell{12, 3}) == "pt12pt3");

  auto c = parse_cell_name("pt12pt3");
  REQUIRE(c.has_value());
  REQUIRE(*c == Cell{12, 3});

  auto upper = parse_cell_name("PT1PT2");   // planners may upper-case objects
  REQUIRE(upper.has_value());
  REQUIRE(*upper == Cell{1, 2});

  REQUIRE_FALSE(parse_cell_name("pt1").has_value());
  REQUIRE_FALSE(parse_cell_name("pt1pt2x").has_value());
  REQUIRE_FALSE(parse_cell_name("ptapt1").has_value());
  REQUIRE_FALSE(parse_cell_name("").has_value());
}
