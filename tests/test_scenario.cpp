#include <catch2/catch_test_macros.hpp>
#include <gcx/encoder.hpp>
#include <gcx/scenario.hpp>

using namespace gcx;

TEST_CASE("built-in catalog lookups") {
  const auto& cat = scenario_catalog();
  REQUIRE(cat.size() >= 4);

  auto s = scenario_by_key("crossing_small");
  REQUIRE(s.has_value());
  REQUIRE(s->snapshot.width == 5);
  REQUIRE(s->snapshot.lanes == 3);
  REQUIRE(s->snapshot.agent.pos == Cell{4, 2});
  REQUIRE(s->snapshot.finish == Cell{0, 0});
  REQUIRE(s->snapshot.cars.size() == 2);

  REQUIRE_FALSE(scenario_by_key("nope").has_value());
  REQUIRE_FALSE(scenario_by_key_in({}, "crossing_small").has_value());
}

TEST_CASE("every catalog scenario encodes") {
  for (const auto& sc : scenario_catalog()) {
    INFO(sc.key);
    const auto model = build_model(sc.snapshot);
    REQUIRE(model.horizon == planning_horizon(sc.snapshot));
    const auto enc = encode(model);
    REQUIRE(enc.problem.goal().atoms.size() == static_cast<std::size_t>(model.horizon));
  }
}

TEST_CASE("parked cars block their cell at every instant") {
  const auto model = build_model(scenario_by_key("parking")->snapshot);
  for (int t = 0; t < model.horizon; ++t) {
    REQUIRE(model.timeline.is_blocked(Cell{2, 0}, t));
    REQUIRE(model.timeline.blocked_cells(t).size() == 3);
  }
}

TEST_CASE("resolve_scenario prefers catalog keys") {
  auto s = resolve_scenario("fast_sweep");
  REQUIRE(s.has_value());
  REQUIRE(s->width == 6);
  REQUIRE_FALSE(resolve_scenario("/nonexistent/gcx/scenario.csv").has_value());
}
