#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>

#include <gcx/encoder.hpp>
#include <gcx/errors.hpp>
#include <gcx/plan.hpp>

using namespace gcx;

namespace {

WorldSnapshot one_car_world() {
  WorldSnapshot s;
  s.width = 5;
  s.lanes = 3;
  s.agent.pos = {4, 2};
  s.agent.speed_min = -3;
  s.agent.speed_max = -1;
  s.finish = {0, 0};
  s.cars = {{0, {3, 1}, -1}};
  return s;
}

bool has_fact(const pddl::Problem& p, const std::string& text) {
  return std::any_of(p.init().begin(), p.init().end(),
                     [&](const pddl::Atom& a){ return pddl::format_atom(a) == text; });
}

const pddl::ObjectGroup* group(const pddl::Problem& p, const std::string& type) {
  for (const auto& g : p.objects()) if (g.type == type) return &g;
  return nullptr;
}

bool has(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("planning horizon covers the crossing at the slowest speed") {
  auto s = one_car_world();
  REQUIRE(planning_horizon(s) == 6);

  s.width = 7;
  s.agent.speed_max = -2;
  REQUIRE(planning_horizon(s) == 5);

  const auto m = build_model(s);
  REQUIRE(m.horizon == 5);
  REQUIRE(m.speeds == std::vector<int>{-2, -3});
}

TEST_CASE("domain declares the grid-driving vocabulary") {
  const auto d = make_domain();
  REQUIRE(d.name() == kDomainName);
  REQUIRE(d.action("UP") != nullptr);
  REQUIRE(d.action("DOWN") != nullptr);
  REQUIRE(d.action("FORWARD") != nullptr);
  REQUIRE(d.action("FORWARD")->params.size() == 5);
  REQUIRE(d.predicate("forward_next")->params.size() == 4);

  const std::string text = pddl::to_pddl(d);
  REQUIRE(has(text, "(define (domain grid_world)"));
  REQUIRE(has(text, ":negative-preconditions"));
  REQUIRE(has(text, "  agent - car\n"));
  REQUIRE(has(text, "(forward_next ?pt1 ?pt2 ?t2 ?s)"));
  REQUIRE(has(text, "(not (blocked ?pt2 ?t2))"));
  REQUIRE(has(text, ":effect (at ?pt2 ?t2 agent1)"));
}

TEST_CASE("problem facts follow the occupancy timeline") {
  const auto model = build_model(one_car_world());
  const auto enc = encode(model);
  const auto& p = enc.problem;

  SECTION("objects") {
    REQUIRE(group(p, "agent")->names == std::vector<std::string>{"agent1"});
    REQUIRE(group(p, "car")->names == std::vector<std::string>{"car0"});
    REQUIRE(group(p, "time")->names.size() == 7);
    REQUIRE(group(p, "speed")->names == std::vector<std::string>{"-1", "-2", "-3"});
    REQUIRE(group(p, "gridcell")->names.size() == 15);
  }

  SECTION("car presence and blocking") {
    REQUIRE(has_fact(p, "(at pt3pt1 0 car0)"));
    REQUIRE(has_fact(p, "(at pt2pt1 1 car0)"));
    REQUIRE(has_fact(p, "(at pt4pt1 4 car0)"));
    REQUIRE(has_fact(p, "(blocked pt2pt1 1)"));
    REQUIRE(has_fact(p, "(not (blocked pt2pt2 1))"));
    REQUIRE_FALSE(has_fact(p, "(not (blocked pt2pt1 1))"));
    // Free facts only where a transition can land.
    REQUIRE_FALSE(has_fact(p, "(not (blocked pt0pt0 0))"));
    REQUIRE_FALSE(has_fact(p, "(not (blocked pt0pt0 6))"));
  }

  SECTION("agent, transitions and instants") {
    REQUIRE(has_fact(p, "(at pt4pt2 0 agent1)"));
    REQUIRE(has_fact(p, "(up_next pt3pt2 pt2pt2 1)"));
    REQUIRE(has_fact(p, "(up_next pt4pt2 pt3pt1 2)"));
    REQUIRE(has_fact(p, "(forward_next pt3pt1 pt0pt1 1 -3)"));
    REQUIRE(has_fact(p, "(forward_next pt4pt1 pt2pt1 1 -2)"));
    REQUIRE(has_fact(p, "(next_instant 0 1)"));
    REQUIRE(has_fact(p, "(next_instant 5 6)"));
    REQUIRE_FALSE(has_fact(p, "(next_instant 6 7)"));
  }

  SECTION("goal is a disjunction over instants") {
    REQUIRE(p.goal().op == pddl::Connective::Or);
    REQUIRE(p.goal().atoms.size() == 6);
    REQUIRE(pddl::format_atom(p.goal().atoms.front()) == "(at pt0pt0 0 agent1)");
    REQUIRE(pddl::format_atom(p.goal().atoms.back()) == "(at pt0pt0 5 agent1)");
  }

  SECTION("serialized problem") {
    const std::string text = pddl::to_pddl(p);
    REQUIRE(has(text, "(define (problem crossing)"));
    REQUIRE(has(text, "(:domain grid_world)"));
    REQUIRE(has(text, "(:goal (or\n  (at pt0pt0 0 agent1)"));
  }
}

TEST_CASE("snapshots that cannot be encoded are rejected") {
  auto s = one_car_world();

  SECTION("agent outside the grid") {
    s.agent.pos = {5, 0};
    REQUIRE_THROWS_AS(build_model(s), EncodingError);
  }
  SECTION("finish outside the grid") {
    s.finish = {0, 3};
    REQUIRE_THROWS_AS(build_model(s), EncodingError);
  }
  SECTION("car outside the grid") {
    s.cars.push_back({1, {-1, 0}, -1});
    REQUIRE_THROWS_AS(build_model(s), EncodingError);
  }
  SECTION("empty or non-negative speed range") {
    s.agent.speed_min = -1;
    s.agent.speed_max = -2;
    REQUIRE_THROWS_AS(build_model(s), EncodingError);
    s.agent.speed_min = -1;
    s.agent.speed_max = 0;
    REQUIRE_THROWS_AS(build_model(s), EncodingError);
  }
  SECTION("zero-sized grid") {
    s.width = 0;
    REQUIRE_THROWS_AS(build_model(s), EncodingError);
  }
  SECTION("duplicate car ids") {
    s.cars.push_back({0, {1, 2}, -2});
    const auto m = build_model(s);
    REQUIRE_THROWS_AS(encode(m), EncodingError);
  }
}

TEST_CASE("one car crossing ahead of an agent at the left edge") {
  WorldSnapshot s = one_car_world();
  s.agent.pos = {0, 0};
  s.finish = {4, 1};

  const auto model = build_model(s);
  REQUIRE(model.horizon == 6);
  const auto enc = encode(model);
  const auto& p = enc.problem;

  REQUIRE(has_fact(p, "(blocked pt3pt1 0)"));
  REQUIRE(has_fact(p, "(blocked pt2pt1 1)"));
  REQUIRE(has_fact(p, "(at pt0pt0 0 agent1)"));

  REQUIRE(p.goal().op == pddl::Connective::Or);
  REQUIRE(p.goal().atoms.size() == 6);
  for (std::size_t t = 0; t < p.goal().atoms.size(); ++t) {
    REQUIRE(pddl::format_atom(p.goal().atoms[t]) == "(at pt4pt1 " + std::to_string(t) + " agent1)");
  }
  REQUIRE(has(pddl::to_pddl(p), "(:goal (or\n  (at pt4pt1 0 agent1)"));

  const auto step = parse_plan_line("(forward pt0pt0 pt3pt0 0 1 -3)");
  const auto act = translate_step(step, s.agent);
  REQUIRE(act == EnvAction{MoveKind::Forward, -3});
  REQUIRE(to_string(act) == "forward[-3]");
}
