#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <gcx/errors.hpp>
#include <gcx/plan.hpp>

using namespace gcx;

static AgentSnapshot default_agent() {
  AgentSnapshot a;
  a.pos = {4, 2};
  a.speed_min = -3;
  a.speed_max = -1;
  return a;
}

TEST_CASE("forward steps keep their signed speed") {
  const auto st = parse_plan_line("(forward pt3pt0 pt0pt0 0 1 -3)");
  REQUIRE(st.kind == MoveKind::Forward);
  REQUIRE(st.from == Cell{3, 0});
  REQUIRE(st.to == Cell{0, 0});
  REQUIRE(st.t_from == 0);
  REQUIRE(st.t_to == 1);
  REQUIRE(st.speed == -3);

  const auto agent = default_agent();
  const auto act = translate_step(st, agent);
  REQUIRE(act == EnvAction{MoveKind::Forward, -3});
  REQUIRE(to_string(act) == "forward[-3]");
  REQUIRE(action_index(act, agent) == std::optional<int>{2});
  REQUIRE(action_index(EnvAction{MoveKind::Forward, -1}, agent) == std::optional<int>{4});
  REQUIRE_FALSE(action_index(EnvAction{MoveKind::Forward, -4}, agent).has_value());
}

TEST_CASE("lateral steps that changed lane and column stay lateral") {
  const auto agent = default_agent();
  const auto up = translate_step(parse_plan_line("(up pt3pt2 pt2pt1 0 1)"), agent);
  const auto down = translate_step(parse_plan_line("(down pt3pt0 pt2pt1 1 2)"), agent);
  REQUIRE(up == EnvAction{MoveKind::Up, 0});
  REQUIRE(down == EnvAction{MoveKind::Down, 0});
  REQUIRE(to_string(up) == "up");
  REQUIRE(to_string(down) == "down");
  REQUIRE(action_index(up, agent) == std::optional<int>{0});
  REQUIRE(action_index(down, agent) == std::optional<int>{1});
}

TEST_CASE("degraded lateral steps become the slowest forward") {
  const auto agent = default_agent();
  SECTION("same lane") {
    REQUIRE(translate_step(parse_plan_line("(up pt3pt2 pt2pt2 0 1)"), agent) ==
            EnvAction{MoveKind::Forward, -1});
  }
  SECTION("same column at the left boundary") {
    REQUIRE(translate_step(parse_plan_line("(up pt0pt1 pt0pt0 2 3)"), agent) ==
            EnvAction{MoveKind::Forward, -1});
  }
  SECTION("slowest forward follows the agent's range") {
    AgentSnapshot fast = agent;
    fast.speed_max = -2;
    REQUIRE(translate_step(parse_plan_line("(down pt4pt1 pt3pt1 0 1)"), fast) ==
            EnvAction{MoveKind::Forward, -2});
  }
}

TEST_CASE("action names are matched without regard to case") {
  const auto st = parse_plan_line("  (FORWARD PT4PT1 PT2PT1 0 1 -2)  ");
  REQUIRE(st.kind == MoveKind::Forward);
  REQUIRE(st.to == Cell{2, 1});
  REQUIRE(parse_plan_line("(Up pt1pt1 pt0pt0 3 4)").kind == MoveKind::Up);
}

TEST_CASE("malformed plan lines are reported with the offending text") {
  const std::vector<std::string> bad{
    "(jump pt0pt0 pt1pt0 0 1)",
    "(forward pt0pt0 pt1pt0 0 1)",
    "(up pt0pt0 pt1pt0 0 1 -1)",
    "(forward pt0pt0 0 1 -1)",
    "forward pt0pt0 pt1pt0 0 1 -1",
    "(forward pt0pt0 pt1pt0 0 99999999999 -1)",
  };
  for (const auto& line : bad) {
    try {
      (void)parse_plan_line(line);
      FAIL("accepted: " << line);
    } catch (const PlanParseError& e) {
      REQUIRE(e.line() == line);
    }
  }
}

TEST_CASE("plan files skip cost comments and blank lines") {
  std::istringstream in(
    "(forward pt4pt2 pt1pt2 0 1 -3)\n"
    "\n"
    "  (up pt1pt2 pt0pt1 1 2)\r\n"
    "; cost = 2 (unit cost)\n");
  const auto lines = read_plan_lines(in);
  REQUIRE(lines == std::vector<std::string>{"(forward pt4pt2 pt1pt2 0 1 -3)", "(up pt1pt2 pt0pt1 1 2)"});

  const auto steps = parse_plan(lines);
  REQUIRE(steps.size() == 2);
  REQUIRE(translate(steps, default_agent()) ==
          std::vector<EnvAction>{{MoveKind::Forward, -3}, {MoveKind::Up, 0}});

  REQUIRE_FALSE(load_plan_file("/nonexistent/gcx/sas_plan").has_value());
}

TEST_CASE("agent history holds the cell across skipped instants") {
  const std::vector<PlanStep> steps{
    {MoveKind::Forward, {4, 2}, {3, 2}, 0, 1, -1},
    {MoveKind::Up, {3, 2}, {2, 1}, 2, 3, 0},
  };
  const auto h = agent_history(Cell{4, 2}, steps);
  REQUIRE(h == std::vector<Cell>{{4, 2}, {3, 2}, {3, 2}, {2, 1}});
  REQUIRE(agent_history(Cell{1, 1}, {}) == std::vector<Cell>{{1, 1}});
}
