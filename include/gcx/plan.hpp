#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <gcx/grid.hpp>
#include <gcx/snapshot.hpp>
#include <gcx/transitions.hpp>

namespace gcx {

// One planner action, e.g. "(forward pt3pt0 pt0pt0 0 1 -3)".
struct PlanStep {
  MoveKind kind = MoveKind::Forward;
  Cell from{};
  Cell to{};
  int t_from = 0;
  int t_to = 0;
  int speed = 0;   // signed, forward only
};

// Environment-native action token.
struct EnvAction {
  MoveKind kind = MoveKind::Forward;
  int speed = 0;   // signed, forward only
  bool operator==(const EnvAction& o) const { return kind == o.kind && speed == o.speed; }
  bool operator!=(const EnvAction& o) const { return !(*this == o); }
};

// "up", "down", "forward[-3]"
std::string to_string(const EnvAction& a);

// Position in the environment's action list: up, down, then forward speeds
// from speed_min to speed_max. nullopt for a forward speed outside the range.
std::optional<int> action_index(const EnvAction& a, const AgentSnapshot& agent);

// Lines starting with '(' are actions; everything else (cost comments,
// blank lines) is skipped.
std::vector<std::string> read_plan_lines(std::istream& in);

// Filesystem wrapper; nullopt if the file cannot be opened.
std::optional<std::vector<std::string>> load_plan_file(const std::string& path);

// Throws PlanParseError for a line that matches no action shape.
PlanStep parse_plan_line(const std::string& line);
std::vector<PlanStep> parse_plan(const std::vector<std::string>& lines);

// Lateral steps that did not change lane or column are the degraded /
// clamped transitions; the environment executes them as the slowest forward.
EnvAction translate_step(const PlanStep& step, const AgentSnapshot& agent);
std::vector<EnvAction> translate(const std::vector<PlanStep>& steps, const AgentSnapshot& agent);

// Agent cell per instant, starting at `start` (history[0]); the cell is held
// across instants a step skips.
std::vector<Cell> agent_history(const Cell& start, const std::vector<PlanStep>& steps);

} // namespace gcx
