#include <gcx/plan.hpp>
#include <gcx/errors.hpp>
#include <gcx/snapshot.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>

namespace gcx {

std::string to_string(const EnvAction& a) {
  switch (a.kind) {
    case MoveKind::Up:   return "up";
    case MoveKind::Down: return "down";
    case MoveKind::Forward: break;
  }
  return "forward[" + std::to_string(a.speed) + "]";
}

std::optional<int> action_index(const EnvAction& a, const AgentSnapshot& agent) {
  if (a.kind == MoveKind::Up) return 0;
  if (a.kind == MoveKind::Down) return 1;
  if (a.speed < agent.speed_min || a.speed > agent.speed_max) return std::nullopt;
  return 2 + (a.speed - agent.speed_min);
}

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> read_plan_lines(std::istream& in) {
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] != '(') continue;
    out.push_back(raw);
  }
  return out;
}

std::optional<std::vector<std::string>> load_plan_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return read_plan_lines(f);
}

namespace {

// (name from to t1 t2 [speed])
//  1: name  2,3: from x,y  4,5: to x,y  6: t1  7: t2  8: speed
const std::regex& action_grammar() {
  static const std::regex re(
    R"(^\(\s*([A-Za-z_]+)\s+pt(\d+)pt(\d+)\s+pt(\d+)pt(\d+)\s+(\d+)\s+(\d+)(?:\s+(-?\d+))?\s*\)$)",
    std::regex::ECMAScript | std::regex::icase);
  return re;
}

enum Field : std::size_t {
  kName = 1, kFromX, kFromY, kToX, kToY, kTimeFrom, kTimeTo, kSpeed,
};

int to_int(const std::smatch& m, Field f) { return std::stoi(m[f].str()); }

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

PlanStep parse_plan_line(const std::string& line) {
  const std::string raw = trim(line);
  std::smatch m;
  if (!std::regex_match(raw, m, action_grammar())) {
    throw PlanParseError("unrecognized plan line", raw);
  }

  const std::string name = lower(m[kName].str());
  const bool has_speed = m[kSpeed].matched;

  PlanStep st;
  if (name == "up" && !has_speed) {
    st.kind = MoveKind::Up;
  } else if (name == "down" && !has_speed) {
    st.kind = MoveKind::Down;
  } else if (name == "forward" && has_speed) {
    st.kind = MoveKind::Forward;
  } else {
    throw PlanParseError("unknown action shape '" + name + "'", raw);
  }

  try {
    st.from = Cell{to_int(m, kFromX), to_int(m, kFromY)};
    st.to = Cell{to_int(m, kToX), to_int(m, kToY)};
    st.t_from = to_int(m, kTimeFrom);
    st.t_to = to_int(m, kTimeTo);
    if (has_speed) st.speed = to_int(m, kSpeed);
  } catch (const std::out_of_range&) {
    throw PlanParseError("number out of range", raw);
  }
  return st;
}

std::vector<PlanStep> parse_plan(const std::vector<std::string>& lines) {
  std::vector<PlanStep> out;
  out.reserve(lines.size());
  for (const auto& l : lines) out.push_back(parse_plan_line(l));
  return out;
}

EnvAction translate_step(const PlanStep& step, const AgentSnapshot& agent) {
  if (step.kind == MoveKind::Forward) return EnvAction{MoveKind::Forward, step.speed};

  const bool same_lane = step.from.y == step.to.y;
  const bool same_column = step.from.x == step.to.x;
  if (same_lane || same_column) {
    return EnvAction{MoveKind::Forward, agent.speed_max};   // slowest forward, e.g. -1
  }
  return EnvAction{step.kind, 0};
}

std::vector<EnvAction> translate(const std::vector<PlanStep>& steps, const AgentSnapshot& agent) {
  std::vector<EnvAction> out;
  out.reserve(steps.size());
  for (const auto& s : steps) out.push_back(translate_step(s, agent));
  return out;
}

std::vector<Cell> agent_history(const Cell& start, const std::vector<PlanStep>& steps) {
  std::vector<Cell> h{start};
  for (const auto& s : steps) {
    if (s.t_to < 0) continue;
    const auto t = static_cast<std::size_t>(s.t_to);
    while (h.size() < t) h.push_back(h.back());
    if (h.size() == t) h.push_back(s.to);
    else h[t] = s.to;
  }
  return h;
}

} // namespace gcx
