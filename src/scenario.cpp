#include <gcx/scenario.hpp>
#include <gcx/log.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

namespace gcx {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static int to_int_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx);
    ok = ok && idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0;
  }
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<WorldSnapshot> scenario_from_csv_stream(std::istream& in) {
  WorldSnapshot s;
  bool have_width = false, have_lanes = false, have_agent = false, have_finish = false;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);
    const std::string key = lower(cols[0]);
    bool ok = true;

    if (key == "width" && cols.size() == 2) {
      const int w = to_int_safe(cols[1], ok);
      if (ok) { s.width = w; have_width = true; }
    } else if (key == "lanes" && cols.size() == 2) {
      const int n = to_int_safe(cols[1], ok);
      if (ok) { s.lanes = n; have_lanes = true; }
    } else if (key == "agent" && cols.size() == 5) {
      AgentSnapshot a;
      a.pos.x = to_int_safe(cols[1], ok);
      a.pos.y = to_int_safe(cols[2], ok);
      a.speed_min = to_int_safe(cols[3], ok);
      a.speed_max = to_int_safe(cols[4], ok);
      if (ok) { s.agent = a; have_agent = true; }
    } else if (key == "finish" && cols.size() == 3) {
      Cell f;
      f.x = to_int_safe(cols[1], ok);
      f.y = to_int_safe(cols[2], ok);
      if (ok) { s.finish = f; have_finish = true; }
    } else if (key == "car" && cols.size() == 5) {
      CarSnapshot c;
      const int id = to_int_safe(cols[1], ok);
      c.pos.x = to_int_safe(cols[2], ok);
      c.pos.y = to_int_safe(cols[3], ok);
      c.speed = to_int_safe(cols[4], ok);
      ok = ok && id >= 0;
      if (ok) { c.id = static_cast<CarId>(id); s.cars.push_back(c); }
    } else {
      ok = false;
    }

    if (!ok) log::get()->debug("scenario: skipping line {}: '{}'", line_no, raw);
  }

  if (!(have_width && have_lanes && have_agent && have_finish)) return std::nullopt;
  return s;
}

std::optional<WorldSnapshot> load_scenario_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return scenario_from_csv_stream(f);
}

static WorldSnapshot make_world(int width, int lanes, Cell agent, Cell finish,
                                std::vector<CarSnapshot> cars) {
  WorldSnapshot s;
  s.width = width;
  s.lanes = lanes;
  s.agent.pos = agent;
  s.agent.speed_min = -3;
  s.agent.speed_max = -1;
  s.finish = finish;
  s.cars = std::move(cars);
  return s;
}

static std::vector<Scenario> make_catalog_builtin() {
  return {
    // Agent starts on the right edge and crosses to the finish at x = 0.
    {"crossing_small", make_world(5, 3, {4, 2}, {0, 0}, {
      {0, {3, 1}, -1},
      {1, {1, 0}, -2},
    })},
    // Finish lies behind the agent; planners report no plan.
    {"unreachable", make_world(5, 3, {0, 0}, {4, 1}, {
      {0, {3, 1}, -1},
    })},
    {"fast_sweep", make_world(6, 2, {5, 1}, {0, 1}, {
      {0, {4, 0}, -3},
      {1, {2, 1}, -2},
    })},
    {"parking", make_world(5, 3, {4, 2}, {0, 0}, {
      {0, {2, 0}, 0},
      {1, {3, 1}, 0},
      {2, {1, 2}, 0},
    })},
  };
}

const std::vector<Scenario>& scenario_catalog() {
  static const std::vector<Scenario> cat = make_catalog_builtin();
  return cat;
}

std::optional<Scenario> scenario_by_key(const std::string& key) {
  return scenario_by_key_in(scenario_catalog(), key);
}

std::optional<Scenario> scenario_by_key_in(const std::vector<Scenario>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Scenario& s){ return s.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::optional<WorldSnapshot> resolve_scenario(const std::string& key_or_path) {
  if (auto sc = scenario_by_key(key_or_path); sc.has_value()) return sc->snapshot;
  return load_scenario_csv(key_or_path);
}

} // namespace gcx
