#include <gcx/grid.hpp>
#include <cctype>

namespace gcx {

GridIndex::GridIndex(int width, int lanes)
  : width_(width < 0 ? 0 : width), lanes_(lanes < 0 ? 0 : lanes) {
  cells_.reserve(static_cast<std::size_t>(width_) * static_cast<std::size_t>(lanes_));
  names_.reserve(cells_.capacity());
  for (int x = 0; x < width_; ++x) {
    for (int y = 0; y < lanes_; ++y) {
      cells_.push_back(Cell{x, y});
      names_.push_back(cell_name(Cell{x, y}));
    }
  }
}

std::string cell_name(const Cell& c) {
  return "pt" + std::to_string(c.x) + "pt" + std::to_string(c.y);
}

static bool read_number(const std::string& s, std::size_t& pos, int& out) {
  const std::size_t start = pos;
  long v = 0;
  while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
    v = v * 10 + (s[pos] - '0');
    if (v > 1000000) return false;
    ++pos;
  }
  if (pos == start) return false;
  out = static_cast<int>(v);
  return true;
}

std::optional<Cell> parse_cell_name(const std::string& name) {
  // Planners may upper-case object names.
  std::string s;
  s.reserve(name.size());
  for (char c : name) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  std::size_t pos = 0;
  Cell c{};
  if (s.compare(pos, 2, "pt") != 0) return std::nullopt;
  pos += 2;
  if (!read_number(s, pos, c.x)) return std::nullopt;
  if (s.compare(pos, 2, "pt") != 0) return std::nullopt;
  pos += 2;
  if (!read_number(s, pos, c.y)) return std::nullopt;
  if (pos != s.size()) return std::nullopt;
  return c;
}

} // namespace gcx
