#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gcx {

struct Cell {
  int x = 0;   // column, 0 is the left boundary (finish side)
  int y = 0;   // lane, 0 is the topmost lane
  bool operator==(const Cell& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Cell& o) const { return !(*this == o); }
};

// Width x lanes lookup table. Cells are enumerated x-major, lane-minor.
class GridIndex {
public:
  GridIndex() = default;
  GridIndex(int width, int lanes);

  int width() const { return width_; }
  int lanes() const { return lanes_; }
  std::size_t size() const { return cells_.size(); }

  bool contains(const Cell& c) const {
    return c.x >= 0 && c.x < width_ && c.y >= 0 && c.y < lanes_;
  }

  // Dense index in enumeration order. Caller checks contains() first.
  std::size_t index_of(const Cell& c) const {
    return static_cast<std::size_t>(c.x) * static_cast<std::size_t>(lanes_) +
           static_cast<std::size_t>(c.y);
  }
  const Cell& cell_at(std::size_t idx) const { return cells_[idx]; }

  const std::vector<Cell>& cells() const { return cells_; }
  const std::vector<std::string>& names() const { return names_; }
  const std::string& name_of(const Cell& c) const { return names_[index_of(c)]; }

private:
  int width_{0};
  int lanes_{0};
  std::vector<Cell> cells_;
  std::vector<std::string> names_;
};

// "pt<x>pt<y>"
std::string cell_name(const Cell& c);

// Inverse of cell_name; nullopt on anything else.
std::optional<Cell> parse_cell_name(const std::string& name);

} // namespace gcx
