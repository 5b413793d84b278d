#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <gcx/grid.hpp>
#include <gcx/snapshot.hpp>

namespace gcx {

// A car standing on a cell at an instant ("at" fact). Sweep cells get no
// presence, only a block.
struct CarPresence {
  CarId car = 0;
  Cell cell{};
  int instant = 0;
};

struct BlockFact {
  Cell cell{};
  int instant = 0;
};

// Blocked / free cells for instants [0, horizon).
//
// Claims are first-writer-wins per (cell, instant): when two cars reach the
// same cell at the same instant only the first car in snapshot order records
// a presence. The cell is blocked either way.
class OccupancyTimeline {
public:
  // origin: the agent's start cell, kept free at instant 0.
  static OccupancyTimeline build(const std::vector<CarSnapshot>& cars,
                                 const GridIndex& grid,
                                 int horizon,
                                 const Cell& origin);

  int horizon() const { return horizon_; }
  const GridIndex& grid() const { return grid_; }

  bool is_blocked(const Cell& c, int instant) const;
  bool is_free(const Cell& c, int instant) const { return !is_blocked(c, instant); }

  // Cells in enumeration order.
  std::vector<Cell> blocked_cells(int instant) const;
  std::vector<Cell> free_cells(int instant) const;

  // In insertion order (instant, then car order, then sweep order).
  const std::vector<CarPresence>& presences() const { return presences_; }
  const std::vector<BlockFact>& blocks() const { return blocks_; }

  // Who claimed a cell, if it was claimed by a car position (not a sweep).
  std::optional<CarId> occupant(const Cell& c, int instant) const;

private:
  bool claim_(const Cell& c, int instant);
  bool in_range_(int instant) const { return instant >= 0 && instant < horizon_; }

  GridIndex grid_;
  int horizon_{0};
  // instant-major, then grid index
  std::vector<std::uint8_t> blocked_;
  std::vector<CarPresence> presences_;
  std::vector<BlockFact> blocks_;
};

} // namespace gcx
