#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <gcx/grid.hpp>
#include <gcx/occupancy.hpp>

namespace gcx {

enum class MoveKind : int {
  Up = 0,
  Down = 1,
  Forward = 2,
};

const char* move_kind_name(MoveKind k); // "up", "down", "forward"

struct TransitionFact {
  Cell from{};
  MoveKind kind = MoveKind::Forward;
  int speed = 0;     // signed forward speed, 0 for lateral moves
  Cell to{};
  int instant = 0;   // instant at which the destination is reached
};

// Successor cell of every move from every cell for instants [1, horizon).
//
// Lateral moves also advance one column. A lateral destination that is not
// free at the instant degrades to the same-lane cell of that column, so every
// (cell, move, instant) has exactly one successor. Forward destinations are
// never substituted; the planner's "not blocked" precondition rules them out.
class TransitionTable {
public:
  // speeds: signed forward speeds, e.g. {-1, -2, -3}
  static TransitionTable generate(const OccupancyTimeline& timeline,
                                  const std::vector<int>& speeds);

  // Throws EncodingError for a cell, instant or speed outside the table.
  Cell next_cell(const Cell& from, MoveKind kind, int instant, int speed = 0) const;

  const std::vector<TransitionFact>& facts() const { return facts_; }
  int horizon() const { return horizon_; }

private:
  std::size_t slot_(const Cell& from, int instant, std::size_t move) const;
  std::size_t moves_per_cell_() const { return 2 + speeds_.size(); }

  GridIndex grid_;
  int horizon_{0};
  std::vector<int> speeds_;
  std::vector<TransitionFact> facts_;  // (instant, cell, up, down, speeds...) order
};

// Pure rules, exposed for reuse by the table and tests.
Cell lateral_target(const Cell& from, MoveKind kind, const GridIndex& grid,
                    const OccupancyTimeline& timeline, int instant);
Cell forward_target(const Cell& from, int speed);

} // namespace gcx
