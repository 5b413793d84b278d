#include <gcx/transitions.hpp>
#include <gcx/errors.hpp>
#include <gcx/log.hpp>
#include <algorithm>

namespace gcx {

const char* move_kind_name(MoveKind k) {
  switch (k) {
    case MoveKind::Up:      return "up";
    case MoveKind::Down:    return "down";
    case MoveKind::Forward: return "forward";
  }
  return "unknown";
}

Cell lateral_target(const Cell& from, MoveKind kind, const GridIndex& grid,
                    const OccupancyTimeline& timeline, int instant) {
  const int x = std::max(0, from.x - 1);
  int y = from.y;
  if (kind == MoveKind::Up) y = std::max(0, from.y - 1);
  else if (kind == MoveKind::Down) y = std::min(grid.lanes() - 1, from.y + 1);

  const Cell cand{x, y};
  if (timeline.is_free(cand, instant)) return cand;
  return Cell{x, from.y};
}

Cell forward_target(const Cell& from, int speed) {
  const int mag = speed < 0 ? -speed : speed;
  return Cell{std::max(0, from.x - mag), from.y};
}

TransitionTable TransitionTable::generate(const OccupancyTimeline& timeline,
                                          const std::vector<int>& speeds) {
  TransitionTable tt;
  tt.grid_ = timeline.grid();
  tt.horizon_ = timeline.horizon();
  tt.speeds_ = speeds;

  const auto& grid = tt.grid_;
  const int instants = tt.horizon_ > 1 ? tt.horizon_ - 1 : 0;
  tt.facts_.reserve(static_cast<std::size_t>(instants) * grid.size() * tt.moves_per_cell_());

  for (int t = 1; t < tt.horizon_; ++t) {
    for (const auto& c : grid.cells()) {
      tt.facts_.push_back({c, MoveKind::Up, 0, lateral_target(c, MoveKind::Up, grid, timeline, t), t});
      tt.facts_.push_back({c, MoveKind::Down, 0, lateral_target(c, MoveKind::Down, grid, timeline, t), t});
      for (int s : tt.speeds_) {
        tt.facts_.push_back({c, MoveKind::Forward, s, forward_target(c, s), t});
      }
    }
  }

  log::get()->debug("transitions: {} facts over {} instants", tt.facts_.size(), instants);
  return tt;
}

std::size_t TransitionTable::slot_(const Cell& from, int instant, std::size_t move) const {
  return (static_cast<std::size_t>(instant - 1) * grid_.size() + grid_.index_of(from)) *
         moves_per_cell_() + move;
}

Cell TransitionTable::next_cell(const Cell& from, MoveKind kind, int instant, int speed) const {
  if (!grid_.contains(from)) {
    throw EncodingError("transition query for cell " + cell_name(from) + " outside grid");
  }
  if (instant < 1 || instant >= horizon_) {
    throw EncodingError("transition query for instant " + std::to_string(instant) +
                        " outside [1, " + std::to_string(horizon_) + ")");
  }

  std::size_t move = 0;
  if (kind == MoveKind::Up) {
    move = 0;
  } else if (kind == MoveKind::Down) {
    move = 1;
  } else {
    auto it = std::find(speeds_.begin(), speeds_.end(), speed);
    if (it == speeds_.end()) {
      throw EncodingError("transition query for unknown speed " + std::to_string(speed));
    }
    move = 2 + static_cast<std::size_t>(it - speeds_.begin());
  }
  return facts_[slot_(from, instant, move)].to;
}

} // namespace gcx
