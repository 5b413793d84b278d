#include <gcx/occupancy.hpp>
#include <gcx/log.hpp>
#include <gcx/trajectory.hpp>

namespace gcx {

bool OccupancyTimeline::claim_(const Cell& c, int instant) {
  const std::size_t slot = static_cast<std::size_t>(instant) * grid_.size() + grid_.index_of(c);
  if (blocked_[slot]) return false;
  blocked_[slot] = 1;
  blocks_.push_back(BlockFact{c, instant});
  return true;
}

OccupancyTimeline OccupancyTimeline::build(const std::vector<CarSnapshot>& cars,
                                           const GridIndex& grid,
                                           int horizon,
                                           const Cell& origin) {
  OccupancyTimeline tl;
  tl.grid_ = grid;
  tl.horizon_ = horizon < 0 ? 0 : horizon;
  tl.blocked_.assign(static_cast<std::size_t>(tl.horizon_) * grid.size(), 0);
  if (tl.horizon_ == 0 || grid.size() == 0) return tl;

  const int width = grid.width();

  // Instant 0: current cells, except the agent's start cell.
  for (const auto& car : cars) {
    if (!grid.contains(car.pos) || car.pos == origin) continue;
    if (tl.claim_(car.pos, 0)) tl.presences_.push_back(CarPresence{car.id, car.pos, 0});
  }

  std::size_t collisions = 0;
  for (int t = 1; t < tl.horizon_; ++t) {
    for (const auto& car : cars) {
      if (!grid.contains(car.pos)) continue;
      const Cell now = project(car, t, width);
      if (tl.claim_(now, t)) {
        tl.presences_.push_back(CarPresence{car.id, now, t});
      } else {
        ++collisions;
      }
      for (const auto& c : sweep(car, t, width)) {
        if (c != now) (void)tl.claim_(c, t);
      }
    }
  }

  log::get()->debug("occupancy: {} cars, horizon {}, {} blocks, {} presences, {} shared claims",
                    cars.size(), tl.horizon_, tl.blocks_.size(), tl.presences_.size(), collisions);
  return tl;
}

bool OccupancyTimeline::is_blocked(const Cell& c, int instant) const {
  if (!in_range_(instant) || !grid_.contains(c)) return false;
  return blocked_[static_cast<std::size_t>(instant) * grid_.size() + grid_.index_of(c)] != 0;
}

std::vector<Cell> OccupancyTimeline::blocked_cells(int instant) const {
  std::vector<Cell> out;
  if (!in_range_(instant)) return out;
  for (const auto& c : grid_.cells()) {
    if (is_blocked(c, instant)) out.push_back(c);
  }
  return out;
}

std::vector<Cell> OccupancyTimeline::free_cells(int instant) const {
  std::vector<Cell> out;
  if (!in_range_(instant)) return out;
  for (const auto& c : grid_.cells()) {
    if (!is_blocked(c, instant)) out.push_back(c);
  }
  return out;
}

std::optional<CarId> OccupancyTimeline::occupant(const Cell& c, int instant) const {
  for (const auto& p : presences_) {
    if (p.instant == instant && p.cell == c) return p.car;
  }
  return std::nullopt;
}

} // namespace gcx
