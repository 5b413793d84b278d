#pragma once
#include <string>
#include <vector>
#include <gcx/encoder.hpp>
#include <gcx/grid.hpp>

namespace gcx {

// RAII application that renders one planning model instant by instant.
class ViewerApp {
public:
  // history: agent cell per instant (may be empty when no plan is loaded).
  ViewerApp(const PlanningModel& model, std::vector<Cell> history, std::string title);
  int run(); // returns 0 on normal exit

private:
  // Input & playback
  void process_input_();
  void advance_playback_(float dt);
  // Rendering
  void render_frame_();
  void draw_grid_();
  void draw_cars_();
  void draw_agent_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f cellToScreen_(const Cell& c) const;   // top-left corner
  Cell agent_cell_(int instant) const;

  // Dependencies
  const PlanningModel& model_;
  std::vector<Cell> history_;
  std::string title_;

  // UI state
  int   instant_{0};
  bool  playing_{false};
  float step_timer_{0.0f};
  float seconds_per_instant_{0.6f};
  float cell_px_{64.0f};
  bool  show_sweeps_{true};
};

} // namespace gcx
