#include <raylib.h>
#include <algorithm>
#include <cstdio>
#include <unordered_map>
#include <utility>

#include <gcx/viewer/app.hpp>

namespace gcx {

namespace {

// High-contrast palette; assigned per CarId (stable during session).
static Color colorFor(CarId id) {
  static const Color PAL[] = {
    {231, 76, 60, 255},   // red
    {52, 152, 219, 255},  // blue
    {46, 204, 113, 255},  // green
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {26, 188, 156, 255},  // teal
    {230, 126, 34, 255},  // orange
    {236, 112, 99, 255},  // salmon
  };
  static std::unordered_map<CarId, int> idx;
  auto it = idx.find(id);
  if (it == idx.end()) {
    int assigned = static_cast<int>(idx.size()) % static_cast<int>(sizeof(PAL)/sizeof(PAL[0]));
    it = idx.emplace(id, assigned).first;
  }
  return PAL[it->second];
}

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y = 20;  // size 20
static constexpr int kHUD_LINE2_Y = 46;  // size 18
static constexpr int kHUD_LINE3_Y = 72;  // size 14
static constexpr int kGRID_TOP    = 110;
static constexpr int kGRID_LEFT   = 40;

} // namespace

ViewerApp::ViewerApp(const PlanningModel& model, std::vector<Cell> history, std::string title)
  : model_(model), history_(std::move(history)), title_(std::move(title)) {}

ViewerApp::Vec2f ViewerApp::cellToScreen_(const Cell& c) const {
  return { kGRID_LEFT + c.x * cell_px_, kGRID_TOP + c.y * cell_px_ };
}

Cell ViewerApp::agent_cell_(int instant) const {
  if (history_.empty()) return instant == 0 ? model_.snapshot.agent.pos : Cell{-1, -1};
  const auto i = std::min<std::size_t>(static_cast<std::size_t>(instant), history_.size() - 1);
  return history_[i];
}

int ViewerApp::run() {
  const int W = std::max(640, kGRID_LEFT * 2 + int(model_.grid.width() * cell_px_));
  const int H = std::max(360, kGRID_TOP + 40 + int(model_.grid.lanes() * cell_px_));
  InitWindow(W, H, ("GCX - " + title_).c_str());
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    advance_playback_(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  const int last = std::max(0, model_.horizon - 1);
  if (IsKeyPressed(KEY_SPACE)) playing_ = !playing_;
  if (IsKeyPressed(KEY_RIGHT)) { instant_ = std::min(last, instant_ + 1); playing_ = false; }
  if (IsKeyPressed(KEY_LEFT))  { instant_ = std::max(0, instant_ - 1); playing_ = false; }
  if (IsKeyPressed(KEY_HOME) || IsKeyPressed(KEY_R)) { instant_ = 0; step_timer_ = 0.0f; }
  if (IsKeyPressed(KEY_B)) show_sweeps_ = !show_sweeps_;

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      cell_px_ = std::min(160.0f, cell_px_ * 1.01f);
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) cell_px_ = std::max(16.0f, cell_px_ * 0.99f);

  // Playback speed
  if (IsKeyPressed(KEY_ONE))   seconds_per_instant_ = 1.2f;
  if (IsKeyPressed(KEY_TWO))   seconds_per_instant_ = 0.6f;
  if (IsKeyPressed(KEY_THREE)) seconds_per_instant_ = 0.3f;
}

void ViewerApp::advance_playback_(float dt) {
  if (!playing_) return;
  step_timer_ += dt;
  if (step_timer_ < seconds_per_instant_) return;
  step_timer_ = 0.0f;
  const int last = std::max(0, model_.horizon - 1);
  instant_ = (instant_ >= last) ? 0 : instant_ + 1;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{30, 30, 34, 255});
  draw_grid_();
  draw_cars_();
  draw_agent_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_grid_() {
  const auto& tl = model_.timeline;
  const Cell finish = model_.goal.finish;

  for (const auto& c : model_.grid.cells()) {
    const auto p = cellToScreen_(c);
    Color fill = Color{40, 40, 46, 255};   // asphalt
    if (show_sweeps_ && tl.is_blocked(c, instant_)) fill = Color{110, 50, 50, 255};
    DrawRectangle(int(p.x), int(p.y), int(cell_px_), int(cell_px_), fill);

    // Finish checker
    if (c == finish) {
      const int squares = 4;
      const float sq = cell_px_ / squares;
      for (int i = 0; i < squares; ++i) {
        for (int j = 0; j < squares; ++j) {
          const Color col = ((i + j) % 2 == 0) ? Color{240,240,240,160} : Color{20,20,22,160};
          DrawRectangle(int(p.x + i*sq), int(p.y + j*sq), int(sq), int(sq), col);
        }
      }
    }
    DrawRectangleLines(int(p.x), int(p.y), int(cell_px_), int(cell_px_), Color{70,70,80,255});
  }

  // Lane markings (dashed) between lanes
  const int lanes = model_.grid.lanes();
  for (int y = 1; y < lanes; ++y) {
    const float py = kGRID_TOP + y * cell_px_;
    for (int x = 0; x < model_.grid.width(); ++x) {
      const float px = kGRID_LEFT + x * cell_px_;
      DrawLineEx({px + cell_px_*0.2f, py}, {px + cell_px_*0.6f, py}, 3.0f, Color{235,235,235,200});
    }
  }
}

void ViewerApp::draw_cars_() {
  // Cars point left: nose at the cell's left edge.
  for (const auto& pr : model_.timeline.presences()) {
    if (pr.instant != instant_) continue;
    const auto p = cellToScreen_(pr.cell);
    const float m = cell_px_ * 0.18f;
    Vector2 nose  = { p.x + m,            p.y + cell_px_ * 0.5f };
    Vector2 tailT = { p.x + cell_px_ - m, p.y + m };
    Vector2 tailB = { p.x + cell_px_ - m, p.y + cell_px_ - m };
    DrawTriangle(nose, tailB, tailT, colorFor(pr.car));
    DrawText(TextFormat("%u", (unsigned)pr.car), int(p.x + cell_px_*0.55f), int(p.y + cell_px_*0.4f), 14, RAYWHITE);
  }
}

void ViewerApp::draw_agent_() {
  // Path so far
  if (!history_.empty()) {
    const std::size_t upto = std::min<std::size_t>(static_cast<std::size_t>(instant_), history_.size() - 1);
    for (std::size_t i = 1; i <= upto; ++i) {
      const auto a = cellToScreen_(history_[i-1]);
      const auto b = cellToScreen_(history_[i]);
      const float h = cell_px_ * 0.5f;
      DrawLineEx({a.x + h, a.y + h}, {b.x + h, b.y + h}, 3.0f, Color{80,220,120,200});
    }
  }

  const Cell c = agent_cell_(instant_);
  if (!model_.grid.contains(c)) return;
  const auto p = cellToScreen_(c);
  DrawCircleV({p.x + cell_px_*0.5f, p.y + cell_px_*0.5f}, cell_px_ * 0.3f, Color{80,220,120,255});
}

void ViewerApp::draw_hud_() {
  const Cell a = agent_cell_(instant_);
  const bool at_finish = a == model_.goal.finish;
  const auto blocked = model_.timeline.blocked_cells(instant_).size();

  DrawText(TextFormat("%s  grid=%dx%d  cars=%d  instant=%d/%d  %s",
                      title_.c_str(),
                      model_.grid.width(), model_.grid.lanes(),
                      (int)model_.snapshot.cars.size(),
                      instant_, std::max(0, model_.horizon - 1),
                      playing_ ? "playing" : "paused"),
           20, kHUD_LINE1_Y, 20, Color{220,235,220,255});

  char status[128];
  if (history_.empty()) {
    std::snprintf(status, sizeof(status), "blocked=%zu  (no plan loaded)", blocked);
  } else {
    std::snprintf(status, sizeof(status), "blocked=%zu  agent=%s%s", blocked,
                  model_.grid.contains(a) ? cell_name(a).c_str() : "--",
                  at_finish ? "  FINISH" : "");
  }
  DrawText(status, 20, kHUD_LINE2_Y, 18, Color{235,220,220,255});

  DrawText("Space: Play/Pause | Left/Right: Instant | R: Rewind | 1..3: Speed | W/S or +/-: Zoom | B: Blocked cells",
           20, kHUD_LINE3_Y, 14, Color{190,205,190,255});
}

} // namespace gcx
