#include <iostream>
#include <string>
#include <utility>
#include <gcx/encoder.hpp>
#include <gcx/errors.hpp>
#include <gcx/log.hpp>
#include <gcx/plan.hpp>
#include <gcx/scenario.hpp>
#include <gcx/viewer/app.hpp>

using namespace gcx;

// gcx_viewer [scenario-key-or-csv] [sas_plan]
int main(int argc, char** argv) {
  const std::string scenario = argc > 1 ? argv[1] : "crossing_small";
  const auto snap = resolve_scenario(scenario);
  if (!snap.has_value()) {
    log::get()->error("unknown scenario '{}'", scenario);
    return 1;
  }

  try {
    const PlanningModel model = build_model(*snap);
    std::vector<Cell> history;
    if (argc > 2) {
      const auto lines = load_plan_file(argv[2]);
      if (!lines.has_value()) {
        log::get()->error("cannot open plan file {}", argv[2]);
        return 1;
      }
      history = agent_history(snap->agent.pos, parse_plan(*lines));
    }

    ViewerApp app(model, std::move(history), scenario);
    return app.run();
  } catch (const std::runtime_error& e) {
    log::get()->error("{}", e.what());
    return 1;
  }
}
