#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <gcx/agent.hpp>
#include <gcx/encoder.hpp>
#include <gcx/errors.hpp>
#include <gcx/log.hpp>
#include <gcx/scenario.hpp>

namespace po = boost::program_options;
using namespace gcx;

static int emit_only(const WorldSnapshot& snap, const PlannerConfig& cfg) {
  const auto enc = encode(build_model(snap));
  const std::filesystem::path dir(cfg.work_dir);
  std::filesystem::create_directories(dir);
  std::ofstream domain(dir / cfg.domain_file, std::ios::binary);
  std::ofstream problem(dir / cfg.problem_file, std::ios::binary);
  domain << pddl::to_pddl(enc.domain);
  problem << pddl::to_pddl(enc.problem);
  if (!domain.flush() || !problem.flush()) {
    log::get()->error("cannot write PDDL artifacts into {}", dir.string());
    return 3;
  }
  std::cout << (dir / cfg.domain_file).string() << "\n" << (dir / cfg.problem_file).string() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  PlannerConfig cfg;
  std::string scenario;
  std::string level;

  po::options_description desc("gcx_plan options");
  desc.add_options()
    ("help,h", "print this help")
    ("list", "list built-in scenarios")
    ("scenario,s", po::value<std::string>(&scenario)->default_value("crossing_small"),
       "built-in scenario key or scenario CSV path")
    ("planner,p", po::value<std::string>(&cfg.planner)->default_value(cfg.planner),
       "planner executable (Fast Downward driver)")
    ("search", po::value<std::string>(&cfg.search)->default_value(cfg.search),
       "planner search configuration")
    ("workdir,w", po::value<std::string>(&cfg.work_dir)->default_value(cfg.work_dir),
       "directory for PDDL artifacts and the plan file")
    ("emit-only", "write domain and problem, do not run the planner")
    ("keep", po::bool_switch(&cfg.keep_files), "keep artifacts after planning")
    ("log-level", po::value<std::string>(&level)->default_value("info"),
       "trace, debug, info, warn, error");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << desc << std::endl;
    return 1;
  }

  if (vm.count("help")) {
    std::cout << desc << std::endl;
    return 0;
  }
  if (vm.count("list")) {
    for (const auto& s : scenario_catalog()) std::cout << s.key << "\n";
    return 0;
  }

  log::init(level);

  const auto snap = resolve_scenario(scenario);
  if (!snap.has_value()) {
    log::get()->error("scenario '{}' is neither a built-in key nor a readable scenario file", scenario);
    return 1;
  }

  try {
    if (vm.count("emit-only")) return emit_only(*snap, cfg);

    PlanningAgent agent(cfg);
    const PlanStatus status = agent.initialize(*snap);
    if (status == PlanStatus::NoPlan) return 2;
    if (status == PlanStatus::ToolFailure) return 3;

    while (auto a = agent.step()) {
      const auto idx = action_index(*a, snap->agent);
      std::cout << to_string(*a) << " " << (idx ? *idx : -1) << "\n";
    }
  } catch (const EncodingError& e) {
    log::get()->error("encoding failed: {}", e.what());
    return 1;
  } catch (const PlanParseError& e) {
    log::get()->error("cannot read plan: {}", e.what());
    return 3;
  } catch (const std::filesystem::filesystem_error& e) {
    log::get()->error("{}", e.what());
    return 3;
  }
  return 0;
}
