#include <gcx/planner.hpp>
#include <gcx/log.hpp>
#include <gcx/plan.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <sys/wait.h>

namespace gcx {

namespace fs = std::filesystem;

const char* plan_status_name(PlanStatus s) {
  switch (s) {
    case PlanStatus::Found:       return "found";
    case PlanStatus::NoPlan:      return "no plan";
    case PlanStatus::ToolFailure: return "tool failure";
  }
  return "unknown";
}

bool is_unsolvable_exit(int exit_code) {
  // 10 translate unsolvable, 11 search unsolvable, 12 search unsolved (incomplete)
  return exit_code >= 10 && exit_code <= 12;
}

// Exit codes 0..3 all mean a plan was written (1..3: found, then ran out of
// memory or time while improving it).
static bool is_plan_found_exit(int exit_code) { return exit_code >= 0 && exit_code <= 3; }

static std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string planner_command(const PlannerConfig& cfg) {
  return "cd " + shell_quote(cfg.work_dir) + " && " +
         shell_quote(cfg.planner) + " " +
         shell_quote(cfg.domain_file) + " " +
         shell_quote(cfg.problem_file) +
         " --search " + shell_quote(cfg.search) +
         " > " + shell_quote(cfg.log_file) + " 2>&1";
}

static bool write_text(const fs::path& p, const std::string& text) {
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  f << text;
  f.flush();
  return static_cast<bool>(f);
}

static void remove_quietly(const fs::path& p) {
  std::error_code ec;
  fs::remove(p, ec);
  if (ec) log::get()->warn("could not remove {}: {}", p.string(), ec.message());
}

// The command runs inside work_dir, so a path to the planner is resolved
// against the caller's directory first. Bare names still go through PATH.
static std::string resolve_planner(const std::string& planner) {
  if (planner.find('/') == std::string::npos) return planner;
  std::error_code ec;
  const fs::path abs = fs::absolute(planner, ec);
  return ec ? planner : abs.lexically_normal().string();
}

PlannerResult run_planner(const PlannerConfig& cfg_in, const Encoding& enc) {
  PlannerConfig cfg = cfg_in;
  cfg.planner = resolve_planner(cfg.planner);

  PlannerResult res;
  const fs::path dir(cfg.work_dir);
  const fs::path domain = dir / cfg.domain_file;
  const fs::path problem = dir / cfg.problem_file;
  const fs::path plan = dir / cfg.plan_file;
  const fs::path logf = dir / cfg.log_file;

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    res.detail = "cannot create work dir " + dir.string() + ": " + ec.message();
    log::get()->error("{}", res.detail);
    return res;
  }

  if (!write_text(domain, pddl::to_pddl(enc.domain)) ||
      !write_text(problem, pddl::to_pddl(enc.problem))) {
    res.detail = "cannot write PDDL artifacts into " + dir.string();
    log::get()->error("{}", res.detail);
    return res;
  }
  remove_quietly(plan);

  const std::string cmd = planner_command(cfg);
  log::get()->info("running planner: {}", cmd);
  const int raw = std::system(cmd.c_str());

  if (raw == -1) {
    res.detail = "cannot start shell for planner";
  } else if (!WIFEXITED(raw)) {
    res.detail = "planner terminated abnormally";
  } else {
    res.exit_code = WEXITSTATUS(raw);
    if (is_plan_found_exit(res.exit_code)) {
      if (auto lines = load_plan_file(plan.string()); lines.has_value()) {
        res.status = PlanStatus::Found;
        res.plan_lines = std::move(*lines);
        res.detail = "plan with " + std::to_string(res.plan_lines.size()) + " steps";
      } else {
        res.detail = "planner exited with " + std::to_string(res.exit_code) + " but wrote no plan";
      }
    } else if (is_unsolvable_exit(res.exit_code)) {
      res.status = PlanStatus::NoPlan;
      res.detail = "planner found no plan (exit " + std::to_string(res.exit_code) + ")";
    } else {
      res.detail = "planner failed with exit code " + std::to_string(res.exit_code) +
                   ", see " + logf.string();
    }
  }

  switch (res.status) {
    case PlanStatus::Found:       log::get()->info("{}", res.detail); break;
    case PlanStatus::NoPlan:      log::get()->warn("{}", res.detail); break;
    case PlanStatus::ToolFailure: log::get()->error("{}", res.detail); break;
  }

  if (!cfg.keep_files) {
    remove_quietly(domain);
    remove_quietly(problem);
    remove_quietly(plan);
    if (res.status != PlanStatus::ToolFailure) remove_quietly(logf);
  }
  return res;
}

} // namespace gcx
