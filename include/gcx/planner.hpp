#pragma once
#include <string>
#include <vector>
#include <gcx/encoder.hpp>

namespace gcx {

struct PlannerConfig {
  std::string planner = "fast-downward.py";
  std::string search = "lazy_greedy([ff()], preferred=[ff()])";
  std::string work_dir = ".";             // one per concurrent episode
  std::string domain_file = "domain.pddl";
  std::string problem_file = "problem.pddl";
  std::string plan_file = "sas_plan";     // written by the planner into work_dir
  std::string log_file = "planner.log";   // planner stdout / stderr
  bool keep_files = false;
};

enum class PlanStatus {
  Found,        // plan file read
  NoPlan,       // planner reported the task unsolvable
  ToolFailure,  // artifacts not written, planner missing or crashed
};

const char* plan_status_name(PlanStatus s);

struct PlannerResult {
  PlanStatus status = PlanStatus::ToolFailure;
  int exit_code = -1;
  std::vector<std::string> plan_lines;   // raw action lines, in order
  std::string detail;                    // human-readable reason
};

// Fast Downward driver exit codes that mean "no plan exists / none found".
bool is_unsolvable_exit(int exit_code);

// Writes both artifacts (one batched write each), runs the planner in
// work_dir and blocks until it exits, reads the plan, removes the artifacts
// unless keep_files. Never throws for planner problems.
PlannerResult run_planner(const PlannerConfig& cfg, const Encoding& enc);

// The shell command run_planner executes. run_planner first makes a planner
// path containing '/' absolute, since the command runs inside work_dir.
std::string planner_command(const PlannerConfig& cfg);

} // namespace gcx
