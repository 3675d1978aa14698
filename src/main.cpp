// main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <string>

#include "utils.h"
#include "types.h"
#include "config.h"
#include "input_tables.h"
#include "result_io.h"
#include "scheduler.h"

using namespace slotopt;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string faculty_path;       // required
  std::string courses_path;       // required
  std::string selection_path;     // required
  std::string config_path = "";   // optional, defaults otherwise
  std::string out_path = "result.json";
  bool have_seed = false;
  unsigned long long seed = 0;
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  slot_optimizer --faculty faculty.csv --courses courses.csv --selection selection.csv [--config config.json] [--out result.json] [--seed N] [--quiet]

Required:
  --faculty PATH      Name, Adjustment, Voting
  --courses PATH      Course, Faculty
  --selection PATH    Course, s1 .. s10 (0 = unranked, 1 = best)

Optional:
  --config PATH       JSON config (MIP_SOLVER, time limits, SEED, ...)
                      Ctrl-C stops a running SCIP or SAT solve; under CBC it
                      takes effect when the current solve returns.
  --out PATH          Result JSON (default result.json)
  --seed N            Overrides SEED
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--faculty")   f.faculty_path = need("--faculty");
    else if (a == "--courses")   f.courses_path = need("--courses");
    else if (a == "--selection") f.selection_path = need("--selection");
    else if (a == "--config")    f.config_path = need("--config");
    else if (a == "--out")       f.out_path = need("--out");
    else if (a == "--seed") {
      const std::string v = need("--seed");
      try { f.seed = std::stoull(v); f.have_seed = true; }
      catch (const std::exception&) { std::cerr << "Bad --seed value: " << v << "\n"; std::exit(2); }
    }
    else if (a == "--quiet") f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.faculty_path.empty() || f.courses_path.empty() || f.selection_path.empty()) {
    std::cerr << "Missing required --faculty/--courses/--selection.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// Set from the signal handler, polled by main.
static std::atomic<bool> g_interrupted{false};
extern "C" void on_sigint(int) { g_interrupted.store(true); }

static int exit_code_for(Failure f) {
  switch (f) {
    case Failure::none: return 0;
    case Failure::infeasible_or_unsolved: return 3;
    case Failure::solver_fault: return 4;
    case Failure::aborted: return 5;
  }
  return 4;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  SchedulerConfig cfg;
  ScheduleRequest req;
  try {
    if (!flags.config_path.empty()) cfg = parse_config(load_json(flags.config_path));
    if (flags.have_seed) cfg.seed = flags.seed;
    if (!flags.verbose) cfg.verbose = false;

    req.faculty = load_faculty_csv(flags.faculty_path);
    req.courses = load_courses_csv(flags.courses_path);
    req.preferences = load_preferences_csv(flags.selection_path, cfg.catalog);
  } catch (const MalformedInput& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  if (cfg.verbose) {
    std::cout << "Course slot optimizer\n";
    std::cout << "Config: solver=" << cfg.mip_solver
              << " slots=" << cfg.catalog.size()
              << " courses=" << req.preferences.size()
              << " faculty=" << req.faculty.size()
              << " seed=" << cfg.seed
              << " exclusion=" << exclusion_policy_name(cfg.exclusion_policy) << "\n";
  }

  // Solve on a worker so Ctrl-C can cancel through SolveControl.
  SolveControl control;
  std::signal(SIGINT, on_sigint);
  auto fut = std::async(std::launch::async, [&]() {
    return optimize_schedule(req, cfg, &control);
  });
  while (fut.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
    if (g_interrupted.load() && !control.cancelled()) {
      std::cerr << "Interrupted; cancelling solve...\n";
      control.cancel();
    }
  }

  ScheduleOutcome outcome;
  try {
    outcome = fut.get();
  } catch (const MalformedInput& e) {
    std::cerr << "Invalid input: " << e.what() << "\n"; return 1;
  }

  if (!outcome.ok()) {
    std::cerr << "Optimization error (" << failure_name(outcome.failure) << "): " << outcome.message << "\n";
    return exit_code_for(outcome.failure);
  }

  const ScheduleResult& result = *outcome.result;
  if (cfg.verbose) print_summary(std::cout, result, cfg.balance_limit);

  try { save_json(flags.out_path, to_json(result)); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 6; }

  if (cfg.verbose) std::cout << "Result written to " << flags.out_path << "\n";
  return 0;
}
