// mip_backend.h
#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace slotopt {

enum class MipStatus {
  optimal,
  feasible,       // incumbent found, optimality not proven (budget hit)
  infeasible,
  unbounded,
  not_solved,
  abnormal,
  model_invalid,
  aborted
};

const char* mip_status_name(MipStatus s);

struct MipTerm {
  int var;
  double coeff;
};

// Cancellation handle shared between the caller and an in-flight solve.
// cancel() may be called from any thread.
class SolveControl {
public:
  void cancel();
  bool cancelled() const;

  // Installed by the backend for the duration of a solve. Runs the hook at
  // once if the control is already cancelled.
  void attach(std::function<void()> interrupt);
  void detach();

private:
  mutable std::mutex mu_;
  bool cancelled_ = false;
  std::function<void()> interrupt_;
};

struct MipSolveParams {
  long long time_limit_ms = 0;  // 0 = unlimited
  bool log_search = false;
  SolveControl* control = nullptr;
};

struct MipSolution {
  MipStatus status = MipStatus::not_solved;
  double objective = 0.0;
  std::vector<double> values;   // indexed by variable id; empty unless optimal/feasible
  long long wall_ms = 0;
};

// Narrow view of an integer-programming engine: boolean variables,
// linear row constraints, one linear objective.
class MipModel {
public:
  virtual ~MipModel() = default;

  virtual int add_bool_var(const std::string& name) = 0;
  // lb <= sum(terms) <= ub ; repeated variables are summed
  virtual void add_constraint(const std::vector<MipTerm>& terms,
                              double lb, double ub,
                              const std::string& name) = 0;
  // repeated variables are summed
  virtual void set_objective(const std::vector<MipTerm>& terms, bool maximize) = 0;
  virtual MipSolution solve(const MipSolveParams& params) = 0;

  static double infinity();  // same value as MPSolver::infinity()
};

// Creates a fresh model per solve. Returns nullptr when the engine is unavailable.
using MipFactory = std::function<std::unique_ptr<MipModel>()>;

// OR-Tools MPSolver backend; solver_id as accepted by MPSolver::CreateSolver ("CBC", "SCIP", "SAT", ...).
MipFactory ortools_mip_factory(const std::string& solver_id);

} // namespace slotopt
