#include "mip_backend.h"

#include <limits>
#include <utility>

#include <ortools/linear_solver/linear_solver.h>

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPVariable;

namespace slotopt
{

    const char *mip_status_name(MipStatus s)
    {
        switch (s)
        {
        case MipStatus::optimal:
            return "optimal";
        case MipStatus::feasible:
            return "feasible";
        case MipStatus::infeasible:
            return "infeasible";
        case MipStatus::unbounded:
            return "unbounded";
        case MipStatus::not_solved:
            return "not_solved";
        case MipStatus::abnormal:
            return "abnormal";
        case MipStatus::model_invalid:
            return "model_invalid";
        case MipStatus::aborted:
            return "aborted";
        }
        return "unknown";
    }

    // ---------- SolveControl ----------

    void SolveControl::cancel()
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_ = true;
        if (interrupt_)
            interrupt_();
    }

    bool SolveControl::cancelled() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return cancelled_;
    }

    void SolveControl::attach(std::function<void()> interrupt)
    {
        std::lock_guard<std::mutex> lk(mu_);
        interrupt_ = std::move(interrupt);
        // cancel() may have landed after the caller's last check
        if (cancelled_ && interrupt_)
            interrupt_();
    }

    void SolveControl::detach()
    {
        std::lock_guard<std::mutex> lk(mu_);
        interrupt_ = nullptr;
    }

    double MipModel::infinity()
    {
        return std::numeric_limits<double>::infinity();
    }

    namespace
    {

        MipStatus from_result_status(MPSolver::ResultStatus st)
        {
            switch (st)
            {
            case MPSolver::OPTIMAL:
                return MipStatus::optimal;
            case MPSolver::FEASIBLE:
                return MipStatus::feasible;
            case MPSolver::INFEASIBLE:
                return MipStatus::infeasible;
            case MPSolver::UNBOUNDED:
                return MipStatus::unbounded;
            case MPSolver::ABNORMAL:
                return MipStatus::abnormal;
            case MPSolver::MODEL_INVALID:
                return MipStatus::model_invalid;
            case MPSolver::NOT_SOLVED:
            default:
                return MipStatus::not_solved;
            }
        }

        class OrToolsMipModel : public MipModel
        {
        public:
            explicit OrToolsMipModel(std::unique_ptr<MPSolver> solver)
                : solver_(std::move(solver)) {}

            int add_bool_var(const std::string &name) override
            {
                vars_.push_back(solver_->MakeBoolVar(name));
                return static_cast<int>(vars_.size()) - 1;
            }

            void add_constraint(const std::vector<MipTerm> &terms,
                                double lb, double ub,
                                const std::string &name) override
            {
                MPConstraint *c = solver_->MakeRowConstraint(lb, ub, name);
                for (const auto &t : terms)
                {
                    const MPVariable *v = vars_.at(t.var);
                    c->SetCoefficient(v, c->GetCoefficient(v) + t.coeff);
                }
            }

            void set_objective(const std::vector<MipTerm> &terms, bool maximize) override
            {
                MPObjective *const objective = solver_->MutableObjective();
                objective->Clear();
                for (const auto &t : terms)
                {
                    const MPVariable *v = vars_.at(t.var);
                    objective->SetCoefficient(v, objective->GetCoefficient(v) + t.coeff);
                }
                if (maximize)
                    objective->SetMaximization();
                else
                    objective->SetMinimization();
            }

            MipSolution solve(const MipSolveParams &params) override
            {
                MipSolution out;
                SolveControl *control = params.control;
                if (control && control->cancelled())
                {
                    out.status = MipStatus::aborted;
                    return out;
                }

                if (params.time_limit_ms > 0)
                    solver_->set_time_limit(params.time_limit_ms);
                if (params.log_search)
                    solver_->EnableOutput();
                else
                    solver_->SuppressOutput();

                if (control)
                {
                    // CBC ignores interruption; SCIP and SAT honour it.
                    MPSolver *s = solver_.get();
                    control->attach([s]()
                                    { s->InterruptSolve(); });
                }
                const MPSolver::ResultStatus st = solver_->Solve();
                if (control)
                    control->detach();

                out.wall_ms = static_cast<long long>(solver_->wall_time());
                if (control && control->cancelled())
                {
                    out.status = MipStatus::aborted;
                    return out;
                }

                out.status = from_result_status(st);
                if (out.status == MipStatus::optimal || out.status == MipStatus::feasible)
                {
                    out.objective = solver_->Objective().Value();
                    out.values.reserve(vars_.size());
                    for (const MPVariable *v : vars_)
                        out.values.push_back(v->solution_value());
                }
                return out;
            }

        private:
            std::unique_ptr<MPSolver> solver_;
            std::vector<const MPVariable *> vars_;
        };

    } // namespace

    MipFactory ortools_mip_factory(const std::string &solver_id)
    {
        return [solver_id]() -> std::unique_ptr<MipModel>
        {
            std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(solver_id));
            if (!solver)
                return nullptr;
            return std::make_unique<OrToolsMipModel>(std::move(solver));
        };
    }

} // namespace slotopt
