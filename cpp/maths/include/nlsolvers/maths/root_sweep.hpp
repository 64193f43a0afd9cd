//--------------------------------------------------------------------------
#ifndef NLSOLVERS_MATHS_ROOTSWEEP_H
#define NLSOLVERS_MATHS_ROOTSWEEP_H
//--------------------------------------------------------------------------

#include <functional>

#include "nlsolvers/maths/root_finding.hpp"
#include "nlsolvers/maths/root_finding_params.hpp"

#include <Eigen/Dense>

namespace nlsolvers {

// Solves f(x; p) = 0 with RootFinding::solve() for each parameter value p[i].
// Failed entries are NaN in roots(); status() holds the RootFinding::Output code of every entry.
class RootSweep
{
public:
    typedef std::function<double(double, double)> ParametrisedFunction;

private:
    RootFinding rootfinding;
    Eigen::VectorXd x;
    Eigen::VectorXi output;
    int n_failed;

public:
    RootSweep();
    RootSweep(const RootFindingParams& params_);

    // Initial guess/left end x0[i] and right end x1[i] of the bracket for each p[i]
    int solve(ParametrisedFunction obj_fun, ParametrisedFunction gradient,
              const Eigen::VectorXd& p, const Eigen::VectorXd& x0, const Eigen::VectorXd& x1);
    // Shared initial guess and bracket for all p
    int solve(ParametrisedFunction obj_fun, ParametrisedFunction gradient,
              const Eigen::VectorXd& p, double x0, double x1);

    const Eigen::VectorXd& roots() const { return this->x; }
    const Eigen::VectorXi& status() const { return this->output; }
    int get_failed() const { return this->n_failed; }
    RootFindingParams& get_params() { return this->rootfinding.get_params(); }
};

} // namespace nlsolvers

//--------------------------------------------------------------------------
#endif // NLSOLVERS_MATHS_ROOTSWEEP_H
//--------------------------------------------------------------------------
