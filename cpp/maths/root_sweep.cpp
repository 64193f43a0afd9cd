#include <cmath>
#include <string>
#include <stdexcept>

#include "nlsolvers/global/global.hpp"
#include "nlsolvers/maths/root_sweep.hpp"

namespace nlsolvers {

RootSweep::RootSweep() : n_failed(0) {}

RootSweep::RootSweep(const RootFindingParams& params_) : rootfinding(params_), n_failed(0) {}

int RootSweep::solve(ParametrisedFunction obj_fun, ParametrisedFunction gradient,
                     const Eigen::VectorXd& p, const Eigen::VectorXd& x0, const Eigen::VectorXd& x1)
{
    if (x0.size() != p.size() || x1.size() != p.size())
    {
        throw std::invalid_argument("RootSweep: size mismatch, p has " + std::to_string(p.size())
                                    + " entries, x0 has " + std::to_string(x0.size())
                                    + " and x1 has " + std::to_string(x1.size()));
    }

    const Eigen::Index n = p.size();
    x = Eigen::VectorXd::Constant(n, NAN);
    output = Eigen::VectorXi::Constant(n, RootFinding::Output::SUCCESS);
    n_failed = 0;

    for (Eigen::Index i = 0; i < n; i++)
    {
        const double p_i = p(i);
        auto f = [&obj_fun, p_i](double x_) { return obj_fun(x_, p_i); };
        auto df = [&gradient, p_i](double x_) { return gradient(x_, p_i); };

        output(i) = rootfinding.solve(f, df, x0(i), x1(i));
        if (output(i) == RootFinding::Output::SUCCESS)
        {
            x(i) = rootfinding.getx();
        }
        else
        {
            n_failed++;
            if (rootfinding.get_params().verbose)
            {
                print("RootSweep: solve failed for p", p_i);
                print("status", output(i));
            }
        }
    }
    return n_failed;
}

int RootSweep::solve(ParametrisedFunction obj_fun, ParametrisedFunction gradient,
                     const Eigen::VectorXd& p, double x0, double x1)
{
    return this->solve(obj_fun, gradient, p,
                       Eigen::VectorXd::Constant(p.size(), x0), Eigen::VectorXd::Constant(p.size(), x1));
}

} // namespace nlsolvers
