//--------------------------------------------------------------------------
#ifndef NLSOLVERS_MATHS_ROOTFINDING_H
#define NLSOLVERS_MATHS_ROOTFINDING_H
//--------------------------------------------------------------------------

#include <string>
#include <functional>

#include "nlsolvers/maths/root_finding_params.hpp"

namespace nlsolvers {

// Scalar root finding of f(x) = 0: Newton-Raphson, bisection and Newton-Raphson with bisection fallback.
// Each method returns an Output code; on SUCCESS the root is available through getx(), otherwise getx() is NaN.
class RootFinding
{
public:
    enum Output : int { SUCCESS = 0, CONVERGENCE_FAILURE = 1, INVALID_BRACKET_SIGN = 2 };

private:
    RootFindingParams params;

    double x;  // root of the last call, NaN if it failed
    double x_last, f_last;  // last iterate and last evaluated residual
    int iter, n_eval, n_grad;
    bool fallback;  // bisection was run by solve()
    std::string message;

public:
    RootFinding();
    RootFinding(const RootFindingParams& params_);

    // Newton-Raphson iteration starting from x0: x <- x - f(x)/df(x) while |f(x)| > eps.
    // A zero derivative is not trapped; the step follows IEEE arithmetic.
    int newton_raphson(std::function<double(double)> obj_fun, std::function<double(double)> gradient,
                       double x0, double eps, int max_its);
    // Omitted trailing arguments are taken from the RootFindingParams (eps = 1e-5, max_its = 20 by default)
    int newton_raphson(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0, double eps);
    int newton_raphson(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0);

    // Bisection of the interval [x0, x1]; f(x0) and f(x1) must not have the same sign.
    int bisection(std::function<double(double)> obj_fun,
                  double x0, double x1, double eps, int max_its);
    int bisection(std::function<double(double)> obj_fun, double x0, double x1, double eps);
    int bisection(std::function<double(double)> obj_fun, double x0, double x1);

    // Newton-Raphson from x0, falling back to bisection of [x0, x1] if Newton-Raphson does not converge
    int solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient,
              double x0, double x1, double eps, int max_its_n, int max_its_b);
    int solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient,
              double x0, double x1, double eps, int max_its_n);
    int solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0, double x1, double eps);
    int solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0, double x1);

    double& getx() { return this->x; }
    double get_last_x() const { return this->x_last; }
    double get_last_residual() const { return this->f_last; }
    int get_iterations() const { return this->iter; }
    int get_function_evaluations() const { return this->n_eval; }
    int get_gradient_evaluations() const { return this->n_grad; }
    bool used_fallback() const { return this->fallback; }
    const std::string& get_message() const { return this->message; }
    RootFindingParams& get_params() { return this->params; }

private:
    void reset();
    int run_newton_raphson(std::function<double(double)>& obj_fun, std::function<double(double)>& gradient,
                           double x0, double eps, int max_its);
    int run_bisection(std::function<double(double)>& obj_fun, double x0, double x1, double eps, int max_its);
};

} // namespace nlsolvers

//--------------------------------------------------------------------------
#endif // NLSOLVERS_MATHS_ROOTFINDING_H
//--------------------------------------------------------------------------
