#include <cmath>
#include <string>
#include <functional>

#include "nlsolvers/global/global.hpp"
#include "nlsolvers/maths/root_finding.hpp"

namespace nlsolvers {

RootFinding::RootFinding()
{
   this->reset();
}

RootFinding::RootFinding(const RootFindingParams& params_) : params(params_)
{
   this->reset();
}

void RootFinding::reset()
{
   x = NAN;
   x_last = NAN;
   f_last = NAN;
   iter = 0;
   n_eval = 0;
   n_grad = 0;
   fallback = false;
   message.clear();
   return;
}

int RootFinding::newton_raphson(std::function<double(double)> obj_fun, std::function<double(double)> gradient,
                                double x0, double eps, int max_its)
{
   params.timer.start(Timer::timer::NEWTON);
   this->reset();
   int output = this->run_newton_raphson(obj_fun, gradient, x0, eps, max_its);
   params.timer.stop(Timer::timer::NEWTON);
   return output;
}

int RootFinding::newton_raphson(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0, double eps)
{
   return this->newton_raphson(obj_fun, gradient, x0, eps, params.max_its_newton);
}

int RootFinding::newton_raphson(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0)
{
   return this->newton_raphson(obj_fun, gradient, x0, params.eps, params.max_its_newton);
}

int RootFinding::bisection(std::function<double(double)> obj_fun, double x0, double x1, double eps, int max_its)
{
   params.timer.start(Timer::timer::BISECTION);
   this->reset();
   int output = this->run_bisection(obj_fun, x0, x1, eps, max_its);
   params.timer.stop(Timer::timer::BISECTION);
   return output;
}

int RootFinding::bisection(std::function<double(double)> obj_fun, double x0, double x1, double eps)
{
   return this->bisection(obj_fun, x0, x1, eps, params.max_its_bisection);
}

int RootFinding::bisection(std::function<double(double)> obj_fun, double x0, double x1)
{
   return this->bisection(obj_fun, x0, x1, params.eps, params.max_its_bisection);
}

int RootFinding::solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient,
                       double x0, double x1, double eps, int max_its_n, int max_its_b)
{
   params.timer.start(Timer::timer::SOLVE);
   this->reset();

   params.timer.start(Timer::timer::NEWTON);
   int output = this->run_newton_raphson(obj_fun, gradient, x0, eps, max_its_n);
   params.timer.stop(Timer::timer::NEWTON);

   // Only non-convergence of Newton-Raphson triggers the bisection fallback
   if (output == Output::CONVERGENCE_FAILURE)
   {
      if (params.verbose)
      {
         std::cout << "Newton-Raphson failed, falling back to bisection on [" << x0 << ", " << x1 << "]\n";
      }
      fallback = true;

      params.timer.start(Timer::timer::BISECTION);
      output = this->run_bisection(obj_fun, x0, x1, eps, max_its_b);
      params.timer.stop(Timer::timer::BISECTION);
   }

   params.timer.stop(Timer::timer::SOLVE);
   return output;
}

int RootFinding::solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient,
                       double x0, double x1, double eps, int max_its_n)
{
   return this->solve(obj_fun, gradient, x0, x1, eps, max_its_n, params.max_its_bisection);
}

int RootFinding::solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0, double x1, double eps)
{
   return this->solve(obj_fun, gradient, x0, x1, eps, params.max_its_newton, params.max_its_bisection);
}

int RootFinding::solve(std::function<double(double)> obj_fun, std::function<double(double)> gradient, double x0, double x1)
{
   return this->solve(obj_fun, gradient, x0, x1, params.eps, params.max_its_newton, params.max_its_bisection);
}

int RootFinding::run_newton_raphson(std::function<double(double)>& obj_fun, std::function<double(double)>& gradient,
                                    double x0, double eps, int max_its)
{
   int iteration = 0;
   double x_ = x0;
   message.clear();

   // Convergence is tested on the current estimate before every update, starting with x0 itself.
   // A NaN residual fails the test, so a NaN or inf iterate ends the loop and is returned.
   while (true)
   {
      f_last = obj_fun(x_);
      n_eval++;
      if (!(std::fabs(f_last) > eps))
      {
         break;
      }

      double fx = obj_fun(x_);
      double dfx = gradient(x_);
      n_eval++;
      n_grad++;
      x_ = x_ - (fx / dfx);
      x_last = x_;

      iteration++;
      iter = iteration;
      if (iteration > max_its)
      {
         message = "Newton-Raphson did not converge in max_its iterations.";
         if (params.verbose)
         {
            print("Newton-Raphson: maximum number of iterations exceeded, max_its", max_its);
            print("last x", x_last);
            print("last |f(x)|", std::fabs(f_last));
         }
         x = NAN;
         return Output::CONVERGENCE_FAILURE;
      }
   }

   x_last = x_;
   iter = iteration;
   x = x_;
   return Output::SUCCESS;
}

int RootFinding::run_bisection(std::function<double(double)>& obj_fun, double x0, double x1, double eps, int max_its)
{
   int iteration = 0;
   double x_mid = (x0 + x1) * 0.5;
   x_last = x_mid;
   message.clear();

   // The loop test uses the midpoint of the previous pass; the midpoint is recomputed inside the loop.
   while (true)
   {
      f_last = obj_fun(x_mid);
      n_eval++;
      if (!(std::fabs(f_last) > eps))
      {
         break;
      }

      x_mid = (x0 + x1) * 0.5;
      double f_xmid = obj_fun(x_mid);
      double f_x0 = obj_fun(x0);
      double f_x1 = obj_fun(x1);
      n_eval += 3;
      x_last = x_mid;
      f_last = f_xmid;

      // An endpoint with f exactly zero passes this check
      if (f_x0 > 0. && f_x1 > 0.)
      {
         message = "f(x) positive for both endpoints.";
      }
      else if (f_x0 < 0. && f_x1 < 0.)
      {
         message = "f(x) negative for both endpoints.";
      }
      if (!message.empty())
      {
         if (params.verbose)
         {
            std::cout << "Bisection: " << message << "\n";
            print("x0, x1, f(x0), f(x1)", {x0, x1, f_x0, f_x1});
         }
         iter = iteration;
         x = NAN;
         return Output::INVALID_BRACKET_SIGN;
      }

      // Ordered cases, first match wins. If none matches, the bracket is left unchanged.
      if (f_xmid < 0. && f_x0 < 0.)
      {
         x0 = x_mid;
      }
      else if (f_xmid > 0. && f_x0 > 0.)
      {
         x0 = x_mid;
      }
      else if (f_xmid > 0. && f_x1 > 0.)
      {
         x1 = x_mid;
      }
      else if (f_xmid < 0. && f_x1 < 0.)
      {
         x1 = x_mid;
      }

      iteration++;
      iter = iteration;
      if (iteration > max_its)
      {
         message = "Bisection did not converge in max_its iterations.";
         if (params.verbose)
         {
            print("Bisection: maximum number of iterations exceeded, max_its", max_its);
            print("last bracket", {x0, x1});
            print("last |f(x_mid)|", std::fabs(f_last));
         }
         x = NAN;
         return Output::CONVERGENCE_FAILURE;
      }
   }

   iter = iteration;
   x = x_mid;
   return Output::SUCCESS;
}

} // namespace nlsolvers
