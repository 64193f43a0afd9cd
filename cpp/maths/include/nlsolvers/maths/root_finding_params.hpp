//--------------------------------------------------------------------------
#ifndef NLSOLVERS_MATHS_ROOTFINDINGPARAMS_H
#define NLSOLVERS_MATHS_ROOTFINDINGPARAMS_H
//--------------------------------------------------------------------------

#include "nlsolvers/global/timer.hpp"

namespace nlsolvers {

struct RootFindingParams
{
	// Timers
	Timer timer;

	// Convergence is achieved when |f(x)| < eps
	double eps{ 1e-5 };

	// Maximum number of iterations before a solver is taken to have failed
	int max_its_newton{ 20 };
	int max_its_bisection{ 20 };

	bool verbose = false;

	RootFindingParams() = default;
	RootFindingParams(double eps_, int max_its_newton_, int max_its_bisection_, bool verbose_=false)
		: eps(eps_), max_its_newton(max_its_newton_), max_its_bisection(max_its_bisection_), verbose(verbose_) {}
};

} // namespace nlsolvers

//--------------------------------------------------------------------------
#endif // NLSOLVERS_MATHS_ROOTFINDINGPARAMS_H
//--------------------------------------------------------------------------
