#include <iostream>
#include <string>
#include <cmath>
#include <cstdlib>

#include "nlsolvers/global/global.hpp"
#include "nlsolvers/maths/root_finding.hpp"
#include "nlsolvers/maths/root_finding_params.hpp"

using namespace nlsolvers;

int main(int argc, char **argv)
{
	// ./build/examples/solve_sqrt2 [x0] [x1] [max_its_newton]
	// Solves x^2 - 2 = 0 with Newton-Raphson from x0, falling back to bisection on [x0, x1]
	double x0 = 1.;
	double x1 = 2.;
	RootFindingParams params;
	params.verbose = true;

	if (argc > 1)
	{
		x0 = std::atof(argv[1]);
	}
	if (argc > 2)
	{
		x1 = std::atof(argv[2]);
	}
	if (argc > 3)
	{
		params.max_its_newton = std::atoi(argv[3]);
	}

	auto f = [](double x) { return x*x - 2.; };
	auto df = [](double x) { return 2.*x; };

	RootFinding rootfinding(params);
	int output = rootfinding.solve(f, df, x0, x1);

	if (output == RootFinding::Output::SUCCESS)
	{
		print("root", rootfinding.getx());
		print("iterations", rootfinding.get_iterations());
		print("bisection fallback", rootfinding.used_fallback());
	}
	else
	{
		std::cout << "No root found, output " << output << ": " << rootfinding.get_message() << "\n";
	}
	rootfinding.get_params().timer.print_timers();

	return output;
}
