//--------------------------------------------------------------------------
#ifndef NLSOLVERS_GLOBAL_TIMER_H
#define NLSOLVERS_GLOBAL_TIMER_H
//--------------------------------------------------------------------------

#include <vector>
#include <string>
#include <chrono>

namespace nlsolvers {

class Timer
{
public:
    enum timer : int { NEWTON = 0, BISECTION, SOLVE, TOTAL };

private:
    std::vector<std::string> timer_names = {"Newton-Raphson", "Bisection", "Solve"};
    std::vector<std::chrono::time_point<std::chrono::steady_clock>> t0, t1;
    std::vector<double> tot_time;
    std::vector<int> n_calls;
    std::vector<bool> running;

public:
    Timer();
    ~Timer() = default;

    void start(Timer::timer timer_key);
    void stop(Timer::timer timer_key);
    void reset();

    double elapsedMicroseconds(Timer::timer timer_key);
    double elapsedMilliseconds(Timer::timer timer_key) { return this->elapsedMicroseconds(timer_key) * 1e-3; }
    double elapsedSeconds(Timer::timer timer_key) { return this->elapsedMicroseconds(timer_key) * 1e-6; }
    int get_calls(Timer::timer timer_key) { return this->n_calls[timer_key]; }

    // Print timers
    void print_timers();
};

} // namespace nlsolvers

//--------------------------------------------------------------------------
#endif // NLSOLVERS_GLOBAL_TIMER_H
//--------------------------------------------------------------------------
