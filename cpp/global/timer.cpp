#include "nlsolvers/global/timer.hpp"
#include "nlsolvers/global/global.hpp"

namespace nlsolvers {

Timer::Timer()
{
    this->reset();
}

void Timer::reset()
{
    this->t0.resize(Timer::timer::TOTAL);
    this->t1.resize(Timer::timer::TOTAL);
    this->tot_time = std::vector<double>(Timer::timer::TOTAL, 0.);
    this->n_calls = std::vector<int>(Timer::timer::TOTAL, 0);
    this->running = std::vector<bool>(Timer::timer::TOTAL, false);
    return;
}

void Timer::start(Timer::timer timer_key)
{
    t0[timer_key] = std::chrono::steady_clock::now();
    running[timer_key] = true;
    return;
}

void Timer::stop(Timer::timer timer_key)
{
    // Stopping a timer that was not started has no effect
    if (!running[timer_key])
    {
        return;
    }
    t1[timer_key] = std::chrono::steady_clock::now();
    running[timer_key] = false;
    double dt = std::chrono::duration_cast<std::chrono::microseconds>(t1[timer_key] - t0[timer_key]).count();
    tot_time[timer_key] += dt;
    n_calls[timer_key]++;
    return;
}

double Timer::elapsedMicroseconds(Timer::timer timer_key)
{
    if (running[timer_key])
    {
        return tot_time[timer_key] + std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0[timer_key]).count();
    }
    else
    {
        return tot_time[timer_key];
    }
}

void Timer::print_timers()
{
    // Solve time includes its Newton-Raphson and bisection stages
    print("Total solve time", this->elapsedMicroseconds(Timer::timer::SOLVE));
    for (int i = 0; i < Timer::timer::TOTAL; i++)
    {
        Timer::timer timer_key = static_cast<Timer::timer>(i);
        std::cout << timer_names[i] << ": " << this->elapsedMicroseconds(timer_key) << " microseconds in "
                  << n_calls[i] << " calls\n";
    }
    return;
}

} // namespace nlsolvers
