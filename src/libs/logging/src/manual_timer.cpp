#include <logging/logger.h>
#include <logging/manual_timer.h>

namespace logging
{
manual_timer::manual_timer(std::string name, log_level level) :
    name_{std::move(name)},
    level_{level},
    start_{std::chrono::steady_clock::now()}
{
    LOG(level_) << "[" << name_ << "] starting";
}

double manual_timer::elapsed_ms() const
{
    using namespace std::chrono;
    return duration_cast<microseconds>(steady_clock::now() - start_).count() / 1000.0;
}

double manual_timer::stop_and_print()
{
    double t = elapsed_ms();
    LOG(level_) << "[" << name_ << "] finished"
                << " (" << t << "ms)";
    return t;
}

void manual_timer::restart()
{
    start_ = std::chrono::steady_clock::now();
}
}// namespace logging
