#ifndef LOGGING_MANUAL_TIMER_H
#define LOGGING_MANUAL_TIMER_H

#include <logging/level.h>

#include <chrono>
#include <string>

namespace logging
{
class manual_timer final
{
public:
    explicit manual_timer(std::string name, log_level level = info);

    double elapsed_ms() const;
    double stop_and_print();
    void restart();

private:
    std::string name_;
    log_level level_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
};
}// namespace logging

#endif//LOGGING_MANUAL_TIMER_H
