#ifndef LOGGING_SCOPED_TIMER_H
#define LOGGING_SCOPED_TIMER_H

#include <logging/manual_timer.h>

#include <string>

namespace logging
{
// logs start and elapsed time of the enclosing scope
class scoped_timer final
{
public:
    explicit scoped_timer(std::string name, log_level level = info);
    scoped_timer(scoped_timer const&) = delete;
    scoped_timer(scoped_timer&&) = delete;
    scoped_timer& operator=(scoped_timer const&) = delete;
    scoped_timer& operator=(scoped_timer&&) = delete;
    ~scoped_timer();

private:
    manual_timer timer_;
};
}// namespace logging
#endif//LOGGING_SCOPED_TIMER_H
