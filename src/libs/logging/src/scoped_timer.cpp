#include <logging/scoped_timer.h>

namespace logging
{
scoped_timer::scoped_timer(std::string name, log_level level) :
    timer_{std::move(name), level}
{
}

scoped_timer::~scoped_timer()
{
    timer_.stop_and_print();
}

}// namespace logging
