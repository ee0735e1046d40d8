#include "exception_handler.h"

#include <logging/logger.h>

#include <cxxabi.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <typeinfo>

namespace
{
std::string demangle(const std::type_info& info)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> name{abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free};
    return status == 0 && name ? std::string(name.get()) : std::string(info.name());
}

void log_terminate()
{
    std::cerr << "terminate handler called\n";

    std::exception_ptr eptr = std::current_exception();
    if (!eptr)
    {
        LOG(logging::critical) << "terminate called without an active exception";
        std::abort();
    }

    try
    {
        std::rethrow_exception(eptr);
    }
    catch (std::exception& exc)
    {
        LOG(logging::critical) << "uncaught exception of type '" << demangle(typeid(exc)) << "': " << exc.what();
    }
    catch (...)
    {
        LOG(logging::critical) << "caught something undefined";
    }

    std::abort();// forces abnormal termination
}
}// namespace

namespace exceptions
{
exception_handler::exception_handler() :
    previous_{std::set_terminate(log_terminate)}
{
}

exception_handler::~exception_handler()
{
    std::set_terminate(previous_);
}

}// namespace exceptions
