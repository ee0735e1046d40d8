#ifndef EXCEPTIONS_EXCEPTION_HANDLER_H
#define EXCEPTIONS_EXCEPTION_HANDLER_H

#include <exceptions/exception_handler_if.h>

#include <exception>

namespace exceptions
{
class exception_handler : public exception_handler_if
{
public:
    exception_handler();
    exception_handler(exception_handler const&) = delete;
    exception_handler& operator=(exception_handler const&) = delete;

    exception_handler(exception_handler&&) = delete;
    exception_handler& operator=(exception_handler&&) = delete;

    ~exception_handler() override;

private:
    std::terminate_handler previous_;
};
}// namespace exceptions


#endif//EXCEPTIONS_EXCEPTION_HANDLER_H
