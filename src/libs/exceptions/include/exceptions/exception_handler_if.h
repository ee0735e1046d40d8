#ifndef EXCEPTIONS_EXCEPTION_HANDLER_IF_H
#define EXCEPTIONS_EXCEPTION_HANDLER_IF_H

namespace exceptions
{
// keeps the process wide terminate handler installed while alive
class exception_handler_if
{
public:
    virtual ~exception_handler_if() = default;
};
}// namespace exceptions

#endif//EXCEPTIONS_EXCEPTION_HANDLER_IF_H
