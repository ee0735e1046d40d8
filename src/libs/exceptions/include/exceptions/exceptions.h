#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

/**
   create a message
   @param[in] Message : the exception message
   @param[in] file : file in which the exception occurred
   @param[in] line : line number at which the exception occurred
   @return: A string containing message, file name and line number
*/
std::string make_message(const std::string& Message, const std::string& file, int line);

/**
   create an exception
   @param[in] Message : the exception message
   @param[in] file : file in which the exception occurred
   @param[in] line : line number at which the exception occurred
   @return: An exception object of type T containing a message, with appended file name and line number
*/
template<typename T>
T make_exception(const std::string& Message, const std::string& file, int line)
{
    return T(make_message(Message, file, line));
}

/**
    Convenience macro for make_exception
*/
#define make_exception_macro(T, x) make_exception<T>(x, __FILE__, __LINE__)

/**
   Invalid parameter exception class
*/
class invalid_parameter_exception : public std::runtime_error
{
public:
    /**
       Constructor
       @param[in] message : the exception message
    */
    explicit invalid_parameter_exception(const std::string& message) :
        std::runtime_error(message) {}
};

/**
   Null pointer exception class
*/
class null_pointer_exception : public std::runtime_error
{
public:
    /**
       Constructor
       @param[in] message : the exception message
    */
    explicit null_pointer_exception(const std::string& message) :
        std::runtime_error(message) {}
};

/**
   Raised when an operation is invoked on an object that is not in a state allowing it
*/
class invalid_state_exception : public std::runtime_error
{
public:
    explicit invalid_state_exception(const std::string& message) :
        std::runtime_error(message) {}
};

/**
   Inconsistent or invalid settings
*/
class configuration_exception : public std::runtime_error
{
public:
    explicit configuration_exception(const std::string& message) :
        std::runtime_error(message) {}
};

/**
   Unreadable input or input in a format that is not supported
*/
class unsupported_format_exception : public std::runtime_error
{
public:
    explicit unsupported_format_exception(const std::string& message) :
        std::runtime_error(message) {}
};


#endif//EXCEPTIONS_H
