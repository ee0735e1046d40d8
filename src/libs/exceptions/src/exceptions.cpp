#include <exceptions/exceptions.h>

#include <fmt/format.h>

std::string make_message(const std::string& message, const std::string& file, int line)
{
    return fmt::format("{} @{}:{}", message, file, line);
}
