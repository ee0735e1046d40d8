#include "logging/logger.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace logging
{

log::log(logging::log_level level, source_loc&& location) :
    level_{level},
    message_{},
    location_{location}
{
}

log::log(std::string name, logging::log_level level, source_loc&& location) :
    name_{std::move(name)},
    level_{level},
    message_{},
    location_{location}
{}


log::~log()
{
    auto* target = name_.empty() ? nullptr : spdlog::get(name_).get();
    if (target == nullptr)
        target = spdlog::default_logger_raw();

    std::string to;
    while (std::getline(message_, to, '\n'))
    {
        target->log(spdlog::source_loc{location_.filename_, location_.line_, location_.funcname_}, static_cast<spdlog::level::level_enum>(level_), to);
    }
}
void log::log_message(const std::stringstream& message)
{
    message_ << message.str();
}

log_level parse_level(const std::string& name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return trace;
    if (lower == "debug") return debug;
    if (lower == "info") return info;
    if (lower == "warn" || lower == "warning") return warn;
    if (lower == "error") return error;
    if (lower == "critical") return critical;
    if (lower == "off") return off;

    throw std::invalid_argument("unknown log level '" + name + "'");
}

const char* level_name(log_level level)
{
    switch (level)
    {
        case trace: return "trace";
        case debug: return "debug";
        case info: return "info";
        case warn: return "warn";
        case error: return "error";
        case critical: return "critical";
        case off: return "off";
        default: return "unknown";
    }
}

void configure_logging(const options& opts)
{
    // add console sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(opts.console_level));
    console_sink->set_pattern("%H:%M:%S %^%l%$ %s:%# %v");

    // add file sink
    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(opts.directory + "/logs_" + opts.file_name + ".txt", 0, 0, true);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%H:%M:%S %z] [%n] [%l] [thread %t] %s:%# %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    if (opts.use_syslog)
    {
        auto syslog_sink = std::make_shared<spdlog::sinks::syslog_sink_mt>(opts.file_name, 1, 1, true);
        syslog_sink->set_level(spdlog::level::warn);
        sinks.push_back(syslog_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
}

void add_logger(const std::string& name, const options& opts)
{
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(opts.console_level));
    console_sink->set_pattern("[%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(opts.directory + "/logs_" + name + ".txt", 0, 0, true);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%H:%M:%S %z] [%n] [%l] [thread %t] %s:%# %v");

    auto logger = spdlog::get(name);
    if (!logger)
    {
        logger = std::make_shared<spdlog::logger>(name);
        logger->set_level(spdlog::level::trace);
        spdlog::register_logger(logger);
    }

    auto& sinks = logger->sinks();
    sinks.push_back(console_sink);
    sinks.push_back(file_sink);
}

}// namespace logging
