#ifndef MEDIAVAULT_LOGGER_HPP
#define MEDIAVAULT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace mediavault::logging {

using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using global_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, global_logger_type)

// Initialize file logging; an empty log_file leaves the default console output
void init_logging(const std::string& log_file = "mediavault.log",
                  severity_level min_level = severity_level::info);

// Drop records below the given severity
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

} // namespace mediavault::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(mediavault::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(mediavault::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(mediavault::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(mediavault::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(mediavault::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(mediavault::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // MEDIAVAULT_LOGGER_HPP
