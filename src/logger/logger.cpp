#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace mediavault::logging {

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, global_logger_type) {
  global_logger_type logger;
  logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
  logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());
  return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    boost::log::add_common_attributes();

    if (!log_file.empty()) {
      // Clear any existing sinks
      boost::log::core::get()->remove_all_sinks();

      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);

      namespace expr = boost::log::expressions;
      sink->set_formatter(
          expr::stream
              << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
              << " [" << boost::log::trivial::severity << "] "
              << expr::smessage
      );

      boost::log::core::get()->add_sink(sink);
    }

    set_log_level(min_level);
    enable_logging();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

} // namespace mediavault::logging
