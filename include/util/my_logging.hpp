#pragma once

#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <fmt/format.h>
#include <iostream>
#include <memory>
#include <string>

#include "conf/hookrelay_config.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

using LoggerPtr = std::shared_ptr<
    boost::log::sources::severity_logger<boost::log::trivial::severity_level>>;

inline LoggerPtr make_logger_with_session(const std::string &session_id) {
  auto logger = std::make_shared<boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>>();
  logger->add_attribute(
      "SessionID", boost::log::attributes::constant<std::string>(session_id));
  return logger;
}

inline trivial::severity_level parse_severity(const std::string &level,
                                              trivial::severity_level fallback) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "info") {
    return trivial::info;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return fallback;
}

// File sink with rotation when log_dir is set, otherwise a stderr sink.
inline void init_my_log(const hookrelay::LoggingConfig &loggingConfig) {
  logging::core::get()->remove_all_sinks();
  logging::add_common_attributes();

  if (!loggingConfig.log_dir.empty()) {
    std::string logfile = fmt::format("{}/{}_%N.log", loggingConfig.log_dir,
                                      loggingConfig.log_file);
    auto sink = logging::add_file_log(
        logging::keywords::file_name = logfile,
        logging::keywords::rotation_size = loggingConfig.rotation_size,
        logging::keywords::format = "[%TimeStamp%] [%Severity%] [%SessionID%]: "
                                    "%Message%",
        logging::keywords::auto_flush = true,
        logging::keywords::open_mode = std::ios_base::app);
    sink->locked_backend()->set_file_collector(
        logging::sinks::file::make_collector(
            logging::keywords::target = loggingConfig.log_dir,
            logging::keywords::max_size = loggingConfig.rotation_size * 10,
            logging::keywords::max_files = 10));
    sink->locked_backend()->scan_for_files();
    logging::core::get()->set_filter(
        logging::trivial::severity >=
        parse_severity(loggingConfig.level, trivial::info));
    return;
  }

  logging::add_console_log(
      std::clog, logging::keywords::format = "[%Severity%] %Message%");
  logging::core::get()->set_filter(
      logging::trivial::severity >=
      parse_severity(loggingConfig.level, trivial::warning));
}
