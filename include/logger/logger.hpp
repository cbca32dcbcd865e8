#ifndef DEEPZOOM_LOGGER_HPP
#define DEEPZOOM_LOGGER_HPP

#include <cstddef>
#include <string>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

namespace deepzoom::logging {

struct LogConfig {
    boost::log::trivial::severity_level min_severity = boost::log::trivial::info;
    bool console = true;
    // No file sink when empty
    std::string file_name;
    std::size_t rotation_size = 10 * 1024 * 1024;  // 10 MB
};

// Replaces all sinks with the configured console and file sinks
void init_logging(const LogConfig& config);

// Parses trace, debug, info, warning, error or fatal; throws std::invalid_argument otherwise
boost::log::trivial::severity_level parse_severity(const std::string& text);

using JobLogger = boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>;

// Logger whose records carry a constant JobId attribute
JobLogger make_job_logger(const std::string& job_id);

// Convenience macro for logging through a job context
#define DEEPZOOM_JOB_LOG(context, level) BOOST_LOG_SEV((context).logger(), boost::log::trivial::level)

} // namespace deepzoom::logging

#endif // DEEPZOOM_LOGGER_HPP
