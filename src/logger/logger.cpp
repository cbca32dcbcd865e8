#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>

namespace deepzoom::logging {

namespace {

namespace blog = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

auto make_format() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << blog::trivial::severity << "]"
        << " [Thread " << expr::attr<blog::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << expr::if_(expr::has_attr<std::string>("JobId"))
           [
               expr::stream << " [Job " << expr::attr<std::string>("JobId") << "]"
           ]
        << " " << expr::smessage;
}

} // namespace

void init_logging(const LogConfig& config) {
    auto core = blog::core::get();
    core->remove_all_sinks();
    blog::add_common_attributes();

    if (config.console) {
        blog::add_console_log(
            std::clog,
            keywords::format = make_format(),
            keywords::auto_flush = true
        );
    }

    if (!config.file_name.empty()) {
        blog::add_file_log(
            keywords::file_name = config.file_name,
            keywords::format = make_format(),
            keywords::rotation_size = config.rotation_size,
            keywords::open_mode = std::ios_base::app,
            keywords::auto_flush = true
        );
    }

    core->set_filter(blog::trivial::severity >= config.min_severity);
    BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized with severity " << config.min_severity;
}

boost::log::trivial::severity_level parse_severity(const std::string& text) {
    boost::log::trivial::severity_level level;
    if (!boost::log::trivial::from_string(text.data(), text.size(), level)) {
        throw std::invalid_argument("Unknown log severity: " + text);
    }
    return level;
}

JobLogger make_job_logger(const std::string& job_id) {
    JobLogger logger;
    logger.add_attribute("JobId", boost::log::attributes::constant<std::string>(job_id));
    return logger;
}

} // namespace deepzoom::logging
