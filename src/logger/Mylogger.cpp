#include "Mylogger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace logging = boost::log;

namespace
{
    logging::trivial::severity_level parseLevel(const std::string &level)
    {
        if (level == "trace")
            return logging::trivial::trace;
        if (level == "debug")
            return logging::trivial::debug;
        if (level == "warning")
            return logging::trivial::warning;
        if (level == "error")
            return logging::trivial::error;
        return logging::trivial::info;
    }
}

void MyLogger::init(const std::string &file_name, const std::string &level)
{
    const std::string format = "[%TimeStamp%] [%Severity%]: %Message%";
    if (!file_name.empty())
    {
        logging::add_file_log(
            logging::keywords::file_name = file_name,
            logging::keywords::open_mode = std::ios_base::app,
            logging::keywords::auto_flush = true,
            logging::keywords::format = format);
    }
    logging::add_console_log(std::clog, logging::keywords::format = format);
    logging::add_common_attributes();
    setLevel(level);
}

void MyLogger::setLevel(const std::string &level)
{
    logging::core::get()->set_filter(logging::trivial::severity >= parseLevel(level));
}

void MyLogger::debug(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(debug) << msg;
}

void MyLogger::info(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(info) << msg;
}

void MyLogger::warning(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(warning) << msg;
}

void MyLogger::error(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(error) << msg;
}
