#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

// Thin static facade over Boost.Log trivial logging.
class MyLogger
{
public:
    // Adds a file sink (when file_name is non-empty) and a console sink, and
    // filters out everything below level ("debug", "info", "warning", "error").
    static void init(const std::string &file_name, const std::string &level = "info");

    // Changes the severity filter without touching the sinks.
    static void setLevel(const std::string &level);

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP
