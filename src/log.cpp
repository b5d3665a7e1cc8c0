/*

log.cpp
-------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include <string>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <gmcli/log.hpp>


using std::string;
using boost::iequals;
using boost::algorithm::to_upper_copy;


namespace gmcli
{


namespace
{

log_level_t current_level = LOG_ERROR;

} // anonymous namespace


log_level_t log_level()
{
    return current_level;
}


void log_level(log_level_t level)
{
    current_level = level;
}


std::optional<log_level_t> parse_log_level(const string& name)
{
    for (auto level : {LOG_NONE, LOG_ERROR, LOG_WARN, LOG_INFO, LOG_DEBUG, LOG_TRACE})
        if (iequals(name, log_level_name(level)))
            return level;
    return std::nullopt;
}


const char* log_level_name(log_level_t level)
{
    switch (level)
    {
        case LOG_NONE:
            return "none";
        case LOG_ERROR:
            return "error";
        case LOG_WARN:
            return "warn";
        case LOG_INFO:
            return "info";
        case LOG_DEBUG:
            return "debug";
        case LOG_TRACE:
            return "trace";
    }
    return "unknown";
}


void log_line(const char* component, log_level_t level, const string& message)
{
    std::cerr << "[" << component << "][" << to_upper_copy(string(log_level_name(level))) << "] " << message << std::endl;
}


} // namespace gmcli
