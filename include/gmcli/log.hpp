/*

log.hpp
-------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <sstream>
#include <string>


namespace gmcli
{


/**
Logging levels, ordered by verbosity.
**/
enum log_level_t {LOG_NONE = 0, LOG_ERROR = 1, LOG_WARN = 2, LOG_INFO = 3, LOG_DEBUG = 4, LOG_TRACE = 5};


/**
Current threshold; messages above it are discarded.
**/
log_level_t log_level();


/**
Setting the threshold.
**/
void log_level(log_level_t level);


/**
Parsing the level name (`none`, `error`, `warn`, `info`, `debug`, `trace`), case insensitive.

@return Level, or none if the name is unknown.
**/
std::optional<log_level_t> parse_log_level(const std::string& name);


/**
Printable name of the level.
**/
const char* log_level_name(log_level_t level);


/**
Writing `[component][LEVEL] message` to the standard error.
**/
void log_line(const char* component, log_level_t level, const std::string& message);


} // namespace gmcli


#define GMCLI_LOG(component, level, message) \
    do { \
        if ((level) <= ::gmcli::log_level()) { \
            std::ostringstream gmcli_log_stream_; \
            gmcli_log_stream_ << message; \
            ::gmcli::log_line(component, level, gmcli_log_stream_.str()); \
        } \
    } while (false)

#define GMCLI_LOG_ERROR(component, message) GMCLI_LOG(component, ::gmcli::LOG_ERROR, message)
#define GMCLI_LOG_WARN(component, message) GMCLI_LOG(component, ::gmcli::LOG_WARN, message)
#define GMCLI_LOG_INFO(component, message) GMCLI_LOG(component, ::gmcli::LOG_INFO, message)
#define GMCLI_LOG_DEBUG(component, message) GMCLI_LOG(component, ::gmcli::LOG_DEBUG, message)
#define GMCLI_LOG_TRACE(component, message) GMCLI_LOG(component, ::gmcli::LOG_TRACE, message)
