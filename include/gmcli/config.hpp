/*

config.hpp
----------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <istream>
#include <stdexcept>
#include <string>
#include "log.hpp"


namespace gmcli
{


/**
Account address with its application password.
**/
struct credentials_t
{
    std::string address;

    std::string secret;
};


/**
Server host and port.
**/
struct server_t
{
    std::string host;

    unsigned port;
};


/**
Settings read from the configuration file.
**/
struct config_t
{
    credentials_t credentials;

    server_t imap_server{"imap.gmail.com", 993};

    server_t smtp_server{"smtp.gmail.com", 465};

    /**
    Network timeout, zero for the blocking I/O.
    **/
    std::chrono::milliseconds timeout{0};

    log_level_t log_level = LOG_ERROR;
};


/**
Name of the configuration file looked up by default.
**/
extern const std::string CONFIG_FILE_NAME;


/**
Loading the configuration from the JSON file.

@param path         Path of the file.
@return             Loaded configuration.
@throw config_error File missing or not readable.
@throw *            `parse_config(std::istream&, const std::string&)`.
**/
config_t load_config(const std::string& path);


/**
Parsing the configuration from the JSON stream.

The keys `email` and `app_password` are required, the others get their defaults.

@param input        Stream to read.
@param source       Name of the source used in the error messages.
@return             Parsed configuration.
@throw config_error Malformed JSON, missing key or invalid value.
**/
config_t parse_config(std::istream& input, const std::string& source);


/**
Default location of the configuration file: next to the executable if it exists there, otherwise in the current directory.

@param argv0 Executable path as given to `main`.
**/
std::string default_config_path(const std::string& argv0);


/**
Error thrown by the configuration loading.
**/
class config_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg     Error message.
    @param details Detailed message.
    **/
    config_error(const std::string& msg, const std::string& details);

    config_error(const config_error&) = default;

    config_error(config_error&&) = default;

    ~config_error() = default;

    config_error& operator=(const config_error&) = default;

    config_error& operator=(config_error&&) = default;

    /**
    Getting the detailed message.
    **/
    std::string details() const;

protected:

    std::string details_;
};


} // namespace gmcli
