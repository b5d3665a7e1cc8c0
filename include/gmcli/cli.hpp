/*

cli.hpp
-------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "connection.hpp"
#include "session.hpp"


namespace gmcli
{


/**
Command line front end: parses the arguments, loads the configuration and runs one command on a session.
**/
class cli
{
public:

    /**
    Process exit codes.
    **/
    enum exit_code_t {SUCCESS_CODE = 0, FAILURE_CODE = 1, USAGE_CODE = 2};

    /**
    Creating the connector for the loaded configuration.
    **/
    using connector_factory_t = std::function<std::shared_ptr<connector>(const config_t&)>;

    /**
    Parsed command line.
    **/
    struct options_t
    {
        /**
        Configuration path given by `--config`, empty for the default lookup.
        **/
        std::string config_path;

        bool verbose = false;

        /**
        Command name, empty if none is given.
        **/
        std::string command;

        /**
        Positional arguments of the command.
        **/
        std::vector<std::string> args;

        /**
        Number of listed messages.
        **/
        std::size_t count = 10;

        bool unread = false;

        bool html = false;
    };

    /**
    Creating the front end.

    @param out     Stream for the results.
    @param err     Stream for the usage and configuration errors.
    @param factory Connector factory, the network one by default.
    **/
    cli(std::ostream& out, std::ostream& err, connector_factory_t factory = network_factory());

    /**
    Running the command line.

    @param argv0 Executable path, for the default configuration lookup.
    @param args  Arguments after the executable.
    @return      Exit code.
    **/
    int run(const std::string& argv0, const std::vector<std::string>& args);

    /**
    Parsing the arguments.

    @param args      Arguments after the executable.
    @return          Parsed options.
    @throw cli_error Unknown option, unknown command or wrong arguments.
    **/
    static options_t parse_options(const std::vector<std::string>& args);

    /**
    Splitting the comma separated recipients, dropping the empty ones.
    **/
    static std::vector<std::string> split_recipients(const std::string& to);

    /**
    Usage text.
    **/
    static std::string usage();

    /**
    Factory of the network connector.
    **/
    static connector_factory_t network_factory();

private:

    /**
    Running the parsed command on the session.
    **/
    void dispatch(const options_t& options, session& sess);

    void print_summary(const message_summary_t& summary);

    void print_detail(const message_detail_t& detail);

    std::ostream& out_;

    std::ostream& err_;

    connector_factory_t factory_;
};


/**
Error of the command line usage.
**/
class cli_error : public std::runtime_error
{
public:

    explicit cli_error(const std::string& msg);
};


} // namespace gmcli
