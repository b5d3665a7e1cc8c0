/*

cli.cpp
-------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/scope_exit.hpp>
#include <gmcli/cli.hpp>
#include <gmcli/log.hpp>


using std::endl;
using std::make_shared;
using std::shared_ptr;
using std::string;
using std::vector;
using boost::algorithm::is_any_of;
using boost::algorithm::split;
using boost::algorithm::trim_copy;


namespace gmcli
{


namespace
{

const string SEPARATOR_LINE(50, '-');


bool is_number(const string& text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
}

} // anonymous namespace


cli::cli(std::ostream& out, std::ostream& err, connector_factory_t factory) : out_(out), err_(err), factory_(factory)
{
}


int cli::run(const string& argv0, const vector<string>& args)
{
    options_t options;
    try
    {
        options = parse_options(args);
    }
    catch (const cli_error& exc)
    {
        err_ << exc.what() << endl << endl << usage();
        return USAGE_CODE;
    }

    if (options.command.empty() || options.command == "help")
    {
        out_ << usage();
        return SUCCESS_CODE;
    }

    config_t cfg;
    try
    {
        cfg = load_config(options.config_path.empty() ? default_config_path(argv0) : options.config_path);
    }
    catch (const config_error& exc)
    {
        err_ << "Configuration error: " << exc.what() << " " << exc.details() << endl;
        return FAILURE_CODE;
    }
    log_level(options.verbose ? LOG_TRACE : cfg.log_level);

    session sess(cfg.credentials, factory_(cfg), out_);
    BOOST_SCOPE_EXIT_ALL(&sess)
    {
        sess.close();
    };

    dispatch(options, sess);
    return sess.last_status() ? SUCCESS_CODE : FAILURE_CODE;
}


auto cli::parse_options(const vector<string>& args) -> options_t
{
    options_t options;
    vector<string>::size_type i = 0;
    for (; i < args.size() && args[i].compare(0, 2, "--") == 0; i++)
    {
        if (args[i] == "--config")
        {
            if (++i == args.size())
                throw cli_error("Option --config requires a path.");
            options.config_path = args[i];
        }
        else if (args[i] == "--verbose")
            options.verbose = true;
        else
            throw cli_error("Unknown option: " + args[i]);
    }
    if (i == args.size())
        return options;

    options.command = args[i++];
    for (; i < args.size(); i++)
    {
        if (args[i] == "--unread" && options.command == "list")
            options.unread = true;
        else if (args[i] == "--html" && options.command == "send")
            options.html = true;
        else
            options.args.push_back(args[i]);
    }

    const auto& cmd = options.command;
    const auto argc = options.args.size();
    if (cmd == "help" || cmd == "folders")
    {
        if (argc != 0)
            throw cli_error("Command " + cmd + " takes no arguments.");
    }
    else if (cmd == "list")
    {
        if (argc > 1)
            throw cli_error("Usage: list [count] [--unread]");
        if (argc == 1)
        {
            if (!is_number(options.args[0]))
                throw cli_error("Invalid count: " + options.args[0]);
            try
            {
                options.count = std::stoul(options.args[0]);
            }
            catch (const std::out_of_range&)
            {
                throw cli_error("Invalid count: " + options.args[0]);
            }
        }
    }
    else if (cmd == "search")
    {
        if (argc > 1)
            throw cli_error("Usage: search [query]");
    }
    else if (cmd == "send")
    {
        if (argc != 3)
            throw cli_error("Usage: send <to> <subject> <body> [--html]");
        if (split_recipients(options.args[0]).empty())
            throw cli_error("No recipient address given.");
    }
    else if (cmd == "show")
    {
        if (argc == 0)
            throw cli_error("Usage: show <id>...");
    }
    else if (cmd == "read")
    {
        if (argc != 1)
            throw cli_error("Usage: read <id>");
    }
    else
        throw cli_error("Unknown command: " + cmd);

    if ((cmd == "show" || cmd == "read") && !std::all_of(options.args.begin(), options.args.end(), is_number))
        throw cli_error("Message ids must be numbers.");
    return options;
}


vector<string> cli::split_recipients(const string& to)
{
    vector<string> parts;
    split(parts, to, is_any_of(","));
    vector<string> recipients;
    for (const auto& p : parts)
    {
        string address = trim_copy(p);
        if (!address.empty())
            recipients.push_back(address);
    }
    return recipients;
}


string cli::usage()
{
    std::ostringstream text;
    text << "Usage: gmcli [--config <path>] [--verbose] <command> [arguments]" << endl
        << endl
        << "Commands:" << endl
        << "  list [count] [--unread]            list the last messages of INBOX, 10 by default" << endl
        << "  search [query]                     show the INBOX messages with the query in the subject or the sender" << endl
        << "  send <to> <subject> <body> [--html] send a message, several recipients separated by commas" << endl
        << "  folders                            list all mailboxes" << endl
        << "  show <id>...                       show the INBOX messages with the given ids" << endl
        << "  read <id>                          mark the INBOX message as read" << endl
        << "  help                               print this text" << endl
        << endl
        << "The credentials are read from " << CONFIG_FILE_NAME << " next to the executable or in the current directory." << endl;
    return text.str();
}


auto cli::network_factory() -> connector_factory_t
{
    return [](const config_t& cfg) -> shared_ptr<connector>
    {
        return make_shared<network_connector>(cfg);
    };
}


void cli::dispatch(const options_t& options, session& sess)
{
    const auto& cmd = options.command;
    if (cmd == "list")
    {
        for (const auto& summary : sess.get_emails(session::INBOX, options.count, options.unread))
            print_summary(summary);
    }
    else if (cmd == "search")
    {
        for (const auto& detail : sess.search_emails(options.args.empty() ? string() : options.args[0]))
            print_detail(detail);
    }
    else if (cmd == "show")
    {
        auto details = sess.get_email_details(options.args);
        if (details.empty() && sess.last_status())
            out_ << "No emails found." << endl;
        for (const auto& detail : details)
            print_detail(detail);
    }
    else if (cmd == "send")
        sess.send_email(split_recipients(options.args[0]), options.args[1], options.args[2], options.html);
    else if (cmd == "folders")
        sess.list_mailboxes();
    else if (cmd == "read")
        sess.mark_as_read(options.args[0]);
}


void cli::print_summary(const message_summary_t& summary)
{
    out_ << "ID: " << summary.id << endl
        << "From: " << summary.sender << endl
        << "Subject: " << summary.subject << endl
        << "Date: " << summary.date << endl
        << SEPARATOR_LINE << endl;
}


void cli::print_detail(const message_detail_t& detail)
{
    out_ << "ID: " << detail.id << endl
        << "From: " << detail.sender << endl
        << "Subject: " << detail.subject << endl
        << "Date: " << detail.date << endl
        << "Body: " << detail.body << endl
        << SEPARATOR_LINE << endl;
}


cli_error::cli_error(const string& msg) : std::runtime_error(msg)
{
}


} // namespace gmcli
