/*

smtp.cpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).
Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <stdexcept>
#include <tuple>
#include <boost/asio/ip/host_name.hpp>
#include <gmcli/codec.hpp>
#include <gmcli/log.hpp>
#include <gmcli/smtp.hpp>


using std::string;
using std::tuple;
using std::make_tuple;
using std::stoi;
using std::make_shared;
using std::shared_ptr;
using std::out_of_range;
using std::invalid_argument;
using std::chrono::milliseconds;
using boost::asio::ip::host_name;
using boost::system::system_error;


namespace gmcli
{


smtp::smtp(const string& hostname, unsigned port, milliseconds timeout) :
    dlg_(make_shared<dialog>(hostname, port, timeout)), ssl_options_(dialog_ssl::default_options())
{
    src_host_ = read_hostname();
    dlg_->session_name("smtp");
    dlg_->connect();
}


smtp::smtp(shared_ptr<dialog> dlg) : dlg_(dlg), src_host_("localhost")
{
}


smtp::~smtp()
{
    if (dlg_)
        dlg_->close();
}


string smtp::authenticate(const string& username, const string& password)
{
    if (ssl_options_.has_value())
        dlg_ = dialog_ssl::to_ssl(dlg_, *ssl_options_);

    string greeting = connect();
    ehlo();
    auth_login(username, password);
    return greeting;
}


string smtp::submit(const message& msg)
{
    // Formatting first, so an incomplete message fails before the transaction starts.
    string msg_str = msg.format(true);

    auto reply = command("MAIL FROM: " + message::ADDRESS_BEGIN_STR + msg.sender() + message::ADDRESS_END_STR);
    if (!positive_completion(std::get<0>(reply)))
        throw smtp_error("Mail sender rejection.", std::get<1>(reply));

    for (const auto& rcpt : msg.recipients())
    {
        reply = command("RCPT TO: " + message::ADDRESS_BEGIN_STR + rcpt + message::ADDRESS_END_STR);
        if (!positive_completion(std::get<0>(reply)))
            throw smtp_error("Mail recipient rejection.", std::get<1>(reply));
    }

    reply = command("DATA");
    if (!positive_intermediate(std::get<0>(reply)))
        throw smtp_error("Mail message rejection.", std::get<1>(reply));

    reply = command(msg_str + codec::END_OF_LINE + codec::END_OF_MESSAGE);
    if (!positive_completion(std::get<0>(reply)))
        throw smtp_error("Mail message rejection.", std::get<1>(reply));
    GMCLI_LOG_INFO("SMTP", "message accepted: " << std::get<1>(reply));
    return std::get<1>(reply);
}


void smtp::quit()
{
    auto reply = command("QUIT");
    dlg_->close();
    if (!positive_completion(std::get<0>(reply)))
        throw smtp_error("Quit rejection.", std::get<1>(reply));
}


void smtp::source_hostname(const string& src_host)
{
    src_host_ = src_host;
}


string smtp::source_hostname() const
{
    return src_host_;
}


void smtp::ssl_options(const std::optional<dialog_ssl::ssl_options_t> options)
{
    ssl_options_ = options;
}


string smtp::connect()
{
    string greeting;
    string line = dlg_->receive();
    tuple<int, bool, string> tokens = parse_line(line);
    while (!std::get<1>(tokens))
    {
        greeting += std::get<2>(tokens) + codec::END_OF_LINE;
        line = dlg_->receive();
        tokens = parse_line(line);
    }
    if (std::get<0>(tokens) != SERVICE_READY_STATUS)
        throw smtp_error("Connection rejection.", std::get<2>(tokens));
    greeting += std::get<2>(tokens);
    return greeting;
}


void smtp::ehlo()
{
    auto reply = command("EHLO " + src_host_);
    if (positive_completion(std::get<0>(reply)))
        return;

    reply = command("HELO " + src_host_);
    if (!positive_completion(std::get<0>(reply)))
        throw smtp_error("Initial message rejection.", std::get<1>(reply));
}


void smtp::auth_login(const string& username, const string& password)
{
    auto reply = command("AUTH LOGIN");
    if (!positive_intermediate(std::get<0>(reply)))
        throw smtp_error("Authentication rejection.", std::get<1>(reply));

    auto user_v = codec::base64_encode(username, 0);
    dlg_->mask_next_trace();
    reply = command(user_v.empty() ? "" : user_v[0]);
    if (!positive_intermediate(std::get<0>(reply)))
        throw smtp_error("Username rejection.", std::get<1>(reply));

    auto pass_v = codec::base64_encode(password, 0);
    dlg_->mask_next_trace();
    reply = command(pass_v.empty() ? "" : pass_v[0]);
    if (!positive_completion(std::get<0>(reply)))
        throw smtp_error("Password rejection.", std::get<1>(reply));
}


tuple<int, string> smtp::command(const string& line)
{
    dlg_->send(line);
    return receive_reply();
}


tuple<int, string> smtp::receive_reply()
{
    tuple<int, bool, string> tokens = parse_line(dlg_->receive());
    while (!std::get<1>(tokens))
        tokens = parse_line(dlg_->receive());
    return make_tuple(std::get<0>(tokens), std::get<2>(tokens));
}


string smtp::read_hostname()
{
    try
    {
        return host_name();
    }
    catch (const system_error& exc)
    {
        throw smtp_error("Reading hostname failure.", exc.code().message());
    }
}


tuple<int, bool, string> smtp::parse_line(const string& line)
{
    try
    {
        // A bare status code is the last line of the reply.
        bool last = line.size() == 3 || line.at(3) != '-';
        return make_tuple(stoi(line.substr(0, 3)), last, line.size() > 4 ? line.substr(4) : string());
    }
    catch (const out_of_range&)
    {
        throw smtp_error("Parsing server failure.", "Line=`" + line + "`.");
    }
    catch (const invalid_argument&)
    {
        throw smtp_error("Parsing server failure.", "Line=`" + line + "`.");
    }
}


bool smtp::positive_completion(int status)
{
    return status / 100 == smtp_status_t::POSITIVE_COMPLETION;
}


bool smtp::positive_intermediate(int status)
{
    return status / 100 == smtp_status_t::POSITIVE_INTERMEDIATE;
}


smtp_error::smtp_error(const string& msg, const string& details) : dialog_error(msg, details)
{
}


smtp_error::smtp_error(const char* msg, const string& details) : dialog_error(msg, details)
{
}


} // namespace gmcli
