/*

smtp.hpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).
Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include "dialog.hpp"
#include "message.hpp"


namespace gmcli
{


/**
SMTP client over the implicit TLS.
**/
class smtp
{
public:

    /**
    Making a connection to the server.

    @param hostname Hostname of the server.
    @param port     Port of the server.
    @param timeout  Network timeout after which I/O operations fail. If zero, then no timeout is set i.e. I/O operations are synchronous.
    @throw *        `dialog::connect()`.
    **/
    smtp(const std::string& hostname, unsigned port, std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
    Using an already connected dialog, without switching to TLS.

    @param dlg Dialog to talk over.
    **/
    explicit smtp(std::shared_ptr<dialog> dlg);

    /**
    Closing the connection, without any protocol exchange.
    **/
    virtual ~smtp();

    smtp(const smtp&) = delete;

    smtp(smtp&&) = delete;

    void operator=(const smtp&) = delete;

    void operator=(smtp&&) = delete;

    /**
    Authenticating with the given credentials.

    @param username Username to authenticate.
    @param password Password to authenticate.
    @return         The server greeting message.
    @throw *        `dialog_ssl::to_ssl()`, `connect()`, `ehlo()`, `auth_login(const string&, const string&)`.
    **/
    std::string authenticate(const std::string& username, const std::string& password);

    /**
    Submitting a message in one mail transaction.

    @param msg        Mail message to send.
    @return           The last server message.
    @throw smtp_error Mail sender rejection.
    @throw smtp_error Mail recipient rejection.
    @throw smtp_error Mail message rejection.
    @throw *          `message::format(bool)`.
    **/
    std::string submit(const message& msg);

    /**
    Ending the session and closing the connection.

    @throw smtp_error Quit rejection.
    **/
    void quit();

    /**
    Setting the hostname announced by EHLO.
    **/
    void source_hostname(const std::string& src_host);

    /**
    Getting the hostname announced by EHLO.
    **/
    std::string source_hostname() const;

    /**
    Setting SSL options, none for the plain connection.
    **/
    void ssl_options(const std::optional<dialog_ssl::ssl_options_t> options);

    /**
    Parsing the reply line into the status, the last line flag and the text.

    @param line       Reply line.
    @return           Tuple of the status, flag if the line is the last one of the reply, and the text.
    @throw smtp_error Parsing server failure.
    **/
    static std::tuple<int, bool, std::string> parse_line(const std::string& line);

protected:

    /**
    SMTP response status.
    **/
    enum smtp_status_t {POSITIVE_COMPLETION = 2, POSITIVE_INTERMEDIATE = 3, TRANSIENT_NEGATIVE = 4, PERMANENT_NEGATIVE = 5};

    /**
    SMTP status codes.
    **/
    static const int SERVICE_READY_STATUS = 220;

    /**
    Reading the greeting of the server.

    @return           The server greeting message, the lines separated by CRLF.
    @throw smtp_error Connection rejection.
    **/
    std::string connect();

    /**
    Issuing EHLO, falling back to HELO.

    @throw smtp_error Initial message rejection.
    **/
    void ehlo();

    /**
    Authenticating with the LOGIN mechanism.

    @throw smtp_error Authentication rejection.
    @throw smtp_error Username rejection.
    @throw smtp_error Password rejection.
    **/
    void auth_login(const std::string& username, const std::string& password);

    /**
    Sending a command and reading the whole reply.

    @param line Command to send.
    @return     Status and the text of the last reply line.
    @throw *    `parse_line(const string&)`.
    **/
    std::tuple<int, std::string> command(const std::string& line);

    /**
    Reading all lines of a reply.

    @return Status and the text of the last reply line.
    @throw  `parse_line(const string&)`.
    **/
    std::tuple<int, std::string> receive_reply();

    /**
    Reading the local hostname.

    @throw smtp_error Reading hostname failure.
    **/
    static std::string read_hostname();

    static bool positive_completion(int status);

    static bool positive_intermediate(int status);

    /**
    Dialog to use for send/receive operations.
    **/
    std::shared_ptr<dialog> dlg_;

    /**
    SSL options to set.
    **/
    std::optional<dialog_ssl::ssl_options_t> ssl_options_;

    /**
    Name of the host which client is connecting from.
    **/
    std::string src_host_;
};


/**
Error thrown by SMTP client.
**/
class smtp_error : public dialog_error
{
public:

    /**
    Calling parent constructor.

    @param msg     Error message.
    @param details Detailed message.
    **/
    smtp_error(const std::string& msg, const std::string& details);

    /**
    Calling parent constructor.

    @param msg     Error message.
    @param details Detailed message.
    **/
    explicit smtp_error(const char* msg, const std::string& details);

    smtp_error(const smtp_error&) = default;

    smtp_error(smtp_error&&) = default;

    ~smtp_error() = default;

    smtp_error& operator=(const smtp_error&) = default;

    smtp_error& operator=(smtp_error&&) = default;
};


} // namespace gmcli
