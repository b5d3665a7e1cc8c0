/*

dialog.hpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).
Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>


namespace gmcli
{


/**
Dealing with network in a line oriented fashion.
**/
class dialog : public std::enable_shared_from_this<dialog>
{
public:

    /**
    Making a connection to the server.

    @param hostname Server hostname.
    @param port     Server port.
    @param timeout  Network timeout after which I/O operations fail. If zero, then no timeout is set i.e. I/O operations are synchronous.
    **/
    dialog(const std::string& hostname, unsigned port, std::chrono::milliseconds timeout);

    /**
    Copy constructor.

    @param other Object to copy.
    **/
    dialog(const dialog& other);

    virtual ~dialog() = default;

    void operator=(const dialog&) = delete;

    void operator=(dialog&&) = delete;

    /**
    Resolving the hostname and connecting to the server.

    @throw dialog_error Server connecting failed.
    **/
    virtual void connect();

    /**
    Sending a line to network.

    @param line         Line to send, without the line terminator.
    @throw dialog_error Network sending error.
    **/
    virtual void send(const std::string& line);

    /**
    Receiving a line from network.

    @param raw          Flag if the receiving is raw (no CRLF is truncated) or not.
    @return             Line read from network.
    @throw dialog_error Network receiving error.
    **/
    virtual std::string receive(bool raw = false);

    /**
    Receiving exactly the given number of bytes, as needed for the IMAP literals.

    Bytes already buffered by the line reading are consumed first.

    @param total_bytes  Number of bytes to read.
    @return             Bytes read.
    @throw dialog_error Network receiving error.
    **/
    virtual std::string receive_bytes(std::size_t total_bytes);

    /**
    Closing the socket, ignoring the errors.
    **/
    virtual void close();

    /**
    Label prefixed to the protocol trace lines.
    **/
    void session_name(const std::string& name);

    /**
    Getting the label of the protocol trace.
    **/
    std::string session_name() const;

    /**
    Replacing the next sent line with a placeholder in the protocol trace, so that secrets are not logged.
    **/
    void mask_next_trace();

protected:

    /**
    Outcome of an asynchronous operation, filled by its completion handler.
    **/
    struct async_result_t
    {
        bool finished = false;

        boost::system::error_code error;
    };

    /**
    Tracing a protocol line at the trace log level.

    @param direction Either `SEND` or `RECV`.
    @param line      Protocol line.
    **/
    void trace(const char* direction, const std::string& line);

    /**
    Writing the line and its terminator to the stream.

    @param stream Plain or secure stream.
    @param line   Line without the terminator.
    @throw dialog_error Network sending error, or the timeout.
    **/
    template<typename Stream>
    void write_line(Stream& stream, const std::string& line);

    /**
    Reading from the stream up to the line feed.

    @param stream Plain or secure stream.
    @param raw    Flag if the line terminator is kept.
    @return       The line.
    @throw dialog_error Network receiving error, or the timeout.
    **/
    template<typename Stream>
    std::string read_line(Stream& stream, bool raw);

    /**
    Reading exactly the given number of bytes, taking the already buffered ones first.
    **/
    template<typename Stream>
    std::string read_exact(Stream& stream, std::size_t total_bytes);

    /**
    Running an asynchronous operation until it completes or the timer expires.

    On expiry the socket is closed, so the dialog cannot be used afterwards.

    @param start       Starts the operation, given the handler to call on completion.
    @param expired_msg Message when the timer expires.
    @param failed_msg  Message when the operation fails.
    @throw dialog_error The operation failed or timed out.
    **/
    template<typename Starter>
    void run_bounded(Starter start, const char* expired_msg, const char* failed_msg);

    /**
    Starting the timer for the next asynchronous operation.
    **/
    void arm_timer();

    /**
    Removing the line terminator if the receiving is not raw.
    **/
    static void trim_eol(std::string& line, bool raw);

    const std::string hostname_;

    const unsigned int port_;

    /**
    I/O context, shared with the dialogs copied from this one.
    **/
    std::shared_ptr<boost::asio::io_context> io_ctx_;

    std::shared_ptr<boost::asio::ip::tcp::socket> socket_;

    std::shared_ptr<boost::asio::steady_timer> timer_;

    /**
    Timeout of a single I/O operation, zero for the blocking calls.
    **/
    std::chrono::milliseconds timeout_;

    /**
    Expiry flag of the current operation, replaced on each arming so that a stale expiry is ignored.
    **/
    std::shared_ptr<bool> expired_;

    /**
    Bytes read past the last returned line.
    **/
    std::shared_ptr<boost::asio::streambuf> read_buf_;

    std::shared_ptr<std::istream> read_stream_;

    std::string session_name_;

    /**
    Flag if the next sent line is masked in the trace.
    **/
    bool mask_next_;
};


/**
Secure version of `dialog` class.
**/
class dialog_ssl : public dialog
{
public:

    /**
    SSL options to set.
    **/
    struct ssl_options_t
    {
        /**
        SSL method.
        **/
        boost::asio::ssl::context::method method;

        /**
        SSL verify mode.
        **/
        boost::asio::ssl::verify_mode verify_mode;
    };

    /**
    Switching an existing dialog to SSL, performing the handshake.

    The server certificate is verified against the default trust store and the hostname, if the verify mode requires it.

    @param other   Plain connection to use for the transport.
    @param options SSL options to set.
    @throw dialog_error Switching to SSL failed.
    **/
    dialog_ssl(const dialog& other, const ssl_options_t& options);

    dialog_ssl(const dialog_ssl&) = delete;

    void operator=(const dialog_ssl&) = delete;

    void operator=(dialog_ssl&&) = delete;

    void send(const std::string& line) override;

    std::string receive(bool raw = false) override;

    std::string receive_bytes(std::size_t total_bytes) override;

    /**
    Creating the secure dialog from an existing one.

    @param dlg     Connected plain dialog.
    @param options SSL options to set.
    @return        Secure dialog.
    @throw *       `dialog_ssl::dialog_ssl(const dialog&, const ssl_options_t&)`.
    **/
    static std::shared_ptr<dialog_ssl> to_ssl(const std::shared_ptr<dialog> dlg, const dialog_ssl::ssl_options_t& options);

    /**
    Default options: any TLS version negotiated by the client, with the peer verification.
    **/
    static ssl_options_t default_options();

protected:

    /**
    SSL context.
    **/
    std::shared_ptr<boost::asio::ssl::context> context_;

    /**
    SSL socket stream over the plain socket.
    **/
    std::shared_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket&>> ssl_socket_;
};


/**
Error thrown by the network dialog and the protocols built upon it.
**/
class dialog_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg     Error message.
    @param details Detailed message.
    **/
    dialog_error(const std::string& msg, const std::string& details);

    /**
    Calling parent constructor.

    @param msg     Error message.
    @param details Detailed message.
    **/
    dialog_error(const char* msg, const std::string& details);

    dialog_error(const dialog_error&) = default;

    dialog_error(dialog_error&&) = default;

    ~dialog_error() = default;

    dialog_error& operator=(const dialog_error&) = default;

    dialog_error& operator=(dialog_error&&) = default;

    /**
    Getting the detailed message.

    @return Detailed message, usually the server response or the system error.
    **/
    std::string details() const;

protected:

    /**
    Detailed message.
    **/
    std::string details_;
};


} // namespace gmcli
