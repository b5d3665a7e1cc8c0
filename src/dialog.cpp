/*

dialog.cpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).
Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <string>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <openssl/ssl.h>
#include <gmcli/dialog.hpp>
#include <gmcli/log.hpp>


using std::string;
using std::to_string;
using std::istream;
using std::make_shared;
using std::shared_ptr;
using std::size_t;
using std::chrono::milliseconds;
using boost::asio::ip::tcp;
using boost::asio::buffer;
using boost::asio::mutable_buffer;
using boost::asio::streambuf;
using boost::asio::io_context;
using boost::asio::steady_timer;
using boost::asio::ssl::context;
using boost::asio::ssl::stream_base;
using boost::system::error_code;
using boost::algorithm::trim_right_if;
using boost::algorithm::is_any_of;


namespace gmcli
{


namespace
{

const char LINE_TERMINATOR[] = "\r\n";

const char LINE_FEED = '\n';

} // anonymous namespace


dialog::dialog(const string& hostname, unsigned port, milliseconds timeout) : std::enable_shared_from_this<dialog>(),
    hostname_(hostname), port_(port), io_ctx_(make_shared<io_context>()), socket_(make_shared<tcp::socket>(*io_ctx_)),
    timer_(make_shared<steady_timer>(*io_ctx_)), timeout_(timeout), expired_(make_shared<bool>(false)),
    read_buf_(make_shared<streambuf>()), read_stream_(make_shared<istream>(read_buf_.get())), mask_next_(false)
{
}


dialog::dialog(const dialog& other) : std::enable_shared_from_this<dialog>(),
    hostname_(other.hostname_), port_(other.port_), io_ctx_(other.io_ctx_), socket_(other.socket_), timer_(other.timer_),
    timeout_(other.timeout_), expired_(make_shared<bool>(false)), read_buf_(other.read_buf_), read_stream_(other.read_stream_),
    session_name_(other.session_name_), mask_next_(false)
{
}


void dialog::connect()
{
    GMCLI_LOG_DEBUG("DIALOG", "[" << session_name_ << "] connecting to " << hostname_ << ":" << port_);

    error_code ec;
    tcp::resolver resolver(*io_ctx_);
    auto endpoints = resolver.resolve(hostname_, to_string(port_), ec);
    if (ec)
        throw dialog_error("Server connecting failed.", ec.message());

    if (timeout_.count() == 0)
    {
        boost::asio::connect(*socket_, endpoints, ec);
        if (ec)
            throw dialog_error("Server connecting failed.", ec.message());
        return;
    }

    run_bounded([this, endpoints](auto on_done)
        {
            boost::asio::async_connect(*socket_, endpoints, [on_done](const error_code& error, const tcp::endpoint&) { on_done(error); });
        },
        "Server connecting timed out.", "Server connecting failed.");
}


void dialog::send(const string& line)
{
    trace("SEND", line);
    write_line(*socket_, line);
}


string dialog::receive(bool raw)
{
    string line = read_line(*socket_, raw);
    trace("RECV", line);
    return line;
}


string dialog::receive_bytes(size_t total_bytes)
{
    string bytes = read_exact(*socket_, total_bytes);
    trace("RECV", "<" + to_string(bytes.size()) + " bytes>");
    return bytes;
}


void dialog::close()
{
    error_code ignored;
    timer_->cancel();
    if (socket_->is_open())
    {
        socket_->shutdown(tcp::socket::shutdown_both, ignored);
        socket_->close(ignored);
    }
}


void dialog::session_name(const string& name)
{
    session_name_ = name;
}


string dialog::session_name() const
{
    return session_name_;
}


void dialog::mask_next_trace()
{
    mask_next_ = true;
}


void dialog::trace(const char* direction, const string& line)
{
    bool masked = mask_next_ && string(direction) == "SEND";
    if (masked)
        mask_next_ = false;
    GMCLI_LOG_TRACE("DIALOG", "[" << session_name_ << "] " << direction << ": " << (masked ? string("<masked>") : line));
}


template<typename Stream>
void dialog::write_line(Stream& stream, const string& line)
{
    auto data = make_shared<string>(line + LINE_TERMINATOR);
    if (timeout_.count() == 0)
    {
        error_code ec;
        boost::asio::write(stream, buffer(*data), ec);
        if (ec)
            throw dialog_error("Network sending error.", ec.message());
        return;
    }

    run_bounded([&stream, data](auto on_done)
        {
            boost::asio::async_write(stream, buffer(*data), [data, on_done](const error_code& error, size_t) { on_done(error); });
        },
        "Network sending timed out.", "Network sending failed.");
}


template<typename Stream>
string dialog::read_line(Stream& stream, bool raw)
{
    if (timeout_.count() == 0)
    {
        error_code ec;
        boost::asio::read_until(stream, *read_buf_, LINE_FEED, ec);
        if (ec)
            throw dialog_error("Network receiving error.", ec.message());
    }
    else
    {
        auto buf = read_buf_;
        run_bounded([&stream, buf](auto on_done)
            {
                boost::asio::async_read_until(stream, *buf, LINE_FEED, [buf, on_done](const error_code& error, size_t) { on_done(error); });
            },
            "Network receiving timed out.", "Network receiving failed.");
    }

    string line;
    std::getline(*read_stream_, line, LINE_FEED);
    trim_eol(line, raw);
    return line;
}


template<typename Stream>
string dialog::read_exact(Stream& stream, size_t total_bytes)
{
    auto bytes = make_shared<string>(total_bytes, '\0');
    size_t buffered = std::min(total_bytes, read_buf_->size());
    if (buffered > 0)
        read_stream_->read(&(*bytes)[0], static_cast<std::streamsize>(buffered));
    if (buffered == total_bytes)
        return *bytes;

    mutable_buffer rest = buffer(&(*bytes)[buffered], total_bytes - buffered);
    if (timeout_.count() == 0)
    {
        error_code ec;
        boost::asio::read(stream, rest, ec);
        if (ec)
            throw dialog_error("Network receiving error.", ec.message());
    }
    else
    {
        run_bounded([&stream, bytes, rest](auto on_done)
            {
                boost::asio::async_read(stream, rest, [bytes, on_done](const error_code& error, size_t) { on_done(error); });
            },
            "Network receiving timed out.", "Network receiving failed.");
    }
    return *bytes;
}


template<typename Starter>
void dialog::run_bounded(Starter start, const char* expired_msg, const char* failed_msg)
{
    auto result = make_shared<async_result_t>();
    arm_timer();
    start([result](const error_code& error)
    {
        result->finished = true;
        result->error = error;
    });

    if (io_ctx_->stopped())
        io_ctx_->restart();
    shared_ptr<bool> expired = expired_;
    while (!result->finished && !*expired)
        io_ctx_->run_one();

    error_code ignored;
    timer_->cancel();
    if (!result->finished)
    {
        socket_->close(ignored);
        throw dialog_error(expired_msg, "No response within " + to_string(timeout_.count()) + " ms.");
    }
    if (result->error)
        throw dialog_error(failed_msg, result->error.message());
}


void dialog::arm_timer()
{
    expired_ = make_shared<bool>(false);
    shared_ptr<bool> expired = expired_;
    timer_->expires_after(timeout_);
    timer_->async_wait([expired](const error_code& error)
    {
        if (!error)
            *expired = true;
    });
}


void dialog::trim_eol(string& line, bool raw)
{
    if (!raw)
        trim_right_if(line, is_any_of(LINE_TERMINATOR));
}


dialog_ssl::dialog_ssl(const dialog& other, const ssl_options_t& options) : dialog(other), context_(make_shared<context>(options.method)),
    ssl_socket_(make_shared<boost::asio::ssl::stream<tcp::socket&>>(*socket_, *context_))
{
    error_code ec;
    ssl_socket_->set_verify_mode(options.verify_mode, ec);
    if (!ec && (options.verify_mode & boost::asio::ssl::verify_peer))
    {
        context_->set_default_verify_paths(ec);
        if (!ec)
            ssl_socket_->set_verify_callback(boost::asio::ssl::host_name_verification(hostname_), ec);
    }
    if (ec)
        throw dialog_error("Switching to SSL failed.", ec.message());
    // Gmail picks the certificate by the server name indication.
    if (!SSL_set_tlsext_host_name(ssl_socket_->native_handle(), hostname_.c_str()))
        throw dialog_error("Switching to SSL failed.", "Setting the server name indication failed.");

    if (timeout_.count() == 0)
    {
        ssl_socket_->handshake(stream_base::client, ec);
        if (ec)
            throw dialog_error("Switching to SSL failed.", ec.message());
        return;
    }

    auto ssl = ssl_socket_;
    run_bounded([ssl](auto on_done)
        {
            ssl->async_handshake(stream_base::client, [ssl, on_done](const error_code& error) { on_done(error); });
        },
        "Switching to SSL timed out.", "Switching to SSL failed.");
}


void dialog_ssl::send(const string& line)
{
    trace("SEND", line);
    write_line(*ssl_socket_, line);
}


string dialog_ssl::receive(bool raw)
{
    string line = read_line(*ssl_socket_, raw);
    trace("RECV", line);
    return line;
}


string dialog_ssl::receive_bytes(size_t total_bytes)
{
    string bytes = read_exact(*ssl_socket_, total_bytes);
    trace("RECV", "<" + to_string(bytes.size()) + " bytes>");
    return bytes;
}


shared_ptr<dialog_ssl> dialog_ssl::to_ssl(const shared_ptr<dialog> dlg, const dialog_ssl::ssl_options_t& options)
{
    return make_shared<dialog_ssl>(*dlg, options);
}


auto dialog_ssl::default_options() -> ssl_options_t
{
    return ssl_options_t{context::tls_client, boost::asio::ssl::verify_peer};
}


dialog_error::dialog_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


dialog_error::dialog_error(const char* msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string dialog_error::details() const
{
    return details_;
}


} // namespace gmcli
