/*

session.cpp
-----------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <list>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string/trim.hpp>
#include <gmcli/codec.hpp>
#include <gmcli/log.hpp>
#include <gmcli/message.hpp>
#include <gmcli/session.hpp>


using std::endl;
using std::exception;
using std::invalid_argument;
using std::list;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::vector;
using boost::algorithm::trim_copy;


namespace gmcli
{


status_t status_t::success()
{
    return status_t{};
}


status_t status_t::failure(const string& msg)
{
    status_t st;
    st.ok = false;
    st.message = msg;
    return st;
}


const string session::INBOX{"INBOX"};


session::session(const credentials_t& credentials, shared_ptr<connector> conn, std::ostream& out) :
    credentials_(credentials), connector_(conn), out_(out)
{
}


session::~session()
{
    close();
}


status_t session::connect_imap()
{
    try
    {
        store_ = connector_->open_store(credentials_);
        selected_mailbox_.clear();
        last_status_ = status_t::success();
    }
    catch (const exception& exc)
    {
        store_.reset();
        string text = error_text(exc);
        out_ << "IMAP connection failed: " << text << endl;
        GMCLI_LOG_ERROR("SESSION", "IMAP connection failed: " << text);
        last_status_ = status_t::failure("IMAP connection failed: " + text);
    }
    return last_status_;
}


status_t session::connect_smtp()
{
    try
    {
        transport_ = connector_->open_transport(credentials_);
        last_status_ = status_t::success();
    }
    catch (const exception& exc)
    {
        transport_.reset();
        string text = error_text(exc);
        out_ << "SMTP connection failed: " << text << endl;
        GMCLI_LOG_ERROR("SESSION", "SMTP connection failed: " << text);
        last_status_ = status_t::failure("SMTP connection failed: " + text);
    }
    return last_status_;
}


vector<string> session::list_mailboxes()
{
    if (!ensure_store())
        return {};

    try
    {
        vector<string> names;
        for (const auto& folder : store_->list_folders())
        {
            out_ << folder.name << endl;
            names.push_back(folder.name);
        }
        last_status_ = status_t::success();
        return names;
    }
    catch (const exception& exc)
    {
        fail("Error listing mailboxes", exc);
        return {};
    }
}


vector<message_summary_t> session::get_emails(const string& mailbox, std::size_t limit, bool unread_only)
{
    if (!ensure_store())
        return {};

    try
    {
        select(mailbox);
        list<imap::search_condition_t> conditions;
        conditions.push_back(imap::search_condition_t(unread_only ? imap::search_condition_t::UNSEEN : imap::search_condition_t::ALL));
        list<unsigned long> found = store_->search(conditions);

        // The last sequence numbers, which are not necessarily the latest by date.
        vector<unsigned long> message_nos(found.begin(), found.end());
        if (limit > 0 && message_nos.size() > limit)
            message_nos.erase(message_nos.begin(), message_nos.end() - static_cast<vector<unsigned long>::difference_type>(limit));
        out_ << "Found " << found.size() << " emails" << (unread_only ? " (unread)" : "") << "." << endl;
        GMCLI_LOG_DEBUG("SESSION", "fetching " << message_nos.size() << " of " << found.size() << " messages");

        auto summaries = fetch_summaries(message_nos);
        last_status_ = status_t::success();
        return summaries;
    }
    catch (const exception& exc)
    {
        fail("Error fetching emails", exc);
        return {};
    }
}


bool session::send_email(const vector<string>& to, const string& subject, const string& body, bool html)
{
    vector<string> recipients;
    for (const auto& address : to)
    {
        string trimmed = trim_copy(address);
        if (!trimmed.empty())
            recipients.push_back(trimmed);
    }
    if (recipients.empty())
    {
        fail("Error sending email", invalid_argument("No recipient address."));
        return false;
    }

    if (!ensure_transport())
        return false;

    try
    {
        message msg;
        msg.from(credentials_.address);
        for (const auto& rcpt : recipients)
            msg.add_recipient(rcpt);
        msg.subject(subject);
        msg.content(body, html);
        transport_->submit(msg);
        out_ << "Email sent to: " << msg.header("To").value_or("") << endl;
        GMCLI_LOG_INFO("SESSION", "message sent to " << recipients.size() << " recipient(s)");
        last_status_ = status_t::success();
        return true;
    }
    catch (const exception& exc)
    {
        fail("Error sending email", exc);
        return false;
    }
}


vector<message_detail_t> session::search_emails(const string& query, const string& mailbox)
{
    if (!ensure_store())
        return {};

    try
    {
        select(mailbox);
        list<imap::search_condition_t> conditions;
        conditions.push_back(imap::search_condition_t::either(imap::search_condition_t(imap::search_condition_t::SUBJECT, query),
            imap::search_condition_t(imap::search_condition_t::FROM, query)));
        list<unsigned long> found = store_->search(conditions);
        out_ << "Found " << found.size() << " emails matching '" << query << "'." << endl;

        auto details = fetch_details(vector<unsigned long>(found.begin(), found.end()));
        last_status_ = status_t::success();
        return details;
    }
    catch (const exception& exc)
    {
        fail("Error searching emails", exc);
        return {};
    }
}


vector<message_detail_t> session::get_email_details(const vector<string>& ids)
{
    if (!ensure_store())
        return {};

    try
    {
        vector<unsigned long> message_nos;
        for (const auto& id : ids)
            message_nos.push_back(parse_id(id));
        if (selected_mailbox_.empty())
            select(INBOX);

        auto details = fetch_details(message_nos);
        last_status_ = status_t::success();
        return details;
    }
    catch (const exception& exc)
    {
        fail("Error fetching email details", exc);
        return {};
    }
}


bool session::mark_as_read(const string& id)
{
    if (!ensure_store())
        return false;

    try
    {
        unsigned long message_no = parse_id(id);
        if (selected_mailbox_.empty())
            select(INBOX);
        store_->add_flags(message_no, {"\\Seen"});
        out_ << "Marked message " << message_no << " as read." << endl;
        last_status_ = status_t::success();
        return true;
    }
    catch (const exception& exc)
    {
        fail("Error marking email as read", exc);
        return false;
    }
}


void session::close() noexcept
{
    if (store_)
    {
        try
        {
            if (!selected_mailbox_.empty())
                store_->close_mailbox();
            store_->logout();
        }
        catch (const exception& exc)
        {
            GMCLI_LOG_WARN("SESSION", "IMAP logout failed: " << error_text(exc));
        }
        store_.reset();
        selected_mailbox_.clear();
    }

    if (transport_)
    {
        try
        {
            transport_->quit();
        }
        catch (const exception& exc)
        {
            GMCLI_LOG_WARN("SESSION", "SMTP quit failed: " << error_text(exc));
        }
        transport_.reset();
    }
}


const status_t& session::last_status() const
{
    return last_status_;
}


bool session::imap_connected() const
{
    return store_ != nullptr;
}


bool session::smtp_connected() const
{
    return transport_ != nullptr;
}


bool session::ensure_store()
{
    if (store_)
        return true;
    return static_cast<bool>(connect_imap());
}


bool session::ensure_transport()
{
    if (transport_)
        return true;
    return static_cast<bool>(connect_smtp());
}


void session::select(const string& mailbox)
{
    unsigned long messages_no = store_->select(mailbox);
    selected_mailbox_ = mailbox;
    GMCLI_LOG_DEBUG("SESSION", "selected " << mailbox << " with " << messages_no << " messages");
}


string session::fetch_raw(unsigned long message_no)
{
    string raw = store_->fetch(message_no);
    if (raw.empty())
        GMCLI_LOG_WARN("SESSION", "message " << message_no << " has no content, skipped");
    return raw;
}


message_summary_t session::summarize(unsigned long message_no, const message& msg)
{
    message_summary_t summary;
    summary.id = to_string(message_no);
    summary.subject = decode_header_value(msg.subject());
    summary.sender = decode_header_value(msg.from());
    summary.date = msg.date().value_or("");
    return summary;
}


vector<message_summary_t> session::fetch_summaries(const vector<unsigned long>& message_nos)
{
    vector<message_summary_t> summaries;
    for (auto message_no : message_nos)
    {
        string raw = fetch_raw(message_no);
        if (raw.empty())
            continue;
        message msg;
        msg.parse_headers(raw);
        summaries.push_back(summarize(message_no, msg));
    }
    return summaries;
}


vector<message_detail_t> session::fetch_details(const vector<unsigned long>& message_nos)
{
    vector<message_detail_t> details;
    for (auto message_no : message_nos)
    {
        string raw = fetch_raw(message_no);
        if (raw.empty())
            continue;
        message msg;
        msg.parse(raw);
        message_detail_t detail;
        static_cast<message_summary_t&>(detail) = summarize(message_no, msg);
        detail.body = msg.body_preview(message::PREVIEW_LENGTH);
        details.push_back(detail);
    }
    return details;
}


void session::fail(const string& context, const exception& exc)
{
    string text = error_text(exc);
    out_ << context << ": " << text << endl;
    GMCLI_LOG_ERROR("SESSION", context << ": " << text);
    last_status_ = status_t::failure(context + ": " + text);
}


string session::error_text(const exception& exc)
{
    string details;
    if (auto dlg_exc = dynamic_cast<const dialog_error*>(&exc))
        details = dlg_exc->details();
    else if (auto mime_exc = dynamic_cast<const mime_error*>(&exc))
        details = mime_exc->details();
    return details.empty() ? string(exc.what()) : string(exc.what()) + " " + details;
}


unsigned long session::parse_id(const string& id)
{
    string trimmed = trim_copy(id);
    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }))
        throw invalid_argument("Invalid message id `" + id + "`.");
    unsigned long message_no = std::stoul(trimmed);
    if (message_no == 0)
        throw invalid_argument("Invalid message id `" + id + "`.");
    return message_no;
}


} // namespace gmcli
