/*

session.hpp
-----------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "connection.hpp"


namespace gmcli
{


/**
Outcome of a session operation.
**/
struct status_t
{
    /**
    Flag if the operation succeeded.
    **/
    bool ok = true;

    /**
    Failure description, empty on success.
    **/
    std::string message;

    static status_t success();

    static status_t failure(const std::string& msg);

    explicit operator bool() const
    {
        return ok;
    }
};


/**
Summary of a listed message.
**/
struct message_summary_t
{
    /**
    Message sequence number as text.
    **/
    std::string id;

    std::string subject;

    std::string sender;

    /**
    Raw `Date` header.
    **/
    std::string date;
};


/**
Summary with the body preview.
**/
struct message_detail_t : public message_summary_t
{
    std::string body;
};


/**
Mail session manager: one IMAP and one SMTP connection for the single account, opened on demand.

No operation throws; failures are printed and turned into the benign results, with the outcome kept in `last_status()`.
**/
class session
{
public:

    /**
    Mailbox used by default.
    **/
    static const std::string INBOX;

    /**
    Creating the session without connecting.

    @param credentials Account to log in with.
    @param conn        Connector opening the store and the transport.
    @param out         Stream for the printed diagnostics and listings.
    **/
    session(const credentials_t& credentials, std::shared_ptr<connector> conn, std::ostream& out);

    /**
    Closing both connections.
    **/
    ~session();

    session(const session&) = delete;

    session(session&&) = delete;

    void operator=(const session&) = delete;

    void operator=(session&&) = delete;

    /**
    Connecting and logging in to the IMAP server.

    On failure the diagnostic `IMAP connection failed: ...` is printed and the session stays without the IMAP connection.
    **/
    status_t connect_imap();

    /**
    Connecting and logging in to the SMTP server, symmetric to `connect_imap()`.
    **/
    status_t connect_smtp();

    /**
    Printing and returning all mailbox names, decoded to UTF-8.

    @return Mailbox names, empty on failure.
    **/
    std::vector<std::string> list_mailboxes();

    /**
    Listing the last messages of the mailbox by the sequence number.

    @param mailbox     Mailbox to select.
    @param limit       Maximum number of messages, zero for all.
    @param unread_only Flag if only the unseen messages are listed.
    @return            Summaries in the ascending sequence order, empty on failure.
    **/
    std::vector<message_summary_t> get_emails(const std::string& mailbox = INBOX, std::size_t limit = 10, bool unread_only = false);

    /**
    Sending the message with one text part.

    @param to      Recipient addresses.
    @param subject Subject in UTF-8.
    @param body    Text in UTF-8.
    @param html    Flag if the text is HTML.
    @return        True if the server accepted the message.
    **/
    bool send_email(const std::vector<std::string>& to, const std::string& subject, const std::string& body, bool html = false);

    /**
    Searching the mailbox for the query within the subject or the sender, with no limit on the number of results.

    @param query   Text to look for, the empty one matching all messages.
    @param mailbox Mailbox to select.
    @return        Details of the found messages, empty on failure.
    **/
    std::vector<message_detail_t> search_emails(const std::string& query, const std::string& mailbox = INBOX);

    /**
    Fetching the details of the messages of the selected mailbox, `INBOX` if none is selected.

    @param ids Message sequence numbers as text.
    @return    Details in the order of the identifiers, empty on failure.
    **/
    std::vector<message_detail_t> get_email_details(const std::vector<std::string>& ids);

    /**
    Setting the `\Seen` flag of the message in the selected mailbox, `INBOX` if none is selected.

    @param id Message sequence number as text.
    @return   True if the flag was stored.
    **/
    bool mark_as_read(const std::string& id);

    /**
    Closing the selected mailbox, logging out and quitting the transport. Errors are logged and ignored, repeated calls do nothing.
    **/
    void close() noexcept;

    /**
    Outcome of the last operation.
    **/
    const status_t& last_status() const;

    bool imap_connected() const;

    bool smtp_connected() const;

private:

    /**
    Connecting the store if it is missing.
    **/
    bool ensure_store();

    /**
    Connecting the transport if it is missing.
    **/
    bool ensure_transport();

    /**
    Selecting the mailbox and remembering it.
    **/
    void select(const std::string& mailbox);

    /**
    Fetching the raw message, empty if the server returned no content.
    **/
    std::string fetch_raw(unsigned long message_no);

    /**
    Summaries from the header blocks only, throwing on the first failure.
    **/
    std::vector<message_summary_t> fetch_summaries(const std::vector<unsigned long>& message_nos);

    /**
    Summaries with the body previews, throwing on the first failure.
    **/
    std::vector<message_detail_t> fetch_details(const std::vector<unsigned long>& message_nos);

    static message_summary_t summarize(unsigned long message_no, const message& msg);

    /**
    Printing the failure and recording it as the last status.
    **/
    void fail(const std::string& context, const std::exception& exc);

    /**
    Error message with the details of the protocol errors.
    **/
    static std::string error_text(const std::exception& exc);

    /**
    Parsing the message sequence number.

    @throw std::invalid_argument Not a positive number.
    **/
    static unsigned long parse_id(const std::string& id);

    credentials_t credentials_;

    std::shared_ptr<connector> connector_;

    std::ostream& out_;

    std::unique_ptr<mail_store> store_;

    std::unique_ptr<mail_transport> transport_;

    /**
    Selected mailbox, empty if none.
    **/
    std::string selected_mailbox_;

    status_t last_status_;
};


} // namespace gmcli
