/*

test_session.cpp
----------------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <list>
#include <sstream>
#include <string>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <gmcli/imap.hpp>
#include <gmcli/message.hpp>
#include <gmcli/session.hpp>
#include <gmcli/smtp.hpp>
#include "mock_connection.hpp"


using std::list;
using std::ostringstream;
using std::string;
using std::to_string;
using std::vector;
using testing::_;
using testing::ElementsAre;
using testing::Field;
using testing::HasSubstr;
using testing::InSequence;
using testing::Return;
using testing::Throw;
using gmcli::credentials_t;
using gmcli::imap;
using gmcli::imap_error;
using gmcli::message;
using gmcli::message_detail_t;
using gmcli::message_summary_t;
using gmcli::session;
using gmcli::smtp_error;
using gmcli::test::mock_factory;


namespace
{

list<unsigned long> sequence(unsigned long first, unsigned long last)
{
    list<unsigned long> nos;
    for (auto no = first; no <= last; no++)
        nos.push_back(no);
    return nos;
}


string raw_message(unsigned long no, const string& body = "Hello.")
{
    return "From: sender" + to_string(no) + "@example.com\r\n"
        "Subject: Message " + to_string(no) + "\r\n"
        "Date: Mon, 6 May 2024 10:00:00 +0000\r\n"
        "\r\n" + body;
}


class session_test : public testing::Test
{
protected:

    session_test() : credentials_{"a@gmail.com", "secret"}
    {
        ON_CALL(mocks_.store(), fetch(_)).WillByDefault([](unsigned long no) { return raw_message(no); });
    }

    mock_factory mocks_;

    credentials_t credentials_;

    ostringstream out_;
};


auto has_key(imap::search_condition_t::key_type key)
{
    return ElementsAre(Field(&imap::search_condition_t::key, key));
}

} // anonymous namespace


TEST_F(session_test, list_last_messages)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(15));
    EXPECT_CALL(mocks_.store(), search(has_key(imap::search_condition_t::ALL))).WillOnce(Return(sequence(1, 15)));
    EXPECT_CALL(mocks_.store(), fetch(_)).Times(10);
    EXPECT_CALL(*mocks_.connector(), open_transport(_)).Times(0);

    session sess(credentials_, mocks_.connector(), out_);
    vector<message_summary_t> summaries = sess.get_emails();

    ASSERT_EQ(summaries.size(), 10u);
    EXPECT_EQ(summaries.front().id, "6");
    EXPECT_EQ(summaries.back().id, "15");
    EXPECT_EQ(summaries.front().subject, "Message 6");
    EXPECT_EQ(summaries.front().sender, "sender6@example.com");
    EXPECT_EQ(summaries.front().date, "Mon, 6 May 2024 10:00:00 +0000");
    EXPECT_TRUE(sess.last_status().ok);
    EXPECT_TRUE(sess.imap_connected());
    EXPECT_FALSE(sess.smtp_connected());
    EXPECT_EQ(out_.str(), "Found 15 emails.\n");
}


TEST_F(session_test, list_fewer_than_limit)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(3));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce(Return(sequence(1, 3)));

    session sess(credentials_, mocks_.connector(), out_);
    auto summaries = sess.get_emails("INBOX", 10);

    ASSERT_EQ(summaries.size(), 3u);
    EXPECT_EQ(summaries[0].id, "1");
    EXPECT_EQ(summaries[2].id, "3");
}


TEST_F(session_test, list_unread_without_limit)
{
    EXPECT_CALL(mocks_.store(), select("[Gmail]/All Mail")).WillOnce(Return(40));
    EXPECT_CALL(mocks_.store(), search(has_key(imap::search_condition_t::UNSEEN))).WillOnce(Return(list<unsigned long>{4, 17, 23, 31}));

    session sess(credentials_, mocks_.connector(), out_);
    auto summaries = sess.get_emails("[Gmail]/All Mail", 0, true);

    ASSERT_EQ(summaries.size(), 4u);
    EXPECT_EQ(summaries[1].id, "17");
    EXPECT_EQ(out_.str(), "Found 4 emails (unread).\n");
}


TEST_F(session_test, list_reads_headers_only)
{
    const string multipart = "From: sender1@example.com\r\nSubject: Report\r\nContent-Type: multipart/alternative; boundary=b\r\n\r\n"
        "--b\r\nContent-Type: text/plain\r\nContent-Transfer-Encoding: base64\r\n\r\nSGVsbG8u\r\n--b--\r\n";
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(1));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce(Return(list<unsigned long>{1}));
    EXPECT_CALL(mocks_.store(), fetch(1)).WillOnce(Return(multipart));

    session sess(credentials_, mocks_.connector(), out_);
    auto summaries = sess.get_emails();

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].subject, "Report");
    EXPECT_EQ(summaries[0].sender, "sender1@example.com");
    EXPECT_EQ(summaries[0].date, "");
}


TEST_F(session_test, list_empty_mailbox)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(0));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce(Return(list<unsigned long>{}));
    EXPECT_CALL(mocks_.store(), fetch(_)).Times(0);

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.get_emails().empty());
    EXPECT_TRUE(sess.last_status().ok);
}


TEST_F(session_test, list_fetch_failure)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(2));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce(Return(sequence(1, 2)));
    EXPECT_CALL(mocks_.store(), fetch(_)).WillRepeatedly(Throw(imap_error("Fetching message failure.", "Response=`1 NO`.")));

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.get_emails().empty());
    EXPECT_FALSE(sess.last_status().ok);
    EXPECT_THAT(out_.str(), HasSubstr("Error fetching emails: Fetching message failure. Response=`1 NO`."));
}


TEST_F(session_test, imap_login_failure)
{
    EXPECT_CALL(*mocks_.connector(), open_store(_)).WillOnce(Throw(imap_error("Authentication failure.",
        "Line=`1 NO [AUTHENTICATIONFAILED] Invalid credentials (Failure)`.")));
    EXPECT_CALL(*mocks_.connector(), open_transport(_)).Times(0);

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.get_emails().empty());

    EXPECT_THAT(out_.str(), HasSubstr("IMAP connection failed: Authentication failure."));
    EXPECT_THAT(out_.str(), HasSubstr("Invalid credentials"));
    EXPECT_FALSE(sess.last_status().ok);
    EXPECT_FALSE(sess.imap_connected());
}


TEST_F(session_test, smtp_login_failure)
{
    EXPECT_CALL(*mocks_.connector(), open_transport(_)).WillOnce(Throw(smtp_error("Password rejection.", "5.7.8 BadCredentials")));
    EXPECT_CALL(*mocks_.connector(), open_store(_)).Times(0);

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_FALSE(sess.send_email({"b@x.com"}, "Hi", "Body"));
    EXPECT_THAT(out_.str(), HasSubstr("SMTP connection failed: Password rejection. 5.7.8 BadCredentials"));
    EXPECT_FALSE(sess.smtp_connected());
}


TEST_F(session_test, send_email)
{
    string formatted;
    message sent;
    EXPECT_CALL(*mocks_.connector(), open_store(_)).Times(0);
    EXPECT_CALL(mocks_.transport(), submit(_)).WillOnce([&](const message& msg)
    {
        sent = msg;
        formatted = msg.format();
    });

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.send_email({" b@x.com "}, "Hi", "Body"));
    EXPECT_TRUE(sess.last_status().ok);

    EXPECT_EQ(sent.sender(), "a@gmail.com");
    EXPECT_EQ(sent.recipients(), vector<string>{"b@x.com"});

    message parsed;
    parsed.parse(formatted);
    EXPECT_EQ(parsed.from().value(), "a@gmail.com");
    EXPECT_EQ(parsed.header("To").value(), "b@x.com");
    EXPECT_EQ(parsed.subject().value(), "Hi");
    ASSERT_EQ(parsed.parts().size(), 1u);
    EXPECT_EQ(parsed.parts()[0].content_type(), "text/plain");
    EXPECT_EQ(parsed.parts()[0].text(), "Body");
}


TEST_F(session_test, send_html_to_several)
{
    message sent;
    EXPECT_CALL(mocks_.transport(), submit(_)).WillOnce([&](const message& msg) { sent = msg; });

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.send_email({"b@x.com", "", "c@x.com"}, "News", "<p>News</p>", true));

    EXPECT_EQ(sent.recipients(), (vector<string>{"b@x.com", "c@x.com"}));
    EXPECT_TRUE(sent.is_html());
    EXPECT_EQ(sent.body(), "<p>News</p>");
    EXPECT_EQ(out_.str(), "Email sent to: b@x.com, c@x.com\n");
}


TEST_F(session_test, send_without_recipients)
{
    EXPECT_CALL(*mocks_.connector(), open_transport(_)).Times(0);

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_FALSE(sess.send_email({" ", ""}, "Hi", "Body"));
    EXPECT_THAT(out_.str(), HasSubstr("Error sending email: No recipient address."));
    EXPECT_FALSE(sess.last_status().ok);
}


TEST_F(session_test, send_rejected)
{
    EXPECT_CALL(mocks_.transport(), submit(_)).WillOnce(Throw(smtp_error("Mail recipient rejection.", "550 5.1.1 No such user")));

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_FALSE(sess.send_email({"nobody@x.com"}, "Hi", "Body"));
    EXPECT_THAT(out_.str(), HasSubstr("Error sending email: Mail recipient rejection. 550 5.1.1 No such user"));
}


TEST_F(session_test, search_empty_query)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(25));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce([](const list<imap::search_condition_t>& conditions)
    {
        EXPECT_EQ(conditions.size(), 1u);
        EXPECT_EQ(conditions.front().key, imap::search_condition_t::OR);
        EXPECT_EQ(conditions.front().to_string(), "OR SUBJECT \"\" FROM \"\"");
        return sequence(1, 25);
    });

    session sess(credentials_, mocks_.connector(), out_);
    vector<message_detail_t> details = sess.search_emails("");

    ASSERT_EQ(details.size(), 25u);
    EXPECT_EQ(details.front().id, "1");
    EXPECT_EQ(details.back().id, "25");
    EXPECT_EQ(details.back().body, "Hello.");
    EXPECT_EQ(out_.str(), "Found 25 emails matching ''.\n");
}


TEST_F(session_test, search_by_sender)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(25));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce([](const list<imap::search_condition_t>& conditions)
    {
        EXPECT_EQ(conditions.front().to_string(), "OR SUBJECT \"sender7\" FROM \"sender7\"");
        return list<unsigned long>{7};
    });

    session sess(credentials_, mocks_.connector(), out_);
    auto details = sess.search_emails("sender7");

    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details[0].sender, "sender7@example.com");
}


TEST_F(session_test, details_preview)
{
    string long_body(800, 'x');
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(9));
    EXPECT_CALL(mocks_.store(), fetch(9)).WillOnce(Return(raw_message(9, long_body)));
    EXPECT_CALL(mocks_.store(), fetch(2)).WillOnce(Return(
        "Subject: =?UTF-8?B?R3LDvMOfZQ==?=\r\n"
        "Content-Type: multipart/alternative; boundary=b\r\n"
        "\r\n"
        "--b\r\n"
        "Content-Type: text/html\r\n"
        "\r\n"
        "<p>html only</p>\r\n"
        "--b--\r\n"));

    session sess(credentials_, mocks_.connector(), out_);
    auto details = sess.get_email_details({"9", "2"});

    ASSERT_EQ(details.size(), 2u);
    EXPECT_EQ(details[0].id, "9");
    EXPECT_EQ(details[0].body.size(), message::PREVIEW_LENGTH);
    EXPECT_EQ(details[1].id, "2");
    EXPECT_EQ(details[1].subject, "Gr\xC3\xBC\xC3\x9F" "e");
    EXPECT_EQ(details[1].sender, "");
    EXPECT_EQ(details[1].body, "");
}


TEST_F(session_test, details_invalid_id)
{
    EXPECT_CALL(mocks_.store(), fetch(_)).Times(0);

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.get_email_details({"3", "abc"}).empty());
    EXPECT_THAT(out_.str(), HasSubstr("Error fetching email details: Invalid message id `abc`."));
}


TEST_F(session_test, details_keep_selected_mailbox)
{
    EXPECT_CALL(mocks_.store(), select("Work")).WillOnce(Return(5));
    EXPECT_CALL(mocks_.store(), select("INBOX")).Times(0);
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce(Return(sequence(1, 5)));

    session sess(credentials_, mocks_.connector(), out_);
    sess.get_emails("Work", 1);
    auto details = sess.get_email_details({"3"});

    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details[0].subject, "Message 3");
}


TEST_F(session_test, mark_as_read)
{
    {
        InSequence seq;
        EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(5));
        EXPECT_CALL(mocks_.store(), add_flags(4, vector<string>{"\\Seen"}));
    }

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_TRUE(sess.mark_as_read("4"));
    EXPECT_THAT(out_.str(), HasSubstr("Marked message 4 as read."));
}


TEST_F(session_test, mark_as_read_rejected)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(5));
    EXPECT_CALL(mocks_.store(), add_flags(_, _)).WillOnce(Throw(imap_error("Storing flags failure.", "Line=`1 NO`.")));

    session sess(credentials_, mocks_.connector(), out_);
    EXPECT_FALSE(sess.mark_as_read("4"));
    EXPECT_THAT(out_.str(), HasSubstr("Error marking email as read: Storing flags failure."));
}


TEST_F(session_test, list_mailboxes)
{
    imap::mailbox_folder_t inbox;
    inbox.name = "INBOX";
    imap::mailbox_folder_t sent;
    sent.name = "[Gmail]/Sent Mail";
    EXPECT_CALL(mocks_.store(), list_folders()).WillOnce(Return(vector<imap::mailbox_folder_t>{inbox, sent}));

    session sess(credentials_, mocks_.connector(), out_);
    auto names = sess.list_mailboxes();

    EXPECT_EQ(names, (vector<string>{"INBOX", "[Gmail]/Sent Mail"}));
    EXPECT_EQ(out_.str(), "INBOX\n[Gmail]/Sent Mail\n");
}


TEST_F(session_test, close_once)
{
    EXPECT_CALL(mocks_.store(), select("INBOX")).WillOnce(Return(1));
    EXPECT_CALL(mocks_.store(), search(_)).WillOnce(Return(sequence(1, 1)));
    {
        InSequence seq;
        EXPECT_CALL(mocks_.store(), close_mailbox()).Times(1);
        EXPECT_CALL(mocks_.store(), logout()).Times(1);
    }
    EXPECT_CALL(mocks_.transport(), quit()).Times(1);

    session sess(credentials_, mocks_.connector(), out_);
    sess.get_emails();
    sess.send_email({"b@x.com"}, "Hi", "Body");
    sess.close();
    EXPECT_FALSE(sess.imap_connected());
    EXPECT_FALSE(sess.smtp_connected());
    sess.close();
}


TEST_F(session_test, close_without_selection)
{
    EXPECT_CALL(mocks_.store(), list_folders()).WillOnce(Return(vector<imap::mailbox_folder_t>{}));
    EXPECT_CALL(mocks_.store(), close_mailbox()).Times(0);
    EXPECT_CALL(mocks_.store(), logout()).WillOnce(Throw(imap_error("Logout failure.", "Line=`1 BAD`.")));

    session sess(credentials_, mocks_.connector(), out_);
    sess.list_mailboxes();
    sess.close();
    EXPECT_FALSE(sess.imap_connected());
}
