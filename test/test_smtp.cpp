/*

test_smtp.cpp
-------------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <memory>
#include <string>
#include <tuple>
#include <vector>
#include <gtest/gtest.h>
#include <gmcli/message.hpp>
#include <gmcli/smtp.hpp>
#include "scripted_dialog.hpp"


using std::make_shared;
using std::string;
using std::vector;
using gmcli::message;
using gmcli::mime_error;
using gmcli::smtp;
using gmcli::smtp_error;
using gmcli::test::scripted_dialog;


namespace
{

message make_message(const string& body)
{
    message msg;
    msg.from("a@gmail.com");
    msg.add_recipient("b@x.com");
    msg.add_recipient("c@x.com");
    msg.subject("Hi");
    msg.content(body, false);
    return msg;
}

} // anonymous namespace


TEST(smtp, authenticate)
{
    auto dlg = make_shared<scripted_dialog>(
        "220 smtp.gmail.com ESMTP ready\r\n"
        "250-smtp.gmail.com at your service\r\n"
        "250-SIZE 35882577\r\n"
        "250-AUTH LOGIN PLAIN XOAUTH2\r\n"
        "250 SMTPUTF8\r\n"
        "334 VXNlcm5hbWU6\r\n"
        "334 UGFzc3dvcmQ6\r\n"
        "235 2.7.0 Accepted\r\n");
    smtp conn(dlg);
    string greeting = conn.authenticate("a@gmail.com", "secret");

    EXPECT_EQ(greeting, "smtp.gmail.com ESMTP ready");
    EXPECT_EQ(dlg->sent(), (vector<string>{"EHLO localhost", "AUTH LOGIN", "YUBnbWFpbC5jb20=", "c2VjcmV0"}));
    EXPECT_TRUE(dlg->exhausted());
}


TEST(smtp, multiline_greeting)
{
    auto dlg = make_shared<scripted_dialog>(
        "220-smtp.example.com\r\n"
        "220 ready\r\n"
        "250 hello\r\n"
        "334 VXNlcm5hbWU6\r\n"
        "334 UGFzc3dvcmQ6\r\n"
        "235 Accepted\r\n");
    smtp conn(dlg);
    EXPECT_EQ(conn.authenticate("a@gmail.com", "secret"), "smtp.example.com\r\nready");
}


TEST(smtp, helo_fallback)
{
    auto dlg = make_shared<scripted_dialog>(
        "220 ready\r\n"
        "502 command not implemented\r\n"
        "250 hello\r\n"
        "334 VXNlcm5hbWU6\r\n"
        "334 UGFzc3dvcmQ6\r\n"
        "235 Accepted\r\n");
    smtp conn(dlg);
    conn.source_hostname("client.example.com");
    conn.authenticate("a@gmail.com", "secret");

    EXPECT_EQ(dlg->sent()[0], "EHLO client.example.com");
    EXPECT_EQ(dlg->sent()[1], "HELO client.example.com");
}


TEST(smtp, connection_rejected)
{
    auto dlg = make_shared<scripted_dialog>("554 no service\r\n");
    smtp conn(dlg);
    EXPECT_THROW(conn.authenticate("a@gmail.com", "secret"), smtp_error);
}


TEST(smtp, password_rejected)
{
    auto dlg = make_shared<scripted_dialog>(
        "220 ready\r\n"
        "250 hello\r\n"
        "334 VXNlcm5hbWU6\r\n"
        "334 UGFzc3dvcmQ6\r\n"
        "535-5.7.8 Username and Password not accepted.\r\n"
        "535 5.7.8 https://support.google.com/mail/?p=BadCredentials\r\n");
    smtp conn(dlg);
    try
    {
        conn.authenticate("a@gmail.com", "wrong");
        FAIL() << "authentication passed";
    }
    catch (const smtp_error& exc)
    {
        EXPECT_STREQ(exc.what(), "Password rejection.");
        EXPECT_EQ(exc.details(), "5.7.8 https://support.google.com/mail/?p=BadCredentials");
    }
}


TEST(smtp, submit)
{
    auto dlg = make_shared<scripted_dialog>(
        "250 2.1.0 OK\r\n"
        "250 2.1.5 OK\r\n"
        "250 2.1.5 OK\r\n"
        "354 Go ahead\r\n"
        "250 2.0.0 OK queued\r\n");
    smtp conn(dlg);
    string reply = conn.submit(make_message("first\r\n.hidden\r\nlast"));

    EXPECT_EQ(reply, "2.0.0 OK queued");
    ASSERT_EQ(dlg->sent().size(), 5u);
    EXPECT_EQ(dlg->sent()[0], "MAIL FROM: <a@gmail.com>");
    EXPECT_EQ(dlg->sent()[1], "RCPT TO: <b@x.com>");
    EXPECT_EQ(dlg->sent()[2], "RCPT TO: <c@x.com>");
    EXPECT_EQ(dlg->sent()[3], "DATA");

    const string& data = dlg->sent()[4];
    EXPECT_NE(data.find("\r\n..hidden\r\n"), string::npos);
    EXPECT_EQ(data.substr(data.size() - 3), "\r\n.");
    EXPECT_EQ(data.find("\r\n.\r\n"), string::npos);
}


TEST(smtp, recipient_rejected)
{
    auto dlg = make_shared<scripted_dialog>(
        "250 2.1.0 OK\r\n"
        "550 5.1.1 The email account that you tried to reach does not exist.\r\n");
    smtp conn(dlg);
    EXPECT_THROW(conn.submit(make_message("body")), smtp_error);
    EXPECT_EQ(dlg->sent().size(), 2u);
}


TEST(smtp, incomplete_message)
{
    auto dlg = make_shared<scripted_dialog>("");
    smtp conn(dlg);
    message msg;
    msg.from("a@gmail.com");
    msg.content("body", false);

    EXPECT_THROW(conn.submit(msg), mime_error);
    EXPECT_TRUE(dlg->sent().empty());
}


TEST(smtp, recipient_line_break)
{
    auto dlg = make_shared<scripted_dialog>("");
    smtp conn(dlg);
    message msg;
    msg.from("a@gmail.com");
    msg.add_recipient("b@x.com>\r\nRCPT TO: <evil@attacker.com");
    msg.content("body", false);

    EXPECT_THROW(conn.submit(msg), mime_error);
    EXPECT_TRUE(dlg->sent().empty());
}


TEST(smtp, quit)
{
    auto dlg = make_shared<scripted_dialog>("221 2.0.0 closing connection\r\n");
    smtp conn(dlg);
    conn.quit();

    EXPECT_EQ(dlg->sent()[0], "QUIT");
    EXPECT_TRUE(dlg->closed());
}


TEST(smtp, parse_line)
{
    auto tokens = smtp::parse_line("250-smtp.gmail.com at your service");
    EXPECT_EQ(std::get<0>(tokens), 250);
    EXPECT_FALSE(std::get<1>(tokens));
    EXPECT_EQ(std::get<2>(tokens), "smtp.gmail.com at your service");

    tokens = smtp::parse_line("250");
    EXPECT_EQ(std::get<0>(tokens), 250);
    EXPECT_TRUE(std::get<1>(tokens));
    EXPECT_EQ(std::get<2>(tokens), "");

    EXPECT_THROW(smtp::parse_line("OK"), smtp_error);
    EXPECT_THROW(smtp::parse_line("abc ready"), smtp_error);
}
