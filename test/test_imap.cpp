/*

test_imap.cpp
-------------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <list>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <gmcli/imap.hpp>
#include "scripted_dialog.hpp"


using std::list;
using std::make_shared;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::vector;
using gmcli::imap;
using gmcli::imap_error;
using gmcli::test::scripted_dialog;


TEST(imap, authenticate)
{
    auto dlg = make_shared<scripted_dialog>(
        "* OK Gimap ready for requests from 10.0.0.1\r\n"
        "* CAPABILITY IMAP4rev1 UNSELECT IDLE NAMESPACE QUOTA ID XLIST CHILDREN X-GM-EXT-1\r\n"
        "1 OK a@gmail.com authenticated (Success)\r\n");
    imap conn(dlg);
    string greeting = conn.authenticate("a@gmail.com", "se\"cret");

    EXPECT_EQ(greeting, "Gimap ready for requests from 10.0.0.1");
    ASSERT_EQ(dlg->sent().size(), 1u);
    EXPECT_EQ(dlg->sent()[0], "1 LOGIN \"a@gmail.com\" \"se\\\"cret\"");
}


TEST(imap, authenticate_rejected)
{
    auto dlg = make_shared<scripted_dialog>(
        "* OK Gimap ready\r\n"
        "1 NO [AUTHENTICATIONFAILED] Invalid credentials (Failure)\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.authenticate("a@gmail.com", "wrong"), imap_error);
}


TEST(imap, greeting_rejected)
{
    auto dlg = make_shared<scripted_dialog>("* BYE server unavailable\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.authenticate("a@gmail.com", "secret"), imap_error);
}


TEST(imap, select)
{
    auto dlg = make_shared<scripted_dialog>(
        "* FLAGS (\\Answered \\Flagged \\Draft \\Deleted \\Seen $NotPhishing $Phishing)\r\n"
        "* OK [PERMANENTFLAGS (\\Answered \\Flagged \\Draft \\Deleted \\Seen $NotPhishing $Phishing \\*)] Flags permitted.\r\n"
        "* OK [UIDVALIDITY 3] UIDs valid.\r\n"
        "* 12 EXISTS\r\n"
        "* 0 RECENT\r\n"
        "* OK [UIDNEXT 40] Predicted next UID.\r\n"
        "* OK [HIGHESTMODSEQ 5000]\r\n"
        "1 OK [READ-WRITE] INBOX selected. (Success)\r\n");
    imap conn(dlg);
    auto stat = conn.select("INBOX");

    EXPECT_EQ(dlg->sent()[0], "1 SELECT \"INBOX\"");
    EXPECT_EQ(stat.messages_no, 12u);
    EXPECT_EQ(stat.messages_recent, 0u);
    EXPECT_EQ(stat.uid_validity, 3u);
    EXPECT_EQ(stat.uid_next, 40u);
    EXPECT_TRUE(dlg->exhausted());
}


TEST(imap, select_read_only)
{
    auto dlg = make_shared<scripted_dialog>(
        "* 4 EXISTS\r\n"
        "1 OK [READ-ONLY] Sent Mail selected. (Success)\r\n");
    imap conn(dlg);
    auto stat = conn.select("[Gmail]/Sent Mail", true);

    EXPECT_EQ(dlg->sent()[0], "1 EXAMINE \"[Gmail]/Sent Mail\"");
    EXPECT_EQ(stat.messages_no, 4u);
}


TEST(imap, select_without_exists)
{
    auto dlg = make_shared<scripted_dialog>("1 OK [READ-WRITE] INBOX selected. (Success)\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.select("INBOX"), imap_error);
}


TEST(imap, select_missing_mailbox)
{
    auto dlg = make_shared<scripted_dialog>("1 NO [NONEXISTENT] Unknown Mailbox: Nope (Failure)\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.select("Nope"), imap_error);
}


TEST(imap, search_all)
{
    auto dlg = make_shared<scripted_dialog>(
        "* SEARCH 1 2 3 4 5\r\n"
        "1 OK SEARCH completed (Success)\r\n");
    imap conn(dlg);
    list<imap::search_condition_t> conds;
    conds.push_back(imap::search_condition_t(imap::search_condition_t::ALL));
    auto found = conn.search(conds);

    EXPECT_EQ(dlg->sent()[0], "1 SEARCH ALL");
    EXPECT_EQ(found, (list<unsigned long>{1, 2, 3, 4, 5}));
}


TEST(imap, search_nothing_found)
{
    auto dlg = make_shared<scripted_dialog>(
        "* SEARCH\r\n"
        "1 OK SEARCH completed (Success)\r\n");
    imap conn(dlg);
    list<imap::search_condition_t> conds;
    conds.push_back(imap::search_condition_t(imap::search_condition_t::UNSEEN));
    auto found = conn.search(conds);

    EXPECT_EQ(dlg->sent()[0], "1 SEARCH UNSEEN");
    EXPECT_TRUE(found.empty());
}


TEST(imap, search_subject_or_sender)
{
    auto dlg = make_shared<scripted_dialog>(
        "* SEARCH 2 5 9\r\n"
        "1 OK SEARCH completed (Success)\r\n");
    imap conn(dlg);
    list<imap::search_condition_t> conds;
    conds.push_back(imap::search_condition_t::either(imap::search_condition_t(imap::search_condition_t::SUBJECT, "invoice"),
        imap::search_condition_t(imap::search_condition_t::FROM, "invoice")));
    auto found = conn.search(conds);

    EXPECT_EQ(dlg->sent()[0], "1 SEARCH OR SUBJECT \"invoice\" FROM \"invoice\"");
    EXPECT_EQ(found, (list<unsigned long>{2, 5, 9}));
}


TEST(imap, search_utf8_literals)
{
    const string query = "caf\xC3\xA9";
    auto dlg = make_shared<scripted_dialog>(
        "+ go ahead\r\n"
        "+ go ahead\r\n"
        "* SEARCH 4\r\n"
        "1 OK SEARCH completed (Success)\r\n");
    imap conn(dlg);
    list<imap::search_condition_t> conds;
    conds.push_back(imap::search_condition_t::either(imap::search_condition_t(imap::search_condition_t::SUBJECT, query),
        imap::search_condition_t(imap::search_condition_t::FROM, query)));
    auto found = conn.search(conds);

    ASSERT_EQ(dlg->sent().size(), 3u);
    EXPECT_EQ(dlg->sent()[0], "1 SEARCH CHARSET UTF-8 OR SUBJECT {5}");
    EXPECT_EQ(dlg->sent()[1], query + " FROM {5}");
    EXPECT_EQ(dlg->sent()[2], query);
    EXPECT_EQ(found, (list<unsigned long>{4}));
}


TEST(imap, search_control_characters_as_literal)
{
    const string query = "x\r\nA1 DELETE INBOX";
    auto dlg = make_shared<scripted_dialog>(
        "+ go ahead\r\n"
        "* SEARCH\r\n"
        "1 OK SEARCH completed (Success)\r\n");
    imap conn(dlg);
    list<imap::search_condition_t> conds;
    conds.push_back(imap::search_condition_t(imap::search_condition_t::SUBJECT, query));
    auto found = conn.search(conds);

    ASSERT_EQ(dlg->sent().size(), 2u);
    EXPECT_EQ(dlg->sent()[0], "1 SEARCH CHARSET UTF-8 SUBJECT {18}");
    EXPECT_EQ(dlg->sent()[1], query);
    EXPECT_TRUE(found.empty());

    imap::search_condition_t tab(imap::search_condition_t::FROM, "a\tb");
    EXPECT_EQ(tab.literals, (vector<string>{"a\tb"}));
}


TEST(imap, search_literal_refused)
{
    auto dlg = make_shared<scripted_dialog>("1 BAD Could not parse command\r\n");
    imap conn(dlg);
    list<imap::search_condition_t> conds;
    conds.push_back(imap::search_condition_t(imap::search_condition_t::SUBJECT, "\xC3\xA9t\xC3\xA9"));
    EXPECT_THROW(conn.search(conds), imap_error);
}


TEST(imap, search_condition_text)
{
    imap::search_condition_t cond = imap::search_condition_t::either(imap::search_condition_t(imap::search_condition_t::SUBJECT, "a \"b\""),
        imap::search_condition_t(imap::search_condition_t::SEEN));
    EXPECT_EQ(cond.to_string(), "OR SUBJECT \"a \\\"b\\\"\" SEEN");
    EXPECT_THROW(imap::search_condition_t{imap::search_condition_t::OR}, imap_error);
}


TEST(imap, fetch_literal)
{
    const string msg = "Subject: Hi\r\nFrom: b@x.com\r\n\r\nBody line\r\n";
    auto dlg = make_shared<scripted_dialog>(
        "* 3 FETCH (RFC822 {" + to_string(msg.size()) + "}\r\n" + msg + " FLAGS (\\Seen))\r\n"
        "1 OK Success\r\n");
    imap conn(dlg);
    string fetched = conn.fetch(3);

    EXPECT_EQ(dlg->sent()[0], "1 FETCH 3 (RFC822)");
    EXPECT_EQ(fetched, msg);
    EXPECT_TRUE(dlg->exhausted());
}


TEST(imap, fetch_peek)
{
    const string msg = "Subject: (no parens) [x]\r\n\r\n{not a literal}\r\n";
    auto dlg = make_shared<scripted_dialog>(
        "* 7 FETCH (BODY[] {" + to_string(msg.size()) + "}\r\n" + msg + ")\r\n"
        "1 OK Success\r\n");
    imap conn(dlg);
    string fetched = conn.fetch(7, true);

    EXPECT_EQ(dlg->sent()[0], "1 FETCH 7 (BODY.PEEK[])");
    EXPECT_EQ(fetched, msg);
}


TEST(imap, fetch_skips_other_messages)
{
    const string other = "Subject: other\r\n\r\n";
    const string msg = "Subject: mine\r\n\r\n";
    auto dlg = make_shared<scripted_dialog>(
        "* 2 FETCH (FLAGS (\\Seen))\r\n"
        "* 5 FETCH (RFC822 {" + to_string(other.size()) + "}\r\n" + other + ")\r\n"
        "* 6 FETCH (RFC822 {" + to_string(msg.size()) + "}\r\n" + msg + ")\r\n"
        "1 OK Success\r\n");
    imap conn(dlg);
    EXPECT_EQ(conn.fetch(6), msg);
}


TEST(imap, fetch_missing_message)
{
    auto dlg = make_shared<scripted_dialog>("1 OK Success\r\n");
    imap conn(dlg);
    EXPECT_EQ(conn.fetch(99), "");
}


TEST(imap, fetch_failure)
{
    auto dlg = make_shared<scripted_dialog>("1 BAD Could not parse command\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.fetch(1), imap_error);
}


TEST(imap, list_folders)
{
    auto dlg = make_shared<scripted_dialog>(
        "* LIST (\\HasNoChildren) \"/\" \"INBOX\"\r\n"
        "* LIST (\\HasChildren \\Noselect) \"/\" \"[Gmail]\"\r\n"
        "* LIST (\\HasNoChildren \\Sent) \"/\" \"[Gmail]/Sent Mail\"\r\n"
        "* LIST (\\HasNoChildren) \"/\" \"&BB8EQAQ4BDIENQRC-\"\r\n"
        "* LIST (\\HasNoChildren) \"/\" {4}\r\n"
        "Work\r\n"
        "* LIST (\\HasNoChildren) NIL Flat\r\n"
        "1 OK Success\r\n");
    imap conn(dlg);
    auto folders = conn.list_folders();

    EXPECT_EQ(dlg->sent()[0], "1 LIST \"\" \"*\"");
    ASSERT_EQ(folders.size(), 6u);
    EXPECT_EQ(folders[0].name, "INBOX");
    EXPECT_EQ(folders[0].delimiter, "/");
    EXPECT_TRUE(folders[0].selectable);
    EXPECT_EQ(folders[1].name, "[Gmail]");
    EXPECT_FALSE(folders[1].selectable);
    EXPECT_EQ(folders[1].attributes, (vector<string>{"\\HasChildren", "\\Noselect"}));
    EXPECT_EQ(folders[2].name, "[Gmail]/Sent Mail");
    EXPECT_EQ(folders[3].name, "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82");
    EXPECT_EQ(folders[4].name, "Work");
    EXPECT_EQ(folders[5].name, "Flat");
    EXPECT_EQ(folders[5].delimiter, "");
}


TEST(imap, list_folders_wrong_tag)
{
    auto dlg = make_shared<scripted_dialog>("7 OK Success\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.list_folders(), imap_error);
}


TEST(imap, unterminated_quote)
{
    auto dlg = make_shared<scripted_dialog>(
        "* LIST (\\HasNoChildren) \"/\" \"INBOX\r\n"
        "1 OK Success\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.list_folders(), imap_error);
}


TEST(imap, add_flags)
{
    auto dlg = make_shared<scripted_dialog>(
        "* 4 FETCH (FLAGS (\\Seen))\r\n"
        "1 OK Success\r\n");
    imap conn(dlg);
    conn.add_flags(4, {"\\Seen"});
    EXPECT_EQ(dlg->sent()[0], "1 STORE 4 +FLAGS (\\Seen)");
}


TEST(imap, add_flags_rejected)
{
    auto dlg = make_shared<scripted_dialog>("1 NO STORE attempt on READ-ONLY folder (Failure)\r\n");
    imap conn(dlg);
    EXPECT_THROW(conn.add_flags(4, {"\\Seen"}), imap_error);
}


TEST(imap, close_and_logout)
{
    auto dlg = make_shared<scripted_dialog>(
        "1 OK Returned to authenticated state. (Success)\r\n"
        "* BYE LOGOUT Requested\r\n"
        "2 OK 73 good day (Success)\r\n");
    imap conn(dlg);
    conn.close();
    conn.logout();

    EXPECT_EQ(dlg->sent(), (vector<string>{"1 CLOSE", "2 LOGOUT"}));
    EXPECT_TRUE(dlg->closed());
}
