/*

connection.cpp
--------------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <list>
#include <memory>
#include <string>
#include <vector>
#include <gmcli/connection.hpp>
#include <gmcli/log.hpp>


using std::list;
using std::string;
using std::unique_ptr;
using std::make_unique;
using std::vector;


namespace gmcli
{


network_connector::network_connector(const config_t& cfg) : config_(cfg)
{
}


unique_ptr<mail_store> network_connector::open_store(const credentials_t& credentials)
{
    GMCLI_LOG_INFO("IMAP", "connecting to " << config_.imap_server.host << ":" << config_.imap_server.port);
    auto client = make_unique<imap>(config_.imap_server.host, config_.imap_server.port, config_.timeout);
    client->authenticate(credentials.address, credentials.secret);
    GMCLI_LOG_INFO("IMAP", "logged in as " << credentials.address);
    return make_unique<imap_store>(std::move(client));
}


unique_ptr<mail_transport> network_connector::open_transport(const credentials_t& credentials)
{
    GMCLI_LOG_INFO("SMTP", "connecting to " << config_.smtp_server.host << ":" << config_.smtp_server.port);
    auto client = make_unique<smtp>(config_.smtp_server.host, config_.smtp_server.port, config_.timeout);
    client->authenticate(credentials.address, credentials.secret);
    GMCLI_LOG_INFO("SMTP", "logged in as " << credentials.address);
    return make_unique<smtp_transport>(std::move(client));
}


imap_store::imap_store(unique_ptr<imap> client) : client_(std::move(client))
{
}


vector<imap::mailbox_folder_t> imap_store::list_folders()
{
    return client_->list_folders("*");
}


unsigned long imap_store::select(const string& mailbox)
{
    return client_->select(mailbox).messages_no;
}


list<unsigned long> imap_store::search(const list<imap::search_condition_t>& conditions)
{
    return client_->search(conditions);
}


string imap_store::fetch(unsigned long message_no)
{
    return client_->fetch(message_no);
}


void imap_store::add_flags(unsigned long message_no, const vector<string>& flags)
{
    client_->add_flags(message_no, flags);
}


void imap_store::close_mailbox()
{
    client_->close();
}


void imap_store::logout()
{
    client_->logout();
}


smtp_transport::smtp_transport(unique_ptr<smtp> client) : client_(std::move(client))
{
}


void smtp_transport::submit(const message& msg)
{
    client_->submit(msg);
}


void smtp_transport::quit()
{
    client_->quit();
}


} // namespace gmcli
