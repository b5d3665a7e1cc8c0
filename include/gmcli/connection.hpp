/*

connection.hpp
--------------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <list>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "imap.hpp"
#include "message.hpp"
#include "smtp.hpp"


namespace gmcli
{


/**
Authenticated mailbox store, the subset of IMAP the session needs.

All methods throw `dialog_error` or its descendants on failure.
**/
class mail_store
{
public:

    virtual ~mail_store() = default;

    virtual std::vector<imap::mailbox_folder_t> list_folders() = 0;

    /**
    Selecting the mailbox.

    @return Number of messages in the mailbox.
    **/
    virtual unsigned long select(const std::string& mailbox) = 0;

    virtual std::list<unsigned long> search(const std::list<imap::search_condition_t>& conditions) = 0;

    /**
    Fetching the raw message, which marks it as seen.
    **/
    virtual std::string fetch(unsigned long message_no) = 0;

    virtual void add_flags(unsigned long message_no, const std::vector<std::string>& flags) = 0;

    /**
    Closing the selected mailbox.
    **/
    virtual void close_mailbox() = 0;

    virtual void logout() = 0;
};


/**
Authenticated mail submission.
**/
class mail_transport
{
public:

    virtual ~mail_transport() = default;

    virtual void submit(const message& msg) = 0;

    virtual void quit() = 0;
};


/**
Opening the authenticated store and transport for the credentials.
**/
class connector
{
public:

    virtual ~connector() = default;

    /**
    Connecting and logging in to the store.

    @throw dialog_error Connection or authentication failure.
    **/
    virtual std::unique_ptr<mail_store> open_store(const credentials_t& credentials) = 0;

    /**
    Connecting and logging in to the transport.

    @throw dialog_error Connection or authentication failure.
    **/
    virtual std::unique_ptr<mail_transport> open_transport(const credentials_t& credentials) = 0;
};


/**
Connector to the configured IMAP and SMTP servers over the implicit TLS.
**/
class network_connector : public connector
{
public:

    explicit network_connector(const config_t& cfg);

    std::unique_ptr<mail_store> open_store(const credentials_t& credentials) override;

    std::unique_ptr<mail_transport> open_transport(const credentials_t& credentials) override;

private:

    config_t config_;
};


/**
Store backed by the IMAP client.
**/
class imap_store : public mail_store
{
public:

    explicit imap_store(std::unique_ptr<imap> client);

    std::vector<imap::mailbox_folder_t> list_folders() override;

    unsigned long select(const std::string& mailbox) override;

    std::list<unsigned long> search(const std::list<imap::search_condition_t>& conditions) override;

    std::string fetch(unsigned long message_no) override;

    void add_flags(unsigned long message_no, const std::vector<std::string>& flags) override;

    void close_mailbox() override;

    void logout() override;

private:

    std::unique_ptr<imap> client_;
};


/**
Transport backed by the SMTP client.
**/
class smtp_transport : public mail_transport
{
public:

    explicit smtp_transport(std::unique_ptr<smtp> client);

    void submit(const message& msg) override;

    void quit() override;

private:

    std::unique_ptr<smtp> client_;
};


} // namespace gmcli
