/*

mock_connection.hpp
-------------------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <list>
#include <memory>
#include <string>
#include <vector>
#include <gmock/gmock.h>
#include <gmcli/connection.hpp>


namespace gmcli
{
namespace test
{


class mock_store : public mail_store
{
public:

    MOCK_METHOD(std::vector<imap::mailbox_folder_t>, list_folders, (), (override));
    MOCK_METHOD(unsigned long, select, (const std::string& mailbox), (override));
    MOCK_METHOD(std::list<unsigned long>, search, (const std::list<imap::search_condition_t>& conditions), (override));
    MOCK_METHOD(std::string, fetch, (unsigned long message_no), (override));
    MOCK_METHOD(void, add_flags, (unsigned long message_no, const std::vector<std::string>& flags), (override));
    MOCK_METHOD(void, close_mailbox, (), (override));
    MOCK_METHOD(void, logout, (), (override));
};


class mock_transport : public mail_transport
{
public:

    MOCK_METHOD(void, submit, (const message& msg), (override));
    MOCK_METHOD(void, quit, (), (override));
};


class mock_connector : public connector
{
public:

    MOCK_METHOD(std::unique_ptr<mail_store>, open_store, (const credentials_t& credentials), (override));
    MOCK_METHOD(std::unique_ptr<mail_transport>, open_transport, (const credentials_t& credentials), (override));
};


/**
Connector handing out the prepared mocks, each at most once.

The mocks are created up front so that the expectations can be set before the session takes the ownership.
**/
class mock_factory
{
public:

    mock_factory() : connector_(std::make_shared<testing::NiceMock<mock_connector>>()),
        store_(std::make_unique<testing::NiceMock<mock_store>>()), transport_(std::make_unique<testing::NiceMock<mock_transport>>()),
        store_ptr_(store_.get()), transport_ptr_(transport_.get())
    {
        ON_CALL(*connector_, open_store(testing::_)).WillByDefault([this](const credentials_t&)
        {
            if (store_ == nullptr)
                throw dialog_error("Network connecting error.", "Store already taken.");
            return std::unique_ptr<mail_store>(std::move(store_));
        });
        ON_CALL(*connector_, open_transport(testing::_)).WillByDefault([this](const credentials_t&)
        {
            if (transport_ == nullptr)
                throw dialog_error("Network connecting error.", "Transport already taken.");
            return std::unique_ptr<mail_transport>(std::move(transport_));
        });
    }

    std::shared_ptr<testing::NiceMock<mock_connector>> connector() const
    {
        return connector_;
    }

    /**
    Store mock, valid until the session releases it.
    **/
    testing::NiceMock<mock_store>& store() const
    {
        return *store_ptr_;
    }

    testing::NiceMock<mock_transport>& transport() const
    {
        return *transport_ptr_;
    }

private:

    std::shared_ptr<testing::NiceMock<mock_connector>> connector_;

    std::unique_ptr<testing::NiceMock<mock_store>> store_;

    std::unique_ptr<testing::NiceMock<mock_transport>> transport_;

    testing::NiceMock<mock_store>* store_ptr_;

    testing::NiceMock<mock_transport>* transport_ptr_;
};


} // namespace test
} // namespace gmcli
