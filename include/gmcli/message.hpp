/*

message.hpp
-----------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string/compare.hpp>
#include <boost/range/algorithm/lexicographical_compare.hpp>


namespace gmcli
{


/**
Case insensitive ordering of the header names.
**/
struct header_name_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const
    {
        return boost::range::lexicographical_compare(lhs, rhs, boost::algorithm::is_iless());
    }
};


/**
MIME entity: headers with the content, either a leaf or a multipart with the nested entities.
**/
class mime
{
public:

    /**
    Headers by name, in the order of appearance within the same name.
    **/
    using headers_t = std::multimap<std::string, std::string, header_name_less>;

    /**
    Header name and value separator.
    **/
    static const char HEADER_SEPARATOR_CHAR = ':';

    /**
    Content type used if none is given.
    **/
    static const std::string DEFAULT_CONTENT_TYPE;

    mime() = default;

    virtual ~mime() = default;

    mime(const mime&) = default;

    mime(mime&&) = default;

    mime& operator=(const mime&) = default;

    mime& operator=(mime&&) = default;

    /**
    Parsing the entity from its textual form.

    Folded headers are unfolded, a multipart content is split by its boundary into the nested entities recursively. Lines may end with CRLF or
    a bare LF.

    @param text       Entity text.
    @throw mime_error Empty entity.
    **/
    void parse(const std::string& text);

    /**
    Parsing only the header block, leaving the content and the nested entities empty.

    @param text       Entity text.
    @throw mime_error Empty entity.
    **/
    void parse_headers(const std::string& text);

    /**
    Getting the headers.
    **/
    const headers_t& headers() const;

    /**
    Getting the first value of the header.

    @param name Header name, case insensitive.
    @return     Unfolded raw value, none if the header is missing.
    **/
    std::optional<std::string> header(const std::string& name) const;

    /**
    Setting the header, replacing all previous values of it.
    **/
    void header(const std::string& name, const std::string& value);

    /**
    Lowercase media type such as `text/plain`, the default one if no `Content-Type` is given.
    **/
    std::string content_type() const;

    /**
    Getting a parameter of the `Content-Type` header.

    @param name Parameter name, case insensitive.
    @return     Parameter value without the quotes, empty if missing.
    **/
    std::string content_type_param(const std::string& name) const;

    /**
    Lowercase `Content-Transfer-Encoding`, `7bit` if missing.
    **/
    std::string transfer_encoding() const;

    /**
    Content as it appears in the entity, without the transfer decoding.
    **/
    const std::string& raw_content() const;

    /**
    Content with the transfer encoding removed.
    **/
    std::string decoded_content() const;

    /**
    Content with the transfer encoding removed and the charset converted to UTF-8, dropping what cannot be converted.
    **/
    std::string text() const;

    /**
    Checking if the entity is a multipart one.
    **/
    bool is_multipart() const;

    /**
    Nested entities of a multipart entity.
    **/
    const std::vector<mime>& parts() const;

    /**
    Finding the first leaf with the exact content type, walking the nested entities depth first.

    @param type Lowercase media type.
    @return     Found entity, null if there is none.
    **/
    const mime* find_first(const std::string& type) const;

protected:

    /**
    Parsing the headers and, unless only those are wanted, the content. An empty text gives an empty entity.
    **/
    void parse_entity(const std::string& text, bool headers_only = false);

    /**
    Splitting the multipart content by the boundary into the nested entities.
    **/
    void parse_parts(const std::string& boundary);

    /**
    Headers of the entity.
    **/
    headers_t headers_;

    /**
    Content of the entity.
    **/
    std::string content_;

    /**
    Nested entities.
    **/
    std::vector<mime> parts_;
};


/**
Mail message, either fetched from the server or composed for sending.
**/
class message : public mime
{
public:

    /**
    Characters surrounding a mail address in the protocol commands.
    **/
    static const std::string ADDRESS_BEGIN_STR;
    static const std::string ADDRESS_END_STR;

    /**
    Maximum number of characters of the body preview.
    **/
    static constexpr std::string::size_type PREVIEW_LENGTH = 500;

    /**
    Getting the raw `Subject` header.
    **/
    std::optional<std::string> subject() const;

    /**
    Setting the subject, encoded when formatted if it is not ASCII.
    **/
    void subject(const std::string& text);

    /**
    Getting the raw `From` header.
    **/
    std::optional<std::string> from() const;

    /**
    Setting the sender address.
    **/
    void from(const std::string& address);

    /**
    Getting the raw `Date` header.
    **/
    std::optional<std::string> date() const;

    /**
    Adding a recipient address.
    **/
    void add_recipient(const std::string& address);

    /**
    Getting the recipient addresses.
    **/
    const std::vector<std::string>& recipients() const;

    /**
    Getting the sender address, as set by `from(const std::string&)`.
    **/
    std::string sender() const;

    /**
    Setting the text content of the message.

    @param body Text in UTF-8.
    @param html Flag if the text is HTML or plain.
    **/
    void content(const std::string& body, bool html);

    /**
    Getting the text content set for sending.
    **/
    const std::string& body() const;

    /**
    Flag if the content set for sending is HTML.
    **/
    bool is_html() const;

    /**
    Body preview of a fetched message.

    A single part message is decoded into UTF-8 whatever its type. Of a multipart message the first `text/plain` entity found depth first is
    decoded, the preview being empty if there is no such entity.

    @param max_chars Number of characters to keep.
    @return          Preview with at most the given number of characters.
    **/
    std::string body_preview(std::string::size_type max_chars = PREVIEW_LENGTH) const;

    /**
    Formatting the message to be sent, as `multipart/alternative` with one text entity in UTF-8.

    @param dot_escape Flag if the lines starting with the dot are escaped, as needed by the SMTP data.
    @return           Message text, lines separated with CRLF and without the trailing line end.
    @throw mime_error No sender or recipient given.
    **/
    std::string format(bool dot_escape = false) const;

protected:

    /**
    Sender address.
    **/
    std::string sender_;

    /**
    Recipient addresses.
    **/
    std::vector<std::string> recipients_;

    /**
    Text content to send.
    **/
    std::string body_;

    /**
    Flag if the text content is HTML.
    **/
    bool html_ = false;
};


/**
Error thrown by the message parsing and formatting.
**/
class mime_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg     Error message.
    @param details Detailed message.
    **/
    mime_error(const std::string& msg, const std::string& details);

    mime_error(const mime_error&) = default;

    mime_error(mime_error&&) = default;

    ~mime_error() = default;

    mime_error& operator=(const mime_error&) = default;

    mime_error& operator=(mime_error&&) = default;

    /**
    Getting the detailed message.
    **/
    std::string details() const;

protected:

    /**
    Detailed message.
    **/
    std::string details_;
};


} // namespace gmcli
