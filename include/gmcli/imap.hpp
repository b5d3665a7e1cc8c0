/*

imap.hpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).
Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "dialog.hpp"


namespace gmcli
{


/**
IMAP client over the implicit TLS.
**/
class imap
{
public:

    /**
    Counters reported when a mailbox is selected. Zero stands for the counter the server did not report.
    **/
    struct mailbox_stat_t
    {
        /**
        `EXISTS`, the highest sequence number.
        **/
        unsigned long messages_no;

        unsigned long messages_recent;

        /**
        Sequence number from the `UNSEEN` response code.
        **/
        unsigned long messages_first_unseen;

        unsigned long uid_next;

        unsigned long uid_validity;

        mailbox_stat_t() : messages_no(0), messages_recent(0), messages_first_unseen(0), uid_next(0), uid_validity(0)
        {
        }
    };

    /**
    Mailbox folder as listed by the server.
    **/
    struct mailbox_folder_t
    {
        /**
        Full folder name, decoded from the modified UTF-7.
        **/
        std::string name;

        /**
        Hierarchy delimiter, empty if the server reports none.
        **/
        std::string delimiter;

        /**
        Folder attributes such as `\Noselect` or `\HasChildren`.
        **/
        std::vector<std::string> attributes;

        /**
        Flag if the folder can be selected.
        **/
        bool selectable = true;
    };

    /**
    One or more search keys joined into the `SEARCH` arguments.

    The IMAP string is kept as fragments interleaved with the string literals, so that eight bit values can be sent under
    `CHARSET UTF-8`: the command is `fragments[0] literals[0] fragments[1] ...`, each fragment followed by a literal ending with the literal
    size marker.
    **/
    struct search_condition_t
    {
        /**
        Search key. `SUBJECT` and `FROM` take a substring to match, `OR` is only built by `either()` and the rest take no value.
        **/
        enum key_type {ALL, SEEN, UNSEEN, SUBJECT, FROM, OR} key;

        /**
        Command text around the literals.
        **/
        std::vector<std::string> fragments;

        /**
        Eight bit values sent as the string literals.
        **/
        std::vector<std::string> literals;

        /**
        Building the arguments of a single key.

        @param condition_key   Search key.
        @param condition_value Value to search for, ignored by the keys without a value.
        @throw imap_error      Invalid search condition.
        **/
        search_condition_t(key_type condition_key, const std::string& condition_value = std::string());

        /**
        Creating the disjunction of two conditions.
        **/
        static search_condition_t either(const search_condition_t& first, const search_condition_t& second);

        /**
        Appending another condition, separated by the space.
        **/
        void append(const search_condition_t& other);

        /**
        Printable form, with the literals inlined.
        **/
        std::string to_string() const;
    };

    /**
    Opening the TCP connection, the TLS is set up by `authenticate()`.

    @param host    Server name.
    @param port    Server port.
    @param timeout Limit of each network operation, zero for blocking ones.
    @throw *       `dialog::connect()`.
    **/
    imap(const std::string& host, unsigned port, std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /**
    Using an already connected dialog, without switching to TLS.

    @param dlg Dialog to talk over.
    **/
    explicit imap(std::shared_ptr<dialog> dlg);

    /**
    Closing the connection, without any protocol exchange.
    **/
    virtual ~imap();

    imap(const imap&) = delete;

    imap(imap&&) = delete;

    void operator=(const imap&) = delete;

    void operator=(imap&&) = delete;

    /**
    Switching to TLS, reading the greeting and logging in. Called once per connection.

    @param username Account address.
    @param password Application password.
    @return         Greeting line of the server.
    @throw *        `dialog_ssl::to_ssl()`, `connect()`, `auth_login(const string&, const string&)`.
    **/
    std::string authenticate(const std::string& username, const std::string& password);

    /**
    Listing folders matching the pattern.

    @param pattern    Mailbox pattern, `*` for all folders.
    @return           Folders in the server order.
    @throw imap_error Listing folders failure.
    @throw imap_error Parsing failure.
    **/
    std::vector<mailbox_folder_t> list_folders(const std::string& pattern = "*");

    /**
    Opening a mailbox with `SELECT`, or with `EXAMINE` when it is not to be modified.

    @param mailbox    Mailbox name.
    @param read_only  Flag to use `EXAMINE`.
    @return           Counters of the mailbox.
    @throw imap_error Select or examine mailbox failure.
    @throw imap_error No number of existing messages.
    **/
    mailbox_stat_t select(const std::string& mailbox, bool read_only = false);

    /**
    Searching the selected mailbox.

    Conditions with the eight bit values are sent as literals with `CHARSET UTF-8`.

    @param conditions Conditions to satisfy, all of them.
    @return           Message sequence numbers in the server order.
    @throw imap_error Search mailbox failure.
    @throw imap_error Parsing failure.
    **/
    std::list<unsigned long> search(const std::list<search_condition_t>& conditions);

    /**
    Fetching a message from the selected mailbox.

    @param message_no    Sequence number of the message.
    @param dont_set_seen Use the PEEK semantics so the `\Seen` flag is not set.
    @return              Raw message, empty if the server returned none.
    @throw imap_error    Fetching message failure.
    @throw imap_error    Parsing failure.
    **/
    std::string fetch(unsigned long message_no, bool dont_set_seen = false);

    /**
    Adding flags to a message of the selected mailbox.

    @param message_no Sequence number of the message.
    @param flags      Flags to add, such as `\Seen`.
    @throw imap_error Storing flags failure.
    **/
    void add_flags(unsigned long message_no, const std::vector<std::string>& flags);

    /**
    Closing the selected mailbox.

    @throw imap_error Closing mailbox failure.
    **/
    void close();

    /**
    Logging out and closing the connection.

    @throw imap_error Logout failure.
    **/
    void logout();

    /**
    Setting SSL options, none for the plain connection.
    **/
    void ssl_options(const std::optional<dialog_ssl::ssl_options_t> options);

    /**
    Quoting the text as the IMAP string.
    **/
    static std::string to_astring(const std::string& text);

protected:

    /**
    Untagged response character.
    **/
    static const std::string UNTAGGED_RESPONSE;

    /**
    Continuation response character.
    **/
    static const std::string CONTINUE_RESPONSE;

    /**
    Token separator.
    **/
    static const std::string TOKEN_SEPARATOR_STR;
    static const char TOKEN_SEPARATOR_CHAR = ' ';

    /**
    Character to mark optional part of a response.
    **/
    static const char OPTIONAL_BEGIN = '[';
    static const char OPTIONAL_END = ']';

    /**
    Character to mark a parenthesized list.
    **/
    static const char LIST_BEGIN = '(';
    static const char LIST_END = ')';

    /**
    Characters to mark a string literal size.
    **/
    static const char STRING_LITERAL_BEGIN = '{';
    static const char STRING_LITERAL_END = '}';

    /**
    Quoted atom delimiter.
    **/
    static const char QUOTED_ATOM = '"';

    /**
    Tagged response line.
    **/
    struct tag_result_response_t
    {
        /**
        Possible response results.
        **/
        enum result_t {OK, NO, BAD};

        /**
        Tag of the response, `*` for untagged, `+` for continuation.
        **/
        std::string tag;

        /**
        Result of the tagged response, none for the untagged data.
        **/
        std::optional<result_t> result;

        /**
        Rest of the response line.
        **/
        std::string response;

        tag_result_response_t(const std::string& parsed_tag, const std::optional<result_t>& parsed_result, const std::string& parsed_response) :
            tag(parsed_tag), result(parsed_result), response(parsed_response)
        {
        }

        /**
        Formatting the response line back for error messages.
        **/
        std::string to_string() const;
    };

    /**
    Reading the untagged `OK` greeting.

    @throw imap_error Connection to server failure.
    **/
    std::string connect();

    /**
    Authenticating with the LOGIN command.

    @throw imap_error Authentication failure.
    **/
    void auth_login(const std::string& username, const std::string& password);

    /**
    Sending the tagged command, waiting for the continuation before each string literal.

    @param fragments Command text around the literals.
    @param literals  String literals.
    @throw imap_error Literal not accepted.
    **/
    void send_command(const std::vector<std::string>& fragments, const std::vector<std::string>& literals);

    /**
    Reading the response lines of a command which returns no data, up to the tagged one.

    @param error_msg  Message of the thrown error when the result is not OK.
    @throw imap_error The given message.
    **/
    void receive_status(const char* error_msg);

    /**
    Reading the next response, including the string literals and the lines following them.

    Untagged responses are parsed into the optional and mandatory parts, tagged and continuation ones only into the tag and result.

    @return           The first line of the response.
    @throw imap_error Parsing failure.
    **/
    tag_result_response_t receive_response();

    /**
    Parsing the response line into the tag, result and the rest of the line.

    @param line       Response line.
    @return           Parsed line.
    @throw imap_error Parsing failure.
    **/
    tag_result_response_t parse_tag_result(const std::string& line) const;

    /**
    Parsing the response into the optional and mandatory tokens.

    @param response   Response line without the tag and result.
    @throw imap_error Parser failure.
    **/
    void parse_response(const std::string& response);

    /**
    Resetting the parser state for the next response.
    **/
    void reset_response_parser();

    /**
    Prepending the next tag to the command.
    **/
    std::string format(const std::string& command);

    std::shared_ptr<dialog> dlg_;

    /**
    TLS settings applied by `authenticate()`, none to stay on the plain connection.
    **/
    std::optional<dialog_ssl::ssl_options_t> ssl_options_;

    /**
    Number of the last sent command.
    **/
    unsigned tag_;

    /**
    Parsed piece of a response: an atom, a string literal or a list of further tokens. Only the member matching `token_type` is filled.
    **/
    struct response_token_t
    {
        /**
        `EMPTY` until the first character decides the kind.
        **/
        enum class token_type_t {EMPTY, ATOM, LITERAL, LIST} token_type;

        std::string atom;

        std::string literal;

        /**
        Digits between the braces, collected before the literal bytes arrive.
        **/
        std::string literal_size;

        std::list<std::shared_ptr<response_token_t>> parenthesized_list;

        response_token_t() : token_type(token_type_t::EMPTY)
        {
        }
    };

    /**
    Tokens inside the square brackets, the response code.
    **/
    std::list<std::shared_ptr<response_token_t>> optional_part_;

    /**
    Tokens outside the square brackets.
    **/
    std::list<std::shared_ptr<response_token_t>> mandatory_part_;

    /**
    Flag if the parser is inside the square brackets.
    **/
    bool optional_part_state_;

    enum class atom_state_t {NONE, PLAIN, QUOTED} atom_state_;

    /**
    Depth of the currently open lists.
    **/
    unsigned int parenthesis_list_counter_;

    enum class string_literal_state_t {NONE, SIZE, WAITING, READING, DONE} literal_state_;

    /**
    Descending into the innermost open list of the sequence.

    @param token_list Top level sequence.
    @return           Sequence receiving the next token.
    **/
    std::list<std::shared_ptr<response_token_t>>* find_last_token_list(std::list<std::shared_ptr<response_token_t>>& token_list);

    /**
    Finding the literal token waiting to be read, which is the last literal at any depth.

    @param token_list Top level sequence.
    @return           Literal token, null if there is none.
    **/
    std::shared_ptr<response_token_t> find_pending_literal(const std::list<std::shared_ptr<response_token_t>>& token_list) const;

    /**
    Reading the pending string literal with the exact size, followed by the rest of the response line.

    @throw imap_error Parsing failure.
    **/
    void read_literal();
};


/**
IMAP protocol failure, the details carrying the offending server line.
**/
class imap_error : public dialog_error
{
public:

    imap_error(const std::string& msg, const std::string& details);

    imap_error(const char* msg, const std::string& details);

    imap_error(const imap_error&) = default;

    imap_error(imap_error&&) = default;

    ~imap_error() = default;

    imap_error& operator=(const imap_error&) = default;

    imap_error& operator=(imap_error&&) = default;
};


} // namespace gmcli
