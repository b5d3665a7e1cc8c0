/*

imap.cpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).
Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cctype>
#include <list>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <gmcli/codec.hpp>
#include <gmcli/imap.hpp>
#include <gmcli/log.hpp>


using std::invalid_argument;
using std::list;
using std::make_shared;
using std::out_of_range;
using std::shared_ptr;
using std::stoul;
using std::string;
using std::to_string;
using std::vector;
using std::chrono::milliseconds;
using boost::iequals;
using boost::starts_with;
using boost::algorithm::all;
using boost::algorithm::is_cntrl;
using boost::algorithm::join;


namespace gmcli
{


const string imap::UNTAGGED_RESPONSE{"*"};
const string imap::CONTINUE_RESPONSE{"+"};
const string imap::TOKEN_SEPARATOR_STR{" "};


string imap::to_astring(const string& text)
{
    return codec::surround_string(codec::escape_string(text, "\"\\"));
}


imap::search_condition_t::search_condition_t(imap::search_condition_t::key_type condition_key, const string& condition_value) :
    key(condition_key)
{
    auto string_key = [this, &condition_value](const string& name)
    {
        // Control characters, line breaks among them, cannot appear in a quoted string.
        if (codec::is_ascii(condition_value) && all(condition_value, !is_cntrl()))
            fragments.push_back(name + TOKEN_SEPARATOR_STR + to_astring(condition_value));
        else
        {
            fragments.push_back(name + TOKEN_SEPARATOR_STR + STRING_LITERAL_BEGIN + std::to_string(condition_value.size()) + STRING_LITERAL_END);
            literals.push_back(condition_value);
        }
    };

    switch (key)
    {
        case ALL:
            fragments.push_back("ALL");
            break;

        case SEEN:
            fragments.push_back("SEEN");
            break;

        case UNSEEN:
            fragments.push_back("UNSEEN");
            break;

        case SUBJECT:
            string_key("SUBJECT");
            break;

        case FROM:
            string_key("FROM");
            break;

        default:
            throw imap_error("Invalid search condition.", "Disjunction requires two conditions.");
    }
}


auto imap::search_condition_t::either(const search_condition_t& first, const search_condition_t& second) -> search_condition_t
{
    search_condition_t cond(ALL);
    cond.key = OR;
    cond.fragments = {"OR"};
    cond.append(first);
    cond.append(second);
    return cond;
}


void imap::search_condition_t::append(const search_condition_t& other)
{
    if (other.fragments.empty())
        return;

    // A trailing literal is followed by a fresh fragment, otherwise the text continues the last fragment.
    if (fragments.empty())
        fragments.push_back(other.fragments.front());
    else if (literals.size() == fragments.size())
        fragments.push_back(TOKEN_SEPARATOR_STR + other.fragments.front());
    else
        fragments.back() += TOKEN_SEPARATOR_STR + other.fragments.front();
    fragments.insert(fragments.end(), other.fragments.begin() + 1, other.fragments.end());
    literals.insert(literals.end(), other.literals.begin(), other.literals.end());
}


string imap::search_condition_t::to_string() const
{
    string text;
    for (vector<string>::size_type i = 0; i < fragments.size(); i++)
    {
        text += fragments[i];
        if (i < literals.size())
            text += literals[i];
    }
    return text;
}


string imap::tag_result_response_t::to_string() const
{
    static const char* const RESULT_NAMES[] = {"OK", "NO", "BAD"};
    return tag + " " + (result.has_value() ? RESULT_NAMES[*result] : "<null>") + " " + response;
}


imap::imap(const string& hostname, unsigned port, milliseconds timeout) :
    dlg_(make_shared<dialog>(hostname, port, timeout)), ssl_options_(dialog_ssl::default_options()), tag_(0), optional_part_state_(false),
    atom_state_(atom_state_t::NONE), parenthesis_list_counter_(0), literal_state_(string_literal_state_t::NONE)
{
    dlg_->session_name("imap");
    dlg_->connect();
}


imap::imap(shared_ptr<dialog> dlg) :
    dlg_(dlg), tag_(0), optional_part_state_(false), atom_state_(atom_state_t::NONE), parenthesis_list_counter_(0),
    literal_state_(string_literal_state_t::NONE)
{
}


imap::~imap()
{
    if (dlg_)
        dlg_->close();
}


string imap::authenticate(const string& username, const string& password)
{
    if (ssl_options_.has_value())
        dlg_ = dialog_ssl::to_ssl(dlg_, *ssl_options_);

    string greeting = connect();
    auth_login(username, password);
    return greeting;
}


auto imap::list_folders(const string& pattern) -> vector<mailbox_folder_t>
{
    dlg_->send(format("LIST " + to_astring("") + TOKEN_SEPARATOR_STR + to_astring(pattern)));
    vector<mailbox_folder_t> folders;

    bool has_more = true;
    try
    {
        while (has_more)
        {
            tag_result_response_t parsed_line = receive_response();
            if (parsed_line.tag == UNTAGGED_RESPONSE)
            {
                if (mandatory_part_.empty() || mandatory_part_.front()->token_type != response_token_t::token_type_t::ATOM ||
                    !iequals(mandatory_part_.front()->atom, "LIST"))
                    continue;
                mandatory_part_.pop_front();

                // Attributes, delimiter and the name, in that order.
                if (mandatory_part_.size() < 3)
                    throw imap_error("Listing folders failure.", "Response=`" + parsed_line.response + "`.");
                auto attr_token = mandatory_part_.front();
                mandatory_part_.pop_front();
                auto delim_token = mandatory_part_.front();
                mandatory_part_.pop_front();
                auto name_token = mandatory_part_.front();
                if (attr_token->token_type != response_token_t::token_type_t::LIST || name_token->token_type == response_token_t::token_type_t::LIST)
                    throw imap_error("Parsing failure.", "Response=`" + parsed_line.response + "`.");

                mailbox_folder_t folder;
                for (const auto& tok : attr_token->parenthesized_list)
                {
                    if (tok->token_type != response_token_t::token_type_t::ATOM)
                        continue;
                    folder.attributes.push_back(tok->atom);
                    if (iequals(tok->atom, "\\Noselect") || iequals(tok->atom, "\\NonExistent"))
                        folder.selectable = false;
                }
                if (delim_token->token_type == response_token_t::token_type_t::ATOM && !iequals(delim_token->atom, "NIL"))
                    folder.delimiter = delim_token->atom;
                string raw_name = name_token->token_type == response_token_t::token_type_t::ATOM ? name_token->atom : name_token->literal;
                if (raw_name.empty())
                    continue;
                folder.name = codec::decode_imap_utf7(raw_name);
                folders.push_back(folder);
            }
            else if (parsed_line.tag == to_string(tag_))
            {
                if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
                    throw imap_error("Listing folders failure.", "Response=`" + parsed_line.to_string() + "`.");
                has_more = false;
            }
            else
                throw imap_error("Incorrect tag parsed.", "Tag=`" + parsed_line.tag + "`.");
        }
    }
    catch (const invalid_argument& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    catch (const out_of_range& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }

    reset_response_parser();
    return folders;
}


auto imap::select(const string& mailbox, bool read_only) -> mailbox_stat_t
{
    dlg_->send(format((read_only ? "EXAMINE " : "SELECT ") + to_astring(mailbox)));

    mailbox_stat_t stat;
    bool exists_found = false;
    auto store_counter = [&stat, &exists_found](const string& name, const string& number)
    {
        static const std::pair<const char*, unsigned long mailbox_stat_t::*> COUNTERS[] = {
            {"EXISTS", &mailbox_stat_t::messages_no}, {"RECENT", &mailbox_stat_t::messages_recent},
            {"UNSEEN", &mailbox_stat_t::messages_first_unseen}, {"UIDNEXT", &mailbox_stat_t::uid_next},
            {"UIDVALIDITY", &mailbox_stat_t::uid_validity}};

        for (const auto& counter : COUNTERS)
        {
            if (!iequals(name, counter.first))
                continue;
            try
            {
                stat.*counter.second = stoul(number);
            }
            catch (const invalid_argument& exc)
            {
                throw imap_error("Integer expected.", exc.what());
            }
            catch (const out_of_range& exc)
            {
                throw imap_error("Integer expected.", exc.what());
            }
            if (counter.second == &mailbox_stat_t::messages_no)
                exists_found = true;
        }
    };
    auto atom_pair = [](const list<shared_ptr<response_token_t>>& tokens)
    {
        return tokens.size() == 2 && tokens.front()->token_type == response_token_t::token_type_t::ATOM &&
            tokens.back()->token_type == response_token_t::token_type_t::ATOM;
    };

    for (;;)
    {
        tag_result_response_t reply = receive_response();
        if (reply.tag == to_string(tag_))
        {
            if (reply.result != tag_result_response_t::OK)
                throw imap_error("Select or examine mailbox failure.", "Response=`" + reply.to_string() + "`.");
            break;
        }
        if (reply.tag != UNTAGGED_RESPONSE)
            throw imap_error("Parsing failure.", "Tag=`" + reply.tag + "`.");

        // Response codes come as `* OK [NAME number]`, the counters as `* number NAME`.
        if (reply.result == tag_result_response_t::OK)
        {
            if (atom_pair(optional_part_))
                store_counter(optional_part_.front()->atom, optional_part_.back()->atom);
        }
        else if (atom_pair(mandatory_part_))
            store_counter(mandatory_part_.back()->atom, mandatory_part_.front()->atom);
    }
    reset_response_parser();

    if (!exists_found)
        throw imap_error("No number of existing messages.", "Mailbox=`" + mailbox + "`.");
    return stat;
}


list<unsigned long> imap::search(const list<imap::search_condition_t>& conditions)
{
    search_condition_t criteria(search_condition_t::ALL);
    criteria.fragments.clear();
    for (const auto& c : conditions)
        criteria.append(c);
    if (criteria.fragments.empty())
        criteria = search_condition_t(search_condition_t::ALL);

    string prefix = criteria.literals.empty() ? "SEARCH " : "SEARCH CHARSET " + codec::CHARSET_UTF8 + TOKEN_SEPARATOR_STR;
    criteria.fragments.front() = prefix + criteria.fragments.front();
    send_command(criteria.fragments, criteria.literals);

    list<unsigned long> results;
    bool has_more = true;
    try
    {
        while (has_more)
        {
            tag_result_response_t parsed_line = receive_response();
            if (parsed_line.tag == UNTAGGED_RESPONSE)
            {
                if (mandatory_part_.empty())
                    continue;
                auto search_token = mandatory_part_.front();
                if (search_token->token_type != response_token_t::token_type_t::ATOM || !iequals(search_token->atom, "SEARCH"))
                    continue;
                mandatory_part_.pop_front();

                for (const auto& tok : mandatory_part_)
                    if (tok->token_type == response_token_t::token_type_t::ATOM)
                    {
                        const unsigned long idx = stoul(tok->atom);
                        if (idx == 0)
                            throw imap_error("Incorrect message id.", "Response=`" + parsed_line.response + "`.");
                        results.push_back(idx);
                    }
            }
            else if (parsed_line.tag == to_string(tag_))
            {
                if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
                    throw imap_error("Search mailbox failure.", "Response=`" + parsed_line.to_string() + "`.");

                has_more = false;
            }
            else
                throw imap_error("Incorrect tag parsed.", "Tag=`" + parsed_line.tag + "`.");
        }
    }
    catch (const invalid_argument& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    catch (const out_of_range& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    reset_response_parser();
    return results;
}


string imap::fetch(unsigned long message_no, bool dont_set_seen)
{
    const string fetch_token = dont_set_seen ? "BODY.PEEK[]" : "RFC822";
    dlg_->send(format("FETCH " + to_string(message_no) + TOKEN_SEPARATOR_STR + LIST_BEGIN + fetch_token + LIST_END));

    string msg_str;
    bool found = false;
    bool has_more = true;
    while (has_more)
    {
        tag_result_response_t parsed_line = receive_response();
        if (parsed_line.tag == UNTAGGED_RESPONSE)
        {
            // Sequence number, the fetch atom and the data list.
            if (found || mandatory_part_.size() < 3)
                continue;
            auto it = mandatory_part_.begin();
            if ((*it)->token_type != response_token_t::token_type_t::ATOM || (*it)->atom != to_string(message_no))
                continue;
            ++it;
            if ((*it)->token_type != response_token_t::token_type_t::ATOM || !iequals((*it)->atom, "FETCH"))
                continue;
            ++it;
            if ((*it)->token_type != response_token_t::token_type_t::LIST)
                throw imap_error("Parsing failure.", "Response=`" + parsed_line.response + "`.");
            for (const auto& tok : (*it)->parenthesized_list)
                if (tok->token_type == response_token_t::token_type_t::LITERAL)
                {
                    msg_str = tok->literal;
                    found = true;
                    break;
                }
        }
        else if (parsed_line.tag == to_string(tag_))
        {
            if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
                throw imap_error("Fetching message failure.", "Response=`" + parsed_line.to_string() + "`.");
            has_more = false;
        }
        else
            throw imap_error("Incorrect tag parsed.", "Tag=`" + parsed_line.tag + "`.");
    }
    reset_response_parser();
    if (!found)
        GMCLI_LOG_WARN("IMAP", "no message data for " << message_no);
    return msg_str;
}


void imap::add_flags(unsigned long message_no, const vector<string>& flags)
{
    string flags_s = string(1, LIST_BEGIN) + join(flags, TOKEN_SEPARATOR_STR) + LIST_END;
    dlg_->send(format("STORE " + to_string(message_no) + " +FLAGS " + flags_s));
    receive_status("Storing flags failure.");
}


void imap::close()
{
    dlg_->send(format("CLOSE"));
    receive_status("Closing mailbox failure.");
}


void imap::logout()
{
    dlg_->send(format("LOGOUT"));
    receive_status("Logout failure.");
    dlg_->close();
}


void imap::ssl_options(const std::optional<dialog_ssl::ssl_options_t> options)
{
    ssl_options_ = options;
}


string imap::connect()
{
    // read greetings message
    string line = dlg_->receive();
    tag_result_response_t parsed_line = parse_tag_result(line);

    if (parsed_line.tag != UNTAGGED_RESPONSE)
        throw imap_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
    if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
        throw imap_error("Connection to server failure.", "Line=`" + line + "`.");
    return parsed_line.response;
}


void imap::auth_login(const string& username, const string& password)
{
    auto cmd = format("LOGIN " + to_astring(username) + TOKEN_SEPARATOR_STR + to_astring(password));
    dlg_->mask_next_trace();
    dlg_->send(cmd);

    bool has_more = true;
    while (has_more)
    {
        string line = dlg_->receive();
        tag_result_response_t parsed_line = parse_tag_result(line);

        if (parsed_line.tag == UNTAGGED_RESPONSE)
            continue;
        if (parsed_line.tag != to_string(tag_))
            throw imap_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
        if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
            throw imap_error("Authentication failure.", "Line=`" + line + "`.");

        has_more = false;
    }
}


void imap::send_command(const vector<string>& fragments, const vector<string>& literals)
{
    string line = format(fragments.empty() ? string() : fragments.front());
    for (vector<string>::size_type i = 0; i < literals.size(); i++)
    {
        dlg_->send(line);
        string cont = dlg_->receive();
        if (!starts_with(cont, CONTINUE_RESPONSE))
            throw imap_error("Literal not accepted.", "Line=`" + cont + "`.");
        line = literals[i] + (i + 1 < fragments.size() ? fragments[i + 1] : string());
    }
    dlg_->send(line);
}


void imap::receive_status(const char* error_msg)
{
    bool has_more = true;
    while (has_more)
    {
        string line = dlg_->receive();
        tag_result_response_t parsed_line = parse_tag_result(line);
        if (parsed_line.tag == UNTAGGED_RESPONSE)
            continue;
        if (parsed_line.tag != to_string(tag_))
            throw imap_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
        if (!parsed_line.result.has_value() || parsed_line.result.value() != tag_result_response_t::OK)
            throw imap_error(error_msg, "Line=`" + line + "`.");
        has_more = false;
    }
}


auto imap::receive_response() -> tag_result_response_t
{
    reset_response_parser();
    string line = dlg_->receive();
    tag_result_response_t parsed_line = parse_tag_result(line);
    if (parsed_line.tag != UNTAGGED_RESPONSE)
        return parsed_line;

    try
    {
        parse_response(parsed_line.response);
        while (literal_state_ == string_literal_state_t::READING)
            read_literal();
    }
    catch (const invalid_argument& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    catch (const out_of_range& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    return parsed_line;
}


void imap::read_literal()
{
    auto literal_token = find_pending_literal(optional_part_state_ ? optional_part_ : mandatory_part_);
    if (literal_token == nullptr)
        throw imap_error("Parser failure.", "No literal to read.");
    literal_token->literal = dlg_->receive_bytes(stoul(literal_token->literal_size));
    literal_state_ = string_literal_state_t::NONE;

    // The response continues on the line right after the literal.
    parse_response(dlg_->receive());
}


auto imap::parse_tag_result(const string& line) const -> tag_result_response_t
{
    static const std::pair<const char*, tag_result_response_t::result_t> RESULTS[] = {
        {"OK", tag_result_response_t::OK}, {"NO", tag_result_response_t::NO}, {"BAD", tag_result_response_t::BAD}};

    const string::size_type tag_end = line.find(TOKEN_SEPARATOR_STR);
    if (tag_end == string::npos)
        throw imap_error("Parsing failure.", "Line=`" + line + "`.");

    const string::size_type word_end = line.find(TOKEN_SEPARATOR_STR, tag_end + 1);
    const string word = line.substr(tag_end + 1, word_end == string::npos ? string::npos : word_end - tag_end - 1);
    for (const auto& candidate : RESULTS)
        if (iequals(word, candidate.first))
            return tag_result_response_t(line.substr(0, tag_end), candidate.second, word_end == string::npos ? string() : line.substr(word_end + 1));
    return tag_result_response_t(line.substr(0, tag_end), std::nullopt, line.substr(tag_end + 1));
}


/*
The response content consists of the optional part, enclosed in square brackets, and the mandatory part. Both are sequences of atoms, string
literals and parenthesized lists, the lists containing the same three kinds recursively. The grammar is parsed in one pass, character by character:
1. a square bracket opens or closes the optional part
2. a brace starts the literal size, the literal itself follows the line and is read by `read_literal()`
3. a parenthesis opens or closes a list, tracked by the parenthesis counter
4. a double quote starts a quoted atom, in which the backslash escapes the next character
5. any other character belongs to a plain atom or to the literal size

A read character belongs to the last token of the sequence at the current parenthesis depth, which is found by `find_last_token_list()`. The parser
state is kept between calls, so the line following a literal continues the same response.
*/
void imap::parse_response(const string& response)
{
    list<shared_ptr<imap::response_token_t>>* token_list = nullptr;
    shared_ptr<response_token_t> cur_token;
    bool escaped = false;

    auto new_token = [&](response_token_t::token_type_t type)
    {
        cur_token = make_shared<response_token_t>();
        cur_token->token_type = type;
        token_list = optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
        token_list->push_back(cur_token);
    };

    for (auto ch : response)
    {
        if (atom_state_ == atom_state_t::QUOTED)
        {
            if (escaped)
            {
                cur_token->atom += ch;
                escaped = false;
            }
            else if (ch == codec::BACKSLASH_CHAR)
                escaped = true;
            else if (ch == QUOTED_ATOM)
                atom_state_ = atom_state_t::NONE;
            else
                cur_token->atom += ch;
            continue;
        }

        switch (ch)
        {
            case OPTIONAL_BEGIN:
            {
                if (optional_part_state_)
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                optional_part_state_ = true;
                atom_state_ = atom_state_t::NONE;
            }
            break;

            case OPTIONAL_END:
            {
                if (!optional_part_state_)
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                optional_part_state_ = false;
                atom_state_ = atom_state_t::NONE;
            }
            break;

            case LIST_BEGIN:
            {
                new_token(response_token_t::token_type_t::LIST);
                parenthesis_list_counter_++;
                atom_state_ = atom_state_t::NONE;
            }
            break;

            case LIST_END:
            {
                if (parenthesis_list_counter_ == 0)
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                parenthesis_list_counter_--;
                atom_state_ = atom_state_t::NONE;
            }
            break;

            case STRING_LITERAL_BEGIN:
            {
                if (literal_state_ == string_literal_state_t::SIZE)
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                new_token(response_token_t::token_type_t::LITERAL);
                literal_state_ = string_literal_state_t::SIZE;
                atom_state_ = atom_state_t::NONE;
            }
            break;

            case STRING_LITERAL_END:
            {
                if (literal_state_ != string_literal_state_t::SIZE || cur_token->literal_size.empty())
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                literal_state_ = string_literal_state_t::WAITING;
            }
            break;

            case TOKEN_SEPARATOR_CHAR:
                atom_state_ = atom_state_t::NONE;
                break;

            case QUOTED_ATOM:
            {
                new_token(response_token_t::token_type_t::ATOM);
                atom_state_ = atom_state_t::QUOTED;
                escaped = false;
            }
            break;

            default:
            {
                if (literal_state_ == string_literal_state_t::SIZE)
                {
                    if (!std::isdigit(static_cast<unsigned char>(ch)))
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");
                    cur_token->literal_size += ch;
                }
                else if (literal_state_ == string_literal_state_t::WAITING)
                {
                    // no characters allowed after the right brace, crlf is required
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                }
                else
                {
                    if (atom_state_ == atom_state_t::NONE)
                    {
                        new_token(response_token_t::token_type_t::ATOM);
                        atom_state_ = atom_state_t::PLAIN;
                    }
                    cur_token->atom += ch;
                }
            }
        }
    }

    if (atom_state_ == atom_state_t::QUOTED)
        throw imap_error("Parser failure.", "Unterminated quoted string.");
    atom_state_ = atom_state_t::NONE;
    if (literal_state_ == string_literal_state_t::WAITING)
        literal_state_ = string_literal_state_t::READING;
    else if (literal_state_ == string_literal_state_t::SIZE)
        throw imap_error("Parser failure.", "Unterminated literal size.");
}


void imap::reset_response_parser()
{
    optional_part_.clear();
    mandatory_part_.clear();
    optional_part_state_ = false;
    atom_state_ = atom_state_t::NONE;
    parenthesis_list_counter_ = 0;
    literal_state_ = string_literal_state_t::NONE;
}


string imap::format(const string& command)
{
    return to_string(++tag_) + TOKEN_SEPARATOR_STR + command;
}


list<shared_ptr<imap::response_token_t>>* imap::find_last_token_list(list<shared_ptr<response_token_t>>& token_list)
{
    list<shared_ptr<response_token_t>>* list_ptr = &token_list;
    unsigned int depth = 1;
    while (!list_ptr->empty() && list_ptr->back()->token_type == response_token_t::token_type_t::LIST && depth <= parenthesis_list_counter_)
    {
        list_ptr = &(list_ptr->back()->parenthesized_list);
        depth++;
    }
    return list_ptr;
}


shared_ptr<imap::response_token_t> imap::find_pending_literal(const list<shared_ptr<response_token_t>>& token_list) const
{
    shared_ptr<response_token_t> pending;
    for (const auto& tok : token_list)
    {
        if (tok->token_type == response_token_t::token_type_t::LITERAL)
            pending = tok;
        else if (tok->token_type == response_token_t::token_type_t::LIST)
        {
            auto nested = find_pending_literal(tok->parenthesized_list);
            if (nested != nullptr)
                pending = nested;
        }
    }
    return pending;
}


imap_error::imap_error(const string& msg, const string& details) : dialog_error(msg, details)
{
}


imap_error::imap_error(const char* msg, const string& details) : dialog_error(msg, details)
{
}


} // namespace gmcli
