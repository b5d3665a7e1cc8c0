/*

message.cpp
-----------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <locale>
#include <sstream>
#include <string>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <gmcli/codec.hpp>
#include <gmcli/message.hpp>
#include <gmcli/sha256.hpp>


using std::optional;
using std::string;
using std::stringstream;
using std::vector;
using boost::iequals;
using boost::starts_with;
using boost::algorithm::join;
using boost::algorithm::to_lower_copy;
using boost::algorithm::trim_copy;
using boost::algorithm::trim_left_copy;
using boost::algorithm::trim_right_copy;
using boost::posix_time::ptime;
using boost::posix_time::second_clock;
using boost::posix_time::time_facet;


namespace gmcli
{


namespace
{

/**
Next line of the text starting at the given position, without its line end.

@param text Text to read from.
@param pos  Position of the line, moved to the next one.
@return     Line read.
**/
string next_line(const string& text, string::size_type& pos)
{
    string::size_type eol = text.find(codec::LF_CHAR, pos);
    string line = text.substr(pos, eol == string::npos ? string::npos : eol - pos);
    pos = eol == string::npos ? text.size() : eol + 1;
    if (!line.empty() && line.back() == codec::CR_CHAR)
        line.pop_back();
    return line;
}


/**
Splitting the text into lines by the LF, removing the CR before it.
**/
vector<string> split_lines(const string& text)
{
    vector<string> lines;
    string::size_type pos = 0;
    do
        lines.push_back(next_line(text, pos));
    while (pos < text.size());
    return lines;
}


/**
Date in the RFC 5322 format, in UTC.
**/
string format_date(const ptime& time)
{
    stringstream ss;
    ss.imbue(std::locale(std::locale::classic(), new time_facet("%a, %d %b %Y %H:%M:%S +0000")));
    ss << time;
    return ss.str();
}

} // anonymous namespace


const string mime::DEFAULT_CONTENT_TYPE{"text/plain"};
const string message::ADDRESS_BEGIN_STR{"<"};
const string message::ADDRESS_END_STR{">"};


void mime::parse(const string& text)
{
    if (trim_copy(text).empty())
        throw mime_error("Parsing failure.", "Empty message.");
    parse_entity(text);
}


void mime::parse_headers(const string& text)
{
    if (trim_copy(text).empty())
        throw mime_error("Parsing failure.", "Empty message.");
    parse_entity(text, true);
}


void mime::parse_entity(const string& text, bool headers_only)
{
    headers_.clear();
    content_.clear();
    parts_.clear();

    string::size_type pos = 0;
    auto last_header = headers_.end();
    bool body_found = false;
    while (pos < text.size())
    {
        string line = next_line(text, pos);
        if (line.empty())
        {
            body_found = true;
            break;
        }

        if (line.front() == codec::SPACE_CHAR || line.front() == codec::TAB_CHAR)
        {
            if (last_header != headers_.end())
                last_header->second += line;
            continue;
        }

        string::size_type colon = line.find(HEADER_SEPARATOR_CHAR);
        if (colon == string::npos || colon == 0)
            continue;
        string name = trim_copy(line.substr(0, colon));
        last_header = headers_.emplace(name, trim_left_copy(line.substr(colon + 1)));
    }

    if (headers_only)
        return;
    if (body_found)
        content_ = text.substr(pos);

    if (is_multipart())
    {
        string boundary = content_type_param("boundary");
        if (!boundary.empty())
            parse_parts(boundary);
    }
}


void mime::parse_parts(const string& boundary)
{
    const string delimiter = "--" + boundary;
    string::size_type pos = 0;
    string::size_type part_begin = 0;
    bool in_part = false;

    auto add_part = [this, &part_begin](string::size_type part_end)
    {
        // The line end before the delimiter belongs to the delimiter.
        if (part_end > part_begin && content_[part_end - 1] == codec::LF_CHAR)
            part_end--;
        if (part_end > part_begin && content_[part_end - 1] == codec::CR_CHAR)
            part_end--;
        mime part;
        part.parse_entity(content_.substr(part_begin, part_end - part_begin));
        parts_.push_back(part);
    };

    while (pos < content_.size())
    {
        string::size_type line_begin = pos;
        string line = next_line(content_, pos);
        if (!starts_with(line, delimiter))
            continue;

        string rest = trim_right_copy(line.substr(delimiter.size()));
        bool closing = rest == "--";
        if (!rest.empty() && !closing)
            continue;

        if (in_part)
            add_part(line_begin);
        if (closing)
            return;
        in_part = true;
        part_begin = pos;
    }

    // Missing closing delimiter, the last part runs to the end.
    if (in_part)
        add_part(content_.size());
}


auto mime::headers() const -> const headers_t&
{
    return headers_;
}


optional<string> mime::header(const string& name) const
{
    auto it = headers_.find(name);
    if (it == headers_.end())
        return std::nullopt;
    return it->second;
}


void mime::header(const string& name, const string& value)
{
    headers_.erase(name);
    headers_.emplace(name, value);
}


string mime::content_type() const
{
    auto value = header("Content-Type");
    if (!value.has_value())
        return DEFAULT_CONTENT_TYPE;
    string type = to_lower_copy(trim_copy(value->substr(0, value->find(';'))));
    return type.empty() ? DEFAULT_CONTENT_TYPE : type;
}


string mime::content_type_param(const string& name) const
{
    auto value = header("Content-Type");
    if (!value.has_value())
        return "";

    // Parameters are separated by semicolons outside of the quoted strings.
    vector<string> params;
    string param;
    bool quoted = false;
    for (string::size_type i = value->find(';'); i != string::npos && i < value->size(); i++)
    {
        char ch = (*value)[i];
        if (ch == codec::QUOTE_CHAR)
            quoted = !quoted;
        if (ch == ';' && !quoted)
        {
            params.push_back(param);
            param.clear();
        }
        else
            param += ch;
    }
    params.push_back(param);

    for (const auto& p : params)
    {
        string::size_type eq = p.find(codec::EQUAL_CHAR);
        if (eq == string::npos || !iequals(trim_copy(p.substr(0, eq)), name))
            continue;
        string val = trim_copy(p.substr(eq + 1));
        if (val.size() >= 2 && val.front() == codec::QUOTE_CHAR && val.back() == codec::QUOTE_CHAR)
        {
            string unquoted;
            for (string::size_type i = 1; i + 1 < val.size(); i++)
            {
                if (val[i] == codec::BACKSLASH_CHAR && i + 2 < val.size())
                    i++;
                unquoted += val[i];
            }
            val = unquoted;
        }
        return val;
    }
    return "";
}


string mime::transfer_encoding() const
{
    auto value = header("Content-Transfer-Encoding");
    if (!value.has_value() || trim_copy(*value).empty())
        return "7bit";
    return to_lower_copy(trim_copy(*value));
}


const string& mime::raw_content() const
{
    return content_;
}


string mime::decoded_content() const
{
    string encoding = transfer_encoding();
    if (encoding == "base64")
        return codec::base64_decode(content_);
    if (encoding == "quoted-printable")
        return codec::quoted_printable_decode(content_);
    return content_;
}


string mime::text() const
{
    string charset = content_type_param("charset");
    return codec::to_utf8(decoded_content(), charset.empty() ? codec::CHARSET_ASCII : charset);
}


bool mime::is_multipart() const
{
    return starts_with(content_type(), "multipart/");
}


const vector<mime>& mime::parts() const
{
    return parts_;
}


const mime* mime::find_first(const string& type) const
{
    if (!is_multipart())
        return content_type() == type ? this : nullptr;

    for (const auto& part : parts_)
    {
        const mime* found = part.find_first(type);
        if (found != nullptr)
            return found;
    }
    return nullptr;
}


optional<string> message::subject() const
{
    return header("Subject");
}


void message::subject(const string& text)
{
    header("Subject", text);
}


optional<string> message::from() const
{
    return header("From");
}


void message::from(const string& address)
{
    sender_ = address;
    header("From", address);
}


optional<string> message::date() const
{
    return header("Date");
}


void message::add_recipient(const string& address)
{
    recipients_.push_back(address);
    header("To", join(recipients_, ", "));
}


const vector<string>& message::recipients() const
{
    return recipients_;
}


string message::sender() const
{
    return sender_;
}


void message::content(const string& body, bool html)
{
    body_ = body;
    html_ = html;
}


const string& message::body() const
{
    return body_;
}


bool message::is_html() const
{
    return html_;
}


string message::body_preview(string::size_type max_chars) const
{
    if (!is_multipart())
        return codec::truncate_utf8(text(), max_chars);

    const mime* plain = find_first(DEFAULT_CONTENT_TYPE);
    if (plain == nullptr)
        return "";
    return codec::truncate_utf8(plain->text(), max_chars);
}


string message::format(bool dot_escape) const
{
    if (sender_.empty())
        throw mime_error("Formatting failure.", "No sender address.");
    if (recipients_.empty())
        throw mime_error("Formatting failure.", "No recipient address.");
    auto reject_line_break = [](const string& header, const string& value)
    {
        if (value.find_first_of("\r\n") != string::npos)
            throw mime_error("Formatting failure.", "Line break in the " + header + " header.");
    };
    reject_line_break("From", sender_);
    for (const auto& rcpt : recipients_)
        reject_line_break("To", rcpt);
    reject_line_break("Subject", subject().value_or(""));

    string subject_s = subject().value_or("");
    if (!codec::is_ascii(subject_s))
        subject_s = codec::encode_header_value(subject_s);
    string::size_type at_pos = sender_.find('@');
    string domain = at_pos == string::npos ? "localhost" : sender_.substr(at_pos + 1);
    const string boundary = "=_" + unique_token(sender_ + recipients_.front(), 40);

    vector<string> lines;
    lines.push_back("From: " + sender_);
    lines.push_back("To: " + join(recipients_, ", "));
    lines.push_back("Subject: " + subject_s);
    lines.push_back("Date: " + format_date(second_clock::universal_time()));
    lines.push_back("Message-ID: " + ADDRESS_BEGIN_STR + unique_token(sender_) + "@" + domain + ADDRESS_END_STR);
    lines.push_back("MIME-Version: 1.0");
    lines.push_back("Content-Type: multipart/alternative; boundary=" + codec::surround_string(boundary));
    lines.push_back("");
    lines.push_back("--" + boundary);
    lines.push_back(string("Content-Type: ") + (html_ ? "text/html" : "text/plain") + "; charset=" + codec::CHARSET_UTF8);

    vector<string> body_lines = split_lines(body_);
    bool seven_bit = codec::is_ascii(body_);
    for (const auto& l : body_lines)
        if (l.size() > static_cast<string::size_type>(codec::line_len_policy_t::MANDATORY))
            seven_bit = false;
    if (!seven_bit)
        body_lines = codec::quoted_printable_encode(body_);
    lines.push_back(string("Content-Transfer-Encoding: ") + (seven_bit ? "7bit" : "quoted-printable"));
    lines.push_back("");
    lines.insert(lines.end(), body_lines.begin(), body_lines.end());
    lines.push_back("--" + boundary + "--");

    if (dot_escape)
        for (auto& l : lines)
            if (!l.empty() && l.front() == codec::DOT_CHAR)
                l.insert(l.begin(), codec::DOT_CHAR);
    return join(lines, codec::END_OF_LINE);
}


mime_error::mime_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string mime_error::details() const
{
    return details_;
}


} // namespace gmcli
