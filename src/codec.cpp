/*

codec.cpp
---------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/regex.hpp>
#include <gmcli/codec.hpp>


using std::string;
using std::u16string;
using std::vector;
using boost::algorithm::all;
using boost::algorithm::is_space;
using boost::algorithm::to_lower_copy;
using boost::iequals;
using boost::regex;
using boost::smatch;
using boost::sregex_iterator;
namespace conv = boost::locale::conv;


namespace gmcli
{


const string codec::END_OF_LINE{"\r\n"};
const string codec::END_OF_MESSAGE{"."};
const string codec::CHARSET_UTF8{"UTF-8"};
const string codec::CHARSET_ASCII{"US-ASCII"};


namespace
{

const string BASE64_CHARS{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
const string HEX_DIGITS{"0123456789ABCDEF"};

// charset, encoding, encoded text
const regex ENCODED_WORD{R"(=\?([^?\s]+)\?([QqBb])\?([^?\s]*)\?=)"};

// Raw bytes per encoded word chunk, so that the Base64 word stays within 75 characters.
const string::size_type ENCODED_WORD_CHUNK = 45;


int hex_value(char ch)
{
    auto pos = HEX_DIGITS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    return pos == string::npos ? -1 : static_cast<int>(pos);
}


bool is_utf8_lead(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
}


string encode_qp_char(char ch)
{
    auto byte = static_cast<unsigned char>(ch);
    string enc{codec::EQUAL_CHAR};
    enc += HEX_DIGITS[byte >> 4];
    enc += HEX_DIGITS[byte & 0x0F];
    return enc;
}

} // anonymous namespace


string codec::escape_string(const string& text, const string& escaping_chars)
{
    string esc_str;
    esc_str.reserve(text.size());
    for (auto ch : text)
    {
        if (escaping_chars.find(ch) != string::npos)
            esc_str += BACKSLASH_CHAR;
        esc_str += ch;
    }
    return esc_str;
}


string codec::surround_string(const string& text, char surround_char)
{
    return surround_char + text + surround_char;
}


bool codec::is_ascii(const string& text)
{
    return std::all_of(text.begin(), text.end(), [](char ch) { return static_cast<unsigned char>(ch) < 0x80; });
}


vector<string> codec::base64_encode(const string& text, string::size_type line_len)
{
    string encoded;
    encoded.reserve((text.size() + 2) / 3 * 4);
    string::size_type i = 0;
    for (; i + 2 < text.size(); i += 3)
    {
        unsigned long triple = (static_cast<unsigned char>(text[i]) << 16) | (static_cast<unsigned char>(text[i + 1]) << 8) |
            static_cast<unsigned char>(text[i + 2]);
        encoded += BASE64_CHARS[(triple >> 18) & 0x3F];
        encoded += BASE64_CHARS[(triple >> 12) & 0x3F];
        encoded += BASE64_CHARS[(triple >> 6) & 0x3F];
        encoded += BASE64_CHARS[triple & 0x3F];
    }
    if (i < text.size())
    {
        unsigned long triple = static_cast<unsigned char>(text[i]) << 16;
        if (i + 1 < text.size())
            triple |= static_cast<unsigned char>(text[i + 1]) << 8;
        encoded += BASE64_CHARS[(triple >> 18) & 0x3F];
        encoded += BASE64_CHARS[(triple >> 12) & 0x3F];
        encoded += (i + 1 < text.size()) ? BASE64_CHARS[(triple >> 6) & 0x3F] : EQUAL_CHAR;
        encoded += EQUAL_CHAR;
    }

    vector<string> lines;
    if (encoded.empty())
        return lines;
    if (line_len == 0)
    {
        lines.push_back(encoded);
        return lines;
    }
    for (string::size_type pos = 0; pos < encoded.size(); pos += line_len)
        lines.push_back(encoded.substr(pos, line_len));
    return lines;
}


string codec::base64_decode(const string& text)
{
    string decoded;
    decoded.reserve(text.size() * 3 / 4);
    unsigned long bits = 0;
    int bit_count = 0;
    for (auto ch : text)
    {
        if (ch == EQUAL_CHAR)
            break;
        auto pos = BASE64_CHARS.find(ch);
        if (pos == string::npos)
            continue;
        bits = (bits << 6) | pos;
        bit_count += 6;
        if (bit_count >= 8)
        {
            bit_count -= 8;
            decoded += static_cast<char>((bits >> bit_count) & 0xFF);
        }
    }
    return decoded;
}


vector<string> codec::quoted_printable_encode(const string& text)
{
    vector<string> lines;
    const string::size_type max_len = static_cast<string::size_type>(line_len_policy_t::RECOMMENDED) - 1;
    string::size_type start = 0;
    while (start <= text.size())
    {
        string::size_type end = text.find(LF_CHAR, start);
        string line = text.substr(start, end == string::npos ? string::npos : end - start);
        if (!line.empty() && line.back() == CR_CHAR)
            line.pop_back();

        string enc_line;
        for (string::size_type i = 0; i < line.size(); i++)
        {
            char ch = line[i];
            auto byte = static_cast<unsigned char>(ch);
            bool trailing_space = (ch == SPACE_CHAR || ch == TAB_CHAR) && i + 1 == line.size();
            string token = (ch == EQUAL_CHAR || byte > 126 || (byte < 32 && ch != TAB_CHAR) || trailing_space) ? encode_qp_char(ch) : string(1, ch);
            if (enc_line.size() + token.size() > max_len)
            {
                lines.push_back(enc_line + EQUAL_CHAR);
                enc_line.clear();
            }
            enc_line += token;
        }
        lines.push_back(enc_line);

        if (end == string::npos)
            break;
        start = end + 1;
    }
    return lines;
}


string codec::quoted_printable_decode(const string& text, bool q_codec)
{
    string decoded;
    decoded.reserve(text.size());
    for (string::size_type i = 0; i < text.size(); i++)
    {
        char ch = text[i];
        if (ch == '_' && q_codec)
            decoded += SPACE_CHAR;
        else if (ch == EQUAL_CHAR)
        {
            // Soft line break, possibly with LF only.
            if (i + 1 < text.size() && text[i + 1] == LF_CHAR)
            {
                i += 1;
                continue;
            }
            if (i + 2 < text.size() && text[i + 1] == CR_CHAR && text[i + 2] == LF_CHAR)
            {
                i += 2;
                continue;
            }
            int high = i + 1 < text.size() ? hex_value(text[i + 1]) : -1;
            int low = i + 2 < text.size() ? hex_value(text[i + 2]) : -1;
            if (high < 0 || low < 0)
            {
                decoded += ch;
                continue;
            }
            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        }
        else
            decoded += ch;
    }
    return decoded;
}


string codec::to_utf8(const string& text, const string& charset)
{
    string cs = to_lower_copy(charset);
    if (cs.empty() || cs == "utf-8" || cs == "utf8" || cs == "us-ascii" || cs == "ascii")
        return sanitize_utf8(text);

    try
    {
        return conv::to_utf<char>(text, charset, conv::skip);
    }
    catch (const conv::invalid_charset_error&)
    {
        return sanitize_utf8(text);
    }
    catch (const conv::conversion_error&)
    {
        return sanitize_utf8(text);
    }
}


string codec::sanitize_utf8(const string& text)
{
    return conv::utf_to_utf<char>(text, conv::skip);
}


string codec::truncate_utf8(const string& text, string::size_type max_chars)
{
    string::size_type chars = 0;
    for (string::size_type i = 0; i < text.size(); i++)
    {
        if (!is_utf8_lead(text[i]))
            continue;
        if (chars == max_chars)
            return text.substr(0, i);
        chars++;
    }
    return text;
}


string codec::decode_encoded_words(const string& text)
{
    string result;
    auto pos = text.cbegin();
    bool prev_encoded = false;
    for (sregex_iterator it(text.cbegin(), text.cend(), ENCODED_WORD), end; it != end; ++it)
    {
        const smatch& word = *it;
        string gap(pos, word[0].first);
        if (!(prev_encoded && all(gap, is_space())))
            result += sanitize_utf8(gap);

        string charset = word[1].str();
        auto lang_pos = charset.find('*');
        if (lang_pos != string::npos)
            charset.erase(lang_pos);
        string bytes = iequals(word[2].str(), "B") ? base64_decode(word[3].str()) : quoted_printable_decode(word[3].str(), true);
        result += to_utf8(bytes, charset);

        prev_encoded = true;
        pos = word[0].second;
    }
    result += sanitize_utf8(string(pos, text.cend()));
    return result;
}


string codec::encode_header_value(const string& text)
{
    if (is_ascii(text))
        return text;

    string encoded;
    string chunk;
    auto flush = [&]()
    {
        if (chunk.empty())
            return;
        if (!encoded.empty())
            encoded += END_OF_LINE + SPACE_CHAR;
        auto enc = base64_encode(chunk, 0);
        encoded += "=?" + CHARSET_UTF8 + "?B?" + enc.front() + "?=";
        chunk.clear();
    };
    for (string::size_type i = 0; i < text.size(); )
    {
        string::size_type next = i + 1;
        while (next < text.size() && !is_utf8_lead(text[next]))
            next++;
        if (chunk.size() + (next - i) > ENCODED_WORD_CHUNK)
            flush();
        chunk.append(text, i, next - i);
        i = next;
    }
    flush();
    return encoded;
}


string codec::decode_imap_utf7(const string& text)
{
    string result;
    for (string::size_type i = 0; i < text.size(); i++)
    {
        if (text[i] != '&')
        {
            result += text[i];
            continue;
        }

        string::size_type end = text.find('-', i + 1);
        if (end == string::npos)
        {
            result += text.substr(i);
            break;
        }
        if (end == i + 1)
            result += '&';
        else
        {
            string b64 = text.substr(i + 1, end - i - 1);
            std::replace(b64.begin(), b64.end(), ',', '/');
            string bytes = base64_decode(b64);
            u16string utf16;
            for (string::size_type k = 0; k + 1 < bytes.size(); k += 2)
                utf16 += static_cast<char16_t>((static_cast<unsigned char>(bytes[k]) << 8) | static_cast<unsigned char>(bytes[k + 1]));
            result += conv::utf_to_utf<char>(utf16, conv::skip);
        }
        i = end;
    }
    return result;
}


string decode_header_value(const std::optional<string>& value)
{
    if (!value.has_value())
        return string();
    return codec::decode_encoded_words(*value);
}


} // namespace gmcli
