/*

codec.hpp
---------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <vector>


namespace gmcli
{


/**
Text encodings used by the mail protocols.

None of the decoding methods throws: malformed input is decoded on the best-effort basis, dropping what cannot be represented.
**/
class codec
{
public:

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Tab character.
    **/
    static constexpr char TAB_CHAR = '\t';

    /**
    Double quote character.
    **/
    static constexpr char QUOTE_CHAR = '"';

    /**
    Backslash character.
    **/
    static constexpr char BACKSLASH_CHAR = '\\';

    /**
    Equal character, used as the quoted printable escape.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Dot character.
    **/
    static constexpr char DOT_CHAR = '.';

    /**
    Line terminator of the mail protocols.
    **/
    static const std::string END_OF_LINE;

    /**
    Message terminator of the SMTP data.
    **/
    static const std::string END_OF_MESSAGE;

    /**
    Name of the charset which every decoded text is converted to.
    **/
    static const std::string CHARSET_UTF8;

    /**
    Name of the ASCII charset.
    **/
    static const std::string CHARSET_ASCII;

    /**
    Line length policies.

    The `RECOMMENDED` policy excludes the line terminator.
    **/
    enum class line_len_policy_t : std::string::size_type {NONE = 0, RECOMMENDED = 76, MANDATORY = 998};

    /**
    Escaping the given characters with the backslash.

    @param text            Text to escape.
    @param escaping_chars  Characters to be escaped.
    @return                Escaped text.
    **/
    static std::string escape_string(const std::string& text, const std::string& escaping_chars);

    /**
    Surrounding the text with the given character.

    @param text           Text to surround.
    @param surround_char  Character to put on both sides.
    @return               Surrounded text.
    **/
    static std::string surround_string(const std::string& text, char surround_char = QUOTE_CHAR);

    /**
    Checking if the text consists of seven bit characters only.
    **/
    static bool is_ascii(const std::string& text);

    /**
    Encoding into the Base64 alphabet.

    @param text      Bytes to encode.
    @param line_len  Maximum length of the encoded lines, zero for a single line.
    @return          Encoded lines, empty vector for empty input.
    **/
    static std::vector<std::string> base64_encode(const std::string& text,
        std::string::size_type line_len = static_cast<std::string::size_type>(line_len_policy_t::RECOMMENDED));

    /**
    Decoding the Base64 text.

    Characters outside of the alphabet are skipped, decoding stops at the padding.
    **/
    static std::string base64_decode(const std::string& text);

    /**
    Encoding into the quoted printable format.

    Line breaks of the input are kept as CRLF hard breaks, too long lines are split by soft breaks.

    @param text  Text to encode.
    @return      Encoded lines.
    **/
    static std::vector<std::string> quoted_printable_encode(const std::string& text);

    /**
    Decoding the quoted printable text.

    @param text     Text to decode.
    @param q_codec  Using the Q variant of the header encoded words, where the underscore represents the space.
    @return         Decoded bytes. Invalid escapes are copied as they are.
    **/
    static std::string quoted_printable_decode(const std::string& text, bool q_codec = false);

    /**
    Converting the text of the given charset to UTF-8.

    Unknown charsets are treated as UTF-8. Bytes which are not valid in the source charset are dropped.
    **/
    static std::string to_utf8(const std::string& text, const std::string& charset);

    /**
    Dropping the invalid UTF-8 sequences.
    **/
    static std::string sanitize_utf8(const std::string& text);

    /**
    Truncating UTF-8 text to the given number of characters, without splitting a multibyte sequence.
    **/
    static std::string truncate_utf8(const std::string& text, std::string::size_type max_chars);

    /**
    Decoding the RFC 2047 encoded words of a header value into UTF-8.

    Plain and encoded words are concatenated in the original order. Whitespace between two adjacent encoded words is dropped.
    **/
    static std::string decode_encoded_words(const std::string& text);

    /**
    Encoding a header value as the Base64 encoded word, if it contains eight bit characters.

    @param text  UTF-8 header value.
    @return      The value itself if it is ASCII, the encoded word otherwise.
    **/
    static std::string encode_header_value(const std::string& text);

    /**
    Decoding a mailbox name from the IMAP modified UTF-7 into UTF-8.
    **/
    static std::string decode_imap_utf7(const std::string& text);
};


/**
Decoding a possibly MIME encoded header value into printable text.

@param value  Raw header value, or none if the header is absent.
@return       Decoded value, empty string for an absent header.
**/
std::string decode_header_value(const std::optional<std::string>& value);


} // namespace gmcli
