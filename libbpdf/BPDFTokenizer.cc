#include <bpdf/BPDFTokenizer.hh>

#include <bpdf/BUtil.hh>

#include <cstring>

namespace
{
    bool
    read_char(InputSource& input, char& ch)
    {
        return input.read(&ch, 1) == 1;
    }

    bool
    is_regular(char ch)
    {
        return !(BUtil::is_space(ch) || BUtil::is_delimiter(ch));
    }
} // namespace

void
BPDFTokenizer::allowEOF()
{
    allow_eof = true;
}

void
BPDFTokenizer::expectInlineImage()
{
    inline_image_expected = true;
}

bool
BPDFTokenizer::skipSpaceAndComments(InputSource& input)
{
    char ch;
    while (read_char(input, ch)) {
        if (ch == '%') {
            while (read_char(input, ch)) {
                if (ch == '\r' || ch == '\n') {
                    break;
                }
            }
        } else if (!BUtil::is_space(ch)) {
            input.unreadCh(ch);
            return true;
        }
    }
    return false;
}

BPDFTokenizer::Token
BPDFTokenizer::readToken(InputSource& input, std::string const& context)
{
    if (inline_image_expected) {
        inline_image_expected = false;
        return readInlineImage(input);
    }
    if (!skipSpaceAndComments(input)) {
        input.setLastOffset(input.tell());
        if (allow_eof) {
            return {tt_eof, ""};
        }
        return {tt_bad, "", "EOF while reading token in " + context};
    }
    input.setLastOffset(input.tell());
    char ch;
    read_char(input, ch);
    switch (ch) {
    case '[':
        return {tt_array_open, "["};
    case ']':
        return {tt_array_close, "]"};
    case '{':
        return {tt_brace_open, "{"};
    case '}':
        return {tt_brace_close, "}"};
    case '(':
        return readLiteralString(input);
    case ')':
        return {tt_bad, ")", "unexpected )"};
    case '/':
        return readName(input);
    case '<':
        {
            char next;
            if (read_char(input, next)) {
                if (next == '<') {
                    return {tt_dict_open, "<<"};
                }
                input.unreadCh(next);
            }
            return readHexString(input);
        }
    case '>':
        {
            char next;
            if (read_char(input, next)) {
                if (next == '>') {
                    return {tt_dict_close, ">>"};
                }
                input.unreadCh(next);
            }
            return {tt_bad, ">", "unexpected >"};
        }
    default:
        return readRegular(input, ch);
    }
}

BPDFTokenizer::Token
BPDFTokenizer::readLiteralString(InputSource& input)
{
    std::string val;
    int depth = 1;
    char ch;
    while (read_char(input, ch)) {
        if (ch == '\\') {
            if (!read_char(input, ch)) {
                break;
            }
            switch (ch) {
            case 'n':
                val += '\n';
                break;
            case 'r':
                val += '\r';
                break;
            case 't':
                val += '\t';
                break;
            case 'b':
                val += '\b';
                break;
            case 'f':
                val += '\f';
                break;
            case '\r':
                // line continuation
                if (read_char(input, ch) && ch != '\n') {
                    input.unreadCh(ch);
                }
                break;
            case '\n':
                break;
            default:
                if (ch >= '0' && ch <= '7') {
                    int code = ch - '0';
                    for (int i = 0; i < 2; ++i) {
                        if (!read_char(input, ch)) {
                            break;
                        }
                        if (ch < '0' || ch > '7') {
                            input.unreadCh(ch);
                            break;
                        }
                        code = 8 * code + (ch - '0');
                    }
                    val += static_cast<char>(code & 0xff);
                } else {
                    // Unknown escapes, including \( \) and \\, stand for the character itself.
                    val += ch;
                }
            }
        } else if (ch == '(') {
            ++depth;
            val += ch;
        } else if (ch == ')') {
            if (--depth == 0) {
                return {tt_string, val};
            }
            val += ch;
        } else if (ch == '\r') {
            // An unescaped end-of-line is always read as a single newline.
            if (read_char(input, ch) && ch != '\n') {
                input.unreadCh(ch);
            }
            val += '\n';
        } else {
            val += ch;
        }
    }
    return {tt_bad, val, "EOF while reading string"};
}

BPDFTokenizer::Token
BPDFTokenizer::readHexString(InputSource& input)
{
    std::string hex;
    char ch;
    while (read_char(input, ch)) {
        if (ch == '>') {
            return {tt_string, BUtil::hex_decode(hex)};
        }
        if (BUtil::is_hex_digit(ch)) {
            hex += ch;
        } else if (!BUtil::is_space(ch)) {
            return {tt_bad, hex, std::string("invalid character (") + ch + ") in hexstring"};
        }
    }
    return {tt_bad, hex, "EOF while reading hexstring"};
}

BPDFTokenizer::Token
BPDFTokenizer::readName(InputSource& input)
{
    std::string val;
    char ch;
    while (read_char(input, ch)) {
        if (!is_regular(ch)) {
            input.unreadCh(ch);
            break;
        }
        if (ch == '#') {
            char hi = 0;
            char lo = 0;
            if (read_char(input, hi) && BUtil::is_hex_digit(hi) && read_char(input, lo) &&
                BUtil::is_hex_digit(lo)) {
                val += static_cast<char>(
                    (BUtil::hex_decode_char(hi) << 4) | BUtil::hex_decode_char(lo));
                continue;
            }
            return {tt_bad, val, "name with invalid # escape"};
        }
        val += ch;
    }
    return {tt_name, val};
}

BPDFTokenizer::Token
BPDFTokenizer::readRegular(InputSource& input, char first)
{
    std::string val(1, first);
    char ch;
    while (read_char(input, ch)) {
        if (!is_regular(ch)) {
            input.unreadCh(ch);
            break;
        }
        val += ch;
    }
    if (val == "true" || val == "false") {
        return {tt_bool, val};
    }
    if (val == "null") {
        return {tt_null, val};
    }
    size_t i = (val.at(0) == '-' || val.at(0) == '+') ? 1 : 0;
    bool digits = false;
    bool point = false;
    bool numeric = i < val.size();
    for (; i < val.size(); ++i) {
        if (BUtil::is_digit(val.at(i))) {
            digits = true;
        } else if (val.at(i) == '.' && !point) {
            point = true;
        } else {
            numeric = false;
            break;
        }
    }
    if (numeric && digits) {
        return {point ? tt_real : tt_integer, val};
    }
    return {tt_word, val};
}

BPDFTokenizer::Token
BPDFTokenizer::readInlineImage(InputSource& input)
{
    // One whitespace character separates ID from the data.
    char ch;
    if (read_char(input, ch) && !BUtil::is_space(ch)) {
        input.unreadCh(ch);
    }
    bpdf_offset_t start = input.tell();
    input.setLastOffset(start);
    std::string data;
    while (read_char(input, ch)) {
        data += ch;
        size_t n = data.size();
        // Look for <space>EI followed by whitespace or EOF.
        if (n >= 3 && data.at(n - 1) == 'I' && data.at(n - 2) == 'E' &&
            BUtil::is_space(data.at(n - 3))) {
            char after;
            bool at_eof = !read_char(input, after);
            if (!at_eof) {
                input.unreadCh(after);
            }
            if (at_eof || BUtil::is_space(after) || BUtil::is_delimiter(after)) {
                input.seek(start + static_cast<bpdf_offset_t>(n - 2), SEEK_SET);
                return {tt_inline_image, data.substr(0, n - 3)};
            }
        }
    }
    return {tt_bad, data, "EOF while looking for EI after inline image"};
}
