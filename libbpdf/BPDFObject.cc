#include <bpdf/BPDFObject_private.hh>

#include <bpdf/BUtil.hh>

#include <stdexcept>

std::string
BPDF_String::unparse() const
{
    // Use a hex string when more than a fifth of the characters would need escaping.
    size_t nonprintable = 0;
    for (auto ch: val) {
        auto c = static_cast<unsigned char>(ch);
        if ((c < 32 || c > 126) &&
            !(ch == '\n' || ch == '\r' || ch == '\t' || ch == '\b' || ch == '\f')) {
            ++nonprintable;
        }
    }
    if (nonprintable * 5 > val.size()) {
        return "<" + BUtil::hex_encode(val) + ">";
    }
    std::string result = "(";
    for (auto ch: val) {
        switch (ch) {
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '(':
            result += "\\(";
            break;
        case ')':
            result += "\\)";
            break;
        case '\\':
            result += "\\\\";
            break;
        default:
            {
                auto c = static_cast<unsigned char>(ch);
                if (c < 32 || c > 126) {
                    result += "\\" + std::string(1, char('0' + ((c >> 6) & 7))) +
                        char('0' + ((c >> 3) & 7)) + char('0' + (c & 7));
                } else {
                    result += ch;
                }
            }
        }
    }
    result += ")";
    return result;
}

std::string
BPDF_String::getUTF8Val() const
{
    if (BUtil::is_utf16(val)) {
        return BUtil::utf16_to_utf8(val);
    }
    if (val.size() >= 3 && val.compare(0, 3, "\xef\xbb\xbf") == 0) {
        // PDF 2.0 allows UTF-8 strings marked with a byte order mark.
        return val.substr(3);
    }
    return BUtil::pdf_doc_to_utf8(val);
}

std::string
BPDF_Name::normalizeName(std::string const& name)
{
    std::string result = "/";
    for (auto ch: name) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 33 || c > 126 || ch == '#' || BUtil::is_delimiter(ch)) {
            result += "#" + BUtil::hex_encode(std::string(1, ch));
        } else {
            result += ch;
        }
    }
    return result;
}

std::string
BPDFObject::unparse() const
{
    switch (getTypeCode()) {
    case ot_uninitialized:
        throw std::logic_error("attempted to unparse an uninitialized object handle");
    case ot_reserved:
        throw std::logic_error("attempted to unparse a reserved object");
    case ot_null:
        return "null";
    case ot_boolean:
        return as<BPDF_Bool>()->val ? "true" : "false";
    case ot_integer:
        return std::to_string(as<BPDF_Integer>()->val);
    case ot_real:
        return as<BPDF_Real>()->val;
    case ot_string:
        return as<BPDF_String>()->unparse();
    case ot_name:
        return BPDF_Name::normalizeName(as<BPDF_Name>()->name);
    case ot_array:
        {
            std::string result = "[ ";
            for (auto const& item: as<BPDF_Array>()->items) {
                result += item.unparse() + " ";
            }
            return result + "]";
        }
    case ot_dictionary:
        {
            std::string result = "<< ";
            for (auto const& [key, value]: as<BPDF_Dictionary>()->items) {
                result += BPDF_Name::normalizeName(key) + " " + value.unparse() + " ";
            }
            return result + ">>";
        }
    case ot_stream:
        return as<BPDF_Stream>()->stream_dict.unparse();
    case ot_operator:
        return as<BPDF_Operator>()->val;
    case ot_inlineimage:
        return as<BPDF_InlineImage>()->val;
    case ot_reference:
        return as<BPDF_Reference>()->og.unparse() + " R";
    }
    return {};
}
