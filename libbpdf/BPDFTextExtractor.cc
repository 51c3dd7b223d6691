#include <bpdf/BPDFTextExtractor.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BUtil.hh>

#include <cmath>
#include <vector>

class CMapReader: public BPDFObjectHandle::ParserCallbacks
{
  public:
    CMapReader(BPDFTextExtractor::ToUnicode& result) :
        result(result)
    {
    }
    ~CMapReader() override = default;

    void
    handleObject(BPDFObjectHandle obj) override
    {
        if (!obj.isOperator()) {
            operands.push_back(obj);
            return;
        }
        auto op = obj.getOperatorValue();
        if (op == "endbfchar") {
            for (size_t i = 0; i + 1 < operands.size(); i += 2) {
                add(operands.at(i), operands.at(i + 1));
            }
        } else if (op == "endbfrange") {
            for (size_t i = 0; i + 2 < operands.size(); i += 3) {
                addRange(operands.at(i), operands.at(i + 1), operands.at(i + 2));
            }
        }
        operands.clear();
    }

    void
    handleEOF() override
    {
    }

  private:
    void
    add(BPDFObjectHandle const& code, BPDFObjectHandle const& dest)
    {
        if (!(code.isString() && dest.isString()) || code.getStringValue().empty()) {
            return;
        }
        auto code_str = code.getStringValue();
        result.code_lengths.insert(code_str.size());
        result.map[code_str] = BUtil::utf16_to_utf8(dest.getStringValue());
    }

    void
    addRange(BPDFObjectHandle const& lo, BPDFObjectHandle const& hi, BPDFObjectHandle const& dest)
    {
        if (!(lo.isString() && hi.isString())) {
            return;
        }
        auto lo_str = lo.getStringValue();
        auto hi_str = hi.getStringValue();
        if (lo_str.empty() || lo_str.size() != hi_str.size() || lo_str.size() > 4) {
            return;
        }
        unsigned long first = to_number(lo_str);
        unsigned long last = to_number(hi_str);
        // Ranges are limited to the last byte of the code.
        if (last < first || last - first > 0xff) {
            return;
        }
        result.code_lengths.insert(lo_str.size());
        for (unsigned long code = first; code <= last; ++code) {
            auto offset = code - first;
            std::string utf16;
            if (dest.isString()) {
                utf16 = dest.getStringValue();
                if (utf16.empty()) {
                    continue;
                }
                // Increment the last character of the destination.
                auto last_byte = static_cast<unsigned char>(utf16.back());
                utf16.back() = static_cast<char>(last_byte + offset);
            } else if (dest.isArray()) {
                auto item = dest.getArrayItem(static_cast<int>(offset));
                if (!item.isString()) {
                    continue;
                }
                utf16 = item.getStringValue();
            } else {
                return;
            }
            result.map[to_code(code, lo_str.size())] = BUtil::utf16_to_utf8(utf16);
        }
    }

    static unsigned long
    to_number(std::string const& bytes)
    {
        unsigned long value = 0;
        for (char ch: bytes) {
            value = (value << 8) | static_cast<unsigned char>(ch);
        }
        return value;
    }

    static std::string
    to_code(unsigned long value, size_t length)
    {
        std::string code(length, '\0');
        for (size_t i = length; i > 0; --i) {
            code.at(i - 1) = static_cast<char>(value & 0xff);
            value >>= 8;
        }
        return code;
    }

    BPDFTextExtractor::ToUnicode& result;
    std::vector<BPDFObjectHandle> operands;
};

BPDFTextExtractor::ToUnicode::ToUnicode(BPDFObjectHandle cmap_stream)
{
    if (!cmap_stream.isStream()) {
        return;
    }
    CMapReader reader(*this);
    BPDFObjectHandle::parseContentStream(cmap_stream, &reader);
}

bool
BPDFTextExtractor::ToUnicode::empty() const
{
    return map.empty();
}

std::string
BPDFTextExtractor::ToUnicode::decode(std::string const& codes) const
{
    std::string result;
    size_t pos = 0;
    size_t min_length = code_lengths.empty() ? 1 : *code_lengths.begin();
    while (pos < codes.size()) {
        bool found = false;
        for (auto length: code_lengths) {
            if (pos + length > codes.size()) {
                break;
            }
            auto it = map.find(codes.substr(pos, length));
            if (it != map.end()) {
                result += it->second;
                pos += length;
                found = true;
                break;
            }
        }
        if (!found) {
            pos += min_length;
        }
    }
    return result;
}

namespace
{
    class TextCollector: public BPDFObjectHandle::ParserCallbacks
    {
      public:
        TextCollector(BPDFObjectHandle fonts) :
            fonts(fonts)
        {
        }
        ~TextCollector() override = default;

        void
        handleObject(BPDFObjectHandle obj) override
        {
            if (!obj.isOperator()) {
                operands.push_back(obj);
                return;
            }
            counted = false;
            auto op = obj.getOperatorValue();
            if (op == "Tf" && operands.size() == 2 && operands.at(0).isName()) {
                selectFont(operands.at(0).getName());
            } else if (op == "Tj" && operands.size() == 1) {
                show(operands.at(0));
            } else if (op == "'" && operands.size() == 1) {
                newline();
                show(operands.at(0));
            } else if (op == "\"" && operands.size() == 3) {
                newline();
                show(operands.at(2));
            } else if (op == "TJ" && operands.size() == 1 && operands.at(0).isArray()) {
                for (auto const& item: operands.at(0).getArrayAsVector()) {
                    double adjustment = 0.0;
                    if (item.getValueAsNumber(adjustment)) {
                        // A large negative adjustment moves right far enough to read as a space.
                        if (adjustment < -200.0 && !text.empty() && text.back() != ' ' &&
                            text.back() != '\n') {
                            text += ' ';
                        }
                    } else {
                        show(item);
                    }
                }
            } else if (op == "T*") {
                newline();
            } else if ((op == "Td" || op == "TD") && operands.size() == 2) {
                double ty = 0.0;
                if (operands.at(1).getValueAsNumber(ty) && std::fabs(ty) > 0.001) {
                    newline();
                } else {
                    space();
                }
            } else if (op == "Tm" && operands.size() == 6) {
                double f = 0.0;
                if (operands.at(5).getValueAsNumber(f)) {
                    if (have_tm && std::fabs(f - last_tm_y) > 0.001) {
                        newline();
                    } else if (have_tm) {
                        space();
                    }
                    have_tm = true;
                    last_tm_y = f;
                }
            } else if (op == "ET") {
                space();
            }
            operands.clear();
        }

        void
        handleEOF() override
        {
        }

        std::string text;
        int runs{0};

      private:
        void
        selectFont(std::string const& name)
        {
            auto font = fonts.getKey(name);
            auto it = to_unicode.find(name);
            if (it == to_unicode.end()) {
                it = to_unicode.emplace(name, ToUnicode(font.getKey("ToUnicode"))).first;
            }
            current = &it->second;
            two_byte = font.getKey("Subtype").isNameAndEquals("Type0");
        }

        void
        show(BPDFObjectHandle const& str)
        {
            if (!str.isString()) {
                return;
            }
            auto codes = str.getStringValue();
            if (codes.empty()) {
                return;
            }
            if (!counted) {
                ++runs;
                counted = true;
            }
            if (current && !current->empty()) {
                text += current->decode(codes);
            } else if (!two_byte) {
                text += BUtil::pdf_doc_to_utf8(codes);
            }
        }

        void
        newline()
        {
            if (!text.empty() && text.back() != '\n') {
                if (text.back() == ' ') {
                    text.pop_back();
                }
                text += '\n';
            }
        }

        void
        space()
        {
            if (!text.empty() && text.back() != '\n' && text.back() != ' ') {
                text += ' ';
            }
        }

        using ToUnicode = BPDFTextExtractor::ToUnicode;

        BPDFObjectHandle fonts;
        std::map<std::string, ToUnicode> to_unicode;
        ToUnicode const* current{nullptr};
        bool two_byte{false};
        bool have_tm{false};
        double last_tm_y{0.0};
        std::vector<BPDFObjectHandle> operands;

        bool counted{false};
    };

    std::string
    collect(BPDFPageObjectHelper const& page, int& runs)
    {
        TextCollector collector(page.getAttribute("Resources").getKey("Font"));
        page.parseContents(&collector);
        runs = collector.runs;
        auto text = collector.text;
        while (!text.empty() && (text.back() == ' ' || text.back() == '\n')) {
            text.pop_back();
        }
        return text;
    }
} // namespace

std::string
BPDFTextExtractor::extractPage(BPDFPageObjectHelper const& page)
{
    int runs = 0;
    return collect(page, runs);
}

int
BPDFTextExtractor::countTextRuns(BPDFPageObjectHelper const& page)
{
    int runs = 0;
    collect(page, runs);
    return runs;
}
