#include <bpdf/assert_test.h>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFObjectHandle.hh>
#include <bpdf/BPDFTokenizer.hh>
#include <bpdf/BufferInputSource.hh>
#include <iostream>
#include <vector>

static std::vector<BPDFTokenizer::Token>
tokenize(std::string const& data)
{
    BufferInputSource input("tokens", data);
    BPDFTokenizer tokenizer;
    tokenizer.allowEOF();
    std::vector<BPDFTokenizer::Token> result;
    while (true) {
        auto token = tokenizer.readToken(input, "test");
        if (token.getType() == BPDFTokenizer::tt_eof) {
            break;
        }
        result.push_back(token);
        if (token.getType() == BPDFTokenizer::tt_bad) {
            break;
        }
    }
    return result;
}

static void
test_tokenizer()
{
    auto tokens = tokenize(
        "<< /Type /Pa#67e /N -12 /R .5 >> % comment\n"
        "[ (a\\(b\\)\\101) <4142 4> ] true null BT");
    typedef BPDFTokenizer T;
    std::vector<BPDFTokenizer::Token> expected = {
        {T::tt_dict_open, "<<"},
        {T::tt_name, "Type"},
        {T::tt_name, "Page"},
        {T::tt_name, "N"},
        {T::tt_integer, "-12"},
        {T::tt_name, "R"},
        {T::tt_real, ".5"},
        {T::tt_dict_close, ">>"},
        {T::tt_array_open, "["},
        {T::tt_string, "a(b)A"},
        {T::tt_string, "AB@"},
        {T::tt_array_close, "]"},
        {T::tt_bool, "true"},
        {T::tt_null, "null"},
        {T::tt_word, "BT"},
    };
    assert(tokens.size() == expected.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!(tokens.at(i) == expected.at(i))) {
            std::cout << "token " << i << ": " << tokens.at(i).getValue() << std::endl;
        }
        assert(tokens.at(i) == expected.at(i));
    }

    auto bad = tokenize("(unterminated");
    assert(bad.back().getType() == T::tt_bad);
    assert(!bad.back().getErrorMessage().empty());
    bad = tokenize("<41 zz>");
    assert(bad.back().getType() == T::tt_bad);
}

static void
test_parse_unparse()
{
    auto dict = BPDFObjectHandle::parse("<< /B [1 2.50 (x)] /A /Name#20Space /C << /D true >> >>");
    assert(dict.isDictionary());
    assert(dict.getKeys().size() == 3);
    assert(dict.unparse() == "<< /A /Name#20Space /B [ 1 2.50 (x) ] /C << /D true >> >>");
    assert(dict.getKey("A").getName() == "Name Space");
    assert(dict.getKey("B").getArrayItem(1).getNumericValue() == 2.5);
    assert(dict.getKey("B").getArrayItem(7).isNull());
    assert(dict.getKey("Missing").isNull());
    assert(dict.getKey("C").getKey("D").getBoolValue());

    // Setting a key to null removes it.
    dict.replaceKey("A", BPDFObjectHandle::newNull());
    assert(!dict.hasKey("A"));
    dict.removeKey("B");
    assert(dict.unparse() == "<< /C << /D true >> >>");

    // Direct objects are shared between handles.
    auto c = dict.getKey("C");
    c.replaceKey("E", BPDFObjectHandle::newInteger(3));
    assert(dict.getKey("C").getKey("E").getIntValue() == 3);
    auto copy = dict.shallowCopy();
    copy.replaceKey("F", BPDFObjectHandle::newInteger(4));
    assert(!dict.hasKey("F"));

    auto binary = BPDFObjectHandle::newString(std::string("\x01\x02\x03\x04", 4));
    assert(binary.unparse() == "<01020304>");
    assert(BPDFObjectHandle::newString("a(b)\n").unparse() == "(a\\(b\\)\\n)");

    auto unicode = BPDFObjectHandle::newUnicodeString("Gr\xc3\xbc\xc3\x9f\x65 \xe2\x82\xac");
    assert(unicode.getUTF8Value() == "Gr\xc3\xbc\xc3\x9f\x65 \xe2\x82\xac");
    auto ascii = BPDFObjectHandle::newUnicodeString("plain");
    assert(ascii.getStringValue() == "plain");

    double d = 0;
    assert(BPDFObjectHandle::newInteger(7).getValueAsNumber(d) && d == 7.0);
    assert(!BPDFObjectHandle::newName("N").getValueAsNumber(d));
    assert(BPDFObjectHandle::parse("[0 0 612 792]").isRectangle());
    assert(!BPDFObjectHandle::parse("[0 0 612]").isRectangle());

    try {
        BPDFObjectHandle::newName("N").getIntValue();
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_object);
    }
    try {
        BPDFObjectHandle::parse("<< /A 1 >> extra");
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_damaged_pdf);
    }
}

namespace
{
    class Collector: public BPDFObjectHandle::ParserCallbacks
    {
      public:
        void
        handleObject(BPDFObjectHandle obj) override
        {
            if (obj.isOperator()) {
                operators.push_back(obj.getOperatorValue());
            } else {
                ++operands;
            }
        }
        void
        handleEOF() override
        {
            eof = true;
        }

        std::vector<std::string> operators;
        int operands{0};
        bool eof{false};
    };
} // namespace

static void
test_indirect_and_content()
{
    BPDF pdf;
    pdf.emptyPDF();
    auto a = pdf.makeIndirectObject(BPDFObjectHandle::parse("<< /Value 1 >>"));
    assert(a.isIndirect());
    assert(a.getOwningBPDF() == &pdf);
    assert(pdf.makeIndirectObject(a).getObjGen() == a.getObjGen());
    auto same = pdf.getObject(a.getObjGen());
    same.replaceKey("Value", BPDFObjectHandle::newInteger(2));
    assert(a.getKey("Value").getIntValue() == 2);
    assert(a.isSameObjectAs(same));
    auto holder = BPDFObjectHandle::newArray({a});
    assert(holder.unparse() == "[ " + a.getObjGen().unparse() + " R ]");

    auto s1 = pdf.newStream("q 1 0 0 1 0 0 cm BT /F1 12 Tf (Hi) Tj");
    auto s2 = pdf.newStream("ET Q");
    Collector c;
    BPDFObjectHandle::parseContentStream(BPDFObjectHandle::newArray({s1, s2}), &c);
    std::vector<std::string> expected = {"q", "cm", "BT", "Tf", "Tj", "ET", "Q"};
    assert(c.operators == expected);
    assert(c.operands == 9);
    assert(c.eof);

    // Foreign objects are copied along with everything they reference.
    BPDF other;
    other.emptyPDF();
    auto copied = other.copyForeignObject(a);
    assert(copied.getOwningBPDF() == &other);
    assert(copied.getKey("Value").getIntValue() == 2);
    copied.replaceKey("Value", BPDFObjectHandle::newInteger(5));
    assert(a.getKey("Value").getIntValue() == 2);
    assert(other.copyForeignObject(a).getObjGen() == copied.getObjGen());
}

int
main()
{
    test_tokenizer();
    test_parse_unparse();
    test_indirect_and_content();
    std::cout << "object tests done" << std::endl;
    return 0;
}
