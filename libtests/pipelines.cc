#include <bpdf/assert_test.h>

#include <bpdf/Pl_ASCII85Decoder.hh>
#include <bpdf/Pl_ASCIIHexDecoder.hh>
#include <bpdf/Pl_Count.hh>
#include <bpdf/Pl_Flate.hh>
#include <bpdf/Pl_Predictor.hh>
#include <bpdf/Pl_RunLength.hh>
#include <bpdf/Pl_String.hh>
#include <iostream>
#include <stdexcept>

template <typename P>
static std::string
decode(std::string const& data)
{
    std::string out;
    Pl_String s("out", nullptr, out);
    P p("decode", &s);
    p.writeString(data);
    p.finish();
    return out;
}

static std::string
flate(std::string const& data, Pl_Flate::action_e action, int level = -1)
{
    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_Flate f("flate", &s, action, level);
    // Write in uneven pieces to exercise buffering.
    size_t pos = 0;
    size_t piece = 1;
    while (pos < data.size()) {
        size_t len = std::min(piece, data.size() - pos);
        f.write(reinterpret_cast<unsigned char const*>(data.data() + pos), len);
        pos += len;
        piece = piece * 3 + 1;
    }
    f.finish();
    return out;
}

static void
test_flate()
{
    std::string data;
    for (int i = 0; i < 20000; ++i) {
        data += "line " + std::to_string(i % 97) + "\n";
    }
    auto fast = flate(data, Pl_Flate::a_deflate, 1);
    auto best = flate(data, Pl_Flate::a_deflate, 9);
    assert(fast.size() < data.size());
    assert(best.size() <= fast.size());
    assert(flate(fast, Pl_Flate::a_inflate) == data);
    assert(flate(best, Pl_Flate::a_inflate) == data);

    // Nothing written still gives a valid stream.
    auto empty = flate("", Pl_Flate::a_deflate);
    assert(!empty.empty());
    assert(flate(empty, Pl_Flate::a_inflate).empty());

    bool thrown = false;
    try {
        flate("this is not zlib data at all", Pl_Flate::a_inflate);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_decoders()
{
    assert(decode<Pl_ASCIIHexDecoder>("48 65 6c\n6C 6f>") == "Hello");
    assert(decode<Pl_ASCIIHexDecoder>("414>") == "A@");
    assert(decode<Pl_ASCII85Decoder>("9jqo^~>") == "Man ");
    assert(decode<Pl_ASCII85Decoder>("z~>") == std::string(4, '\0'));
    assert(decode<Pl_RunLength>(std::string("\x02" "abc\xfeZ\x80", 7)) == "abcZZZ");
}

static std::string
unpredict(std::string const& data, unsigned int predictor, unsigned int columns, unsigned int bpc)
{
    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_Predictor p("predictor", &s, predictor, columns, 1, bpc);
    for (char c: data) {
        p.writeString(std::string(1, c));
    }
    p.finish();
    return out;
}

static void
test_predictors()
{
    // PNG rows: Up, then Up again, then Sub, then Paeth.
    std::string png("\2\1\2\3"
                    "\2\1\1\1"
                    "\1\5\1\1"
                    "\4\0\0\0",
                    16);
    assert(unpredict(png, 12, 3, 8) == std::string("\1\2\3\2\3\4\5\6\7\5\6\7", 12));

    // Average uses the rounded-down mean of left and up.
    assert(unpredict(std::string("\0\4\6\3\1\1", 6), 10, 2, 8) == "\4\6\3\5");

    // A short final row is padded.
    assert(unpredict(std::string("\1\5\1", 3), 15, 3, 8) == std::string("\5\6\6", 3));

    assert(unpredict("\12\1\1", 2, 3, 8) == "\12\13\14");
    assert(unpredict(std::string("\0\377\0\1", 4), 2, 2, 16) == std::string("\0\377\1\0", 4));

    bool thrown = false;
    try {
        unpredict("", 2, 3, 4);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_count()
{
    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_Count c("count", &s);
    c.writeString("0123456789");
    c.writeString("");
    c.writeString("abc42");
    c.finish();
    assert(c.getCount() == 15);
    assert(out == "0123456789abc42");
}

int
main()
{
    test_flate();
    test_decoders();
    test_predictors();
    test_count();
    std::cout << "pipeline tests done" << std::endl;
    return 0;
}
