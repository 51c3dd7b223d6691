#include <bpdf/assert_test.h>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BUtil.hh>
#include <cstdio>
#include <iostream>
#include <stdexcept>

static std::string
numrange(char const* range, int max)
{
    std::string result;
    for (int i: BUtil::parse_numrange(range, max)) {
        result += (result.empty() ? "" : " ") + std::to_string(i);
    }
    return result;
}

static bool
numrange_fails(char const* range, int max)
{
    try {
        BUtil::parse_numrange(range, max);
    } catch (std::runtime_error&) {
        return true;
    }
    return false;
}

static void
test_numrange()
{
    assert(numrange("1-5", 15) == "1 2 3 4 5");
    assert(numrange("1-3,5, 9", 15) == "1 2 3 5 9");
    assert(numrange("12-z", 15) == "12 13 14 15");
    assert(numrange("r1", 15) == "15");
    assert(numrange("r3-r1", 15) == "13 14 15");
    assert(numrange("5-1", 15) == "5 4 3 2 1");
    assert(numrange("1-6:odd", 15) == "1 3 5");
    assert(numrange("1-6:even", 15) == "2 4 6");
    assert(numrange_fails("", 15));
    assert(numrange_fails("16", 15));
    assert(numrange_fails("1--3", 15));
    assert(numrange_fails("1,,3", 15));
    assert(numrange_fails("1-3:all", 15));
    assert(numrange_fails("x", 15));
    // With max 0 only the syntax is checked.
    assert(!numrange_fails("100-200", 0));
}

static void
test_numbers()
{
    assert(BUtil::int_to_string(7, 3) == "007");
    assert(BUtil::int_to_string(-12) == "-12");
    assert(BUtil::double_to_string(3.14159, 2) == "3.14");
    assert(BUtil::double_to_string(2.5000, 4) == "2.5");
    assert(BUtil::double_to_string(2.0, 3) == "2");
    assert(BUtil::double_to_string(2.0, 3, false) == "2.000");
    assert(BUtil::is_long_long("-1234"));
    assert(!BUtil::is_long_long("12a"));
    assert(!BUtil::is_long_long("012"));
    assert(!BUtil::is_long_long("99999999999999999999"));
    assert(BUtil::is_number("-.5"));
    assert(BUtil::is_number("+12.25"));
    assert(!BUtil::is_number("."));
    assert(!BUtil::is_number("1.2.3"));
    assert(BUtil::string_to_int("-17") == -17);
    bool thrown = false;
    try {
        BUtil::string_to_int("9999999999");
    } catch (std::range_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_strings()
{
    assert(BUtil::hex_encode("\x01\xab z") == "01ab207a");
    assert(BUtil::hex_decode("01 AB 20 7a") == std::string("\x01\xab z"));
    assert(BUtil::hex_decode("414") == "A@");

    auto fields = BUtil::split_string("a,,b,", ',');
    assert(fields.size() == 4);
    assert(fields.at(0) == "a" && fields.at(1).empty() && fields.at(2) == "b");
    assert(fields.at(3).empty());

    std::string utf8 = "caf\xc3\xa9 \xf0\x9f\x93\x84";
    auto utf16 = BUtil::utf8_to_utf16(utf8);
    assert(BUtil::is_utf16(utf16));
    assert(utf16.substr(0, 2) == "\xfe\xff");
    assert(BUtil::utf16_to_utf8(utf16) == utf8);

    std::string pdfdoc;
    assert(BUtil::utf8_to_pdf_doc("caf\xc3\xa9", pdfdoc));
    assert(pdfdoc == "caf\xe9");
    assert(BUtil::pdf_doc_to_utf8(pdfdoc) == "caf\xc3\xa9");
    assert(!BUtil::utf8_to_pdf_doc("\xf0\x9f\x93\x84!", pdfdoc, '?'));
    assert(pdfdoc == "?!");

    BUtil::BPDFTime t(2026, 3, 7, 9, 5, 30, 0);
    assert(BUtil::bpdf_time_to_pdf_time(t) == "D:20260307090530Z");
    t.tz_delta = 300;
    assert(BUtil::bpdf_time_to_pdf_time(t) == "D:20260307090530-05'00'");
}

static void
test_paths()
{
    assert(BUtil::path_basename("dir/sub/file.pdf") == "file.pdf");
    assert(BUtil::path_basename("dir/sub/") == "sub");
    assert(BUtil::path_basename("file.pdf") == "file.pdf");
    assert(BUtil::path_dirname("dir/sub/file.pdf") == "dir/sub");
    assert(BUtil::path_dirname("file.pdf") == ".");
    assert(BUtil::path_dirname("/file.pdf") == "/");
    auto [stem, ext] = BUtil::split_extension("out/report.v2.pdf");
    assert(stem == "out/report.v2" && ext == ".pdf");
    assert(BUtil::split_extension("out.d/README").second.empty());
    assert(BUtil::split_extension(".hidden").second.empty());
}

static void
test_files()
{
    char const* name = "util-test.tmp";
    std::string data("binary\0data\r\n", 13);
    BUtil::write_string_to_file(name, data);
    assert(BUtil::file_can_be_opened(name));
    assert(BUtil::read_file_into_string(name) == data);
    BUtil::rename_file(name, "util-test-2.tmp");
    assert(!BUtil::file_can_be_opened(name));
    BUtil::remove_file("util-test-2.tmp");
    assert(!BUtil::file_can_be_opened("util-test-2.tmp"));

    try {
        BUtil::read_file_into_string("no/such/file.pdf");
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_system);
    }
}

static void
test_exceptions()
{
    BPDFExc full(bpdf_e_damaged_pdf, "in.pdf", "object 3 0", 120, "bad token");
    assert(std::string(full.what()) == "in.pdf (object 3 0, offset 120): bad token");
    assert(full.getMessageDetail() == "bad token");
    assert(full.getFilename() == "in.pdf");
    BPDFExc offset_only(bpdf_e_damaged_pdf, "in.pdf", "", 7, "eof");
    assert(std::string(offset_only.what()) == "in.pdf (offset 7): eof");
    BPDFExc bare(bpdf_e_invalid_angle, "", "", 0, "angle 45");
    assert(std::string(bare.what()) == "angle 45");
    assert(std::string(BPDFExc::kindName(bpdf_e_invalid_angle)) == "InvalidAngle");
    assert(std::string(BPDFExc::kindName(bpdf_e_signature)) == "SignatureError");
}

int
main()
{
    test_numrange();
    test_exceptions();
    test_numbers();
    test_strings();
    test_paths();
    test_files();
    std::cout << "util tests done" << std::endl;
    return 0;
}
