#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <iostream>
#include <stdexcept>

static void
test_roundtrip()
{
    auto pdf = make_sample_pdf(3, "Round trip \xe2\x9c\x93");
    auto data = write_pdf(*pdf);
    assert(data.substr(0, 8) == "%PDF-1.3");
    assert(data.find("%%EOF") != std::string::npos);
    // Content streams are compressed by default.
    assert(data.find("(Page 1)") == std::string::npos);
    // The output doesn't depend on anything but the document.
    assert(write_pdf(*pdf) == data);

    auto in = read_pdf(data);
    assert(!in->wasReconstructed());
    assert(!in->anyWarnings());
    assert(in->getAllPages().size() == 3);
    auto texts = page_texts(*in);
    assert(texts.at(0) == "Page 1" && texts.at(2) == "Page 3");
    assert(in->getInfo().getKey("Title").getUTF8Value() == "Round trip \xe2\x9c\x93");
    auto contents = in->getAllPages().at(1).getKey("Contents");
    assert(contents.getDict().getKey("Filter").isNameAndEquals("FlateDecode"));
    assert(contents.getStreamData() == "BT /F1 12 Tf 72 720 Td (Page 2) Tj ET\n");
    assert(in->getTrailer().getKey("ID").isArray());

    // Rewriting a document that was read gives the same pages.
    auto again = read_pdf(write_pdf(*in));
    assert(page_texts(*again) == texts);
}

static void
test_writer_options()
{
    auto pdf = make_sample_pdf(1);
    BPDFWriter w(*pdf);
    w.setOutputMemory();
    w.setStaticID(true);
    w.setCompressStreams(false);
    w.setMinimumPDFVersion("1.7");
    w.write();
    auto data = w.getOutputString();
    assert(data.substr(0, 8) == "%PDF-1.7");
    assert(data.find("(Page 1) Tj") != std::string::npos);

    // Unreferenced objects are dropped.
    pdf->makeIndirectObject(BPDFObjectHandle::parse("(orphan)"));
    assert(write_pdf(*pdf).find("(orphan)") == std::string::npos);

    try {
        BPDFWriter unset(*pdf);
        unset.getOutputString();
        assert(false);
    } catch (std::logic_error&) {
    }
}

static std::string
replace_startxref(std::string data, std::string const& value)
{
    auto pos = data.rfind("startxref\n") + 10;
    auto end = data.find('\n', pos);
    data.replace(pos, end - pos, value);
    return data;
}

static void
test_recovery()
{
    auto data = write_pdf(*make_sample_pdf(4));

    // startxref points past the end of the file.
    auto bad_offset = replace_startxref(data, "99999999");
    auto in = read_pdf(bad_offset);
    assert(in->wasReconstructed());
    assert(in->anyWarnings());
    assert(in->getAllPages().size() == 4);
    assert(page_texts(*in).at(3) == "Page 4");
    auto warnings = in->getWarnings();
    assert(!warnings.empty());
    assert(warnings.front().getErrorCode() == bpdf_e_damaged_pdf);
    assert(!in->anyWarnings());

    // No cross-reference table or trailer at all. The catalog is found by scanning.
    auto truncated = data.substr(0, data.rfind("\nxref") + 1);
    in = read_pdf(truncated);
    assert(in->wasReconstructed());
    assert(page_texts(*in).at(0) == "Page 1");
    assert(in->getAllPages().size() == 4);

    // Recovery can be turned off.
    auto strict = BPDF::create();
    strict->setAttemptRecovery(false);
    strict->setSuppressWarnings(true);
    try {
        strict->processMemoryFile("strict.pdf", bad_offset);
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_damaged_pdf);
        assert(e.getFilename() == "strict.pdf");
    }

    // Forced reconstruction of an intact file finds the same pages.
    auto forced = BPDF::create();
    forced->setForceReconstruct(true);
    forced->setSuppressWarnings(true);
    forced->processMemoryFile("forced.pdf", data);
    assert(forced->wasReconstructed());
    assert(forced->getAllPages().size() == 4);

    auto garbage = BPDF::create();
    garbage->setSuppressWarnings(true);
    try {
        garbage->processMemoryFile("garbage.pdf", "this is not a PDF file at all\n");
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_damaged_pdf);
    }
}

int
main()
{
    test_roundtrip();
    test_writer_options();
    test_recovery();
    std::cout << "roundtrip tests done" << std::endl;
    return 0;
}
