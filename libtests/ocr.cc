#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFOCRBridge.hh>

#include <iostream>

namespace
{
    // Returns fixed spans and records what it was asked to recognize
    class FakeRecognizer: public BPDFOCRRecognizer
    {
      public:
        ~FakeRecognizer() override = default;

        std::vector<BPDFOCRSpan>
        recognize(BPDFPixmap const& image, std::string const& language, int dpi) override
        {
            ++calls;
            last_width = image.width;
            last_height = image.height;
            last_components = image.components;
            last_language = language;
            last_dpi = dpi;
            return {{"Invoice 42", 72, 72, 200, 24, 96.0}, {"smudge", 300, 500, 40, 20, 12.5}};
        }

        int calls{0};
        int last_width{0};
        int last_height{0};
        int last_components{0};
        std::string last_language;
        int last_dpi{0};
    };

    // Hands out a blank page image without looking at the page
    class BlankRasterizer: public BPDFPageRasterizer
    {
      public:
        ~BlankRasterizer() override = default;

        bool
        rasterize(
            BPDFPageObjectHelper const&, int dpi, BPDFPixmap& result, std::string&) override
        {
            result = BPDFPixmap(dpi * 8, dpi * 11, 1);
            return true;
        }
    };
} // namespace

// Page 1 is a scan, page 2 has text, and page 3 is blank.
static std::string
make_scanned_pdf()
{
    auto pdf = make_sample_pdf(1);
    auto scan = BPDFObjectHandle::newDictionary();
    scan.replaceKey("Type", BPDFObjectHandle::newName("Page"));
    scan.replaceKey(
        "MediaBox", BPDFObjectHandle::newArray(BPDFObjectHandle::Rectangle(0, 0, 612, 792)));
    pdf->addPage(scan, true);
    auto blank = BPDFObjectHandle::newDictionary();
    blank.replaceKey("Type", BPDFObjectHandle::newName("Page"));
    blank.replaceKey(
        "MediaBox", BPDFObjectHandle::newArray(BPDFObjectHandle::Rectangle(0, 0, 612, 792)));
    pdf->addPage(blank, false);

    std::string pixels(100 * 100, '\xff');
    for (size_t i = 2000; i < 3000; ++i) {
        pixels[i] = '\0';
    }
    auto image = pdf->newStream(pixels);
    auto dict = image.getDict();
    dict.replaceKey("Type", BPDFObjectHandle::newName("XObject"));
    dict.replaceKey("Subtype", BPDFObjectHandle::newName("Image"));
    dict.replaceKey("Width", BPDFObjectHandle::newInteger(100));
    dict.replaceKey("Height", BPDFObjectHandle::newInteger(100));
    dict.replaceKey("ColorSpace", BPDFObjectHandle::newName("DeviceGray"));
    dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(8));
    BPDFPageObjectHelper page(pdf->getAllPages().at(0));
    auto name = page.addResource("XObject", "Im", image);
    page.addContentFragment("612 0 0 792 0 0 cm /" + name + " Do", false);
    return write_pdf(*pdf);
}

static void
test_default_rasterizer()
{
    auto data = make_scanned_pdf();
    auto pdf = read_pdf(data);
    BPDFDefaultRasterizer rasterizer;
    BPDFPixmap image;
    std::string reason;
    BPDFPageObjectHelper scan(pdf->getAllPages().at(0));
    assert(rasterizer.rasterize(scan, 72, image, reason));
    assert(image.width == 612 && image.height == 792 && image.components == 1);
    // Rows 20 through 29 of the scan are black; the top row is white.
    assert(image.pixels.at(0) == '\xff');
    assert(image.pixels.at(static_cast<size_t>(612 * 200 + 10)) == '\0');

    BPDFPageObjectHelper blank(pdf->getAllPages().at(2));
    assert(!rasterizer.rasterize(blank, 72, image, reason));
    assert(reason == "page draws no images");
    assert(!rasterizer.rasterize(scan, 0, image, reason));
}

static void
test_ocr_operation()
{
    auto data = make_scanned_pdf();
    auto recognizer = std::make_shared<FakeRecognizer>();
    BPDFEngineConfig config;
    config.recognizer = recognizer;

    auto result = run_operation(
        bpdf_op_ocr, {{"scan.pdf", data}}, {{"dpi", "72"}, {"language", "deu"}}, config);
    // Only the scanned page was sent to the recognizer.
    assert(recognizer->calls == 1);
    assert(recognizer->last_width == 612 && recognizer->last_height == 792);
    assert(recognizer->last_components == 1);
    assert(recognizer->last_language == "deu");
    assert(recognizer->last_dpi == 72);
    assert(result.warnings.size() == 1);
    assert(result.warnings.at(0) == "page 3: skipping OCR: page draws no images");

    auto out_data = BPDFOperation::writeOutput(result.outputs.at(0));
    auto pdf = read_pdf(out_data);
    auto pages = BPDFPageDocumentHelper(*pdf).getAllPages();
    assert(BPDFOCRBridge::hasTextLayer(pages.at(0)));
    assert(!BPDFOCRBridge::hasTextLayer(pages.at(1)));
    assert(!BPDFOCRBridge::hasTextLayer(pages.at(2)));
    assert(pages.at(0).getObjectHandle().getKey("LastModified").isString());
    auto texts = page_texts(*pdf);
    assert(texts.at(0) == "Invoice 42\nsmudge");
    assert(texts.at(1) == "Page 1");
    // The text layer is invisible.
    assert(pages.at(0).getContentsData().find("3 Tr") != std::string::npos);

    // Marked pages are never processed again.
    result = run_operation(bpdf_op_ocr, {{"scan.pdf", out_data}}, {{"dpi", "72"}}, config);
    assert(recognizer->calls == 1);
    assert(page_texts(*reread_output(result)).at(0) == "Invoice 42\nsmudge");

    // Low-confidence words are dropped.
    result = run_operation(
        bpdf_op_ocr, {{"scan.pdf", data}}, {{"dpi", "72"}, {"min-confidence", "50"}}, config);
    assert(page_texts(*reread_output(result)).at(0) == "Invoice 42");

    // Lowering the threshold for existing text lets text pages through too.
    config.rasterizer = std::make_shared<BlankRasterizer>();
    result = run_operation(
        bpdf_op_ocr, {{"scan.pdf", data}}, {{"dpi", "50"}, {"min-text-runs", "2"}}, config);
    assert(recognizer->calls == 5);
    assert(recognizer->last_width == 400 && recognizer->last_height == 550);
    assert(result.warnings.empty());

    result = run_operation(
        bpdf_op_ocr, {{"scan.pdf", data}}, {{"pages", "2"}, {"min-text-runs", "2"}}, config);
    assert(recognizer->calls == 6);
    assert(BPDFOCRBridge::hasTextLayer(reread_output(result)->getAllPages().at(1)));
}

static void
test_extract_with_ocr()
{
    auto data = make_scanned_pdf();
    BPDFEngineConfig config;
    config.recognizer = std::make_shared<FakeRecognizer>();
    config.ocr_dpi = 72;
    auto result =
        run_operation(bpdf_op_extract_text, {{"scan.pdf", data}}, {{"ocr", "yes"}}, config);
    assert(result.artifacts.at(0).data == "Invoice 42\nsmudge\fPage 1\f\n");
}

static void
test_errors()
{
    auto data = make_scanned_pdf();
    try {
        run_operation(bpdf_op_ocr, {{"scan.pdf", data}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_ocr_unavailable);
    }
    BPDFEngineConfig config;
    config.recognizer = std::make_shared<FakeRecognizer>();
    try {
        run_operation(bpdf_op_ocr, {{"scan.pdf", data}}, {{"dpi", "0"}}, config);
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_invalid_parameter);
    }
}

int
main()
{
    test_default_rasterizer();
    test_ocr_operation();
    test_extract_with_ocr();
    test_errors();
    std::cout << "ocr tests done" << std::endl;
    return 0;
}
