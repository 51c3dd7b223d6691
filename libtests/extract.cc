#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPixmap.hh>

#include <iostream>

static BPDFObjectHandle
new_image(BPDF& pdf, int width, int height, std::string const& color_space, int bpc)
{
    int components = (color_space == "DeviceRGB") ? 3 : 1;
    size_t row_bytes = static_cast<size_t>((width * components * bpc + 7) / 8);
    std::string pixels;
    for (size_t i = 0; i < row_bytes * static_cast<size_t>(height); ++i) {
        pixels += static_cast<char>(i % 251);
    }
    auto image = pdf.newStream(pixels);
    auto dict = image.getDict();
    dict.replaceKey("Type", BPDFObjectHandle::newName("XObject"));
    dict.replaceKey("Subtype", BPDFObjectHandle::newName("Image"));
    dict.replaceKey("Width", BPDFObjectHandle::newInteger(width));
    dict.replaceKey("Height", BPDFObjectHandle::newInteger(height));
    dict.replaceKey("ColorSpace", BPDFObjectHandle::newName(color_space));
    dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(bpc));
    return image;
}

static void
place(BPDF& pdf, int page_index, BPDFObjectHandle image)
{
    BPDFPageObjectHelper page(pdf.getAllPages().at(static_cast<size_t>(page_index)));
    auto name = page.addResource("XObject", "Im", image);
    page.addContentFragment("100 0 0 100 50 50 cm /" + name + " Do", false);
}

static void
test_extract_text()
{
    auto data = write_pdf(*make_sample_pdf(3));
    auto result = run_operation(bpdf_op_extract_text, {{"in.pdf", data}});
    assert(result.outputs.empty());
    assert(result.artifacts.size() == 1);
    assert(result.artifacts.at(0).suffix == ".txt");
    assert(result.artifacts.at(0).data == "Page 1\fPage 2\fPage 3\n");

    result = run_operation(bpdf_op_extract_text, {{"in.pdf", data}}, {{"pages", "3,1"}});
    assert(result.artifacts.at(0).data == "Page 3\fPage 1\n");

    // Without a recognizer, asking for OCR is an error even if no page needs it.
    try {
        run_operation(bpdf_op_extract_text, {{"in.pdf", data}}, {{"ocr", "true"}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_ocr_unavailable);
    }

    auto empty = BPDF::create();
    empty->emptyPDF();
    result = run_operation(bpdf_op_extract_text, {{"in.pdf", write_pdf(*empty)}});
    assert(result.artifacts.at(0).data.empty());
}

static void
test_extract_images()
{
    auto pdf = make_sample_pdf(3);
    BPDFPixmap pix(40, 30, 3);
    for (size_t i = 0; i < pix.pixels.size(); ++i) {
        pix.pixels[i] = static_cast<char>(i % 200);
    }
    auto jpeg_data = pix.toJPEG(75);
    auto jpeg = new_image(*pdf, 40, 30, "DeviceRGB", 8);
    jpeg.replaceStreamData(
        jpeg_data, BPDFObjectHandle::newName("DCTDecode"), BPDFObjectHandle::newNull());
    auto gray = new_image(*pdf, 16, 8, "DeviceGray", 8);
    auto bitmap = new_image(*pdf, 16, 16, "DeviceGray", 1);
    place(*pdf, 0, jpeg);
    place(*pdf, 1, gray);
    place(*pdf, 1, jpeg);
    place(*pdf, 2, bitmap);
    auto data = write_pdf(*pdf);

    auto result = run_operation(bpdf_op_extract_images, {{"in.pdf", data}});
    assert(result.outputs.empty());
    assert(result.artifacts.size() == 3);
    assert(result.artifacts.at(0).suffix == "-1.jpg");
    assert(result.artifacts.at(0).data == jpeg_data);
    assert(result.artifacts.at(1).suffix == "-2.pnm");
    assert(result.artifacts.at(1).data.substr(0, 11) == "P5\n16 8\n255");
    assert(result.artifacts.at(1).data.size() == 12 + 16 * 8);
    // Images that can't be converted are written as their decoded samples.
    assert(result.artifacts.at(2).suffix == "-3.bin");
    assert(result.artifacts.at(2).data.size() == 2 * 16);
    assert(result.warnings.size() == 1);
    assert(result.warnings.at(0).substr(0, 32) == "image 3 written as raw samples: ");

    result = run_operation(bpdf_op_extract_images, {{"in.pdf", data}}, {{"pages", "2"}});
    assert(result.artifacts.size() == 2);
    assert(result.warnings.empty());

    auto plain = write_pdf(*make_sample_pdf(2));
    result = run_operation(bpdf_op_extract_images, {{"in.pdf", plain}});
    assert(result.artifacts.empty());
    assert(result.warnings == std::vector<std::string>({"no images found"}));
}

int
main()
{
    test_extract_text();
    test_extract_images();
    std::cout << "extract tests done" << std::endl;
    return 0;
}
