#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPixmap.hh>

#include <iostream>

// Add a noisy RGB image of size x size pixels drawn extent points wide to the first page
static BPDFObjectHandle
add_image(BPDF& pdf, int size, double extent, int bpc = 8)
{
    std::string pixels;
    unsigned int seed = 12345;
    int samples = (bpc == 8) ? size * size * 3 : (size + 7) / 8 * size;
    for (int i = 0; i < samples; ++i) {
        seed = seed * 1103515245U + 12345U;
        pixels += static_cast<char>((seed >> 16) & 0xff);
    }
    auto image = pdf.newStream(pixels);
    auto dict = image.getDict();
    dict.replaceKey("Type", BPDFObjectHandle::newName("XObject"));
    dict.replaceKey("Subtype", BPDFObjectHandle::newName("Image"));
    dict.replaceKey("Width", BPDFObjectHandle::newInteger(size));
    dict.replaceKey("Height", BPDFObjectHandle::newInteger(size));
    dict.replaceKey("ColorSpace", BPDFObjectHandle::newName(bpc == 8 ? "DeviceRGB" : "DeviceGray"));
    dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(bpc));

    BPDFPageObjectHelper page(pdf.getAllPages().at(0));
    auto name = page.addResource("XObject", "Im", image);
    auto e = std::to_string(extent);
    page.addContentFragment(e + " 0 0 " + e + " 100 100 cm /" + name + " Do", false);
    return image;
}

static BPDFObjectHandle
first_image(BPDF& pdf)
{
    BPDFPageObjectHelper page(pdf.getAllPages().at(0));
    return page.getImagePlacements().at(0).image;
}

static void
test_images()
{
    auto pdf = make_sample_pdf(1);
    add_image(*pdf, 300, 300.0);
    auto data = write_pdf(*pdf);

    auto result = run_operation(bpdf_op_compress, {{"in.pdf", data}}, {{"quality", "medium"}});
    assert(result.warnings.empty());
    auto medium = BPDFOperation::writeOutput(result.outputs.at(0));
    assert(medium.size() < data.size() / 2);

    auto out = read_pdf(medium);
    auto image = first_image(*out);
    assert(image.getDict().getKey("Filter").isNameAndEquals("DCTDecode"));
    assert(image.getDict().getKey("Width").getIntValue() == 225);
    assert(image.getDict().getKey("Height").getIntValue() == 225);
    BPDFPixmap pixmap;
    std::string reason;
    assert(BPDFPixmap::fromImage(image, pixmap, reason));
    assert(pixmap.width == 225 && pixmap.components == 3);
    // Text content is untouched.
    assert(page_texts(*out) == std::vector<std::string>({"Page 1"}));

    auto low = BPDFOperation::writeOutput(
        run_operation(bpdf_op_compress, {{"in.pdf", data}}, {{"quality", "low"}}).outputs.at(0));
    auto high = BPDFOperation::writeOutput(
        run_operation(bpdf_op_compress, {{"in.pdf", data}}, {{"quality", "high"}}).outputs.at(0));
    assert(low.size() < medium.size());
    assert(medium.size() < high.size());
    assert(first_image(*read_pdf(high)).getDict().getKey("Width").getIntValue() == 300);

    // 300 pixels over 300 points is 72 dpi; a 36 dpi limit halves it even at high quality.
    result = run_operation(
        bpdf_op_compress, {{"in.pdf", data}}, {{"quality", "high"}, {"dpi", "36"}});
    auto limited = reread_output(result);
    assert(first_image(*limited).getDict().getKey("Width").getIntValue() == 150);

    // The engine's default tier applies when quality isn't given.
    BPDFEngineConfig config;
    config.quality = BPDFEngineConfig::q_low;
    result = run_operation(bpdf_op_compress, {{"in.pdf", data}}, {}, config);
    assert(first_image(*reread_output(result)).getDict().getKey("Width").getIntValue() == 150);
}

static void
test_unsupported()
{
    auto pdf = make_sample_pdf(1);
    add_image(*pdf, 64, 64.0, 1);
    auto data = write_pdf(*pdf);
    auto result = run_operation(bpdf_op_compress, {{"in.pdf", data}});
    assert(result.warnings.size() == 1);
    assert(
        result.warnings.at(0).find("image does not have 8 bits per component") !=
        std::string::npos);
    auto image = first_image(*reread_output(result));
    assert(image.getDict().getKey("BitsPerComponent").getIntValue() == 1);
    assert(!image.getDict().getKey("Filter").isNameAndEquals("DCTDecode"));

    try {
        run_operation(bpdf_op_compress, {{"in.pdf", data}}, {{"quality", "best"}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_invalid_parameter);
    }
    try {
        run_operation(bpdf_op_compress, {{"in.pdf", data}}, {{"dpi", "-1"}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_invalid_parameter);
    }
}

int
main()
{
    test_images();
    test_unsupported();
    std::cout << "compress tests done" << std::endl;
    return 0;
}
