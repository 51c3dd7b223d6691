#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPixmap.hh>
#include <bpdf/BUtil.hh>

#include <cmath>
#include <iostream>
#include <string>

static char const* jpeg_file = "content-test.jpg";

static bool
contains(std::string const& haystack, std::string const& needle)
{
    return haystack.find(needle) != std::string::npos;
}

static bool
close(double a, double b)
{
    return std::fabs(a - b) < 0.01;
}

static bpdf_error_code_e
error_code(
    bpdf_operation_e op,
    std::string const& data,
    std::map<std::string, std::string> const& values)
{
    try {
        run_operation(op, {{"in.pdf", data}}, values);
    } catch (BPDFExc& e) {
        return e.getErrorCode();
    }
    return bpdf_e_success;
}

static void
test_watermark()
{
    auto data = write_pdf(*make_sample_pdf(3));
    auto result =
        run_operation(bpdf_op_watermark, {{"in.pdf", data}}, {{"text", "DRAFT"}, {"pages", "1,3"}});
    auto pdf = reread_output(result);
    auto texts = page_texts(*pdf);
    // Drawn under the page content by default
    assert(texts.at(0) == "DRAFT\nPage 1");
    assert(texts.at(1) == "Page 2");
    assert(texts.at(2) == "DRAFT\nPage 3");

    BPDFPageObjectHelper page = pdf->getAllPages().at(0);
    auto gs = page.getAttribute("Resources").getKey("ExtGState");
    assert(gs.isDictionary() && gs.getKeys().size() == 1);
    auto state = gs.getKey(*gs.getKeys().begin());
    assert(close(state.getKey("ca").getNumericValue(), 0.3));
    assert(close(state.getKey("CA").getNumericValue(), 0.3));
    // The original content is isolated in its own graphics state.
    assert(page.getPageContents().size() == 4);

    auto over = run_operation(
        bpdf_op_watermark,
        {{"in.pdf", data}},
        {{"text", "COPY"}, {"position", "over"}, {"opacity", "1"}});
    assert(page_texts(*reread_output(over)).at(1) == "Page 2\nCOPY");

    assert(error_code(bpdf_op_watermark, data, {}) == bpdf_e_invalid_parameter);
    assert(
        error_code(bpdf_op_watermark, data, {{"text", "X"}, {"opacity", "1.5"}}) ==
        bpdf_e_invalid_parameter);
    assert(
        error_code(bpdf_op_watermark, data, {{"text", "X"}, {"position", "middle"}}) ==
        bpdf_e_invalid_parameter);
    assert(
        error_code(bpdf_op_watermark, data, {{"text", "X"}, {"pages", "7"}}) ==
        bpdf_e_invalid_range);
}

static void
test_add_text()
{
    auto data = write_pdf(*make_sample_pdf(2));
    auto result = run_operation(
        bpdf_op_add_text,
        {{"in.pdf", data}},
        {{"text", "Reviewed\nby QA"}, {"x", "300"}, {"y", "100"}, {"pages", "2"}});
    auto pdf = reread_output(result);
    auto texts = page_texts(*pdf);
    assert(texts.at(0) == "Page 1");
    assert(texts.at(1) == "Page 2\nReviewed\nby QA");

    BPDFPageObjectHelper page = pdf->getAllPages().at(1);
    auto contents = page.getContentsData();
    assert(contents.substr(0, 2) == "q\n");
    assert(contents.find("300 100 Td") != std::string::npos);
    assert(contents.find("(by QA) Tj") != std::string::npos);
    // The sample's font F1 is kept and the added font gets a new name.
    auto fonts = page.getAttribute("Resources").getKey("Font");
    assert(fonts.getKeys().size() == 2);
    assert(fonts.hasKey("F1"));

    // Non-ASCII text is encoded for the standard font.
    auto accented = run_operation(bpdf_op_add_text, {{"in.pdf", data}}, {{"text", "Caf\xc3\xa9"}});
    assert(page_texts(*reread_output(accented)).at(0) == "Page 1\nCaf\xc3\xa9");

    assert(
        error_code(bpdf_op_add_text, data, {{"text", "X"}, {"font-size", "0"}}) ==
        bpdf_e_invalid_parameter);
    assert(
        error_code(bpdf_op_add_text, data, {{"text", "X"}, {"x", "left"}}) ==
        bpdf_e_invalid_parameter);
}

static void
test_add_image()
{
    BPDFPixmap pix(64, 48, 3);
    for (int y = 0; y < 48; ++y) {
        for (int x = 0; x < 64; ++x) {
            auto at = static_cast<size_t>((y * 64 + x) * 3);
            pix.pixels[at] = static_cast<char>(x * 4);
            pix.pixels[at + 1] = static_cast<char>(y * 5);
            pix.pixels[at + 2] = static_cast<char>(128);
        }
    }
    auto jpeg = pix.toJPEG(85);
    BUtil::write_string_to_file(jpeg_file, jpeg);

    auto data = write_pdf(*make_sample_pdf(2));
    auto result = run_operation(
        bpdf_op_add_image, {{"in.pdf", data}}, {{"image", jpeg_file}, {"width", "128"}});
    auto pdf = reread_output(result);
    for (auto const& oh: pdf->getAllPages()) {
        BPDFPageObjectHelper page(oh);
        auto placements = page.getImagePlacements();
        assert(placements.size() == 1);
        auto image = placements.at(0).image;
        assert(image.getDict().getKey("Filter").isNameAndEquals("DCTDecode"));
        assert(image.getDict().getKey("Width").getIntValue() == 64);
        assert(image.getDict().getKey("ColorSpace").isNameAndEquals("DeviceRGB"));
        // The JPEG data is embedded unchanged.
        assert(image.getRawStreamData() == jpeg);
        // Height follows the aspect ratio.
        auto r = placements.at(0).matrix.transformRectangle({0, 0, 1, 1});
        assert(close(r.llx, 36) && close(r.lly, 36) && close(r.urx, 164) && close(r.ury, 132));
    }
    // One image object is shared by all pages.
    auto const& pages = pdf->getAllPages();
    BPDFPageObjectHelper p1(pages.at(0));
    BPDFPageObjectHelper p2(pages.at(1));
    assert(p1.getImagePlacements().at(0).image.isSameObjectAs(
        p2.getImagePlacements().at(0).image));

    // On a rotated page the position is measured on the page as displayed.
    auto rotated = run_operation(bpdf_op_rotate, {{"in.pdf", data}}, {{"angle", "90"}});
    auto rotated_data = BPDFOperation::writeOutput(rotated.outputs.at(0));
    auto placed = reread_output(run_operation(
        bpdf_op_add_image, {{"in.pdf", rotated_data}}, {{"image", jpeg_file}, {"height", "48"}}));
    BPDFPageObjectHelper rp(placed->getAllPages().at(0));
    auto r = rp.getImagePlacements().at(0).matrix.transformRectangle({0, 0, 1, 1});
    assert(close(r.urx - r.llx, 48) && close(r.ury - r.lly, 64));
    assert(close(r.urx, 612 - 36) && close(r.lly, 36));

    assert(
        error_code(bpdf_op_add_image, data, {{"image", "missing-image.jpg"}}) == bpdf_e_system);
    BUtil::write_string_to_file(jpeg_file, "not a jpeg");
    assert(error_code(bpdf_op_add_image, data, {{"image", jpeg_file}}) == bpdf_e_unsupported);
    BUtil::remove_file(jpeg_file);
}

static void
test_paginate()
{
    auto data = write_pdf(*make_sample_pdf(3));
    auto result = run_operation(bpdf_op_paginate, {{"in.pdf", data}});
    auto texts = page_texts(*reread_output(result));
    assert(texts == std::vector<std::string>({"Page 1\n1", "Page 2\n2", "Page 3\n3"}));

    result = run_operation(
        bpdf_op_paginate,
        {{"in.pdf", data}},
        {{"format", "Page {n} of {total}"}, {"start", "5"}, {"position", "top-center"}});
    auto pdf = reread_output(result);
    assert(page_texts(*pdf).at(2) == "Page 3\nPage 7 of 7");

    // Label placement
    BPDFPageObjectHelper page(pdf->getAllPages().at(0));
    auto contents = page.getContentsData();
    auto pos = contents.rfind(" Td");
    assert(pos != std::string::npos);
    auto line_start = contents.rfind('\n', pos) + 1;
    auto operands = BUtil::split_string(contents.substr(line_start, pos - line_start), ' ');
    assert(operands.size() == 2);
    double x = std::stod(operands.at(0));
    double y = std::stod(operands.at(1));
    assert(x > 200 && x < 306);
    assert(close(y, 792 - 36 - 10));

    assert(
        error_code(bpdf_op_paginate, data, {{"position", "center"}}) == bpdf_e_invalid_parameter);
    assert(error_code(bpdf_op_paginate, data, {{"start", "one"}}) == bpdf_e_invalid_parameter);
}

int
main()
{
    test_watermark();
    test_add_text();
    test_add_image();
    test_paginate();
    std::cout << "content operation tests done" << std::endl;
    return 0;
}
