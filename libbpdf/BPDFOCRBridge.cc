#include <bpdf/BPDFOCRBridge.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFOperation_private.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BPDFTextExtractor.hh>
#include <bpdf/BUtil.hh>

#include <algorithm>
#include <cmath>

namespace
{
    std::string
    num(double value)
    {
        return BUtil::double_to_string(value, 2, true);
    }
} // namespace

bool
BPDFDefaultRasterizer::rasterize(
    BPDFPageObjectHelper const& page, int dpi, BPDFPixmap& result, std::string& reason)
{
    if (dpi <= 0) {
        reason = "resolution must be positive";
        return false;
    }
    double width = 0.0;
    double height = 0.0;
    auto to_user = bpdf_op::visual_space(page, width, height);
    BPDFMatrix to_visual;
    if (!to_user.invert(to_visual)) {
        reason = "page has an empty crop box";
        return false;
    }
    double const scale = dpi / 72.0;
    int canvas_width = static_cast<int>(std::lround(width * scale));
    int canvas_height = static_cast<int>(std::lround(height * scale));
    if (canvas_width <= 0 || canvas_height <= 0) {
        reason = "page has an empty crop box";
        return false;
    }
    if (canvas_width > max_dimension || canvas_height > max_dimension) {
        reason = "page is too large to rasterize at " + std::to_string(dpi) + " dpi";
        return false;
    }

    // Pick the largest image on the page, measured as displayed.
    BPDFMatrix unit_to_visual;
    BPDFPixmap image;
    double largest = 0.0;
    std::string last_reason = "page draws no images";
    for (auto const& placement: page.getImagePlacements()) {
        auto matrix = to_visual;
        matrix.concat(placement.matrix);
        double area = std::fabs(matrix.a * matrix.d - matrix.b * matrix.c);
        if (area <= largest) {
            continue;
        }
        BPDFPixmap candidate;
        std::string candidate_reason;
        if (!BPDFPixmap::fromImage(placement.image, candidate, candidate_reason)) {
            last_reason = "image " + placement.name + ": " + candidate_reason;
            continue;
        }
        largest = area;
        image = std::move(candidate);
        unit_to_visual = matrix;
    }
    if (image.empty()) {
        reason = last_reason;
        return false;
    }

    BPDFMatrix visual_to_unit;
    if (!unit_to_visual.invert(visual_to_unit)) {
        reason = "the page's image is drawn with a singular matrix";
        return false;
    }
    if (image.components != 1) {
        image = image.toGray();
    }
    // Reduce the image to about its displayed size first so that sampling doesn't drop detail.
    int shown_width = static_cast<int>(
        std::ceil(std::hypot(unit_to_visual.a, unit_to_visual.b) * scale));
    int shown_height = static_cast<int>(
        std::ceil(std::hypot(unit_to_visual.c, unit_to_visual.d) * scale));
    shown_width = std::max(1, shown_width);
    shown_height = std::max(1, shown_height);
    if (image.width > shown_width || image.height > shown_height) {
        image = image.resample(
            std::min(image.width, shown_width), std::min(image.height, shown_height));
    }

    BPDFPixmap canvas(canvas_width, canvas_height, 1);
    auto bounds = unit_to_visual.transformRectangle(BPDFObjectHandle::Rectangle(0, 0, 1, 1));
    int x0 = std::max(0, static_cast<int>(std::floor(bounds.llx * scale)));
    int x1 = std::min(canvas_width, static_cast<int>(std::ceil(bounds.urx * scale)));
    int y0 = std::max(0, static_cast<int>(std::floor((height - bounds.ury) * scale)));
    int y1 = std::min(canvas_height, static_cast<int>(std::ceil((height - bounds.lly) * scale)));
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            double u = 0.0;
            double v = 0.0;
            visual_to_unit.transform((px + 0.5) / scale, height - (py + 0.5) / scale, u, v);
            if (u < 0.0 || u >= 1.0 || v < 0.0 || v >= 1.0) {
                continue;
            }
            // Image rows run from the top of the unit square down.
            int col = std::min(image.width - 1, static_cast<int>(u * image.width));
            int row = std::min(image.height - 1, static_cast<int>((1.0 - v) * image.height));
            canvas.pixels.at(static_cast<size_t>(py) * static_cast<size_t>(canvas_width) +
                             static_cast<size_t>(px)) =
                image.pixels.at(static_cast<size_t>(row) * static_cast<size_t>(image.width) +
                                static_cast<size_t>(col));
        }
    }
    result = std::move(canvas);
    return true;
}

BPDFOCRBridge::BPDFOCRBridge(
    std::shared_ptr<BPDFOCRRecognizer> recognizer, std::shared_ptr<BPDFPageRasterizer> rasterizer) :
    recognizer(recognizer),
    rasterizer(rasterizer)
{
    if (!this->rasterizer) {
        this->rasterizer = std::make_shared<BPDFDefaultRasterizer>();
    }
}

bool
BPDFOCRBridge::hasTextLayer(BPDFPageObjectHelper const& page)
{
    auto flag = page.getObjectHandle()
                    .getKey("PieceInfo")
                    .getKey("bpdf")
                    .getKey("Private")
                    .getKey("OCRLayer");
    return flag.isBool() && flag.getBoolValue();
}

int
BPDFOCRBridge::process(
    BPDF& pdf,
    Options const& options,
    std::vector<std::string>& warnings,
    std::vector<int> const& pages)
{
    if (!recognizer) {
        throw BPDFExc(
            bpdf_e_ocr_unavailable, pdf.getFilename(), "", 0, "no OCR recognizer is available");
    }
    BPDFPageDocumentHelper dh(pdf);
    auto all_pages = dh.getAllPages();
    std::vector<int> selected = pages;
    if (selected.empty()) {
        for (int i = 0; i < static_cast<int>(all_pages.size()); ++i) {
            selected.push_back(i);
        }
    }

    int processed = 0;
    for (int index: selected) {
        auto& page = all_pages.at(static_cast<size_t>(index));
        std::string where = "page " + std::to_string(index + 1);
        if (hasTextLayer(page)) {
            continue;
        }
        if (BPDFTextExtractor::countTextRuns(page) >= options.min_text_runs) {
            continue;
        }
        BPDFPixmap image;
        std::string reason;
        if (!rasterizer->rasterize(page, options.dpi, image, reason)) {
            warnings.push_back(where + ": skipping OCR: " + reason);
            continue;
        }
        auto spans = recognizer->recognize(image, options.language, options.dpi);
        if (spans.empty()) {
            warnings.push_back(where + ": no text was recognized");
        }
        addTextLayer(page, image, spans, options);
        markPage(page);
        ++processed;
    }
    return processed;
}

void
BPDFOCRBridge::addTextLayer(
    BPDFPageObjectHelper& page,
    BPDFPixmap const& image,
    std::vector<BPDFOCRSpan> const& spans,
    Options const& options)
{
    double width = 0.0;
    double height = 0.0;
    auto to_user = bpdf_op::visual_space(page, width, height);
    double sx = width / image.width;
    double sy = height / image.height;

    std::string text_ops;
    std::string font;
    for (auto const& span: spans) {
        if (span.confidence < options.min_confidence || span.width <= 0 || span.height <= 0) {
            continue;
        }
        auto text = span.text;
        while (!text.empty() && (text.back() == ' ' || text.back() == '\n')) {
            text.pop_back();
        }
        if (text.empty()) {
            continue;
        }
        if (font.empty()) {
            font = bpdf_op::add_standard_font(page, "Helvetica");
        }
        double llx = span.x * sx;
        double lly = height - (span.y + span.height) * sy;
        double box_width = span.width * sx;
        double font_size = span.height * sy;
        double natural = bpdf_op::text_width(text, font_size);
        double hscale = (natural > 0.0) ? 100.0 * box_width / natural : 100.0;
        // Put the baseline above the bottom of the box by Helvetica's descent.
        text_ops += "/" + font + " " + num(font_size) + " Tf " + num(hscale) + " Tz 1 0 0 1 " +
            num(llx) + " " + num(lly + 0.207 * font_size) + " Tm " +
            bpdf_op::text_operand(text) + " Tj\n";
    }
    if (text_ops.empty()) {
        return;
    }
    page.addContentFragment(to_user.unparse() + " cm\nBT\n3 Tr\n" + text_ops + "ET", false);
}

void
BPDFOCRBridge::markPage(BPDFPageObjectHelper& page)
{
    auto oh = page.getObjectHandle();
    auto now = BPDFObjectHandle::newString(
        BUtil::bpdf_time_to_pdf_time(BUtil::get_current_bpdf_time()));
    auto piece_info = oh.getKey("PieceInfo");
    if (!piece_info.isDictionary()) {
        piece_info = BPDFObjectHandle::newDictionary();
        oh.replaceKey("PieceInfo", piece_info);
    }
    auto data = BPDFObjectHandle::newDictionary();
    data.replaceKey("LastModified", now);
    auto priv = BPDFObjectHandle::newDictionary();
    priv.replaceKey("OCRLayer", BPDFObjectHandle::newBool(true));
    data.replaceKey("Private", priv);
    piece_info.replaceKey("bpdf", data);
    oh.replaceKey("LastModified", now);
}
