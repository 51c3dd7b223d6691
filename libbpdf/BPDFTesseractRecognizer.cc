#include <bpdf/BPDFTesseractRecognizer.hh>

#include <bpdf/BPDFExc.hh>

#include <tesseract/baseapi.h>

#include <memory>

namespace
{
    struct TessEnd
    {
        void
        operator()(tesseract::TessBaseAPI* api) const
        {
            api->End();
            delete api;
        }
    };
} // namespace

BPDFTesseractRecognizer::BPDFTesseractRecognizer(std::string const& tessdata_path) :
    tessdata_path(tessdata_path)
{
}

std::vector<BPDFOCRSpan>
BPDFTesseractRecognizer::recognize(BPDFPixmap const& image, std::string const& language, int dpi)
{
    std::unique_ptr<tesseract::TessBaseAPI, TessEnd> api(new tesseract::TessBaseAPI());
    char const* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
    if (api->Init(datapath, language.c_str()) != 0) {
        throw BPDFExc(
            bpdf_e_ocr_unavailable,
            "",
            "",
            0,
            "unable to initialize tesseract for language " + language);
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);
    api->SetImage(
        reinterpret_cast<unsigned char const*>(image.pixels.data()),
        image.width,
        image.height,
        image.components,
        image.width * image.components);
    api->SetSourceResolution(dpi);

    std::vector<BPDFOCRSpan> result;
    if (api->Recognize(nullptr) != 0) {
        return result;
    }
    std::unique_ptr<tesseract::ResultIterator> it(api->GetIterator());
    if (!it) {
        return result;
    }
    auto level = tesseract::RIL_WORD;
    do {
        std::unique_ptr<char[]> word(it->GetUTF8Text(level));
        if (!word || *word.get() == '\0') {
            continue;
        }
        int x1 = 0;
        int y1 = 0;
        int x2 = 0;
        int y2 = 0;
        if (!it->BoundingBox(level, &x1, &y1, &x2, &y2)) {
            continue;
        }
        BPDFOCRSpan span;
        span.text = word.get();
        span.x = x1;
        span.y = y1;
        span.width = x2 - x1;
        span.height = y2 - y1;
        span.confidence = it->Confidence(level);
        result.push_back(span);
    } while (it->Next(level));
    return result;
}
