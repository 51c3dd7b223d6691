#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFOCRBridge.hh>
#include <bpdf/BPDFObjGen.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BPDFPixmap.hh>
#include <bpdf/BPDFTextExtractor.hh>

using namespace bpdf_op;

namespace
{
    BPDFOCRBridge::Options
    ocr_options(BPDFEngineConfig const& config)
    {
        BPDFOCRBridge::Options options;
        options.language = config.ocr_language;
        options.dpi = config.ocr_dpi;
        return options;
    }

    std::vector<int>
    page_indices(std::vector<BPDFPageObjectHelper> const& pages, BPDF& pdf)
    {
        std::vector<int> result;
        for (auto const& page: pages) {
            result.push_back(pdf.findPage(page.getObjectHandle()));
        }
        return result;
    }

    class ExtractTextOperation: public BPDFOperation
    {
      public:
        ExtractTextOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_extract_text, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "write the text of each page";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                param("pages", pt_pages, "", "pages to extract; all if empty"),
                param(
                    "ocr",
                    pt_boolean,
                    "false",
                    "recognize text on pages without any before extracting")};
        }

        bool
        usesOCR(Parameters const& params) const override
        {
            return params.getBoolean("ocr");
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& pdf = *inputs.front().pdf;
            auto pages = selected_pages(pdf, params, "pages");
            Result result;
            if (params.getBoolean("ocr")) {
                BPDFOCRBridge bridge(config.recognizer, config.rasterizer);
                bridge.process(pdf, ocr_options(config), result.warnings, page_indices(pages, pdf));
            }
            std::string text;
            bool first = true;
            for (auto const& page: pages) {
                if (!first) {
                    text += "\f";
                }
                first = false;
                text += BPDFTextExtractor::extractPage(page);
            }
            if (!text.empty() && text.back() != '\n') {
                text += "\n";
            }
            result.artifacts.push_back({".txt", text});
            return result;
        }
    };

    class ExtractImagesOperation: public BPDFOperation
    {
      public:
        ExtractImagesOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_extract_images, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "write the images used by pages to separate files";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {param("pages", pt_pages, "", "pages whose images are extracted; all if empty")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& pdf = *inputs.front().pdf;
            Result result;
            BPDFObjGen::set seen;
            int count = 0;
            for (auto const& page: selected_pages(pdf, params, "pages")) {
                for (auto const& [name, image]: page.getImages()) {
                    if (image.isIndirect() && !seen.add(image.getObjGen())) {
                        continue;
                    }
                    ++count;
                    result.artifacts.push_back(extract(image, count, result.warnings));
                }
            }
            if (count == 0) {
                result.warnings.push_back("no images found");
            }
            return result;
        }

      private:
        static bool
        isJPEG(BPDFObjectHandle const& image)
        {
            auto filter = image.getDict().getKey("Filter");
            if (filter.isArray() && filter.getArrayNItems() == 1) {
                filter = filter.getArrayItem(0);
            }
            return filter.isNameAndEquals("DCTDecode");
        }

        static Artifact
        extract(BPDFObjectHandle const& image, int n, std::vector<std::string>& warnings)
        {
            auto suffix = "-" + std::to_string(n);
            if (isJPEG(image)) {
                return {suffix + ".jpg", image.getRawStreamData()};
            }
            BPDFPixmap pixmap;
            std::string reason;
            if (BPDFPixmap::fromImage(image, pixmap, reason)) {
                return {suffix + ".pnm", pixmap.toPNM()};
            }
            warnings.push_back(
                "image " + std::to_string(n) + " written as raw samples: " + reason);
            if (image.canDecode(bpdf_dl_generalized)) {
                return {suffix + ".bin", image.getStreamData(bpdf_dl_generalized)};
            }
            return {suffix + ".bin", image.getRawStreamData()};
        }
    };

    class OCROperation: public BPDFOperation
    {
      public:
        OCROperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_ocr, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "add an invisible text layer to pages that have no text";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                param("pages", pt_pages, "", "pages to recognize; all if empty"),
                param("language", pt_string, config.ocr_language, "recognizer language"),
                param(
                    "dpi", pt_integer, std::to_string(config.ocr_dpi), "recognition resolution"),
                param(
                    "min-text-runs",
                    pt_integer,
                    "1",
                    "pages with at least this many text operators are skipped"),
                param(
                    "min-confidence",
                    pt_number,
                    "0",
                    "drop recognized words below this confidence (0-100)")};
        }

        bool
        usesOCR(Parameters const&) const override
        {
            return true;
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            BPDFOCRBridge::Options options;
            options.language = params.getString("language");
            options.dpi = static_cast<int>(params.getInteger("dpi"));
            options.min_text_runs = static_cast<int>(params.getInteger("min-text-runs"));
            options.min_confidence = params.getNumber("min-confidence");
            if (options.dpi <= 0 || options.dpi > 1200) {
                fail(bpdf_e_invalid_parameter, input.filename, "dpi must be between 1 and 1200");
            }

            Result result;
            auto pages = selected_pages(*input.pdf, params, "pages");
            BPDFOCRBridge bridge(config.recognizer, config.rasterizer);
            bridge.process(*input.pdf, options, result.warnings, page_indices(pages, *input.pdf));
            result.outputs.push_back({input.pdf});
            return result;
        }
    };
} // namespace

std::unique_ptr<BPDFOperation>
bpdf_make_extract_text(BPDFEngineConfig const& config)
{
    return std::make_unique<ExtractTextOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_extract_images(BPDFEngineConfig const& config)
{
    return std::make_unique<ExtractImagesOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_ocr(BPDFEngineConfig const& config)
{
    return std::make_unique<OCROperation>(config);
}
