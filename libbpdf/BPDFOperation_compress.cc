#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BPDFPixmap.hh>

#include <cmath>
#include <map>

using namespace bpdf_op;

namespace
{
    struct QualityTier
    {
        double factor;
        int jpeg_quality;
    };

    QualityTier
    tier(std::string const& name)
    {
        if (name == "low") {
            return {0.5, 40};
        } else if (name == "high") {
            return {1.0, 80};
        }
        return {0.75, 60};
    }

    class CompressOperation: public BPDFOperation
    {
      public:
        CompressOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_compress, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "recompress streams and downsample images";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                choice(
                    "quality",
                    {"low", "medium", "high"},
                    BPDFEngineConfig::qualityName(config.quality),
                    "image quality tier"),
                param(
                    "dpi",
                    pt_integer,
                    "0",
                    "highest resolution to keep for images placed on pages; 0 for no limit")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            auto t = tier(params.getString("quality"));
            long long dpi = params.getInteger("dpi");
            if (dpi < 0) {
                fail(bpdf_e_invalid_parameter, input.filename, "dpi can't be negative");
            }

            Result result;
            auto max_factor = dpiLimits(*input.pdf, dpi);
            for (auto& obj: input.pdf->getAllObjects()) {
                if (!obj.isImage()) {
                    continue;
                }
                double factor = t.factor;
                auto it = max_factor.find(obj.getObjGen());
                if (it != max_factor.end()) {
                    factor = std::min(factor, it->second);
                }
                compressImage(obj, factor, t.jpeg_quality, input.filename, result.warnings);
            }

            BPDFOperation::Output out{input.pdf};
            out.decode_level = bpdf_dl_generalized;
            out.compression_level = 9;
            result.outputs.push_back(out);
            return result;
        }

      private:
        // For each image placed on a page, the largest scale factor that keeps its resolution
        // at or below dpi
        std::map<BPDFObjGen, double>
        dpiLimits(BPDF& pdf, long long dpi)
        {
            std::map<BPDFObjGen, double> result;
            if (dpi == 0) {
                return result;
            }
            for (auto& page: BPDFPageDocumentHelper(pdf).getAllPages()) {
                for (auto const& placement: page.getImagePlacements()) {
                    auto box = placement.matrix.transformRectangle({0, 0, 1, 1});
                    auto dict = placement.image.getDict();
                    double pixels = dict.getKey("Width").isInteger()
                        ? static_cast<double>(dict.getKey("Width").getIntValue())
                        : 0.0;
                    if (box.width() <= 0.0 || pixels <= 0.0) {
                        continue;
                    }
                    double current_dpi = pixels * 72.0 / box.width();
                    double factor = std::min(1.0, static_cast<double>(dpi) / current_dpi);
                    auto og = placement.image.getObjGen();
                    // An image drawn in several places keeps the largest needed resolution.
                    if (result.count(og)) {
                        result[og] = std::max(result[og], factor);
                    } else {
                        result[og] = factor;
                    }
                }
            }
            return result;
        }

        void
        compressImage(
            BPDFObjectHandle image,
            double factor,
            int quality,
            std::string const& filename,
            std::vector<std::string>& warnings)
        {
            std::string description = "image object " + image.getObjGen().unparse();
            BPDFPixmap pixmap;
            std::string reason;
            if (!BPDFPixmap::fromImage(image, pixmap, reason)) {
                warnings.push_back(
                    BPDFExc(
                        bpdf_e_unsupported,
                        filename,
                        description,
                        0,
                        "leaving image unchanged: " + reason)
                        .what());
                return;
            }
            int new_width = std::max(1, static_cast<int>(std::lround(pixmap.width * factor)));
            int new_height = std::max(1, static_cast<int>(std::lround(pixmap.height * factor)));
            if (new_width != pixmap.width || new_height != pixmap.height) {
                pixmap = pixmap.resample(new_width, new_height);
            }
            auto jpeg = pixmap.toJPEG(quality);
            if (jpeg.size() >= image.getRawStreamData().size()) {
                return;
            }
            image.replaceStreamData(
                jpeg, BPDFObjectHandle::newName("DCTDecode"), BPDFObjectHandle::newNull());
            auto dict = image.getDict();
            dict.replaceKey("Width", BPDFObjectHandle::newInteger(new_width));
            dict.replaceKey("Height", BPDFObjectHandle::newInteger(new_height));
            dict.replaceKey("BitsPerComponent", BPDFObjectHandle::newInteger(8));
            dict.removeKey("Decode");
        }
    };
} // namespace

std::unique_ptr<BPDFOperation>
bpdf_make_compress(BPDFEngineConfig const& config)
{
    return std::make_unique<CompressOperation>(config);
}
