#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BPDFSignature.hh>
#include <bpdf/BPDFTextExtractor.hh>
#include <bpdf/BUtil.hh>

#include <map>
#include <set>

using namespace bpdf_op;

namespace
{
    char const* const info_keys[] = {
        "Title", "Author", "Subject", "Keywords", "Creator", "Producer"};

    std::string
    now()
    {
        return BUtil::bpdf_time_to_pdf_time(BUtil::get_current_bpdf_time());
    }

    class MetadataOperation: public BPDFOperation
    {
      public:
        MetadataOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_metadata, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "edit the document information dictionary";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            std::vector<ParameterSpec> result;
            for (auto const* key: info_keys) {
                result.push_back(param(
                    std::string("set-") + key,
                    pt_string,
                    "",
                    std::string("new /") + key + "; an empty value removes it"));
            }
            result.push_back(param("remove", pt_list, "", "comma-separated keys to remove"));
            result.push_back(
                param("update-mod-date", pt_boolean, "true", "set /ModDate to the current time"));
            return result;
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            auto info = input.pdf->getInfo(true);
            for (auto key: params.getList("remove")) {
                if (!key.empty() && key.at(0) == '/') {
                    key = key.substr(1);
                }
                info.removeKey(key);
            }
            for (auto const* key: info_keys) {
                auto name = std::string("set-") + key;
                if (!params.has(name)) {
                    continue;
                }
                auto const& value = params.getString(name);
                if (value.empty()) {
                    info.removeKey(key);
                } else {
                    info.replaceKey(key, BPDFObjectHandle::newUnicodeString(value));
                }
            }
            if (params.getBoolean("update-mod-date")) {
                info.replaceKey("ModDate", BPDFObjectHandle::newString(now()));
            }
            Result result;
            result.outputs.push_back({input.pdf});
            return result;
        }
    };

    class RepairOperation: public BPDFOperation
    {
      public:
        RepairOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_repair, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "rebuild the cross-reference data by scanning the file and rewrite it";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {};
        }

        void
        openInput(Input& input, Parameters const& params) const override
        {
            auto pdf = BPDF::create();
            pdf->setLogger(config.getLogger());
            pdf->setForceReconstruct(true);
            try {
                pdf->processMemoryFile(
                    input.filename.c_str(), input.data, getInputPassword(params).c_str());
            } catch (BPDFExc& e) {
                if (e.getErrorCode() == bpdf_e_password) {
                    throw;
                }
                fail(bpdf_e_unrecoverable, input.filename, e.getMessageDetail());
            }
            input.pdf = pdf;
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const&) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            Result result;
            int npages = 0;
            try {
                npages = BPDFPageDocumentHelper(*input.pdf).getPageCount();
            } catch (BPDFExc& e) {
                fail(bpdf_e_unrecoverable, input.filename, e.getMessageDetail());
            }
            if (npages == 0) {
                fail(bpdf_e_unrecoverable, input.filename, "no pages could be recovered");
            }
            int n = 0;
            for (auto const& page: BPDFPageDocumentHelper(*input.pdf).getAllPages()) {
                ++n;
                for (auto const& stream: page.getPageContents()) {
                    if (!stream.canDecode()) {
                        result.warnings.push_back(
                            "page " + std::to_string(n) + ": content stream can't be decoded");
                    }
                }
            }
            result.outputs.push_back({input.pdf});
            return result;
        }
    };

    class InfoOperation: public BPDFOperation
    {
      public:
        InfoOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_info, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "describe a document and check that its pages can be read; with two inputs, "
                   "also compare them";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {};
        }

        int
        getMaxInputs() const override
        {
            return 2;
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            Result result;
            std::string report;
            std::vector<Summary> summaries;
            for (auto& input: inputs) {
                summaries.push_back(describe(input, params, report, result.warnings));
            }
            if (summaries.size() == 2) {
                compare(summaries.at(0), summaries.at(1), report);
            }
            result.artifacts.push_back({".txt", report});
            return result;
        }

      private:
        struct Summary
        {
            int pages{0};
            std::map<std::string, std::string> metadata;
            std::string text;
        };

        static std::string
        infoValue(BPDFObjectHandle const& value)
        {
            if (value.isString()) {
                return value.getUTF8Value();
            }
            return value.unparse();
        }

        Summary
        describe(
            Input& input,
            Parameters const& params,
            std::string& report,
            std::vector<std::string>& warnings) const
        {
            auto& pdf = *input.pdf;
            Summary summary;
            if (!report.empty()) {
                report += "\n";
            }
            report += "file: " + input.filename + "\n";
            report += "size: " + std::to_string(input.data.size()) + " bytes\n";
            report += "version: " + pdf.getPDFVersion() + "\n";

            int R = 0;
            int P = 0;
            if (pdf.isEncrypted(R, P)) {
                report += "encrypted: yes (R " + std::to_string(R) + ", P " + std::to_string(P) +
                    ")\n";
            } else {
                report += "encrypted: no\n";
            }

            BPDFPageDocumentHelper dh(pdf);
            auto pages = dh.getAllPages();
            summary.pages = static_cast<int>(pages.size());
            report += "pages: " + std::to_string(summary.pages) + "\n";

            for (auto const& [key, value]: pdf.getInfo().getDictAsMap()) {
                summary.metadata[key] = infoValue(value);
                report += "info /" + key + ": " + summary.metadata[key] + "\n";
            }

            auto signatures = BPDFSignature::verify(input.data, getInputPassword(params));
            auto status = BPDFSignature::overallStatus(signatures);
            if (status == BPDFSignature::s_no_signature) {
                report += "signatures: none\n";
            } else {
                report += "signatures: " + std::to_string(signatures.size()) + " (" +
                    BPDFSignature::statusName(status) + ")\n";
            }

            std::vector<std::string> problems;
            int n = 0;
            for (auto const& page: pages) {
                ++n;
                auto box = page.getMediaBox();
                report += "page " + std::to_string(n) + ": " +
                    BUtil::double_to_string(box.width(), 2) + " x " +
                    BUtil::double_to_string(box.height(), 2) + ", rotation " +
                    std::to_string(page.getRotation()) + "\n";
                try {
                    if (!summary.text.empty()) {
                        summary.text += "\f";
                    }
                    summary.text += BPDFTextExtractor::extractPage(page);
                } catch (BPDFExc& e) {
                    problems.push_back("page " + std::to_string(n) + ": " + e.getMessageDetail());
                }
            }
            if (summary.pages == 0) {
                problems.emplace_back("document has no pages");
            }
            for (auto const& w: pdf.getWarnings()) {
                problems.emplace_back(w.what());
            }
            report += std::string("valid: ") + (problems.empty() ? "yes" : "no") + "\n";
            for (auto const& problem: problems) {
                report += "  " + problem + "\n";
                warnings.push_back(problem);
            }
            return summary;
        }

        static void
        compare(Summary const& a, Summary const& b, std::string& report)
        {
            report += "\ncomparison:\n";
            report += std::string("  page counts match: ") + (a.pages == b.pages ? "yes" : "no") +
                "\n";
            std::set<std::string> keys;
            for (auto const& item: a.metadata) {
                keys.insert(item.first);
            }
            for (auto const& item: b.metadata) {
                keys.insert(item.first);
            }
            for (auto const& key: keys) {
                auto ia = a.metadata.find(key);
                auto ib = b.metadata.find(key);
                std::string va = (ia == a.metadata.end()) ? "(none)" : ia->second;
                std::string vb = (ib == b.metadata.end()) ? "(none)" : ib->second;
                if (va != vb) {
                    report += "  /" + key + " differs: " + va + " | " + vb + "\n";
                }
            }
            report += std::string("  text identical: ") + (a.text == b.text ? "yes" : "no") + "\n";
        }
    };
} // namespace

std::unique_ptr<BPDFOperation>
bpdf_make_metadata(BPDFEngineConfig const& config)
{
    return std::make_unique<MetadataOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_repair(BPDFEngineConfig const& config)
{
    return std::make_unique<RepairOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_info(BPDFEngineConfig const& config)
{
    return std::make_unique<InfoOperation>(config);
}
