#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BUtil.hh>

#include <set>

using namespace bpdf_op;

namespace
{
    std::shared_ptr<BPDF>
    new_document()
    {
        auto pdf = BPDF::create();
        pdf->emptyPDF();
        return pdf;
    }

    // Add a top-level outline item for each entry of targets, in order
    void
    add_outline(BPDF& pdf, std::vector<std::pair<std::string, BPDFObjectHandle>> const& targets)
    {
        if (targets.empty()) {
            return;
        }
        auto outlines = pdf.makeIndirectObject(BPDFObjectHandle::newDictionary());
        outlines.replaceKey("Type", BPDFObjectHandle::newName("Outlines"));
        std::vector<BPDFObjectHandle> items;
        for (auto const& [title, page]: targets) {
            auto item = pdf.makeIndirectObject(BPDFObjectHandle::newDictionary());
            item.replaceKey("Title", BPDFObjectHandle::newUnicodeString(title));
            item.replaceKey("Parent", outlines);
            item.replaceKey(
                "Dest",
                BPDFObjectHandle::newArray({page, BPDFObjectHandle::newName("Fit")}));
            if (!items.empty()) {
                item.replaceKey("Prev", items.back());
                items.back().replaceKey("Next", item);
            }
            items.push_back(item);
        }
        outlines.replaceKey("First", items.front());
        outlines.replaceKey("Last", items.back());
        outlines.replaceKey(
            "Count", BPDFObjectHandle::newInteger(static_cast<long long>(items.size())));
        pdf.getRoot().replaceKey("Outlines", outlines);
        pdf.getRoot().replaceKey("PageMode", BPDFObjectHandle::newName("UseOutlines"));
    }

    class MergeOperation: public BPDFOperation
    {
      public:
        MergeOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_merge, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "concatenate the pages of all inputs in order";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {param(
                "bookmarks", pt_boolean, "false", "add an outline entry for each input")};
        }

        int
        getMaxInputs() const override
        {
            return -1;
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto out = new_document();
            std::vector<std::pair<std::string, BPDFObjectHandle>> targets;
            for (auto& input: inputs) {
                size_t before = out->getAllPages().size();
                for (auto const& page: input.pdf->getAllPages()) {
                    out->addPage(page, false);
                }
                auto const& pages = out->getAllPages();
                if (pages.size() > before) {
                    targets.emplace_back(BUtil::path_basename(input.filename), pages.at(before));
                }
            }
            // Document information comes from the first input.
            auto info = inputs.front().pdf->getTrailer().getKey("Info");
            if (info.isIndirect() && info.isDictionary()) {
                out->getTrailer().replaceKey("Info", out->copyForeignObject(info));
            }
            if (params.getBoolean("bookmarks")) {
                add_outline(*out, targets);
            }
            Result result;
            result.outputs.push_back({out});
            return result;
        }
    };

    class SplitOperation: public BPDFOperation
    {
      public:
        SplitOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_split, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "write groups of pages to separate documents";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                param(
                    "ranges",
                    pt_string,
                    "",
                    "comma-separated page groups, each a page or a range such as 4-6 or 8-z"),
                param("every", pt_integer, "1", "pages per output when ranges is not given")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            auto const& pages = input.pdf->getAllPages();
            int npages = static_cast<int>(pages.size());
            if (npages == 0) {
                fail(bpdf_e_invalid_range, input.filename, "document has no pages to split");
            }

            std::vector<std::vector<int>> groups;
            if (params.has("ranges") && !params.getString("ranges").empty()) {
                std::set<int> used;
                for (auto const& item: BUtil::split_string(params.getString("ranges"), ',')) {
                    std::vector<int> group;
                    try {
                        group = BUtil::parse_numrange(item.c_str(), npages);
                    } catch (std::runtime_error const& e) {
                        fail(bpdf_e_invalid_range, input.filename, e.what());
                    }
                    for (int n: group) {
                        if (!used.insert(n).second) {
                            fail(
                                bpdf_e_invalid_range,
                                input.filename,
                                "page " + std::to_string(n) + " appears in more than one range");
                        }
                    }
                    groups.push_back(group);
                }
            } else {
                long long every = params.getInteger("every");
                if (every < 1) {
                    fail(bpdf_e_invalid_parameter, input.filename, "every must be at least 1");
                }
                for (int start = 1; start <= npages; start += static_cast<int>(every)) {
                    std::vector<int> group;
                    for (int n = start; n <= npages && n < start + every; ++n) {
                        group.push_back(n);
                    }
                    groups.push_back(group);
                }
            }

            Result result;
            for (auto const& group: groups) {
                auto out = new_document();
                for (int n: group) {
                    out->addPage(pages.at(static_cast<size_t>(n - 1)), false);
                }
                result.outputs.push_back({out});
            }
            return result;
        }
    };

    class RotateOperation: public BPDFOperation
    {
      public:
        RotateOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_rotate, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "rotate pages by a multiple of 90 degrees";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                param("pages", pt_pages, "", "pages to rotate; all if empty"),
                param("angle", pt_integer, "90", "clockwise rotation in degrees"),
                param(
                    "relative",
                    pt_boolean,
                    "true",
                    "add to the current rotation instead of replacing it")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            long long angle = params.getInteger("angle");
            if (angle % 90 != 0) {
                fail(
                    bpdf_e_invalid_angle,
                    input.filename,
                    "rotation angle " + std::to_string(angle) + " is not a multiple of 90");
            }
            bool relative = params.getBoolean("relative");
            for (auto& page: selected_pages(*input.pdf, params, "pages")) {
                page.rotatePage(static_cast<int>(angle % 360), relative);
            }
            Result result;
            result.outputs.push_back({input.pdf});
            return result;
        }
    };

    class ReorderOperation: public BPDFOperation
    {
      public:
        ReorderOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_reorder, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "put pages in a new order";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {required(
                "order", pt_list, "comma-separated list of every page number in the new order")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            auto pages = input.pdf->getAllPages();
            auto order = params.getList("order");
            if (order.size() != pages.size()) {
                fail(
                    bpdf_e_invalid_permutation,
                    input.filename,
                    "order lists " + std::to_string(order.size()) + " pages; document has " +
                        std::to_string(pages.size()));
            }
            std::vector<BPDFObjectHandle> new_pages;
            std::set<long long> seen;
            for (auto const& item: order) {
                if (!BUtil::is_long_long(item.c_str())) {
                    fail(
                        bpdf_e_invalid_permutation,
                        input.filename,
                        "\"" + item + "\" is not a page number");
                }
                long long n = BUtil::string_to_ll(item.c_str());
                if (n < 1 || static_cast<size_t>(n) > pages.size()) {
                    fail(
                        bpdf_e_invalid_permutation,
                        input.filename,
                        "page " + item + " does not exist");
                }
                if (!seen.insert(n).second) {
                    fail(
                        bpdf_e_invalid_permutation,
                        input.filename,
                        "page " + item + " appears more than once");
                }
                new_pages.push_back(pages.at(static_cast<size_t>(n - 1)));
            }
            input.pdf->setPages(new_pages);
            Result result;
            result.outputs.push_back({input.pdf});
            return result;
        }
    };
} // namespace

std::unique_ptr<BPDFOperation>
bpdf_make_merge(BPDFEngineConfig const& config)
{
    return std::make_unique<MergeOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_split(BPDFEngineConfig const& config)
{
    return std::make_unique<SplitOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_rotate(BPDFEngineConfig const& config)
{
    return std::make_unique<RotateOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_reorder(BPDFEngineConfig const& config)
{
    return std::make_unique<ReorderOperation>(config);
}
