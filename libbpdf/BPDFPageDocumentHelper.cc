#include <bpdf/BPDFPageDocumentHelper.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BUtil.hh>

BPDFPageDocumentHelper::BPDFPageDocumentHelper(BPDF& pdf) :
    pdf(pdf)
{
}

std::vector<BPDFPageObjectHelper>
BPDFPageDocumentHelper::getAllPages()
{
    std::vector<BPDFPageObjectHelper> pages;
    for (auto const& page: pdf.getAllPages()) {
        pages.emplace_back(page);
    }
    return pages;
}

int
BPDFPageDocumentHelper::getPageCount()
{
    return static_cast<int>(pdf.getAllPages().size());
}

BPDFPageObjectHelper
BPDFPageDocumentHelper::getPage(int index)
{
    auto const& pages = pdf.getAllPages();
    if (index < 0 || static_cast<size_t>(index) >= pages.size()) {
        throw BPDFExc(
            bpdf_e_invalid_range,
            pdf.getFilename(),
            "",
            0,
            "page index " + std::to_string(index) + " out of range; document has " +
                std::to_string(pages.size()) + " pages");
    }
    return {pages.at(static_cast<size_t>(index))};
}

void
BPDFPageDocumentHelper::addPage(BPDFPageObjectHelper newpage, bool first)
{
    pdf.addPage(newpage.getObjectHandle(), first);
}

void
BPDFPageDocumentHelper::addPageAt(
    BPDFPageObjectHelper newpage, bool before, BPDFPageObjectHelper refpage)
{
    pdf.addPageAt(newpage.getObjectHandle(), before, refpage.getObjectHandle());
}

void
BPDFPageDocumentHelper::removePage(BPDFPageObjectHelper page)
{
    pdf.removePage(page.getObjectHandle());
}

void
BPDFPageDocumentHelper::replacePage(int index, BPDFPageObjectHelper newpage)
{
    auto old_page = getPage(index);
    pdf.addPageAt(newpage.getObjectHandle(), true, old_page.getObjectHandle());
    pdf.removePage(old_page.getObjectHandle());
}

std::vector<int>
BPDFPageDocumentHelper::selectPages(std::string const& range)
{
    int npages = getPageCount();
    std::vector<int> result;
    if (range.empty()) {
        for (int i = 0; i < npages; ++i) {
            result.push_back(i);
        }
        return result;
    }
    if (npages == 0) {
        throw BPDFExc(
            bpdf_e_invalid_range, pdf.getFilename(), "", 0, "document has no pages to select");
    }
    try {
        for (int n: BUtil::parse_numrange(range.c_str(), npages)) {
            result.push_back(n - 1);
        }
    } catch (std::runtime_error const& e) {
        throw BPDFExc(bpdf_e_invalid_range, pdf.getFilename(), "", 0, e.what());
    }
    return result;
}
