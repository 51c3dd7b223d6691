#include <bpdf/BPDF_private.hh>

#include <bpdf/BPDFExc.hh>

#include <stdexcept>

// Page manipulation keeps three things consistent: the /Kids array of the root /Pages node,
// all_pages, and pageobj_to_pages_pos. The first call to getAllPages flattens the page tree so
// that the root /Pages node lists every page and inheritable attributes live on the pages
// themselves. After that, only insertPage, removePage and setPages modify the tree. Callers that
// change /Pages directly must call updateAllPagesCache.

namespace
{
    char const* inheritable_keys[] = {"MediaBox", "CropBox", "Resources", "Rotate"};

    bool
    is_inheritable(std::string const& key)
    {
        for (auto const* k: inheritable_keys) {
            if (key == k) {
                return true;
            }
        }
        return false;
    }
} // namespace

std::vector<BPDFObjectHandle> const&
BPDF::getAllPages()
{
    if (!m->ever_called_get_all_pages) {
        flattenPagesTree();
    }
    return m->all_pages;
}

void
BPDF::updateAllPagesCache()
{
    m->all_pages.clear();
    m->pageobj_to_pages_pos.clear();
    m->pushed_inherited_attributes_to_pages = false;
    m->ever_called_get_all_pages = false;
    flattenPagesTree();
}

void
BPDF::flattenPagesTree()
{
    m->ever_called_get_all_pages = true;
    m->all_pages.clear();
    m->pageobj_to_pages_pos.clear();

    auto root = getRoot();
    auto pages = root.getKey("Pages");
    // Some files have /Pages in the catalog pointing into the middle of the tree.
    BPDFObjGen::set seen_parents;
    bool changed_root = false;
    while (pages.isDictionary() && pages.hasKey("Parent") && seen_parents.add(pages.getObjGen())) {
        pages = pages.getKey("Parent");
        changed_root = true;
    }
    if (changed_root) {
        warn(damagedPDF(
            "catalog",
            "document page tree root doesn't point to the root of the page tree; correcting"));
        root.replaceKey("Pages", pages);
    }
    if (!pages.getKey("Kids").isArray()) {
        throw BPDFExc(
            bpdf_e_pages, m->file->getName(), "", 0, "root of pages tree has no /Kids array");
    }

    BPDFObjGen::set visited;
    BPDFObjGen::set seen;
    getAllPagesInternal(pages, visited, seen, {});

    // Inheritable attributes now live on every page.
    for (auto const* key: inheritable_keys) {
        pages.removeKey(key);
    }
    int pos = 0;
    for (auto& page: m->all_pages) {
        page.replaceKey("Parent", pages);
        m->pageobj_to_pages_pos[page.getObjGen()] = pos++;
    }
    pages.replaceKey("Kids", BPDFObjectHandle::newArray(m->all_pages));
    pages.replaceKey(
        "Count", BPDFObjectHandle::newInteger(static_cast<long long>(m->all_pages.size())));
    if (!pages.getKey("Type").isNameAndEquals("Pages")) {
        pages.replaceKey("Type", BPDFObjectHandle::newName("Pages"));
    }
    m->pushed_inherited_attributes_to_pages = true;
}

void
BPDF::getAllPagesInternal(
    BPDFObjectHandle cur_pages,
    BPDFObjGen::set& visited,
    BPDFObjGen::set& seen,
    std::map<std::string, BPDFObjectHandle> inherited)
{
    if (!visited.add(cur_pages.getObjGen())) {
        throw BPDFExc(
            bpdf_e_pages,
            m->file->getName(),
            cur_pages.getObjGen().describe(),
            0,
            "loop detected in /Pages structure");
    }
    for (auto const& [key, value]: cur_pages.getDictAsMap()) {
        if (is_inheritable(key)) {
            inherited[key] = value;
        }
    }

    auto kids = cur_pages.getKey("Kids");
    int n = kids.getArrayNItems();
    for (int i = 0; i < n; ++i) {
        auto kid = kids.getArrayItem(i);
        std::string where = "kid " + std::to_string(i) + " (from 0) of object " +
            cur_pages.getObjGen().unparse();
        if (!kid.isDictionary()) {
            warn(bpdf_e_pages, where, 0, "pages tree includes non-dictionary object; ignoring");
            continue;
        }
        if (!kid.isIndirect()) {
            warn(bpdf_e_pages, where, 0, "page is direct; converting to indirect");
            kid = makeIndirectObject(kid);
            kids.setArrayItem(i, kid);
        }
        if (kid.hasKey("Kids")) {
            getAllPagesInternal(kid, visited, seen, inherited);
            continue;
        }
        if (!seen.add(kid.getObjGen())) {
            warn(
                bpdf_e_pages,
                where,
                0,
                "page appears more than once in the pages tree; creating a new page object as a "
                "copy");
            kid = makeIndirectObject(kid.shallowCopy());
            seen.add(kid.getObjGen());
        }
        if (!kid.isDictionaryOfType("Page")) {
            warn(bpdf_e_pages, where, 0, "/Type key should be /Page but is not; overriding");
            kid.replaceKey("Type", BPDFObjectHandle::newName("Page"));
        }
        for (auto const& [key, value]: inherited) {
            if (!kid.hasKey(key)) {
                // Resources may be shared by many pages; make them indirect rather than copying.
                if (key == "Resources" && !value.isIndirect()) {
                    auto resources = makeIndirectObject(value);
                    inherited[key] = resources;
                    kid.replaceKey(key, resources);
                } else {
                    kid.replaceKey(key, value);
                }
            }
        }
        if (!kid.getKey("MediaBox").isRectangle()) {
            warn(bpdf_e_pages, where, 0, "MediaBox is undefined; setting to letter / ANSI A");
            kid.replaceKey(
                "MediaBox",
                BPDFObjectHandle::newArray(BPDFObjectHandle::Rectangle(0, 0, 612, 792)));
        }
        if (!kid.getKey("Resources").isDictionary()) {
            kid.replaceKey("Resources", BPDFObjectHandle::newDictionary());
        }
        m->all_pages.push_back(kid);
    }
}

int
BPDF::findPage(BPDFObjectHandle const& page)
{
    getAllPages();
    auto og = page.getObjGen();
    auto it = m->pageobj_to_pages_pos.find(og);
    if (it == m->pageobj_to_pages_pos.end()) {
        throw BPDFExc(
            bpdf_e_pages,
            m->file->getName(),
            "page object: object " + og.unparse(),
            0,
            "page object not referenced in /Pages tree");
    }
    return it->second;
}

void
BPDF::insertPage(BPDFObjectHandle newpage, int pos)
{
    // pos counts from zero; pos == number of pages appends.
    getAllPages();
    if (!newpage.isIndirect()) {
        newpage = makeIndirectObject(newpage);
    } else if (newpage.getOwningBPDF() != this) {
        newpage.getOwningBPDF()->getAllPages();
        newpage = copyForeignObject(newpage);
    }
    if (pos < 0 || static_cast<size_t>(pos) > m->all_pages.size()) {
        throw std::logic_error("BPDF::insertPage called with pos out of range");
    }
    if (m->pageobj_to_pages_pos.count(newpage.getObjGen())) {
        newpage = makeIndirectObject(newpage.shallowCopy());
    }

    auto pages = getRoot().getKey("Pages");
    auto kids = pages.getKey("Kids");
    newpage.replaceKey("Parent", pages);
    kids.insertItem(pos, newpage);
    m->all_pages.insert(m->all_pages.begin() + pos, newpage);
    int npages = static_cast<int>(m->all_pages.size());
    pages.replaceKey("Count", BPDFObjectHandle::newInteger(npages));
    for (int i = pos; i < npages; ++i) {
        m->pageobj_to_pages_pos[m->all_pages.at(static_cast<size_t>(i)).getObjGen()] = i;
    }
}

void
BPDF::addPage(BPDFObjectHandle newpage, bool first)
{
    insertPage(newpage, first ? 0 : static_cast<int>(getAllPages().size()));
}

void
BPDF::addPageAt(BPDFObjectHandle newpage, bool before, BPDFObjectHandle refpage)
{
    int refpos = findPage(refpage);
    insertPage(newpage, before ? refpos : refpos + 1);
}

void
BPDF::removePage(BPDFObjectHandle page)
{
    int pos = findPage(page);
    auto pages = getRoot().getKey("Pages");
    pages.getKey("Kids").eraseItem(pos);
    m->all_pages.erase(m->all_pages.begin() + pos);
    m->pageobj_to_pages_pos.erase(page.getObjGen());
    int npages = static_cast<int>(m->all_pages.size());
    pages.replaceKey("Count", BPDFObjectHandle::newInteger(npages));
    for (int i = pos; i < npages; ++i) {
        m->pageobj_to_pages_pos[m->all_pages.at(static_cast<size_t>(i)).getObjGen()] = i;
    }
}

void
BPDF::setPages(std::vector<BPDFObjectHandle> const& new_pages)
{
    getAllPages();
    auto pages = getRoot().getKey("Pages");
    std::vector<BPDFObjectHandle> result;
    BPDFObjGen::set seen;
    for (auto page: new_pages) {
        if (!(page.isIndirect() && page.getOwningBPDF() == this && page.isDictionary())) {
            throw std::logic_error("BPDF::setPages called with a page from another document");
        }
        if (!seen.add(page.getObjGen())) {
            page = makeIndirectObject(page.shallowCopy());
        }
        page.replaceKey("Parent", pages);
        result.push_back(page);
    }
    m->all_pages = std::move(result);
    m->pageobj_to_pages_pos.clear();
    int pos = 0;
    for (auto const& page: m->all_pages) {
        m->pageobj_to_pages_pos[page.getObjGen()] = pos++;
    }
    pages.replaceKey("Kids", BPDFObjectHandle::newArray(m->all_pages));
    pages.replaceKey("Count", BPDFObjectHandle::newInteger(pos));
}
