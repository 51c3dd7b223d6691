#include <bpdf/BPDF_private.hh>

#include <bpdf/BufferInputSource.hh>
#include <bpdf/FileInputSource.hh>
#include <bpdf/BUtil.hh>

#include <atomic>
#include <cstring>
#include <stdexcept>

static std::string const bpdf_version("1.0.0");

// A file with an empty page tree and a correct cross-reference table
static std::string
empty_pdf()
{
    char const* objects[] = {
        "<< /Type /Catalog /Pages 2 0 R >>", "<< /Type /Pages /Kids [] /Count 0 >>"};
    std::string out = "%PDF-1.3\n";
    std::string xref = "xref\n0 3\n0000000000 65535 f \n";
    int objid = 0;
    for (auto const* object: objects) {
        xref += BUtil::int_to_string(static_cast<long long>(out.size()), 10) + " 00000 n \n";
        out += std::to_string(++objid) + " 0 obj\n" + object + "\nendobj\n";
    }
    auto startxref = std::to_string(out.size());
    return out + xref + "trailer << /Size 3 /Root 1 0 R >>\nstartxref\n" + startxref + "\n%%EOF\n";
}

namespace
{
    // Stands in for the input until one of the process methods is called
    class NoInputSource final: public InputSource
    {
      public:
        std::string const&
        getName() const final
        {
            static std::string const name("no input");
            return name;
        }
        bpdf_offset_t
        tell() final
        {
            unopened();
        }
        void
        seek(bpdf_offset_t, int) final
        {
            unopened();
        }
        size_t
        read(char*, size_t) final
        {
            unopened();
        }
        void
        unreadCh(char) final
        {
            unopened();
        }

      private:
        [[noreturn]] static void
        unopened()
        {
            throw std::logic_error("BPDF: no document has been read or created yet");
        }
    };
} // namespace

std::string const&
BPDF::BPDFVersion()
{
    return bpdf_version;
}

BPDF::Members::Members(BPDF& bpdf) :
    log(BPDFLogger::defaultLogger()),
    file(std::make_shared<NoInputSource>()),
    table(std::make_shared<BPDFObjTable>(bpdf))
{
}

BPDF::BPDF() :
    m(std::make_unique<Members>(*this))
{
    // Generate a unique ID. It just has to be unique among all BPDF objects allocated throughout
    // the lifetime of this running application.
    static std::atomic<unsigned long long> unique_id{0};
    m->unique_id = unique_id.fetch_add(1ULL);
}

BPDF::~BPDF()
{
    // Indirect references hold the object table weakly, so clearing it here makes any handle
    // that outlives this object fail cleanly instead of resolving.
    m->xref_table.clear();
    m->table->objects.clear();
}

std::shared_ptr<BPDF>
BPDF::create()
{
    return std::make_shared<BPDF>();
}

void
BPDF::processFile(char const* filename, char const* password)
{
    processInputSource(std::make_shared<FileInputSource>(filename), password);
}

void
BPDF::processMemoryFile(char const* description, std::string data, char const* password)
{
    processInputSource(
        std::make_shared<BufferInputSource>(description, std::move(data)), password);
}

void
BPDF::processInputSource(std::shared_ptr<InputSource> source, char const* password)
{
    m->file = source;
    parse(password);
}

void
BPDF::emptyPDF()
{
    processMemoryFile("empty PDF", empty_pdf());
}

std::shared_ptr<BPDFLogger>
BPDF::getLogger()
{
    return m->log;
}

void
BPDF::setLogger(std::shared_ptr<BPDFLogger> l)
{
    m->log = l ? l : BPDFLogger::defaultLogger();
}

void
BPDF::setSuppressWarnings(bool val)
{
    m->suppress_warnings = val;
}

void
BPDF::setAttemptRecovery(bool val)
{
    m->attempt_recovery = val;
}

void
BPDF::setForceReconstruct(bool val)
{
    m->force_reconstruct = val;
}

bool
BPDF::wasReconstructed() const
{
    return m->reconstructed_xref;
}

std::vector<BPDFExc>
BPDF::getWarnings()
{
    std::vector<BPDFExc> result = std::move(m->warnings);
    m->warnings.clear();
    return result;
}

bool
BPDF::anyWarnings() const
{
    return !m->warnings.empty();
}

size_t
BPDF::numWarnings() const
{
    return m->warnings.size();
}

void
BPDF::warn(BPDFExc const& e)
{
    m->warnings.push_back(e);
    if (!m->suppress_warnings) {
        m->log->warn(std::string("WARNING: ") + m->warnings.back().what() + "\n");
    }
}

void
BPDF::warn(
    bpdf_error_code_e error_code,
    std::string const& object,
    bpdf_offset_t offset,
    std::string const& message)
{
    warn(BPDFExc(error_code, getFilename(), object, offset, message));
}

BPDFExc
BPDF::damagedPDF(std::string const& object, bpdf_offset_t offset, std::string const& message)
{
    return {bpdf_e_damaged_pdf, getFilename(), object, offset, message};
}

BPDFExc
BPDF::damagedPDF(std::string const& object, std::string const& message)
{
    return {bpdf_e_damaged_pdf, getFilename(), object, m->file->getLastOffset(), message};
}

BPDFExc
BPDF::damagedPDF(bpdf_offset_t offset, std::string const& message)
{
    return {bpdf_e_damaged_pdf, getFilename(), "", offset, message};
}

BPDFExc
BPDF::damagedPDF(std::string const& message)
{
    return damagedPDF(m->file->getLastOffset(), message);
}

std::string
BPDF::getFilename() const
{
    return m->file->getName();
}

std::string
BPDF::getPDFVersion() const
{
    return m->pdf_version;
}

namespace
{
    std::pair<int, int>
    parse_version(std::string const& version)
    {
        auto dot = version.find('.');
        if (dot == std::string::npos) {
            return {0, 0};
        }
        try {
            return {
                BUtil::string_to_int(version.substr(0, dot).c_str()),
                BUtil::string_to_int(version.substr(dot + 1).c_str())};
        } catch (std::runtime_error&) {
            return {0, 0};
        }
    }
} // namespace

void
BPDF::requirePDFVersion(std::string const& version)
{
    if (parse_version(m->pdf_version) < parse_version(version)) {
        m->pdf_version = version;
    }
}

BPDFObjectHandle
BPDF::getTrailer()
{
    return m->trailer;
}

BPDFObjectHandle
BPDF::getRoot()
{
    auto root = m->trailer.getKey("Root");
    if (!root.isDictionary()) {
        throw damagedPDF("", "unable to find /Root dictionary");
    }
    return root;
}

BPDFObjectHandle
BPDF::getInfo(bool create)
{
    auto info = m->trailer.getKey("Info");
    if (info.isDictionary() || !create) {
        return info;
    }
    info = makeIndirectObject(BPDFObjectHandle::newDictionary());
    m->trailer.replaceKey("Info", info);
    return info;
}

std::shared_ptr<BPDFObjTable>
BPDF::getTable() const
{
    return m->table;
}

BPDFObjGen
BPDF::nextObjGen()
{
    return {++m->max_objid, 0};
}

BPDFObjectHandle
BPDF::newIndirect(BPDFObjGen og, std::shared_ptr<BPDFObject> const& obj)
{
    obj->bpdf = this;
    obj->og = og;
    m->table->objects[og] = obj;
    m->max_objid = std::max(m->max_objid, og.getObj());
    return BPDFObjectHandle(BPDFObject::create<BPDF_Reference>(m->table, og));
}

BPDFObjectHandle
BPDF::makeIndirectObject(BPDFObjectHandle oh)
{
    if (!oh) {
        throw std::logic_error("attempted to make an uninitialized BPDFObjectHandle indirect");
    }
    if (oh.isIndirect()) {
        if (oh.getOwningBPDF() != this) {
            throw std::logic_error(
                "makeIndirectObject called with an indirect object from another BPDF");
        }
        return oh;
    }
    return newIndirect(nextObjGen(), oh.obj);
}

BPDFObjectHandle
BPDF::newStream(std::string const& data)
{
    return newIndirect(
        nextObjGen(),
        BPDFObject::create<BPDF_Stream>(BPDFObjectHandle::newDictionary(), data));
}

BPDFObjectHandle
BPDF::newReserved()
{
    return newIndirect(nextObjGen(), BPDFObject::create<BPDF_Reserved>());
}

BPDFObjectHandle
BPDF::getObject(BPDFObjGen og)
{
    if (!og.isIndirect()) {
        return BPDFObjectHandle::newNull();
    }
    return BPDFObjectHandle(BPDFObject::create<BPDF_Reference>(m->table, og));
}

BPDFObjectHandle
BPDF::getObject(int objid, int generation)
{
    return getObject(BPDFObjGen(objid, generation));
}

void
BPDF::replaceObject(BPDFObjGen og, BPDFObjectHandle oh)
{
    if (!oh || oh.isIndirect() || oh.getTypeCode() == ot_reserved) {
        throw std::logic_error("replaceObject called with indirect or uninitialized object");
    }
    newIndirect(og, oh.obj);
}

size_t
BPDF::getObjectCount()
{
    std::set<BPDFObjGen> all;
    for (auto const& iter: m->xref_table) {
        all.insert(iter.first);
    }
    for (auto const& iter: m->table->objects) {
        all.insert(iter.first);
    }
    return all.size();
}

std::vector<BPDFObjectHandle>
BPDF::getAllObjects()
{
    std::set<BPDFObjGen> all;
    for (auto const& iter: m->xref_table) {
        all.insert(iter.first);
    }
    for (auto const& iter: m->table->objects) {
        all.insert(iter.first);
    }
    std::vector<BPDFObjectHandle> result;
    for (auto const& og: all) {
        resolve(og);
        result.push_back(getObject(og));
    }
    return result;
}

BPDFObjectHandle
BPDF::copyForeignObject(BPDFObjectHandle foreign)
{
    // Copying happens in two passes. The first pass walks the foreign object graph and reserves
    // a local object for every indirect object it reaches; the second copies each of them with
    // its references rewritten to the reservations. This allows objects with circular
    // references to be copied in any order. Traversal stops at page boundaries: pages other
    // than the one being copied become null, and /Pages nodes are never followed.
    if (!foreign.isIndirect()) {
        throw std::logic_error("BPDF::copyForeignObject called with direct object handle");
    }
    BPDF* other = foreign.getOwningBPDF();
    if (other == nullptr || other == this) {
        throw std::logic_error("BPDF::copyForeignObject called with object from this BPDF");
    }
    auto& object_map = m->object_copiers[other->m->unique_id];

    std::vector<BPDFObjectHandle> to_copy;
    BPDFObjGen::set visiting;
    reserveForeignObjects(foreign, object_map, to_copy, visiting, true);

    for (auto& oh: to_copy) {
        auto copy = replaceForeignIndirectObjects(oh, object_map, true);
        if (!oh.isStream()) {
            replaceObject(object_map[oh.getObjGen()].getObjGen(), copy);
        }
    }

    auto iter = object_map.find(foreign.getObjGen());
    if (iter == object_map.end()) {
        warn(damagedPDF(
            other->getFilename() + " object " + foreign.getObjGen().unparse(),
            "unexpected reference to /Pages object while copying foreign object; replacing with "
            "null"));
        return BPDFObjectHandle::newNull();
    }
    return iter->second;
}

void
BPDF::reserveForeignObjects(
    BPDFObjectHandle foreign,
    std::map<BPDFObjGen, BPDFObjectHandle>& object_map,
    std::vector<BPDFObjectHandle>& to_copy,
    BPDFObjGen::set& visiting,
    bool top)
{
    if (foreign.isPagesObject()) {
        return;
    }

    if (foreign.isIndirect()) {
        auto foreign_og = foreign.getObjGen();
        if (!visiting.add(foreign_og)) {
            return;
        }
        auto mapping = object_map.find(foreign_og);
        if (mapping != object_map.end()) {
            if (!(top && foreign.isPageObject() && mapping->second.isNull())) {
                visiting.erase(foreign_og);
                return;
            }
        } else {
            object_map[foreign_og] = foreign.isStream()
                ? newStream()
                : makeIndirectObject(BPDFObjectHandle::newNull());
            if (!top && foreign.isPageObject()) {
                visiting.erase(foreign_og);
                return;
            }
        }
        to_copy.push_back(foreign);
    }

    if (foreign.isArray()) {
        for (auto const& item: foreign.getArrayAsVector()) {
            reserveForeignObjects(item, object_map, to_copy, visiting, false);
        }
    } else if (foreign.isDictionary()) {
        for (auto const& item: foreign.getDictAsMap()) {
            reserveForeignObjects(item.second, object_map, to_copy, visiting, false);
        }
    } else if (foreign.isStream()) {
        reserveForeignObjects(foreign.getDict(), object_map, to_copy, visiting, false);
    }

    visiting.erase(foreign.getObjGen());
}

BPDFObjectHandle
BPDF::replaceForeignIndirectObjects(
    BPDFObjectHandle foreign, std::map<BPDFObjGen, BPDFObjectHandle>& object_map, bool top)
{
    if (!top && foreign.isIndirect()) {
        auto mapping = object_map.find(foreign.getObjGen());
        if (mapping == object_map.end()) {
            // This case would occur if this is a reference to a Pages object that we didn't
            // traverse into.
            return BPDFObjectHandle::newNull();
        }
        return mapping->second;
    }

    if (foreign.isArray()) {
        std::vector<BPDFObjectHandle> result;
        for (auto const& item: foreign.getArrayAsVector()) {
            result.push_back(replaceForeignIndirectObjects(item, object_map, false));
        }
        return BPDFObjectHandle::newArray(result);
    }

    if (foreign.isDictionary()) {
        auto result = BPDFObjectHandle::newDictionary();
        for (auto const& [key, value]: foreign.getDictAsMap()) {
            result.replaceKey(key, replaceForeignIndirectObjects(value, object_map, false));
        }
        return result;
    }

    if (foreign.isStream()) {
        auto result = object_map[foreign.getObjGen()];
        auto dict = result.getDict();
        for (auto const& [key, value]: foreign.getDict().getDictAsMap()) {
            dict.replaceKey(key, replaceForeignIndirectObjects(value, object_map, false));
        }
        // The data is copied in its encoded form, already decrypted.
        auto stream = result.resolved()->as<BPDF_Stream>();
        stream->data = std::make_shared<std::string>(foreign.getRawStreamData());
        return result;
    }

    return foreign.shallowCopy();
}
