// Reading objects and cross-reference data

#include <bpdf/BPDF_private.hh>

#include <bpdf/BPDFParser.hh>
#include <bpdf/BPDFTokenizer.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/BufferInputSource.hh>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>

class BPDF::StringDecrypter final: public BPDFParser::StringDecrypter
{
  public:
    StringDecrypter(BPDF* bpdf, BPDFObjGen og) :
        bpdf(bpdf),
        og(og)
    {
    }
    ~StringDecrypter() final = default;
    void
    decryptString(std::string& val) final
    {
        bpdf->decryptString(val, og);
    }

  private:
    BPDF* bpdf;
    BPDFObjGen og;
};

namespace
{
    // Marks an object as being resolved for the lifetime of the guard so that self-referential
    // lookups, such as a stream whose /Length refers to itself, are detected.
    class ResolveGuard
    {
      public:
        ResolveGuard(BPDFObjGen::set& resolving, BPDFObjGen og) :
            resolving(resolving),
            og(og),
            added(resolving.add(og))
        {
        }
        ~ResolveGuard()
        {
            if (added) {
                resolving.erase(og);
            }
        }
        bool
        loop() const
        {
            return !added;
        }

      private:
        BPDFObjGen::set& resolving;
        BPDFObjGen og;
        bool added;
    };

    // Parse a non-negative integer at pos, advancing pos.
    bool
    scan_integer(std::string const& data, size_t& pos, long long& value)
    {
        size_t start = pos;
        value = 0;
        while (pos < data.size() && BUtil::is_digit(data.at(pos)) && pos - start < 18) {
            value = 10 * value + (data.at(pos) - '0');
            ++pos;
        }
        return pos > start;
    }

    bool
    scan_space(std::string const& data, size_t& pos)
    {
        size_t start = pos;
        while (pos < data.size() && BUtil::is_space(data.at(pos))) {
            ++pos;
        }
        return pos > start;
    }

    bool
    at_token_boundary(std::string const& data, size_t pos)
    {
        return pos >= data.size() || BUtil::is_space(data.at(pos)) ||
            BUtil::is_delimiter(data.at(pos));
    }
} // namespace

void
BPDF::parse(char const* password)
{
    if (password) {
        m->provided_password = password;
    }
    checkHeader();

    if (m->force_reconstruct) {
        reconstruct_xref();
    } else {
        try {
            // PDF spec says %%EOF must be found within the last 1024 bytes of the file. We add an
            // extra 30 characters to leave room for the startxref stuff.
            bpdf_offset_t size = m->file->getSize();
            bpdf_offset_t start = std::max(bpdf_offset_t(0), size - 1054);
            std::string tail = m->file->read(static_cast<size_t>(size - start), start);
            auto pos = tail.rfind("startxref");
            if (pos == std::string::npos) {
                throw damagedPDF("", 0, "can't find startxref");
            }
            size_t p = pos + 9;
            long long xref_offset = 0;
            scan_space(tail, p);
            if (!scan_integer(tail, p, xref_offset) || xref_offset <= 0 ||
                xref_offset >= size) {
                throw damagedPDF(
                    "", start + static_cast<bpdf_offset_t>(pos), "invalid startxref value");
            }
            read_xref(xref_offset);
        } catch (BPDFExc& e) {
            if (!m->attempt_recovery) {
                throw;
            }
            warn(e);
            reconstruct_xref();
        }
    }

    initializeEncryption();

    bool have_root = false;
    try {
        have_root = m->trailer.getKey("Root").isDictionary();
    } catch (BPDFExc& e) {
        if (e.getErrorCode() == bpdf_e_password) {
            throw;
        }
        warn(e);
    }
    if (!have_root && m->attempt_recovery && !m->reconstructed_xref) {
        warn(damagedPDF("", 0, "unable to find /Root dictionary"));
        reconstruct_xref();
        have_root = m->trailer.getKey("Root").isDictionary();
    }
    if (!have_root) {
        throw damagedPDF("", 0, "unable to find /Root dictionary");
    }
    if (!getRoot().getKey("Pages").isDictionary()) {
        throw damagedPDF("", 0, "unable to find page tree");
    }
}

void
BPDF::checkHeader()
{
    std::string start = m->file->read(1024, 0);
    auto pos = start.find("%PDF-");
    if (pos == std::string::npos) {
        warn(damagedPDF("", 0, "can't find PDF header"));
        // BPDFWriter writes files that usually require at least version 1.2 for /FlateDecode
        m->pdf_version = "1.2";
        return;
    }
    std::string version;
    for (size_t i = pos + 5; i < start.size(); ++i) {
        char ch = start.at(i);
        if (!(BUtil::is_digit(ch) || ch == '.')) {
            break;
        }
        version += ch;
    }
    if (version.empty()) {
        warn(damagedPDF("", static_cast<bpdf_offset_t>(pos), "invalid PDF version"));
        version = "1.2";
    }
    m->pdf_version = version;
}

void
BPDF::setTrailer(BPDFObjectHandle obj)
{
    if (!m->trailer) {
        m->trailer = obj;
    }
}

void
BPDF::read_xref(bpdf_offset_t xref_offset)
{
    while (xref_offset) {
        if (!m->visited_xref_offsets.insert(xref_offset).second) {
            throw damagedPDF("", xref_offset, "loop detected following xref tables");
        }
        m->file->seek(xref_offset, SEEK_SET);
        // Some files have whitespace before the xref keyword.
        std::string line;
        while (line.empty() && m->file->tell() < m->file->getSize()) {
            line = m->file->readLine(50);
            auto first = line.find_first_not_of(" \t\f\r\n");
            line = first == std::string::npos ? "" : line.substr(first);
        }
        if (line.compare(0, 4, "xref") == 0 &&
            (line.size() == 4 || BUtil::is_space(line.at(4)))) {
            xref_offset = read_xrefTable(m->file->getLastOffset());
        } else {
            xref_offset = read_xrefStream(xref_offset);
        }
    }
    if (!m->trailer) {
        throw damagedPDF("", 0, "unable to find trailer while reading xref");
    }
}

bool
BPDF::parse_xrefFirst(std::string const& line, int& obj, int& num, int& bytes)
{
    // Parse the subsection header "first count". bytes is the number of characters consumed.
    size_t p = 0;
    scan_space(line, p);
    long long first = 0;
    long long count = 0;
    if (!scan_integer(line, p, first) || !scan_space(line, p) || !scan_integer(line, p, count)) {
        return false;
    }
    if (first > INT32_MAX || count > INT32_MAX) {
        return false;
    }
    obj = static_cast<int>(first);
    num = static_cast<int>(count);
    bytes = static_cast<int>(p);
    return true;
}

bool
BPDF::read_xrefEntry(bpdf_offset_t& f1, int& f2, char& type)
{
    std::string line = m->file->readLine(30);
    size_t p = 0;
    scan_space(line, p);
    long long offset = 0;
    long long gen = 0;
    if (!scan_integer(line, p, offset) || !scan_space(line, p) ||
        !scan_integer(line, p, gen) || !scan_space(line, p) || p >= line.size()) {
        return false;
    }
    type = line.at(p);
    if (type != 'n' && type != 'f') {
        return false;
    }
    f1 = offset;
    f2 = static_cast<int>(gen);
    return true;
}

bpdf_offset_t
BPDF::read_xrefTable(bpdf_offset_t xref_offset)
{
    struct Entry
    {
        int obj;
        bpdf_offset_t f1;
        int f2;
        char type;
    };
    std::vector<Entry> entries;

    m->file->seek(xref_offset, SEEK_SET);
    m->file->readLine(50); // "xref"
    while (true) {
        bpdf_offset_t line_start = m->file->tell();
        std::string line = m->file->readLine(100);
        auto first = line.find_first_not_of(" \t\f");
        if (first == std::string::npos) {
            if (m->file->tell() >= m->file->getSize()) {
                throw damagedPDF("", line_start, "EOF while reading xref table");
            }
            continue;
        }
        if (line.compare(first, 7, "trailer") == 0) {
            m->file->seek(line_start + static_cast<bpdf_offset_t>(first) + 7, SEEK_SET);
            break;
        }
        int obj = 0;
        int num = 0;
        int bytes = 0;
        if (!parse_xrefFirst(line, obj, num, bytes)) {
            throw damagedPDF("", line_start, "xref syntax invalid");
        }
        for (int i = 0; i < num; ++i) {
            bpdf_offset_t f1 = 0;
            int f2 = 0;
            char type = '\0';
            if (!read_xrefEntry(f1, f2, type)) {
                throw damagedPDF(
                    "xref table", m->file->getLastOffset(), "invalid xref entry (obj=" +
                        std::to_string(obj + i) + ")");
            }
            if (obj + i == 0 && type == 'n') {
                // Object 0 can never be in use.
                continue;
            }
            entries.push_back({obj + i, f1, f2, type});
        }
    }

    BPDFTokenizer tokenizer;
    BPDFParser parser(*m->file, "trailer", tokenizer, nullptr, this);
    bool empty = false;
    auto cur_trailer = parser.parse(empty);
    if (!cur_trailer.isDictionary()) {
        throw damagedPDF("", m->file->getLastOffset(), "expected trailer dictionary");
    }
    setTrailer(cur_trailer);

    // Entries from a hybrid file's cross-reference stream take precedence over the table.
    auto xref_stm = cur_trailer.getKey("XRefStm");
    if (xref_stm.isInteger()) {
        read_xrefStream(xref_stm.getIntValue());
    }

    for (auto const& e: entries) {
        if (e.type == 'f') {
            insertFreeXrefEntry(BPDFObjGen(e.obj, e.f2));
        } else {
            insertXrefEntry(e.obj, 1, e.f1, e.f2);
        }
    }

    auto prev = cur_trailer.getKey("Prev");
    if (prev.isInteger()) {
        return prev.getIntValue();
    }
    return 0;
}

bpdf_offset_t
BPDF::read_xrefStream(bpdf_offset_t xref_offset)
{
    BPDFObjectHandle xref_obj;
    try {
        xref_obj = BPDFObjectHandle(readObjectAtOffset(xref_offset, "xref stream", BPDFObjGen()));
    } catch (BPDFExc& e) {
        throw damagedPDF("", xref_offset, "xref not found: " + e.getMessageDetail());
    }
    if (!(xref_obj && xref_obj.isStream() &&
          xref_obj.getDict().getKey("Type").isNameAndEquals("XRef"))) {
        throw damagedPDF("", xref_offset, "xref not found");
    }
    return processXRefStream(xref_offset, xref_obj);
}

bpdf_offset_t
BPDF::processXRefStream(bpdf_offset_t xref_offset, BPDFObjectHandle& xref_obj)
{
    auto dict = xref_obj.getDict();
    auto W_obj = dict.getKey("W");
    auto Index_obj = dict.getKey("Index");
    auto Size_obj = dict.getKey("Size");
    if (!(W_obj.isArray() && W_obj.getArrayNItems() >= 3 && Size_obj.isInteger())) {
        throw damagedPDF(
            "xref stream",
            xref_offset,
            "Cross-reference stream does not have proper /W and /Index keys");
    }
    int W[3];
    size_t entry_size = 0;
    for (int i = 0; i < 3; ++i) {
        auto w = W_obj.getArrayItem(i);
        if (!w.isInteger() || w.getIntValue() < 0 || w.getIntValue() > 8) {
            throw damagedPDF(
                "xref stream",
                xref_offset,
                "Cross-reference stream's /W contains an invalid value");
        }
        W[i] = w.getIntValueAsInt();
        entry_size += static_cast<size_t>(W[i]);
    }

    std::vector<std::pair<long long, long long>> indx;
    if (Index_obj.isArray()) {
        int n = Index_obj.getArrayNItems();
        if (n % 2 != 0) {
            throw damagedPDF(
                "xref stream",
                xref_offset,
                "Cross-reference stream's /Index has an odd number of elements");
        }
        for (int i = 0; i < n; i += 2) {
            auto a = Index_obj.getArrayItem(i);
            auto b = Index_obj.getArrayItem(i + 1);
            if (!(a.isInteger() && b.isInteger())) {
                throw damagedPDF(
                    "xref stream",
                    xref_offset,
                    "Cross-reference stream's /Index's item is not an integer");
            }
            indx.emplace_back(a.getIntValue(), b.getIntValue());
        }
    } else {
        indx.emplace_back(0, Size_obj.getIntValue());
    }

    std::string data = xref_obj.getStreamData(bpdf_dl_generalized);
    size_t expected = 0;
    for (auto const& sub: indx) {
        expected += static_cast<size_t>(sub.second) * entry_size;
    }
    if (data.size() < expected) {
        throw damagedPDF(
            "xref stream", xref_offset, "Cross-reference stream data has the wrong size");
    }

    size_t pos = 0;
    for (auto const& [first, count]: indx) {
        for (long long i = 0; i < count; ++i) {
            long long fields[3] = {0, 0, 0};
            for (int f = 0; f < 3; ++f) {
                for (int k = 0; k < W[f]; ++k) {
                    fields[f] = (fields[f] << 8) + static_cast<unsigned char>(data.at(pos++));
                }
            }
            // The type field defaults to 1 when its width is zero.
            if (W[0] == 0) {
                fields[0] = 1;
            }
            auto obj = first + i;
            if (obj <= 0 || obj > INT32_MAX) {
                continue;
            }
            if (fields[0] == 0) {
                insertFreeXrefEntry(BPDFObjGen(static_cast<int>(obj), static_cast<int>(fields[2])));
            } else if (fields[0] == 1 || fields[0] == 2) {
                insertXrefEntry(
                    static_cast<int>(obj),
                    static_cast<int>(fields[0]),
                    fields[1],
                    static_cast<int>(fields[2]));
            }
        }
    }

    setTrailer(dict);

    auto prev = dict.getKey("Prev");
    if (prev.isInteger()) {
        return prev.getIntValue();
    }
    return 0;
}

void
BPDF::insertXrefEntry(int obj, int f0, bpdf_offset_t f1, int f2)
{
    // Entries are inserted newest first, so an existing entry always wins. An object that a
    // newer section deleted stays deleted.
    if (obj <= 0 || m->deleted_objects.count(obj)) {
        return;
    }
    int gen = (f0 == 2) ? 0 : f2;
    BPDFObjGen og(obj, gen);
    for (auto const& iter: m->xref_table) {
        if (iter.first.getObj() == obj) {
            return;
        }
    }
    if (f0 == 1) {
        m->xref_table[og] = BPDFXRefEntry(f1);
    } else {
        m->xref_table[og] = BPDFXRefEntry(static_cast<int>(f1), f2);
    }
    m->max_objid = std::max(m->max_objid, obj);
}

void
BPDF::insertFreeXrefEntry(BPDFObjGen og)
{
    for (auto const& iter: m->xref_table) {
        if (iter.first.getObj() == og.getObj()) {
            return;
        }
    }
    m->deleted_objects.insert(og.getObj());
}

void
BPDF::reconstruct_xref()
{
    // Scan the whole file for "n g obj" headers and trailer dictionaries. The last definition of
    // each object wins.
    m->reconstructed_xref = true;
    warn(damagedPDF("", 0, "Attempting to reconstruct cross-reference table"));

    m->xref_table.clear();
    m->deleted_objects.clear();
    m->pending_object_streams.clear();

    std::string data = m->file->read(static_cast<size_t>(m->file->getSize()), 0);
    std::map<BPDFObjGen, bpdf_offset_t> found;
    std::vector<bpdf_offset_t> trailers;
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0 && !(BUtil::is_space(data.at(i - 1)) || BUtil::is_delimiter(data.at(i - 1)))) {
            continue;
        }
        char ch = data.at(i);
        if (BUtil::is_digit(ch)) {
            size_t p = i;
            long long obj = 0;
            long long gen = 0;
            if (scan_integer(data, p, obj) && scan_space(data, p) && scan_integer(data, p, gen) &&
                scan_space(data, p) && data.compare(p, 3, "obj") == 0 &&
                at_token_boundary(data, p + 3) && obj > 0 && obj <= INT32_MAX &&
                gen <= 65535) {
                found[BPDFObjGen(static_cast<int>(obj), static_cast<int>(gen))] =
                    static_cast<bpdf_offset_t>(i);
                i = p + 2;
            }
        } else if (
            ch == 't' && data.compare(i, 7, "trailer") == 0 && at_token_boundary(data, i + 7)) {
            trailers.push_back(static_cast<bpdf_offset_t>(i + 7));
            i += 6;
        }
    }
    if (found.empty()) {
        throw damagedPDF("", 0, "unable to find objects while recovering damaged file");
    }

    // Only the newest generation of each object number is kept.
    for (auto const& [og, offset]: found) {
        for (auto iter = m->xref_table.begin(); iter != m->xref_table.end(); ++iter) {
            if (iter->first.getObj() == og.getObj()) {
                m->xref_table.erase(iter);
                break;
            }
        }
        m->xref_table[og] = BPDFXRefEntry(offset);
        m->max_objid = std::max(m->max_objid, og.getObj());
    }

    BPDFObjectHandle trailer;
    for (auto offset: trailers) {
        try {
            m->file->seek(offset, SEEK_SET);
            BPDFTokenizer tokenizer;
            BPDFParser parser(*m->file, "trailer", tokenizer, nullptr, this);
            bool empty = false;
            auto t = parser.parse(empty);
            if (t.isDictionary() && t.hasKey("Root")) {
                trailer = t;
            }
        } catch (BPDFExc& e) {
            warn(e);
        }
    }

    // Look at each object's dictionary without caching the object, since nothing can be
    // decrypted yet.
    BPDFObjectHandle last_catalog;
    BPDFObjectHandle xref_stream_dict;
    for (auto const& [og, entry]: m->xref_table) {
        BPDFObjectHandle obj;
        try {
            m->file->seek(entry.getOffset(), SEEK_SET);
            BPDFTokenizer tokenizer;
            for (int i = 0; i < 3; ++i) {
                tokenizer.readToken(*m->file, "object header");
            }
            BPDFParser parser(*m->file, og.describe(), tokenizer, nullptr, this);
            bool empty = false;
            obj = parser.parse(empty);
        } catch (BPDFExc&) {
            continue;
        }
        if (!obj.isDictionary()) {
            continue;
        }
        auto type = obj.getKey("Type");
        if (type.isIndirect() || !type.isName()) {
            continue;
        }
        if (type.getName() == "Catalog") {
            last_catalog = getObject(og);
        } else if (type.getName() == "ObjStm") {
            m->pending_object_streams.push_back(og.getObj());
        } else if (type.getName() == "XRef" && obj.hasKey("Root")) {
            xref_stream_dict = obj;
        }
    }

    if (!trailer && xref_stream_dict) {
        trailer = xref_stream_dict;
    }
    bool root_found = false;
    if (trailer) {
        auto root = trailer.getKey("Root");
        root_found = root.isIndirect() && m->xref_table.count(root.getObjGen());
    }
    if (!root_found && last_catalog) {
        warn(damagedPDF(
            "",
            0,
            "no usable trailer found; using object " + last_catalog.getObjGen().unparse() +
                " as the catalog"));
        if (!trailer) {
            trailer = BPDFObjectHandle::newDictionary();
        } else {
            trailer = trailer.shallowCopy();
        }
        trailer.replaceKey("Root", last_catalog);
    }
    if (!trailer) {
        throw damagedPDF("", 0, "unable to find trailer dictionary while recovering damaged file");
    }
    trailer.replaceKey("Size", BPDFObjectHandle::newInteger(m->max_objid + 1));
    m->trailer = trailer;
}

void
BPDF::registerPendingObjectStreams()
{
    // After reconstruction, the contents of object streams are only known once the streams can
    // be read, which may require decryption.
    auto pending = std::move(m->pending_object_streams);
    m->pending_object_streams.clear();
    for (int objstm: pending) {
        try {
            auto og = BPDFObjGen(objstm, 0);
            for (auto const& iter: m->xref_table) {
                if (iter.first.getObj() == objstm) {
                    og = iter.first;
                }
            }
            auto stream = getObject(og);
            auto n = stream.getKey("N");
            if (!stream.isStream() || !n.isInteger()) {
                continue;
            }
            std::string data = stream.getStreamData();
            BufferInputSource input("object stream " + og.unparse(), data);
            BPDFTokenizer tokenizer;
            tokenizer.allowEOF();
            for (long long i = 0; i < n.getIntValue(); ++i) {
                auto tnum = tokenizer.readToken(input, "object stream");
                auto toffset = tokenizer.readToken(input, "object stream");
                if (!(tnum.isInteger() && toffset.isInteger())) {
                    break;
                }
                int obj = BUtil::string_to_int(tnum.getValue().c_str());
                bool present = false;
                for (auto const& iter: m->xref_table) {
                    if (iter.first.getObj() == obj) {
                        present = true;
                        break;
                    }
                }
                if (!present && obj > 0) {
                    m->xref_table[BPDFObjGen(obj, 0)] =
                        BPDFXRefEntry(objstm, static_cast<int>(i));
                    m->max_objid = std::max(m->max_objid, obj);
                }
            }
        } catch (BPDFExc& e) {
            warn(e);
        } catch (std::range_error& e) {
            warn(damagedPDF(
                "object stream " + std::to_string(objstm),
                std::string("invalid object number: ") + e.what()));
        }
    }
}

std::shared_ptr<BPDFObject>
BPDF::resolve(BPDFObjGen og)
{
    auto& objects = m->table->objects;
    auto cached = objects.find(og);
    if (cached != objects.end()) {
        return cached->second;
    }

    auto entry = m->xref_table.find(og);
    if (entry == m->xref_table.end() && !m->pending_object_streams.empty()) {
        registerPendingObjectStreams();
        entry = m->xref_table.find(og);
    }
    if (entry == m->xref_table.end()) {
        if (m->deleted_objects.count(og.getObj())) {
            return BPDFObject::create<BPDF_Null>();
        }
        throw BPDFExc(
            bpdf_e_broken_reference,
            getFilename(),
            og.describe(),
            0,
            "reference to object that does not exist");
    }

    ResolveGuard guard(m->resolving, og);
    if (guard.loop()) {
        warn(damagedPDF(og.describe(), "loop detected resolving object"));
        return BPDFObject::create<BPDF_Null>();
    }

    try {
        if (entry->second.getType() == 1) {
            readObjectAtOffset(entry->second.getOffset(), og.describe(), og);
        } else {
            resolveObjectsInStream(entry->second.getObjStreamNumber());
        }
    } catch (BPDFExc& e) {
        if (e.getErrorCode() != bpdf_e_damaged_pdf || !m->attempt_recovery ||
            m->reconstructed_xref) {
            throw;
        }
        warn(e);
        reconstruct_xref();
        return resolve(og);
    }

    cached = objects.find(og);
    if (cached == objects.end()) {
        warn(damagedPDF(
            og.describe(), "object not found in its location; treating as null"));
        auto null = BPDFObject::create<BPDF_Null>();
        newIndirect(og, null);
        return null;
    }
    return cached->second;
}

std::shared_ptr<BPDFObject>
BPDF::readObjectAtOffset(bpdf_offset_t offset, std::string const& description, BPDFObjGen exp_og)
{
    if (offset <= 0) {
        throw damagedPDF(description, "object has offset 0");
    }
    m->file->seek(offset, SEEK_SET);
    BPDFTokenizer tokenizer;
    auto tobjid = tokenizer.readToken(*m->file, description);
    auto tgen = tokenizer.readToken(*m->file, description);
    auto tobj = tokenizer.readToken(*m->file, description);
    if (!(tobjid.isInteger() && tgen.isInteger() && tobj.isWord("obj"))) {
        throw damagedPDF(offset, "expected n n obj (" + description + ")");
    }
    BPDFObjGen og;
    try {
        og = BPDFObjGen(
            BUtil::string_to_int(tobjid.getValue().c_str()),
            BUtil::string_to_int(tgen.getValue().c_str()));
    } catch (std::range_error&) {
        throw damagedPDF(offset, "object number out of range (" + description + ")");
    }
    if (exp_og.isIndirect() && og != exp_og) {
        throw damagedPDF(offset, "expected " + exp_og.unparse() + " obj (" + description + ")");
    }

    auto obj = readObject(og.describe(), og);

    auto endobj = tokenizer.readToken(*m->file, description);
    if (!endobj.isWord("endobj")) {
        warn(damagedPDF(og.describe(), "expected endobj"));
    }

    if (!m->table->objects.count(og)) {
        newIndirect(og, obj);
    }
    return m->table->objects[og];
}

std::shared_ptr<BPDFObject>
BPDF::readObject(std::string const& description, BPDFObjGen og)
{
    BPDFTokenizer tokenizer;
    std::unique_ptr<StringDecrypter> decrypter;
    if (m->in_encp) {
        decrypter = std::make_unique<StringDecrypter>(this, og);
    }
    BPDFParser parser(*m->file, description, tokenizer, decrypter.get(), this);
    bool empty = false;
    auto oh = parser.parse(empty);
    if (empty) {
        warn(damagedPDF(description, "empty object treated as null"));
        return BPDFObject::create<BPDF_Null>();
    }

    bpdf_offset_t after_object = m->file->tell();
    auto token = tokenizer.readToken(*m->file, description);
    if (!token.isWord("stream")) {
        m->file->seek(after_object, SEEK_SET);
        return oh.obj;
    }
    if (!oh.isDictionary()) {
        throw damagedPDF(description, "stream keyword following non-dictionary");
    }

    // The stream keyword is followed by CRLF or LF. A lone CR is tolerated with a warning.
    char ch;
    if (m->file->read(&ch, 1) == 1) {
        if (ch == '\r') {
            if (m->file->read(&ch, 1) == 1 && ch != '\n') {
                warn(damagedPDF(description, "stream keyword followed by carriage return only"));
                m->file->unreadCh(ch);
            }
        } else if (ch != '\n') {
            warn(damagedPDF(description, "stream keyword not followed by proper line terminator"));
            m->file->unreadCh(ch);
        }
    }
    bpdf_offset_t stream_offset = m->file->tell();

    size_t length = 0;
    bool length_ok = false;
    try {
        auto length_obj = oh.getKey("Length");
        if (length_obj.isInteger() && length_obj.getIntValue() >= 0) {
            length = static_cast<size_t>(length_obj.getIntValue());
            m->file->seek(stream_offset + static_cast<bpdf_offset_t>(length), SEEK_SET);
            length_ok = tokenizer.readToken(*m->file, description).isWord("endstream");
        }
    } catch (BPDFExc& e) {
        warn(e);
    }
    if (!length_ok) {
        length = recoverStreamLength(stream_offset, og);
    }
    return BPDFObject::create<BPDF_Stream>(oh, stream_offset, length);
}

size_t
BPDF::recoverStreamLength(bpdf_offset_t stream_offset, BPDFObjGen og)
{
    warn(damagedPDF(
        og.describe(), stream_offset,
        "stream length is missing or invalid; attempting to recover"));
    m->file->seek(stream_offset, SEEK_SET);
    std::string buf;
    static size_t const chunk = 8192;
    while (true) {
        auto more = m->file->read(chunk);
        if (more.empty()) {
            break;
        }
        size_t search_from = buf.size() >= 9 ? buf.size() - 9 : 0;
        buf += more;
        auto pos = buf.find("endstream", search_from);
        if (pos != std::string::npos) {
            size_t length = pos;
            // The end-of-line marker before endstream is not part of the data.
            if (length > 0 && buf.at(length - 1) == '\n') {
                --length;
            }
            if (length > 0 && buf.at(length - 1) == '\r') {
                --length;
            }
            m->file->seek(stream_offset + static_cast<bpdf_offset_t>(pos + 9), SEEK_SET);
            warn(damagedPDF(
                og.describe(), stream_offset,
                "recovered stream length: " + std::to_string(length)));
            return length;
        }
    }
    throw damagedPDF(og.describe(), stream_offset, "unable to recover stream data");
}

void
BPDF::resolveObjectsInStream(int obj_stream_number)
{
    if (!m->resolved_object_streams.insert(obj_stream_number).second) {
        return;
    }
    BPDFObjectHandle obj_stream;
    for (auto const& iter: m->xref_table) {
        if (iter.first.getObj() == obj_stream_number && iter.second.getType() == 1) {
            obj_stream = getObject(iter.first);
        }
    }
    if (!(obj_stream && obj_stream.isStream())) {
        throw damagedPDF(
            "object stream " + std::to_string(obj_stream_number),
            "supposed object stream is not a stream");
    }
    auto dict = obj_stream.getDict();
    if (!dict.getKey("Type").isNameAndEquals("ObjStm")) {
        warn(damagedPDF(
            "object stream " + std::to_string(obj_stream_number),
            "supposed object stream has wrong type"));
    }
    auto n_obj = dict.getKey("N");
    auto first_obj = dict.getKey("First");
    if (!(n_obj.isInteger() && first_obj.isInteger())) {
        throw damagedPDF(
            "object stream " + std::to_string(obj_stream_number),
            "object stream has incorrect keys");
    }
    auto first = first_obj.getIntValue();
    std::string description = "object stream " + std::to_string(obj_stream_number);
    BufferInputSource input(description, obj_stream.getStreamData(bpdf_dl_generalized));
    BPDFTokenizer tokenizer;
    tokenizer.allowEOF();

    std::vector<std::pair<int, long long>> offsets;
    for (long long i = 0; i < n_obj.getIntValue(); ++i) {
        auto tnum = tokenizer.readToken(input, description);
        auto toffset = tokenizer.readToken(input, description);
        if (!(tnum.isInteger() && toffset.isInteger())) {
            throw damagedPDF(description, "expected integer in object stream header");
        }
        offsets.emplace_back(
            BUtil::string_to_int(tnum.getValue().c_str()),
            BUtil::string_to_ll(toffset.getValue().c_str()));
    }

    for (auto const& [obj, offset]: offsets) {
        BPDFObjGen og(obj, 0);
        auto entry = m->xref_table.find(og);
        // Only objects the cross-reference data places in this stream are loaded.
        if (entry == m->xref_table.end() || entry->second.getType() != 2 ||
            entry->second.getObjStreamNumber() != obj_stream_number ||
            m->table->objects.count(og)) {
            continue;
        }
        input.seek(first + offset, SEEK_SET);
        BPDFParser parser(input, og.describe(), tokenizer, nullptr, this);
        bool empty = false;
        auto oh = parser.parse(empty);
        if (empty) {
            continue;
        }
        newIndirect(og, oh.obj);
    }
}

std::string
BPDF::readRawStreamData(
    BPDFObjGen og, BPDFObjectHandle stream_dict, bpdf_offset_t offset, size_t length)
{
    std::string data = m->file->read(length, offset);
    if (data.size() < length) {
        warn(damagedPDF(
            og.describe(), offset, "unexpected EOF reading stream data"));
    }
    decryptStream(data, og, stream_dict);
    return data;
}
