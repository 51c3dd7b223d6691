#include <bpdf/BPDFWriter.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFSecurityHandler.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/Digest.hh>
#include <bpdf/Pl_AES_PDF.hh>
#include <bpdf/Pl_Count.hh>
#include <bpdf/Pl_Flate.hh>
#include <bpdf/Pl_String.hh>

#include <ctime>
#include <deque>
#include <stdexcept>

class BPDFWriter::Members
{
    friend class BPDFWriter;

  public:
    Members(BPDF& pdf) :
        pdf(pdf)
    {
    }

  private:
    BPDF& pdf;
    std::string filename;
    bool output_memory{false};
    Pipeline* output_pipeline{nullptr};

    bool compress_streams{true};
    bpdf_stream_decode_level_e decode_level{bpdf_dl_none};
    int compression_level{-1};
    std::string min_pdf_version;
    bool static_id{false};
    bool static_aes_iv{false};

    BPDFObjectHandle signature;
    size_t signature_contents_bytes{0};
    SignatureLayout signature_layout;

    BPDFSecurityHandler const* encryption{nullptr};
    std::string id1;
    std::string id2;

    std::string buffer;
    std::unique_ptr<Pl_String> buffer_pl;
    std::unique_ptr<Pl_Count> count_pl;

    std::map<BPDFObjGen, int> obj_renumber;
    BPDFObjGen::set broken;
    std::deque<std::pair<BPDFObjectHandle, int>> object_queue;
    std::vector<bpdf_offset_t> xref;
    int next_objid{1};
    int encryption_dict_objid{0};
    int root_objid{0};
    int info_objid{0};
};

BPDFWriter::BPDFWriter(BPDF& pdf) :
    m(new Members(pdf))
{
}

BPDFWriter::BPDFWriter(BPDF& pdf, char const* filename) :
    m(new Members(pdf))
{
    setOutputFilename(filename);
}

BPDFWriter::~BPDFWriter() = default;

void
BPDFWriter::setOutputFilename(char const* filename)
{
    m->filename = filename ? filename : "";
    m->output_memory = false;
    m->output_pipeline = nullptr;
}

void
BPDFWriter::setOutputMemory()
{
    m->filename.clear();
    m->output_memory = true;
    m->output_pipeline = nullptr;
}

std::string
BPDFWriter::getOutputString()
{
    if (!m->output_memory) {
        throw std::logic_error("BPDFWriter::getOutputString called without setOutputMemory");
    }
    return m->buffer;
}

void
BPDFWriter::setOutputPipeline(Pipeline* p)
{
    m->filename.clear();
    m->output_memory = false;
    m->output_pipeline = p;
}

void
BPDFWriter::setCompressStreams(bool val)
{
    m->compress_streams = val;
}

void
BPDFWriter::setDecodeLevel(bpdf_stream_decode_level_e val)
{
    m->decode_level = val;
}

void
BPDFWriter::setCompressionLevel(int val)
{
    m->compression_level = val;
}

void
BPDFWriter::setMinimumPDFVersion(std::string const& version)
{
    m->min_pdf_version = version;
}

void
BPDFWriter::setStaticID(bool val)
{
    m->static_id = val;
}

void
BPDFWriter::setStaticAesIV(bool val)
{
    m->static_aes_iv = val;
}

void
BPDFWriter::setSignatureDictionary(BPDFObjectHandle sig, size_t contents_bytes)
{
    if (!(sig.isIndirect() && sig.isDictionary())) {
        throw std::logic_error(
            "BPDFWriter::setSignatureDictionary: signature must be an indirect dictionary");
    }
    m->signature = sig;
    m->signature_contents_bytes = contents_bytes;
}

BPDFWriter::SignatureLayout
BPDFWriter::getSignatureLayout() const
{
    return m->signature_layout;
}

void
BPDFWriter::write(std::string_view str)
{
    m->count_pl->writeString(str);
}

bpdf_offset_t
BPDFWriter::getCount() const
{
    return m->count_pl->getCount();
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

    std::string
    flate_compress(std::string const& data, int level)
    {
        std::string result;
        Pl_String out("compressed stream", nullptr, result);
        Pl_Flate flate("compress stream", &out, Pl_Flate::a_deflate, level);
        flate.writeString(data);
        flate.finish();
        return result;
    }
} // namespace

std::string
BPDFWriter::getFinalVersion()
{
    std::string version = m->pdf.getPDFVersion();
    if (parse_version(version) < parse_version(m->min_pdf_version)) {
        version = m->min_pdf_version;
    }
    return version;
}

void
BPDFWriter::generateID()
{
    std::string result;
    if (m->static_id) {
        static unsigned char const tmp[] = {
            0x31, 0x41, 0x59, 0x26, 0x53, 0x58, 0x97, 0x93,
            0x23, 0x84, 0x62, 0x64, 0x33, 0x83, 0x27, 0x95};
        result = std::string(reinterpret_cast<char const*>(tmp), sizeof(tmp));
    } else {
        // The ID only has to be very likely to be unique.
        std::string seed = std::to_string(time(nullptr)) + " " + m->filename + " bpdf ";
        unsigned char random[16];
        BUtil::initializeWithRandomBytes(random, sizeof(random));
        seed.append(reinterpret_cast<char*>(random), sizeof(random));
        auto info = m->pdf.getTrailer().getKey("Info");
        for (auto const& [key, value]: info.getDictAsMap()) {
            if (value.isString()) {
                seed += " " + value.getStringValue();
            }
        }
        result = Digest::compute(BPDFCryptoImpl::h_md5, seed);
    }

    // The first word of an existing /ID is kept and a new second word is generated. An encrypted
    // file must use the first word its encryption parameters were computed with.
    m->id2 = result;
    if (m->encryption) {
        m->id1 = m->encryption->getId1();
    } else {
        auto id = m->pdf.getTrailer().getKey("ID");
        if (id.isArray() && id.getArrayItem(0).isString()) {
            m->id1 = id.getArrayItem(0).getStringValue();
        }
    }
    if (m->id1.empty()) {
        m->id1 = m->id2;
    }
}

int
BPDFWriter::enqueueObject(BPDFObjectHandle object)
{
    auto og = object.getObjGen();
    auto it = m->obj_renumber.find(og);
    if (it != m->obj_renumber.end()) {
        return it->second;
    }
    if (m->broken.contains(og)) {
        return 0;
    }
    try {
        // Resolve now so that a broken reference is reported once and written as null.
        (void)object.getTypeCode();
    } catch (BPDFExc& e) {
        if (e.getErrorCode() != bpdf_e_broken_reference) {
            throw;
        }
        m->pdf.warn(
            bpdf_e_broken_reference,
            og.describe(),
            0,
            std::string("writing null in place of unresolvable reference: ") + e.what());
        m->broken.add(og);
        return 0;
    }
    int objid = m->next_objid++;
    m->obj_renumber[og] = objid;
    m->object_queue.emplace_back(object, objid);
    return objid;
}

std::string
BPDFWriter::encrypt(std::string const& data, int objid, bool is_stream)
{
    auto const* handler = m->encryption;
    if (!handler) {
        return data;
    }
    auto cipher = is_stream ? handler->stream_cipher : handler->string_cipher;
    return handler->apply(cipher, BPDFObjGen(objid, 0), data, true);
}

std::string
BPDFWriter::unparseChild(BPDFObjectHandle child, int objid, bool encrypt_strings)
{
    if (child.isIndirect()) {
        int child_id = enqueueObject(child);
        return child_id ? std::to_string(child_id) + " 0 R" : "null";
    }
    switch (child.getTypeCode()) {
    case ot_string:
        if (encrypt_strings) {
            return BPDFObjectHandle::newString(encrypt(child.getStringValue(), objid, false))
                .unparse();
        }
        return child.unparse();

    case ot_array:
        {
            std::string result = "[";
            for (auto const& item: child.getArrayAsVector()) {
                result += " " + unparseChild(item, objid, encrypt_strings);
            }
            return result + " ]";
        }

    case ot_dictionary:
        {
            // The contents of a signature are never encrypted.
            bool is_signature = child.hasKey("ByteRange");
            std::string result = "<<";
            for (auto const& [key, value]: child.getDictAsMap()) {
                bool encrypt = encrypt_strings && !(is_signature && key == "Contents");
                result += " " + BPDFObjectHandle::newName(key).unparse() + " " +
                    unparseChild(value, objid, encrypt);
            }
            return result + " >>";
        }

    case ot_reserved:
        return "null";

    default:
        return child.unparse();
    }
}

void
BPDFWriter::writeDictionary(BPDFObjectHandle dict, int objid, bool is_signature)
{
    bool encrypt = m->encryption != nullptr;
    bool has_byte_range = dict.hasKey("ByteRange");
    write("<<");
    for (auto const& [key, value]: dict.getDictAsMap()) {
        write(" ");
        write(BPDFObjectHandle::newName(key).unparse());
        write(" ");
        if (is_signature && key == "ByteRange") {
            // Placeholder of fixed width, filled in after the layout is known
            m->signature_layout.byte_range_offset = getCount();
            std::string placeholder = "[";
            for (int i = 0; i < 4; ++i) {
                placeholder += " " + std::string(byte_range_digits, '0');
            }
            placeholder += " ]";
            m->signature_layout.byte_range_length = placeholder.size();
            write(placeholder);
        } else if (is_signature && key == "Contents") {
            m->signature_layout.contents_offset = getCount();
            std::string placeholder =
                "<" + std::string(2 * m->signature_contents_bytes, '0') + ">";
            m->signature_layout.contents_length = placeholder.size();
            write(placeholder);
        } else {
            write(unparseChild(value, objid, encrypt && !(has_byte_range && key == "Contents")));
        }
    }
    write(" >>");
}

void
BPDFWriter::writeStream(BPDFObjectHandle stream, int objid)
{
    auto dict = stream.getDict().shallowCopy();
    bool is_metadata = dict.getKey("Type").isNameAndEquals("Metadata");

    std::string data;
    bool filtered = !dict.getKey("Filter").isNull();
    if (filtered && m->decode_level != bpdf_dl_none && stream.canDecode(m->decode_level)) {
        data = stream.getStreamData(m->decode_level);
        dict.removeKey("Filter");
        dict.removeKey("DecodeParms");
        filtered = false;
    } else {
        data = stream.getRawStreamData();
    }
    if (!filtered && m->compress_streams && !is_metadata) {
        data = flate_compress(data, m->compression_level);
        dict.replaceKey("Filter", BPDFObjectHandle::newName("FlateDecode"));
    }
    if (m->encryption && !(is_metadata && !m->encryption->encryptsMetadata())) {
        data = encrypt(data, objid, true);
    }
    dict.replaceKey("Length", BPDFObjectHandle::newInteger(static_cast<long long>(data.size())));

    writeDictionary(dict, objid, false);
    write("\nstream\n");
    write(data);
    write("\nendstream");
}

void
BPDFWriter::writeObject(BPDFObjectHandle object, int objid)
{
    if (static_cast<size_t>(objid) >= m->xref.size()) {
        m->xref.resize(static_cast<size_t>(objid) + 1, 0);
    }
    m->xref.at(static_cast<size_t>(objid)) = getCount();
    write(std::to_string(objid) + " 0 obj\n");
    if (object.isStream()) {
        writeStream(object, objid);
    } else if (object.isDictionary()) {
        bool is_signature = m->signature && object.isSameObjectAs(m->signature);
        writeDictionary(object, objid, is_signature);
    } else {
        write(unparseChild(object.shallowCopy(), objid, m->encryption != nullptr));
    }
    write("\nendobj\n");
}

void
BPDFWriter::writeEncryptionDictionary()
{
    m->encryption_dict_objid = m->next_objid++;
    m->xref.resize(static_cast<size_t>(m->encryption_dict_objid) + 1, 0);
    m->xref.at(static_cast<size_t>(m->encryption_dict_objid)) = getCount();
    write(std::to_string(m->encryption_dict_objid) + " 0 obj\n");
    write(m->encryption->unparseDictionary());
    write("\nendobj\n");
}

void
BPDFWriter::writeTrailer()
{
    write("trailer <<");
    write(" /Root " + std::to_string(m->root_objid) + " 0 R");
    write(" /Size " + std::to_string(m->next_objid));
    if (m->info_objid) {
        write(" /Info " + std::to_string(m->info_objid) + " 0 R");
    }
    write(" /ID [<" + BUtil::hex_encode(m->id1) + "><" + BUtil::hex_encode(m->id2) + ">]");
    if (m->encryption_dict_objid) {
        write(" /Encrypt " + std::to_string(m->encryption_dict_objid) + " 0 R");
    }
    write(" >>\n");
}

void
BPDFWriter::writeXRefTable()
{
    write("xref\n0 " + std::to_string(m->next_objid) + "\n");
    write("0000000000 65535 f \n");
    for (int i = 1; i < m->next_objid; ++i) {
        write(BUtil::int_to_string(m->xref.at(static_cast<size_t>(i)), 10) + " 00000 n \n");
    }
    writeTrailer();
}

void
BPDFWriter::write()
{
    if (m->filename.empty() && !m->output_memory && !m->output_pipeline) {
        throw std::logic_error("BPDFWriter::write called with no output set");
    }
    if (m->signature && m->signature.getOwningBPDF() != &m->pdf) {
        throw std::logic_error("BPDFWriter: signature dictionary belongs to another document");
    }

    m->buffer.clear();
    m->buffer_pl = std::make_unique<Pl_String>("writer buffer", nullptr, m->buffer);
    m->count_pl = std::make_unique<Pl_Count>("writer count", m->buffer_pl.get());
    m->obj_renumber.clear();
    m->broken.clear();
    m->object_queue.clear();
    m->xref.assign(1, 0);
    m->next_objid = 1;
    m->encryption_dict_objid = 0;
    m->signature_layout = SignatureLayout();
    m->encryption = m->pdf.getSecurityHandler();
    if (m->static_aes_iv) {
        Pl_AES_PDF::useStaticIV();
    }
    generateID();

    write("%PDF-" + getFinalVersion() + "\n%\xbf\xf7\xa2\xfe\n");

    auto trailer = m->pdf.getTrailer();
    m->root_objid = enqueueObject(m->pdf.getRoot());
    auto info = trailer.getKey("Info");
    if (info.isIndirect() && info.isDictionary()) {
        m->info_objid = enqueueObject(info);
    } else if (info.isDictionary()) {
        info = m->pdf.makeIndirectObject(info);
        trailer.replaceKey("Info", info);
        m->info_objid = enqueueObject(info);
    } else {
        m->info_objid = 0;
    }

    while (!m->object_queue.empty()) {
        auto [object, objid] = m->object_queue.front();
        m->object_queue.pop_front();
        writeObject(object, objid);
    }
    if (m->signature && !m->obj_renumber.count(m->signature.getObjGen())) {
        throw std::logic_error(
            "BPDFWriter: signature dictionary is not reachable from the document catalog");
    }
    if (m->encryption) {
        writeEncryptionDictionary();
    }

    bpdf_offset_t xref_offset = getCount();
    writeXRefTable();
    write("startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n");
    m->count_pl->finish();

    if (!m->filename.empty()) {
        BUtil::write_string_to_file(m->filename.c_str(), m->buffer);
    } else if (m->output_pipeline) {
        m->output_pipeline->writeString(m->buffer);
        m->output_pipeline->finish();
    }
}
