// Stream data access for BPDFObjectHandle

#include <bpdf/BPDFObjectHandle.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFObject_private.hh>
#include <bpdf/Pipeline.hh>
#include <bpdf/Pl_ASCII85Decoder.hh>
#include <bpdf/Pl_ASCIIHexDecoder.hh>
#include <bpdf/Pl_DCT.hh>
#include <bpdf/Pl_Flate.hh>
#include <bpdf/Pl_Predictor.hh>
#include <bpdf/Pl_RunLength.hh>
#include <bpdf/Pl_String.hh>

#include <memory>
#include <stdexcept>
#include <vector>

namespace
{
    struct FilterSpec
    {
        std::string name;
        BPDFObjectHandle parms;
    };

    std::string
    canonical_filter_name(std::string const& name)
    {
        // Abbreviations are allowed in inline images and tolerated elsewhere.
        if (name == "Fl") {
            return "FlateDecode";
        }
        if (name == "AHx") {
            return "ASCIIHexDecode";
        }
        if (name == "A85") {
            return "ASCII85Decode";
        }
        if (name == "RL") {
            return "RunLengthDecode";
        }
        if (name == "DCT") {
            return "DCTDecode";
        }
        return name;
    }

    // Returns false if /Filter or /DecodeParms is malformed.
    bool
    get_filters(BPDFObjectHandle const& dict, std::vector<FilterSpec>& filters)
    {
        auto filter_obj = dict.getKey("Filter");
        auto parms_obj = dict.getKey("DecodeParms");
        std::vector<BPDFObjectHandle> names;
        if (filter_obj.isName()) {
            names.push_back(filter_obj);
        } else if (filter_obj.isArray()) {
            names = filter_obj.getArrayAsVector();
        } else if (!filter_obj.isNull()) {
            return false;
        }
        for (size_t i = 0; i < names.size(); ++i) {
            if (!names.at(i).isName()) {
                return false;
            }
            BPDFObjectHandle parms;
            if (parms_obj.isArray()) {
                parms = parms_obj.getArrayItem(static_cast<int>(i));
            } else if (names.size() == 1) {
                parms = parms_obj;
            }
            filters.push_back({canonical_filter_name(names.at(i).getName()), parms});
        }
        return true;
    }

    bool
    can_decode(FilterSpec const& filter, bpdf_stream_decode_level_e level, bool last)
    {
        if (level == bpdf_dl_none) {
            return false;
        }
        if (filter.name == "FlateDecode") {
            if (filter.parms.isDictionary()) {
                auto predictor = filter.parms.getKey("Predictor");
                if (predictor.isInteger()) {
                    auto p = predictor.getIntValue();
                    if (p != 1 && p != 2 && !(p >= 10 && p <= 15)) {
                        return false;
                    }
                    if (p == 2) {
                        auto bpc = filter.parms.getKey("BitsPerComponent");
                        if (bpc.isInteger() && bpc.getIntValue() != 8 && bpc.getIntValue() != 16) {
                            return false;
                        }
                    }
                }
            }
            return true;
        }
        if (filter.name == "ASCIIHexDecode" || filter.name == "ASCII85Decode" ||
            filter.name == "RunLengthDecode") {
            return true;
        }
        if (filter.name == "DCTDecode") {
            return level >= bpdf_dl_all && last;
        }
        return false;
    }

    unsigned int
    get_parm(BPDFObjectHandle const& parms, char const* key, unsigned int dflt)
    {
        auto value = parms.getKey(key);
        if (value.isInteger() && value.getIntValue() > 0) {
            return static_cast<unsigned int>(value.getIntValueAsInt());
        }
        return dflt;
    }
} // namespace

BPDFObjectHandle
BPDFObjectHandle::getDict() const
{
    if (auto s = obj ? resolved()->as<BPDF_Stream>() : nullptr) {
        return s->stream_dict;
    }
    typeError("stream");
}

std::string
BPDFObjectHandle::getRawStreamData() const
{
    auto o = obj ? resolved() : nullptr;
    auto s = o ? o->as<BPDF_Stream>() : nullptr;
    if (!s) {
        typeError("stream");
    }
    if (s->data) {
        return *s->data;
    }
    if (!o->bpdf) {
        throw std::logic_error("stream data is not loaded and the stream has no owning BPDF");
    }
    return o->bpdf->readRawStreamData(o->og, s->stream_dict, s->offset, s->length);
}

bool
BPDFObjectHandle::canDecode(bpdf_stream_decode_level_e level) const
{
    std::vector<FilterSpec> filters;
    if (!get_filters(getDict(), filters)) {
        return false;
    }
    for (size_t i = 0; i < filters.size(); ++i) {
        if (!can_decode(filters.at(i), level, i + 1 == filters.size())) {
            return false;
        }
    }
    return true;
}

bool
BPDFObjectHandle::pipeStreamData(Pipeline* p, bpdf_stream_decode_level_e level) const
{
    auto raw = getRawStreamData();
    std::vector<FilterSpec> filters;
    bool decodable = get_filters(getDict(), filters) && canDecode(level);
    if (!decodable || filters.empty()) {
        p->writeString(raw);
        p->finish();
        return decodable;
    }

    // Build the decoding chain back to front so that each pipeline knows its successor.
    std::vector<std::unique_ptr<Pipeline>> chain;
    Pipeline* next = p;
    for (auto iter = filters.rbegin(); iter != filters.rend(); ++iter) {
        auto const& f = *iter;
        if (f.name == "FlateDecode") {
            unsigned int predictor = get_parm(f.parms, "Predictor", 1);
            unsigned int colors = get_parm(f.parms, "Colors", 1);
            unsigned int bpc = get_parm(f.parms, "BitsPerComponent", 8);
            unsigned int columns = get_parm(f.parms, "Columns", 1);
            if (predictor == 2 || predictor >= 10) {
                chain.push_back(std::make_unique<Pl_Predictor>(
                    "predictor decode", next, predictor, columns, colors, bpc));
                next = chain.back().get();
            }
            chain.push_back(std::make_unique<Pl_Flate>("inflate", next, Pl_Flate::a_inflate));
        } else if (f.name == "ASCIIHexDecode") {
            chain.push_back(std::make_unique<Pl_ASCIIHexDecoder>("ahx decode", next));
        } else if (f.name == "ASCII85Decode") {
            chain.push_back(std::make_unique<Pl_ASCII85Decoder>("a85 decode", next));
        } else if (f.name == "RunLengthDecode") {
            chain.push_back(std::make_unique<Pl_RunLength>("rl decode", next));
        } else if (f.name == "DCTDecode") {
            chain.push_back(std::make_unique<Pl_DCT>("dct decode", next));
        }
        next = chain.back().get();
    }

    std::string description = "stream";
    if (isIndirect()) {
        description = getObjGen().describe();
    }
    try {
        next->writeString(raw);
        next->finish();
    } catch (BPDFExc&) {
        throw;
    } catch (std::runtime_error& e) {
        std::string filename;
        if (auto bpdf = getOwningBPDF()) {
            filename = bpdf->getFilename();
        }
        throw BPDFExc(
            bpdf_e_damaged_pdf,
            filename,
            description,
            0,
            std::string("error decoding stream data: ") + e.what());
    }
    return true;
}

std::string
BPDFObjectHandle::getStreamData(bpdf_stream_decode_level_e level) const
{
    if (level != bpdf_dl_none && !canDecode(level)) {
        std::string filename;
        if (auto bpdf = getOwningBPDF()) {
            filename = bpdf->getFilename();
        }
        throw BPDFExc(
            bpdf_e_unsupported,
            filename,
            isIndirect() ? getObjGen().describe() : "stream",
            0,
            "getStreamData called on unfilterable stream");
    }
    std::string result;
    Pl_String buf("stream data buffer", nullptr, result);
    pipeStreamData(&buf, level);
    return result;
}

void
BPDFObjectHandle::replaceStreamData(
    std::string const& data, BPDFObjectHandle const& filter, BPDFObjectHandle const& decode_parms)
{
    auto s = obj ? resolved()->as<BPDF_Stream>() : nullptr;
    if (!s) {
        typeError("stream");
    }
    s->data = std::make_shared<std::string>(data);
    s->offset = 0;
    s->length = 0;
    auto dict = s->stream_dict;
    dict.replaceKey("Filter", filter);
    dict.replaceKey("DecodeParms", decode_parms);
    dict.replaceKey("Length", newInteger(static_cast<long long>(data.size())));
}
