#ifndef BPDF_PRIVATE_HH
#define BPDF_PRIVATE_HH

#include <bpdf/BPDF.hh>

#include <bpdf/BPDFLogger.hh>
#include <bpdf/BPDFObject_private.hh>
#include <bpdf/BPDFSecurityHandler.hh>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Cross-reference entry. type 1 entries give the offset of an object in the file; type 2
// entries give the object stream and the index of the object inside it.
class BPDFXRefEntry
{
  public:
    BPDFXRefEntry() = default;
    BPDFXRefEntry(bpdf_offset_t offset) :
        type(1),
        offset(offset)
    {
    }
    BPDFXRefEntry(int objstm, int index) :
        type(2),
        objstm(objstm),
        index(index)
    {
    }

    int
    getType() const
    {
        return type;
    }
    bpdf_offset_t
    getOffset() const
    {
        return offset;
    }
    int
    getObjStreamNumber() const
    {
        return objstm;
    }
    int
    getObjStreamIndex() const
    {
        return index;
    }

  private:
    int type{0};
    bpdf_offset_t offset{0};
    int objstm{0};
    int index{0};
};

class BPDF::Members
{
    friend class BPDF;

  public:
    Members(BPDF& bpdf);
    ~Members() = default;

  private:
    std::shared_ptr<BPDFLogger> log;
    std::shared_ptr<InputSource> file;
    std::shared_ptr<BPDFObjTable> table;
    std::string pdf_version{"1.3"};
    bool suppress_warnings{false};
    bool attempt_recovery{true};
    bool force_reconstruct{false};
    bool reconstructed_xref{false};
    bool in_reconstruct{false};
    std::vector<BPDFExc> warnings;

    std::map<BPDFObjGen, BPDFXRefEntry> xref_table;
    // Object numbers that the cross-reference data marks as free
    std::set<int> deleted_objects;
    std::set<bpdf_offset_t> visited_xref_offsets;
    // Object streams whose contents have been loaded
    std::set<int> resolved_object_streams;
    // Object streams found while reconstructing whose contents are not yet in xref_table
    std::vector<int> pending_object_streams;
    BPDFObjGen::set resolving;
    int max_objid{0};
    BPDFObjectHandle trailer;

    // Security handler of the input, used when reading, and the one the writer applies. Both
    // are null for unencrypted files.
    std::shared_ptr<BPDFSecurityHandler> in_encp;
    std::shared_ptr<BPDFSecurityHandler> out_encp;
    std::string provided_password;

    bool pushed_inherited_attributes_to_pages{false};
    bool ever_called_get_all_pages{false};
    std::vector<BPDFObjectHandle> all_pages;
    std::map<BPDFObjGen, int> pageobj_to_pages_pos;

    // Per foreign document, keyed by its unique id: map from foreign objects to their copies
    std::map<unsigned long long, std::map<BPDFObjGen, BPDFObjectHandle>> object_copiers;
    unsigned long long unique_id{0};
};

#endif // BPDF_PRIVATE_HH
