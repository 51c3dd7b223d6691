#ifndef BPDFOBJECT_PRIVATE_HH
#define BPDFOBJECT_PRIVATE_HH

#include <bpdf/BPDFObjGen.hh>
#include <bpdf/BPDFObjectHandle.hh>
#include <bpdf/Constants.h>
#include <bpdf/Types.h>

#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

class BPDF;
class BPDFObjTable;

class BPDF_Reserved final
{
};

class BPDF_Null final
{
};

class BPDF_Bool final
{
  public:
    explicit BPDF_Bool(bool val) :
        val(val)
    {
    }
    bool val;
};

class BPDF_Integer final
{
  public:
    explicit BPDF_Integer(long long val) :
        val(val)
    {
    }
    long long val;
};

class BPDF_Real final
{
  public:
    explicit BPDF_Real(std::string val) :
        val(std::move(val))
    {
    }
    // Reals are stored as strings to avoid roundoff errors.
    std::string val;
};

// Strings may include embedded null characters.
class BPDF_String final
{
  public:
    explicit BPDF_String(std::string val) :
        val(std::move(val))
    {
    }
    std::string unparse() const;
    std::string getUTF8Val() const;

    std::string val;
};

class BPDF_Name final
{
  public:
    explicit BPDF_Name(std::string name) :
        name(std::move(name))
    {
    }
    // Return the name in PDF syntax with #xx escapes. The stored name is unescaped.
    static std::string normalizeName(std::string const& name);

    std::string name;
};

class BPDF_Array final
{
  public:
    BPDF_Array() = default;
    explicit BPDF_Array(std::vector<BPDFObjectHandle> items) :
        items(std::move(items))
    {
    }
    std::vector<BPDFObjectHandle> items;
};

class BPDF_Dictionary final
{
  public:
    BPDF_Dictionary() = default;
    explicit BPDF_Dictionary(std::map<std::string, BPDFObjectHandle> items) :
        items(std::move(items))
    {
    }
    std::map<std::string, BPDFObjectHandle> items;
};

// A stream's data is kept encoded. Until it is loaded or replaced, it lives in the owning
// document's input at [offset, offset + length) and is decrypted as it is read.
class BPDF_Stream final
{
  public:
    BPDF_Stream(BPDFObjectHandle stream_dict, bpdf_offset_t offset, size_t length) :
        stream_dict(std::move(stream_dict)),
        offset(offset),
        length(length)
    {
    }
    BPDF_Stream(BPDFObjectHandle stream_dict, std::string data) :
        stream_dict(std::move(stream_dict)),
        data(std::make_shared<std::string>(std::move(data)))
    {
    }

    BPDFObjectHandle stream_dict;
    std::shared_ptr<std::string> data;
    bpdf_offset_t offset{0};
    size_t length{0};
};

class BPDF_Operator final
{
  public:
    explicit BPDF_Operator(std::string val) :
        val(std::move(val))
    {
    }
    std::string val;
};

class BPDF_InlineImage final
{
  public:
    explicit BPDF_InlineImage(std::string val) :
        val(std::move(val))
    {
    }
    std::string val;
};

// An indirect reference. The table is held weakly, so objects referring to each other never
// keep a document alive.
class BPDF_Reference final
{
  public:
    BPDF_Reference(std::weak_ptr<BPDFObjTable> table, BPDFObjGen og) :
        table(std::move(table)),
        og(og)
    {
    }
    std::weak_ptr<BPDFObjTable> table;
    BPDFObjGen og;
};

class BPDFObject
{
  public:
    // The order of alternatives matches bpdf_object_type_e.
    using Value = std::variant<
        std::monostate,
        BPDF_Reserved,
        BPDF_Null,
        BPDF_Bool,
        BPDF_Integer,
        BPDF_Real,
        BPDF_String,
        BPDF_Name,
        BPDF_Array,
        BPDF_Dictionary,
        BPDF_Stream,
        BPDF_Operator,
        BPDF_InlineImage,
        BPDF_Reference>;

    template <
        typename T,
        typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, BPDFObject>>>
    explicit BPDFObject(T&& value) :
        value(std::forward<T>(value))
    {
    }
    BPDFObject(BPDFObject const&) = delete;
    BPDFObject& operator=(BPDFObject const&) = delete;

    template <typename T, typename... Args>
    static std::shared_ptr<BPDFObject>
    create(Args&&... args)
    {
        return std::make_shared<BPDFObject>(T(std::forward<Args>(args)...));
    }

    bpdf_object_type_e
    getTypeCode() const
    {
        return static_cast<bpdf_object_type_e>(value.index());
    }

    template <typename T>
    T*
    as()
    {
        return std::get_if<T>(&value);
    }

    template <typename T>
    T const*
    as() const
    {
        return std::get_if<T>(&value);
    }

    // Return the PDF syntax for this object. References are written as "n g R".
    std::string unparse() const;

    Value value;
    // Set for objects owned by a document's object table
    BPDF* bpdf{nullptr};
    BPDFObjGen og;
};

// The object table of a document. Indirect references hold it weakly and resolve through it.
class BPDFObjTable
{
  public:
    explicit BPDFObjTable(BPDF& owner) :
        owner(owner)
    {
    }

    BPDF& owner;
    std::map<BPDFObjGen, std::shared_ptr<BPDFObject>> objects;
};

#endif // BPDFOBJECT_PRIVATE_HH
