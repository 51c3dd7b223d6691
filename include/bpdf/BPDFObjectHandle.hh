// Copyright (c) 2024-2026 The bpdf authors
//
// This file is part of bpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BPDFOBJECTHANDLE_HH
#define BPDFOBJECTHANDLE_HH

#include <bpdf/Constants.h>
#include <bpdf/DLL.h>
#include <bpdf/Types.h>

#include <bpdf/BPDFObjGen.hh>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

class BPDF;
class BPDFObject;
class BPDF_Dictionary;
class Pipeline;

// A BPDFObjectHandle is a cheap, copyable reference to a PDF object. Direct objects are shared by
// all handles that refer to them, so modifying a direct array or dictionary through one handle is
// visible through every other handle to the same object.
//
// A handle to an indirect object stores only the owning document's object table and the object's
// number and generation. The object itself is owned by the document and is resolved, and parsed
// if necessary, each time the handle is used. Resolving an object that is not in the document
// throws BPDFExc with bpdf_e_broken_reference. Objects that the cross-reference table marks as
// free resolve to null. Using a handle after its document has been destroyed throws
// std::logic_error.
class BPDFObjectHandle
{
  public:
    // Callbacks for parseContentStream. Operands are delivered before their operator, exactly as
    // they appear in the stream.
    class BPDF_DLL_CLASS ParserCallbacks
    {
      public:
        BPDF_DLL
        virtual ~ParserCallbacks() = default;
        // One of handleObject(BPDFObjectHandle) or handleObject(BPDFObjectHandle, size_t,
        // size_t) must be overridden. The second form receives the object's offset and length
        // within the concatenated content.
        BPDF_DLL
        virtual void handleObject(BPDFObjectHandle);
        BPDF_DLL
        virtual void handleObject(BPDFObjectHandle, size_t offset, size_t length);
        virtual void handleEOF() = 0;
    };

    // Convenience object for rectangles
    class Rectangle
    {
      public:
        Rectangle() :
            llx(0.0),
            lly(0.0),
            urx(0.0),
            ury(0.0)
        {
        }
        Rectangle(double llx, double lly, double urx, double ury) :
            llx(llx),
            lly(lly),
            urx(urx),
            ury(ury)
        {
        }

        double
        width() const
        {
            return urx - llx;
        }

        double
        height() const
        {
            return ury - lly;
        }

        double llx;
        double lly;
        double urx;
        double ury;
    };

    BPDF_DLL
    BPDFObjectHandle() = default;
    BPDF_DLL
    BPDFObjectHandle(BPDFObjectHandle const&) = default;
    BPDF_DLL
    BPDFObjectHandle& operator=(BPDFObjectHandle const&) = default;
    BPDF_DLL
    BPDFObjectHandle(BPDFObjectHandle&&) = default;
    BPDF_DLL
    BPDFObjectHandle& operator=(BPDFObjectHandle&&) = default;

    BPDF_DLL
    bool isInitialized() const;
    BPDF_DLL
    explicit operator bool() const;

    // Two handles are the same object if they are the same indirect object of the same document
    // or share the same direct object.
    BPDF_DLL
    bool isSameObjectAs(BPDFObjectHandle const&) const;

    // Type of the resolved object
    BPDF_DLL
    bpdf_object_type_e getTypeCode() const;
    BPDF_DLL
    char const* getTypeName() const;

    BPDF_DLL
    bool isBool() const;
    BPDF_DLL
    bool isNull() const;
    BPDF_DLL
    bool isInteger() const;
    BPDF_DLL
    bool isReal() const;
    BPDF_DLL
    bool isName() const;
    BPDF_DLL
    bool isString() const;
    BPDF_DLL
    bool isOperator() const;
    BPDF_DLL
    bool isInlineImage() const;
    BPDF_DLL
    bool isArray() const;
    BPDF_DLL
    bool isDictionary() const;
    BPDF_DLL
    bool isStream() const;
    BPDF_DLL
    bool isReserved() const;
    // Integer or real
    BPDF_DLL
    bool isNumber() const;
    BPDF_DLL
    bool isIndirect() const;
    BPDF_DLL
    bool isNameAndEquals(std::string const& name) const;
    // True for a dictionary, or a stream's dictionary, whose /Type and, if given, /Subtype
    // match.
    BPDF_DLL
    bool isDictionaryOfType(std::string const& type, std::string const& subtype = "") const;
    BPDF_DLL
    bool isPageObject() const;
    BPDF_DLL
    bool isPagesObject() const;
    BPDF_DLL
    bool isImage() const;
    BPDF_DLL
    bool isFormXObject() const;

    // Construct objects from a string representation such as "<< /A [1 2 (x)] >>". Indirect
    // references in the string are not permitted.
    BPDF_DLL
    static BPDFObjectHandle
    parse(std::string const& object_str, std::string const& object_description = "");

    // Parse a content stream, or an array of content streams treated as their concatenation,
    // and call the callbacks for every operand and operator.
    BPDF_DLL
    static void parseContentStream(BPDFObjectHandle stream_or_array, ParserCallbacks* callbacks);
    BPDF_DLL
    void parseAsContents(ParserCallbacks* callbacks) const;

    BPDF_DLL
    static BPDFObjectHandle newNull();
    BPDF_DLL
    static BPDFObjectHandle newBool(bool value);
    BPDF_DLL
    static BPDFObjectHandle newInteger(long long value);
    BPDF_DLL
    static BPDFObjectHandle newReal(std::string const& value);
    BPDF_DLL
    static BPDFObjectHandle
    newReal(double value, int decimal_places = 0, bool trim_trailing_zeroes = true);
    BPDF_DLL
    static BPDFObjectHandle newName(std::string const& name);
    BPDF_DLL
    static BPDFObjectHandle newString(std::string const& str);
    // Create a text string from UTF-8. PDFDocEncoding is used if it can represent the string,
    // otherwise UTF-16BE with a byte order mark.
    BPDF_DLL
    static BPDFObjectHandle newUnicodeString(std::string const& utf8_str);
    BPDF_DLL
    static BPDFObjectHandle newOperator(std::string const&);
    BPDF_DLL
    static BPDFObjectHandle newInlineImage(std::string const&);
    BPDF_DLL
    static BPDFObjectHandle newArray(std::vector<BPDFObjectHandle> const& items = {});
    BPDF_DLL
    static BPDFObjectHandle newArray(Rectangle const&);
    BPDF_DLL
    static BPDFObjectHandle
    newDictionary(std::map<std::string, BPDFObjectHandle> const& items = {});

    // Create a new stream in the given document. The stream is made indirect. The data is stored
    // unfiltered unless replaceStreamData is later called with a filter.
    BPDF_DLL
    static BPDFObjectHandle newStream(BPDF* bpdf, std::string const& data = "");

    // Accessors for scalars. Calling an accessor on an object of the wrong type throws BPDFExc
    // with bpdf_e_object.
    BPDF_DLL
    bool getBoolValue() const;
    BPDF_DLL
    long long getIntValue() const;
    BPDF_DLL
    int getIntValueAsInt() const;
    BPDF_DLL
    std::string getRealValue() const;
    BPDF_DLL
    double getNumericValue() const;
    BPDF_DLL
    bool getValueAsNumber(double&) const;
    BPDF_DLL
    std::string getName() const;
    BPDF_DLL
    std::string getStringValue() const;
    // Interpret a string as a PDF text string: UTF-16 with a byte order mark or PDFDocEncoding
    BPDF_DLL
    std::string getUTF8Value() const;
    BPDF_DLL
    std::string getOperatorValue() const;
    BPDF_DLL
    std::string getInlineImageValue() const;

    // Array accessors. getArrayItem returns null for out-of-range indices or non-arrays.
    BPDF_DLL
    int getArrayNItems() const;
    BPDF_DLL
    BPDFObjectHandle getArrayItem(int n) const;
    BPDF_DLL
    std::vector<BPDFObjectHandle> getArrayAsVector() const;
    BPDF_DLL
    bool isRectangle() const;
    // Returns a normalized rectangle (llx <= urx, lly <= ury)
    BPDF_DLL
    Rectangle getArrayAsRectangle() const;

    // Dictionary accessors. For streams, these operate on the stream dictionary. getKey returns
    // null if the key is absent or the object is not a dictionary.
    BPDF_DLL
    bool hasKey(std::string const&) const;
    BPDF_DLL
    BPDFObjectHandle getKey(std::string const&) const;
    BPDF_DLL
    std::set<std::string> getKeys() const;
    BPDF_DLL
    std::map<std::string, BPDFObjectHandle> getDictAsMap() const;

    // Mutators. Setting a dictionary key to null removes it.
    BPDF_DLL
    void setArrayItem(int, BPDFObjectHandle const&);
    BPDF_DLL
    void setArrayFromVector(std::vector<BPDFObjectHandle> const& items);
    BPDF_DLL
    void insertItem(int at, BPDFObjectHandle const& item);
    BPDF_DLL
    void appendItem(BPDFObjectHandle const& item);
    BPDF_DLL
    void eraseItem(int at);
    BPDF_DLL
    void replaceKey(std::string const& key, BPDFObjectHandle const& value);
    BPDF_DLL
    void removeKey(std::string const& key);

    // Resource dictionary helpers. getUniqueResourceName returns prefix followed by the smallest
    // number that is not already a key in any of the dictionary's subdictionaries.
    BPDF_DLL
    std::set<std::string> getResourceNames() const;
    BPDF_DLL
    std::string getUniqueResourceName(std::string const& prefix, int& min_suffix) const;

    // Return a new direct object that is a copy of this one. Arrays and dictionaries are copied
    // one level deep. Streams cannot be copied this way.
    BPDF_DLL
    BPDFObjectHandle shallowCopy() const;

    // Stream accessors

    BPDF_DLL
    BPDFObjectHandle getDict() const;

    // Return the stream's data decoded up to decode_level. Throws BPDFExc with
    // bpdf_e_unsupported if a filter is needed that can't be applied at that level.
    BPDF_DLL
    std::string getStreamData(bpdf_stream_decode_level_e level = bpdf_dl_generalized) const;
    // Return the stream's encoded data, decrypted but with all filters still applied
    BPDF_DLL
    std::string getRawStreamData() const;
    // Returns true if the stream's filters can all be decoded at decode_level
    BPDF_DLL
    bool canDecode(bpdf_stream_decode_level_e level = bpdf_dl_generalized) const;
    // Write the stream's data to p. If the data can be decoded at decode_level it is decoded,
    // otherwise the raw data is written. Returns true if the data was decoded. A decoding
    // failure part of the way through throws BPDFExc with bpdf_e_damaged_pdf.
    BPDF_DLL
    bool pipeStreamData(Pipeline* p, bpdf_stream_decode_level_e level) const;

    // Replace the stream's data. data must already be encoded with filter and decode_parms,
    // which are written to /Filter and /DecodeParms (null removes them). /Length is maintained
    // by the writer.
    BPDF_DLL
    void replaceStreamData(
        std::string const& data,
        BPDFObjectHandle const& filter,
        BPDFObjectHandle const& decode_parms);

    // Owning document of an indirect object, or nullptr for direct objects
    BPDF_DLL
    BPDF* getOwningBPDF() const;

    BPDF_DLL
    BPDFObjGen getObjGen() const;
    BPDF_DLL
    int getObjectID() const;
    BPDF_DLL
    int getGeneration() const;

    // Return a PDF representation of the object. Indirect objects are written as "n g R".
    BPDF_DLL
    std::string unparse() const;
    // Like unparse but the top-level object is written as its value even if it is indirect
    BPDF_DLL
    std::string unparseResolved() const;

    // Page object helpers. getPageContents returns the page's content streams; a single stream
    // is returned as a one-element vector.
    BPDF_DLL
    std::vector<BPDFObjectHandle> getPageContents() const;
    BPDF_DLL
    void addPageContents(BPDFObjectHandle contents, bool first);

  private:
    friend class BPDF;
    friend class BPDFObject;
    friend class BPDFParser;
    friend class BPDFWriter;
    friend BPDF_Dictionary* as_dictionary(BPDFObject* o);

    explicit BPDFObjectHandle(std::shared_ptr<BPDFObject> const& obj);
    explicit BPDFObjectHandle(std::shared_ptr<BPDFObject>&& obj);

    // Return the object after following any reference. Never returns nullptr.
    BPDFObject* resolved() const;
    std::shared_ptr<BPDFObject> resolvedPtr() const;
    [[noreturn]] void typeError(char const* expected) const;

    std::shared_ptr<BPDFObject> obj;
};

#endif // BPDFOBJECTHANDLE_HH
