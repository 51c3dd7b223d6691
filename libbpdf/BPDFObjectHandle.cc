#include <bpdf/BPDFObjectHandle.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFObject_private.hh>
#include <bpdf/BPDFParser.hh>
#include <bpdf/BPDFTokenizer.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/BufferInputSource.hh>

#include <algorithm>
#include <climits>
#include <stdexcept>

void
BPDFObjectHandle::ParserCallbacks::handleObject(BPDFObjectHandle)
{
    throw std::logic_error("You must override one of the handleObject methods in ParserCallbacks");
}

void
BPDFObjectHandle::ParserCallbacks::handleObject(BPDFObjectHandle oh, size_t, size_t)
{
    // This version of handleObject is the one called by the parser. Its default implementation
    // calls the one without offsets so that subclasses may override either.
    handleObject(oh);
}

BPDFObjectHandle::BPDFObjectHandle(std::shared_ptr<BPDFObject> const& obj) :
    obj(obj)
{
}

BPDFObjectHandle::BPDFObjectHandle(std::shared_ptr<BPDFObject>&& obj) :
    obj(std::move(obj))
{
}

std::shared_ptr<BPDFObject>
BPDFObjectHandle::resolvedPtr() const
{
    if (!obj) {
        return nullptr;
    }
    if (auto ref = obj->as<BPDF_Reference>()) {
        auto table = ref->table.lock();
        if (!table) {
            throw std::logic_error(
                "attempted to access object " + ref->og.unparse() +
                " whose owning BPDF has been destroyed");
        }
        return table->owner.resolve(ref->og);
    }
    return obj;
}

BPDFObject*
BPDFObjectHandle::resolved() const
{
    return resolvedPtr().get();
}

void
BPDFObjectHandle::typeError(char const* expected) const
{
    std::string filename;
    std::string description;
    if (auto bpdf = getOwningBPDF()) {
        filename = bpdf->getFilename();
    }
    if (isIndirect()) {
        description = getObjGen().describe();
    }
    throw BPDFExc(
        bpdf_e_object,
        filename,
        description,
        0,
        std::string("operation for ") + expected + " attempted on object of type " +
            getTypeName());
}

bool
BPDFObjectHandle::isInitialized() const
{
    return obj != nullptr;
}

BPDFObjectHandle::operator bool() const
{
    return obj != nullptr;
}

bool
BPDFObjectHandle::isSameObjectAs(BPDFObjectHandle const& rhs) const
{
    if (!obj || !rhs.obj) {
        return false;
    }
    auto ref = obj->as<BPDF_Reference>();
    auto rref = rhs.obj->as<BPDF_Reference>();
    if (ref && rref) {
        return ref->og == rref->og && ref->table.lock() == rref->table.lock();
    }
    return obj == rhs.obj;
}

bpdf_object_type_e
BPDFObjectHandle::getTypeCode() const
{
    auto o = resolved();
    return o ? o->getTypeCode() : ot_uninitialized;
}

char const*
BPDFObjectHandle::getTypeName() const
{
    static char const* names[] = {
        "uninitialized",
        "reserved",
        "null",
        "boolean",
        "integer",
        "real",
        "string",
        "name",
        "array",
        "dictionary",
        "stream",
        "operator",
        "inline-image",
        "reference"};
    return names[getTypeCode()];
}

bool
BPDFObjectHandle::isBool() const
{
    return getTypeCode() == ot_boolean;
}

bool
BPDFObjectHandle::isNull() const
{
    return getTypeCode() == ot_null;
}

bool
BPDFObjectHandle::isInteger() const
{
    return getTypeCode() == ot_integer;
}

bool
BPDFObjectHandle::isReal() const
{
    return getTypeCode() == ot_real;
}

bool
BPDFObjectHandle::isName() const
{
    return getTypeCode() == ot_name;
}

bool
BPDFObjectHandle::isString() const
{
    return getTypeCode() == ot_string;
}

bool
BPDFObjectHandle::isOperator() const
{
    return getTypeCode() == ot_operator;
}

bool
BPDFObjectHandle::isInlineImage() const
{
    return getTypeCode() == ot_inlineimage;
}

bool
BPDFObjectHandle::isArray() const
{
    return getTypeCode() == ot_array;
}

bool
BPDFObjectHandle::isDictionary() const
{
    return getTypeCode() == ot_dictionary;
}

bool
BPDFObjectHandle::isStream() const
{
    return getTypeCode() == ot_stream;
}

bool
BPDFObjectHandle::isReserved() const
{
    return getTypeCode() == ot_reserved;
}

bool
BPDFObjectHandle::isNumber() const
{
    auto tc = getTypeCode();
    return tc == ot_integer || tc == ot_real;
}

bool
BPDFObjectHandle::isIndirect() const
{
    return obj && obj->as<BPDF_Reference>();
}

bool
BPDFObjectHandle::isNameAndEquals(std::string const& name) const
{
    return isName() && getName() == name;
}

bool
BPDFObjectHandle::isDictionaryOfType(std::string const& type, std::string const& subtype) const
{
    return isDictionary() && (type.empty() || getKey("Type").isNameAndEquals(type)) &&
        (subtype.empty() || getKey("Subtype").isNameAndEquals(subtype));
}

bool
BPDFObjectHandle::isPageObject() const
{
    return isDictionaryOfType("Page");
}

bool
BPDFObjectHandle::isPagesObject() const
{
    return isDictionaryOfType("Pages");
}

bool
BPDFObjectHandle::isImage() const
{
    return isStream() && getDict().getKey("Subtype").isNameAndEquals("Image");
}

bool
BPDFObjectHandle::isFormXObject() const
{
    return isStream() && getDict().getKey("Subtype").isNameAndEquals("Form");
}

BPDFObjectHandle
BPDFObjectHandle::parse(std::string const& object_str, std::string const& object_description)
{
    BufferInputSource input("parsed object", object_str);
    BPDFTokenizer tokenizer;
    tokenizer.allowEOF();
    BPDFParser parser(input, object_description, tokenizer, nullptr, nullptr);
    bool empty = false;
    auto result = parser.parse(empty);
    if (empty) {
        throw BPDFExc(
            bpdf_e_damaged_pdf, "parsed object", object_description, 0, "empty object");
    }
    auto next = tokenizer.readToken(input, object_description);
    if (next.getType() != BPDFTokenizer::tt_eof) {
        throw BPDFExc(
            bpdf_e_damaged_pdf,
            "parsed object",
            object_description,
            input.getLastOffset(),
            "trailing data found parsing object from string");
    }
    return result;
}

void
BPDFObjectHandle::parseContentStream(
    BPDFObjectHandle stream_or_array, ParserCallbacks* callbacks)
{
    std::string data;
    std::string description;
    if (stream_or_array.isArray()) {
        description = "page content array";
        for (auto const& item: stream_or_array.getArrayAsVector()) {
            if (!item.isStream()) {
                continue;
            }
            data += item.getStreamData();
            data += "\n";
        }
    } else if (stream_or_array.isStream()) {
        description = "content stream";
        if (stream_or_array.isIndirect()) {
            description += " object " + stream_or_array.getObjGen().unparse();
        }
        data = stream_or_array.getStreamData();
    } else {
        throw std::logic_error("parseContentStream called on non-stream, non-array object");
    }

    BufferInputSource input(description, data);
    BPDFTokenizer tokenizer;
    tokenizer.allowEOF();
    while (true) {
        BPDFParser parser(input, description, tokenizer, nullptr, nullptr, true);
        bool empty = false;
        auto obj = parser.parse(empty);
        if (empty) {
            break;
        }
        auto start = parser.getStartOffset();
        callbacks->handleObject(
            obj, static_cast<size_t>(start), static_cast<size_t>(input.tell() - start));
        if (obj.isOperator() && obj.getOperatorValue() == "ID") {
            tokenizer.expectInlineImage();
            auto token = tokenizer.readToken(input, description);
            if (token.getType() != BPDFTokenizer::tt_inline_image) {
                throw BPDFExc(
                    bpdf_e_damaged_pdf,
                    description,
                    "",
                    input.getLastOffset(),
                    token.getErrorMessage());
            }
            auto image_start = input.getLastOffset();
            callbacks->handleObject(
                newInlineImage(token.getValue()),
                static_cast<size_t>(image_start),
                token.getValue().size());
        }
    }
    callbacks->handleEOF();
}

void
BPDFObjectHandle::parseAsContents(ParserCallbacks* callbacks) const
{
    parseContentStream(*this, callbacks);
}

BPDFObjectHandle
BPDFObjectHandle::newNull()
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Null>());
}

BPDFObjectHandle
BPDFObjectHandle::newBool(bool value)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Bool>(value));
}

BPDFObjectHandle
BPDFObjectHandle::newInteger(long long value)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Integer>(value));
}

BPDFObjectHandle
BPDFObjectHandle::newReal(std::string const& value)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Real>(value));
}

BPDFObjectHandle
BPDFObjectHandle::newReal(double value, int decimal_places, bool trim_trailing_zeroes)
{
    return newReal(BUtil::double_to_string(value, decimal_places, trim_trailing_zeroes));
}

BPDFObjectHandle
BPDFObjectHandle::newName(std::string const& name)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Name>(name));
}

BPDFObjectHandle
BPDFObjectHandle::newString(std::string const& str)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_String>(str));
}

BPDFObjectHandle
BPDFObjectHandle::newUnicodeString(std::string const& utf8_str)
{
    std::string pdfdoc;
    if (BUtil::utf8_to_pdf_doc(utf8_str, pdfdoc)) {
        return newString(pdfdoc);
    }
    return newString(BUtil::utf8_to_utf16(utf8_str));
}

BPDFObjectHandle
BPDFObjectHandle::newOperator(std::string const& value)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Operator>(value));
}

BPDFObjectHandle
BPDFObjectHandle::newInlineImage(std::string const& value)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_InlineImage>(value));
}

BPDFObjectHandle
BPDFObjectHandle::newArray(std::vector<BPDFObjectHandle> const& items)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Array>(items));
}

BPDFObjectHandle
BPDFObjectHandle::newArray(Rectangle const& rect)
{
    return newArray(
        {newReal(rect.llx), newReal(rect.lly), newReal(rect.urx), newReal(rect.ury)});
}

BPDFObjectHandle
BPDFObjectHandle::newDictionary(std::map<std::string, BPDFObjectHandle> const& items)
{
    return BPDFObjectHandle(BPDFObject::create<BPDF_Dictionary>(items));
}

BPDFObjectHandle
BPDFObjectHandle::newStream(BPDF* bpdf, std::string const& data)
{
    if (bpdf == nullptr) {
        throw std::logic_error("attempt to create stream in null BPDF object");
    }
    return bpdf->newStream(data);
}

bool
BPDFObjectHandle::getBoolValue() const
{
    if (auto b = obj ? resolved()->as<BPDF_Bool>() : nullptr) {
        return b->val;
    }
    typeError("boolean");
}

long long
BPDFObjectHandle::getIntValue() const
{
    if (auto i = obj ? resolved()->as<BPDF_Integer>() : nullptr) {
        return i->val;
    }
    typeError("integer");
}

int
BPDFObjectHandle::getIntValueAsInt() const
{
    auto v = getIntValue();
    if (v < INT_MIN || v > INT_MAX) {
        throw BPDFExc(
            bpdf_e_object,
            "",
            isIndirect() ? getObjGen().describe() : "",
            0,
            "requested value of integer " + std::to_string(v) + " does not fit in int");
    }
    return static_cast<int>(v);
}

std::string
BPDFObjectHandle::getRealValue() const
{
    if (auto r = obj ? resolved()->as<BPDF_Real>() : nullptr) {
        return r->val;
    }
    typeError("real");
}

double
BPDFObjectHandle::getNumericValue() const
{
    double result = 0.0;
    if (!getValueAsNumber(result)) {
        typeError("number");
    }
    return result;
}

bool
BPDFObjectHandle::getValueAsNumber(double& value) const
{
    if (!obj) {
        return false;
    }
    auto o = resolved();
    if (auto i = o->as<BPDF_Integer>()) {
        value = static_cast<double>(i->val);
        return true;
    }
    if (auto r = o->as<BPDF_Real>()) {
        try {
            value = std::stod(r->val);
        } catch (std::exception&) {
            return false;
        }
        return true;
    }
    return false;
}

std::string
BPDFObjectHandle::getName() const
{
    if (auto n = obj ? resolved()->as<BPDF_Name>() : nullptr) {
        return n->name;
    }
    typeError("name");
}

std::string
BPDFObjectHandle::getStringValue() const
{
    if (auto s = obj ? resolved()->as<BPDF_String>() : nullptr) {
        return s->val;
    }
    typeError("string");
}

std::string
BPDFObjectHandle::getUTF8Value() const
{
    if (auto s = obj ? resolved()->as<BPDF_String>() : nullptr) {
        return s->getUTF8Val();
    }
    typeError("string");
}

std::string
BPDFObjectHandle::getOperatorValue() const
{
    if (auto o = obj ? resolved()->as<BPDF_Operator>() : nullptr) {
        return o->val;
    }
    typeError("operator");
}

std::string
BPDFObjectHandle::getInlineImageValue() const
{
    if (auto ii = obj ? resolved()->as<BPDF_InlineImage>() : nullptr) {
        return ii->val;
    }
    typeError("inlineimage");
}

int
BPDFObjectHandle::getArrayNItems() const
{
    if (auto a = obj ? resolved()->as<BPDF_Array>() : nullptr) {
        return static_cast<int>(a->items.size());
    }
    return 0;
}

BPDFObjectHandle
BPDFObjectHandle::getArrayItem(int n) const
{
    if (auto a = obj ? resolved()->as<BPDF_Array>() : nullptr) {
        if (n >= 0 && static_cast<size_t>(n) < a->items.size()) {
            return a->items.at(static_cast<size_t>(n));
        }
    }
    return newNull();
}

std::vector<BPDFObjectHandle>
BPDFObjectHandle::getArrayAsVector() const
{
    if (auto a = obj ? resolved()->as<BPDF_Array>() : nullptr) {
        return a->items;
    }
    return {};
}

bool
BPDFObjectHandle::isRectangle() const
{
    if (!isArray() || getArrayNItems() != 4) {
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        if (!getArrayItem(i).isNumber()) {
            return false;
        }
    }
    return true;
}

BPDFObjectHandle::Rectangle
BPDFObjectHandle::getArrayAsRectangle() const
{
    if (!isRectangle()) {
        return {};
    }
    double items[4];
    for (int i = 0; i < 4; ++i) {
        items[i] = getArrayItem(i).getNumericValue();
    }
    return {
        std::min(items[0], items[2]),
        std::min(items[1], items[3]),
        std::max(items[0], items[2]),
        std::max(items[1], items[3])};
}

// Dictionary operations on a stream apply to the stream dictionary.
BPDF_Dictionary*
as_dictionary(BPDFObject* o)
{
    if (!o) {
        return nullptr;
    }
    if (auto d = o->as<BPDF_Dictionary>()) {
        return d;
    }
    if (auto s = o->as<BPDF_Stream>()) {
        return s->stream_dict.obj ? s->stream_dict.resolved()->as<BPDF_Dictionary>()
                                  : nullptr;
    }
    return nullptr;
}

bool
BPDFObjectHandle::hasKey(std::string const& key) const
{
    auto d = as_dictionary(resolved());
    return d && d->items.count(key) > 0;
}

BPDFObjectHandle
BPDFObjectHandle::getKey(std::string const& key) const
{
    if (auto d = as_dictionary(resolved())) {
        auto iter = d->items.find(key);
        if (iter != d->items.end()) {
            return iter->second;
        }
    }
    return newNull();
}

std::set<std::string>
BPDFObjectHandle::getKeys() const
{
    std::set<std::string> result;
    if (auto d = as_dictionary(resolved())) {
        for (auto const& item: d->items) {
            result.insert(item.first);
        }
    }
    return result;
}

std::map<std::string, BPDFObjectHandle>
BPDFObjectHandle::getDictAsMap() const
{
    if (auto d = as_dictionary(resolved())) {
        return d->items;
    }
    return {};
}

void
BPDFObjectHandle::setArrayItem(int n, BPDFObjectHandle const& item)
{
    auto a = obj ? resolved()->as<BPDF_Array>() : nullptr;
    if (!a) {
        typeError("array");
    }
    if (n < 0 || static_cast<size_t>(n) >= a->items.size()) {
        throw BPDFExc(bpdf_e_object, "", "", 0, "setArrayItem: index out of range");
    }
    a->items.at(static_cast<size_t>(n)) = item;
}

void
BPDFObjectHandle::setArrayFromVector(std::vector<BPDFObjectHandle> const& items)
{
    auto a = obj ? resolved()->as<BPDF_Array>() : nullptr;
    if (!a) {
        typeError("array");
    }
    a->items = items;
}

void
BPDFObjectHandle::insertItem(int at, BPDFObjectHandle const& item)
{
    auto a = obj ? resolved()->as<BPDF_Array>() : nullptr;
    if (!a) {
        typeError("array");
    }
    if (at < 0 || static_cast<size_t>(at) > a->items.size()) {
        throw BPDFExc(bpdf_e_object, "", "", 0, "insertItem: index out of range");
    }
    a->items.insert(a->items.begin() + at, item);
}

void
BPDFObjectHandle::appendItem(BPDFObjectHandle const& item)
{
    auto a = obj ? resolved()->as<BPDF_Array>() : nullptr;
    if (!a) {
        typeError("array");
    }
    a->items.push_back(item);
}

void
BPDFObjectHandle::eraseItem(int at)
{
    auto a = obj ? resolved()->as<BPDF_Array>() : nullptr;
    if (!a) {
        typeError("array");
    }
    if (at < 0 || static_cast<size_t>(at) >= a->items.size()) {
        throw BPDFExc(bpdf_e_object, "", "", 0, "eraseItem: index out of range");
    }
    a->items.erase(a->items.begin() + at);
}

void
BPDFObjectHandle::replaceKey(std::string const& key, BPDFObjectHandle const& value)
{
    auto d = as_dictionary(resolved());
    if (!d) {
        typeError("dictionary");
    }
    if (!value || (!value.isIndirect() && value.isNull())) {
        d->items.erase(key);
    } else {
        d->items[key] = value;
    }
}

void
BPDFObjectHandle::removeKey(std::string const& key)
{
    auto d = as_dictionary(resolved());
    if (!d) {
        typeError("dictionary");
    }
    d->items.erase(key);
}

// Names from every category of this resource dictionary
std::set<std::string>
BPDFObjectHandle::getResourceNames() const
{
    std::set<std::string> result;
    for (auto const& [category, sub]: getDictAsMap()) {
        if (sub.isDictionary()) {
            auto keys = sub.getKeys();
            result.insert(keys.begin(), keys.end());
        }
    }
    return result;
}

std::string
BPDFObjectHandle::getUniqueResourceName(std::string const& prefix, int& min_suffix) const
{
    auto taken = getResourceNames();
    // One of the next taken.size() + 1 suffixes must be free.
    for (auto limit = min_suffix + static_cast<int>(taken.size()); min_suffix <= limit;
         ++min_suffix) {
        auto name = prefix + std::to_string(min_suffix);
        if (!taken.count(name)) {
            return name;
        }
    }
    throw std::logic_error("getUniqueResourceName: no free resource name");
}

BPDFObjectHandle
BPDFObjectHandle::shallowCopy() const
{
    if (!obj) {
        throw std::logic_error("operation attempted on uninitialized BPDFObjectHandle");
    }
    auto o = resolved();
    if (o->as<BPDF_Stream>()) {
        throw std::logic_error("attempted to make a shallow copy of a stream");
    }
    return BPDFObjectHandle(std::make_shared<BPDFObject>(o->value));
}

BPDF*
BPDFObjectHandle::getOwningBPDF() const
{
    if (!obj) {
        return nullptr;
    }
    if (auto ref = obj->as<BPDF_Reference>()) {
        auto table = ref->table.lock();
        return table ? &table->owner : nullptr;
    }
    return obj->bpdf;
}

BPDFObjGen
BPDFObjectHandle::getObjGen() const
{
    if (auto ref = obj ? obj->as<BPDF_Reference>() : nullptr) {
        return ref->og;
    }
    return {};
}

int
BPDFObjectHandle::getObjectID() const
{
    return getObjGen().getObj();
}

int
BPDFObjectHandle::getGeneration() const
{
    return getObjGen().getGen();
}

std::string
BPDFObjectHandle::unparse() const
{
    if (!obj) {
        throw std::logic_error("attempted to unparse an uninitialized object handle");
    }
    return obj->unparse();
}

std::string
BPDFObjectHandle::unparseResolved() const
{
    if (!obj) {
        throw std::logic_error("attempted to unparse an uninitialized object handle");
    }
    return resolved()->unparse();
}

std::vector<BPDFObjectHandle>
BPDFObjectHandle::getPageContents() const
{
    auto contents = getKey("Contents");
    if (contents.isNull()) {
        return {};
    }
    if (contents.isStream()) {
        return {contents};
    }
    auto bad_contents = [this](std::string const& msg) {
        return BPDFExc(bpdf_e_damaged_pdf, "", "page " + getObjGen().describe(), 0, msg);
    };
    if (!contents.isArray()) {
        throw bad_contents("/Contents is neither a stream nor an array");
    }
    auto result = contents.getArrayAsVector();
    for (auto const& item: result) {
        if (!item.isStream()) {
            throw bad_contents("/Contents array contains an item that is not a stream");
        }
    }
    return result;
}

void
BPDFObjectHandle::addPageContents(BPDFObjectHandle new_contents, bool first)
{
    auto orig = getPageContents();
    std::vector<BPDFObjectHandle> content;
    if (first) {
        content.push_back(new_contents);
    }
    content.insert(content.end(), orig.begin(), orig.end());
    if (!first) {
        content.push_back(new_contents);
    }
    replaceKey("Contents", newArray(content));
}
