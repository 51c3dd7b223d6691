#include <bpdf/BPDFParser.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFLogger.hh>
#include <bpdf/BPDFObject_private.hh>
#include <bpdf/BUtil.hh>

#include <limits>
#include <map>
#include <stdexcept>
#include <vector>

struct BPDFParser::Frame
{
    Frame(bool dict, bpdf_offset_t offset) :
        dict(dict),
        offset(offset)
    {
    }

    bool dict;
    bpdf_offset_t offset;
    std::vector<BPDFObjectHandle> items;
    // The undecrypted value of a /Contents string, restored if this turns out to be a signature
    // dictionary
    std::string contents_raw;
    bool has_contents_raw{false};
};

BPDFObjectHandle
BPDFParser::parse(bool& empty)
{
    empty = false;
    auto token = tokenizer.readToken(input, object_description);
    if (token.getType() == BPDFTokenizer::tt_eof) {
        empty = true;
        return {};
    }
    start_offset = input.getLastOffset();
    if (token.isInteger() && context && !content_stream) {
        // Look ahead for "gen R".
        bpdf_offset_t start = input.getLastOffset();
        bpdf_offset_t after = input.tell();
        auto gen = tokenizer.readToken(input, object_description);
        if (gen.isInteger()) {
            auto r = tokenizer.readToken(input, object_description);
            if (r.isWord("R")) {
                input.setLastOffset(start);
                return makeReference(
                    BUtil::string_to_ll(token.getValue().c_str()),
                    BUtil::string_to_ll(gen.getValue().c_str()));
            }
        }
        input.seek(after, SEEK_SET);
        input.setLastOffset(start);
    }
    return parseRemainder(token);
}

BPDFObjectHandle
BPDFParser::parseRemainder(BPDFTokenizer::Token const& first)
{
    std::vector<Frame> stack;
    auto token = first;
    while (true) {
        BPDFObjectHandle obj;
        std::string raw;
        bool is_string = false;

        switch (token.getType()) {
        case BPDFTokenizer::tt_bad:
            error(token.getErrorMessage());

        case BPDFTokenizer::tt_eof:
            error("unexpected EOF");

        case BPDFTokenizer::tt_brace_open:
        case BPDFTokenizer::tt_brace_close:
            error("unexpected brace token");

        case BPDFTokenizer::tt_array_open:
        case BPDFTokenizer::tt_dict_open:
            if (stack.size() > static_cast<size_t>(max_nesting)) {
                error("ignoring excessively deeply nested data structure");
            }
            stack.emplace_back(
                token.getType() == BPDFTokenizer::tt_dict_open, input.getLastOffset());
            break;

        case BPDFTokenizer::tt_array_close:
            if (stack.empty() || stack.back().dict) {
                error("unexpected array close token");
            }
            obj = BPDFObjectHandle::newArray(stack.back().items);
            stack.pop_back();
            break;

        case BPDFTokenizer::tt_dict_close:
            if (stack.empty() || !stack.back().dict) {
                error("unexpected dictionary close token");
            }
            obj = closeDictionary(stack.back());
            stack.pop_back();
            break;

        case BPDFTokenizer::tt_word:
            if (token.isWord("R") && !content_stream && !stack.empty()) {
                auto& items = stack.back().items;
                auto n = items.size();
                if (n >= 2 && items.at(n - 2).isInteger() && items.at(n - 1).isInteger()) {
                    auto gen = items.at(n - 1).getIntValue();
                    auto id = items.at(n - 2).getIntValue();
                    items.resize(n - 2);
                    obj = makeReference(id, gen);
                    break;
                }
            }
            obj = makeScalar(token);
            break;

        case BPDFTokenizer::tt_string:
            is_string = true;
            raw = token.getValue();
            obj = makeScalar(token);
            break;

        default:
            obj = makeScalar(token);
            break;
        }

        if (obj) {
            if (stack.empty()) {
                return obj;
            }
            addToFrame(stack.back(), obj, is_string ? &raw : nullptr);
        }
        token = tokenizer.readToken(input, object_description);
    }
}

BPDFObjectHandle
BPDFParser::makeScalar(BPDFTokenizer::Token const& token)
{
    auto const& value = token.getValue();
    switch (token.getType()) {
    case BPDFTokenizer::tt_null:
        return BPDFObjectHandle::newNull();

    case BPDFTokenizer::tt_bool:
        return BPDFObjectHandle::newBool(value == "true");

    case BPDFTokenizer::tt_integer:
        try {
            return BPDFObjectHandle::newInteger(BUtil::string_to_ll(value.c_str()));
        } catch (std::range_error&) {
            warn("integer " + value + " out of range; treating as real");
            return BPDFObjectHandle::newReal(value);
        }

    case BPDFTokenizer::tt_real:
        return BPDFObjectHandle::newReal(value);

    case BPDFTokenizer::tt_name:
        return BPDFObjectHandle::newName(value);

    case BPDFTokenizer::tt_string:
        if (decrypter) {
            std::string val = value;
            decrypter->decryptString(val);
            return BPDFObjectHandle::newString(val);
        }
        return BPDFObjectHandle::newString(value);

    case BPDFTokenizer::tt_word:
        if (content_stream) {
            return BPDFObjectHandle::newOperator(value);
        }
        error("unknown token while reading object (" + value + ")");

    default:
        error("unexpected token");
    }
}

BPDFObjectHandle
BPDFParser::makeReference(long long obj, long long gen)
{
    if (!context) {
        throw std::logic_error(
            "BPDFObjectHandle::parse called without context on an object with indirect "
            "references");
    }
    if (obj <= 0 || gen < 0 || obj > std::numeric_limits<int>::max() ||
        gen > std::numeric_limits<int>::max()) {
        warn("invalid object reference " + std::to_string(obj) + " " + std::to_string(gen) +
             " R; treating as null");
        return BPDFObjectHandle::newNull();
    }
    return BPDFObjectHandle(BPDFObject::create<BPDF_Reference>(
        context->getTable(), BPDFObjGen(static_cast<int>(obj), static_cast<int>(gen))));
}

void
BPDFParser::addToFrame(Frame& frame, BPDFObjectHandle obj, std::string const* raw_string)
{
    if (frame.dict && frame.items.size() % 2 == 1 && raw_string &&
        frame.items.back().isNameAndEquals("Contents")) {
        frame.contents_raw = *raw_string;
        frame.has_contents_raw = true;
    }
    frame.items.emplace_back(std::move(obj));
}

BPDFObjectHandle
BPDFParser::closeDictionary(Frame& frame)
{
    auto& items = frame.items;
    if (items.size() % 2 == 1) {
        warn("dictionary ended prematurely; using null as value for last key");
        items.emplace_back(BPDFObjectHandle::newNull());
    }
    std::map<std::string, BPDFObjectHandle> dict;
    for (size_t i = 0; i < items.size(); i += 2) {
        auto const& key = items.at(i);
        if (!key.isName()) {
            error("dictionary key is not a name token (" + key.unparse() + ")");
        }
        auto const& value = items.at(i + 1);
        // A null value is the same as an absent key.
        if (!value.isIndirect() && value.isNull()) {
            dict.erase(key.getName());
        } else {
            dict[key.getName()] = value;
        }
    }
    // Signature contents are never encrypted.
    if (frame.has_contents_raw && decrypter && dict.count("ByteRange")) {
        dict["Contents"] = BPDFObjectHandle::newString(frame.contents_raw);
    }
    return BPDFObjectHandle::newDictionary(dict);
}

void
BPDFParser::error(std::string const& message)
{
    throw BPDFExc(
        bpdf_e_damaged_pdf,
        input.getName(),
        object_description,
        input.getLastOffset(),
        message);
}

void
BPDFParser::warn(std::string const& message)
{
    BPDFExc e(
        bpdf_e_damaged_pdf,
        input.getName(),
        object_description,
        input.getLastOffset(),
        message);
    if (context) {
        context->warn(e);
    } else {
        BPDFLogger::defaultLogger()->warn(std::string("WARNING: ") + e.what() + "\n");
    }
}
