#ifndef BPDFPARSER_HH
#define BPDFPARSER_HH

#include <bpdf/BPDFObjectHandle.hh>
#include <bpdf/BPDFTokenizer.hh>
#include <bpdf/InputSource.hh>

#include <string>

class BPDF;

class BPDFParser
{
  public:
    class StringDecrypter
    {
      public:
        virtual ~StringDecrypter() = default;
        virtual void decryptString(std::string& val) = 0;
    };

    // context is the document that indirect references point into. With content_stream set,
    // bare words become operators and references are not recognized.
    BPDFParser(
        InputSource& input,
        std::string const& object_description,
        BPDFTokenizer& tokenizer,
        StringDecrypter* decrypter,
        BPDF* context,
        bool content_stream = false) :
        input(input),
        object_description(object_description),
        tokenizer(tokenizer),
        decrypter(decrypter),
        context(context),
        content_stream(content_stream)
    {
    }

    // Parse one object. Syntax errors throw BPDFExc with bpdf_e_damaged_pdf. In a content
    // stream, reaching the end of input sets empty and returns an uninitialized handle.
    BPDFObjectHandle parse(bool& empty);

    // Offset of the first token of the object most recently returned by parse
    bpdf_offset_t
    getStartOffset() const
    {
        return start_offset;
    }

    static int const max_nesting = 499;

  private:
    struct Frame;

    BPDFObjectHandle parseRemainder(BPDFTokenizer::Token const& first);
    BPDFObjectHandle makeScalar(BPDFTokenizer::Token const& token);
    BPDFObjectHandle makeReference(long long obj, long long gen);
    void addToFrame(Frame& frame, BPDFObjectHandle obj, std::string const* raw_string);
    BPDFObjectHandle closeDictionary(Frame& frame);
    [[noreturn]] void error(std::string const& message);
    void warn(std::string const& message);

    InputSource& input;
    std::string object_description;
    BPDFTokenizer& tokenizer;
    StringDecrypter* decrypter;
    BPDF* context;
    bool content_stream;
    bpdf_offset_t start_offset{0};
};

#endif // BPDFPARSER_HH
