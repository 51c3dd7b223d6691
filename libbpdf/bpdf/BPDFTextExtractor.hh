#ifndef BPDFTEXTEXTRACTOR_HH
#define BPDFTEXTEXTRACTOR_HH

#include <bpdf/BPDFPageObjectHelper.hh>

#include <map>
#include <set>
#include <string>

// Recovers text from a page's content streams. Text is returned in content order, which is
// usually but not always reading order. Strings are mapped to Unicode through the font's
// /ToUnicode CMap when there is one; otherwise single-byte codes are read as PDFDocEncoding.
class BPDFTextExtractor
{
  public:
    static std::string extractPage(BPDFPageObjectHelper const& page);

    // Number of text-showing operations (Tj, TJ, ' and ") with at least one non-empty string
    static int countTextRuns(BPDFPageObjectHelper const& page);

    // Character code to UTF-8 mapping read from a /ToUnicode stream
    class ToUnicode
    {
      public:
        ToUnicode() = default;
        explicit ToUnicode(BPDFObjectHandle cmap_stream);
        bool empty() const;
        std::string decode(std::string const& codes) const;

      private:
        std::map<std::string, std::string> map;
        std::set<size_t> code_lengths;
        friend class CMapReader;
    };
};

#endif // BPDFTEXTEXTRACTOR_HH
