#ifndef SAMPLE_PDF_HH
#define SAMPLE_PDF_HH

// Helpers shared by the document tests

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFOperation.hh>
#include <bpdf/BPDFPageDocumentHelper.hh>
#include <bpdf/BPDFTextExtractor.hh>
#include <bpdf/BPDFWriter.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

// A document with npages US Letter pages. Page n shows "<label> n" in Helvetica.
inline std::shared_ptr<BPDF>
make_sample_pdf(
    int npages, std::string const& title = "Sample", std::string const& label = "Page")
{
    auto pdf = BPDF::create();
    pdf->emptyPDF();
    auto font = pdf->makeIndirectObject(BPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));
    for (int i = 1; i <= npages; ++i) {
        auto page = BPDFObjectHandle::newDictionary();
        page.replaceKey("Type", BPDFObjectHandle::newName("Page"));
        page.replaceKey(
            "MediaBox",
            BPDFObjectHandle::newArray(BPDFObjectHandle::Rectangle(0, 0, 612, 792)));
        page.replaceKey(
            "Resources",
            BPDFObjectHandle::newDictionary(
                {{"Font", BPDFObjectHandle::newDictionary({{"F1", font}})}}));
        page.replaceKey(
            "Contents",
            pdf->newStream(
                "BT /F1 12 Tf 72 720 Td (" + label + " " + std::to_string(i) + ") Tj ET\n"));
        pdf->addPage(page, false);
    }
    pdf->getInfo(true).replaceKey("Title", BPDFObjectHandle::newUnicodeString(title));
    return pdf;
}

inline std::string
write_pdf(BPDF& pdf)
{
    BPDFWriter w(pdf);
    w.setOutputMemory();
    w.setStaticID(true);
    w.write();
    return w.getOutputString();
}

inline std::shared_ptr<BPDF>
read_pdf(std::string const& data, char const* password = nullptr)
{
    auto pdf = BPDF::create();
    pdf->processMemoryFile("test.pdf", data, password);
    return pdf;
}

// The extracted text of each page
inline std::vector<std::string>
page_texts(BPDF& pdf)
{
    std::vector<std::string> result;
    for (auto const& page: BPDFPageDocumentHelper(pdf).getAllPages()) {
        result.push_back(BPDFTextExtractor::extractPage(page));
    }
    return result;
}

// Run an operation the way the batch processor does, on files given as name and contents
inline BPDFOperation::Result
run_operation(
    bpdf_operation_e op,
    std::vector<std::pair<std::string, std::string>> const& files,
    std::map<std::string, std::string> const& values = {},
    BPDFEngineConfig const& config = {})
{
    auto operation = BPDFOperation::create(op, config);
    auto params = operation->validate(values);
    operation->checkInputCount(files.size());
    std::vector<BPDFOperation::Input> inputs;
    for (auto const& [name, data]: files) {
        BPDFOperation::Input input;
        input.filename = name;
        input.data = data;
        operation->openInput(input, params);
        inputs.push_back(input);
    }
    return operation->apply(inputs, params);
}

// Serialize output n of a result and read it back
inline std::shared_ptr<BPDF>
reread_output(BPDFOperation::Result const& result, size_t n = 0, char const* password = nullptr)
{
    return read_pdf(BPDFOperation::writeOutput(result.outputs.at(n)), password);
}

#endif // SAMPLE_PDF_HH
