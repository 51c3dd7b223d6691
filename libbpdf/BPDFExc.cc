#include <bpdf/BPDFExc.hh>

static std::string
describe(
    std::string const& filename,
    std::string const& object,
    bpdf_offset_t offset,
    std::string const& message)
{
    std::string where = object;
    if (offset > 0) {
        where += (where.empty() ? "" : ", ") + std::string("offset ") + std::to_string(offset);
    }
    std::string prefix = filename;
    if (!where.empty()) {
        prefix += filename.empty() ? where : " (" + where + ")";
    }
    return prefix.empty() ? message : prefix + ": " + message;
}

BPDFExc::BPDFExc(
    bpdf_error_code_e error_code,
    std::string const& filename,
    std::string const& object,
    bpdf_offset_t offset,
    std::string const& message) :
    std::runtime_error(describe(filename, object, offset, message)),
    error_code(error_code),
    filename(filename),
    detail(message)
{
}

bpdf_error_code_e
BPDFExc::getErrorCode() const
{
    return error_code;
}

std::string const&
BPDFExc::getFilename() const
{
    return filename;
}

std::string const&
BPDFExc::getMessageDetail() const
{
    return detail;
}

char const*
BPDFExc::kindName(bpdf_error_code_e code)
{
    static char const* const names[] = {
        "Success",
        "InternalError",
        "IoFailure",
        "UnsupportedImageFormat",
        "WrongPassword",
        "MalformedDocument",
        "MalformedPageTree",
        "ObjectTypeError",
        "BrokenReference",
        "EmptyInput",
        "InvalidRange",
        "InvalidPermutation",
        "InvalidAngle",
        "InvalidParameter",
        "OcrUnavailable",
        "Unrecoverable",
        "SignatureError",
    };
    auto i = static_cast<size_t>(code);
    return i < sizeof(names) / sizeof(names[0]) ? names[i] : "Unknown";
}
