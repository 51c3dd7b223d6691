#include <bpdf/BPDFUsage.hh>

BPDFUsage::BPDFUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
