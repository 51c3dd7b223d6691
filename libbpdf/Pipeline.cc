#include <bpdf/Pipeline.hh>

Pipeline::Pipeline(char const* identifier, Pipeline* next) :
    identifier(identifier),
    next_(next)
{
}

void
Pipeline::write(char const* data, size_t len)
{
    write(reinterpret_cast<unsigned char const*>(data), len);
}

void
Pipeline::writeString(std::string_view str)
{
    write(str.data(), str.size());
}
