#include <bpdf/Pl_Count.hh>

#include <stdexcept>

Pl_Count::Pl_Count(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Pl_Count requires a next pipeline");
    }
}

void
Pl_Count::write(unsigned char const* buf, size_t len)
{
    count += static_cast<bpdf_offset_t>(len);
    next()->write(buf, len);
}

void
Pl_Count::finish()
{
    next()->finish();
}
