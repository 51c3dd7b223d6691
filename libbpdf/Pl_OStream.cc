#include <bpdf/Pl_OStream.hh>

Pl_OStream::Pl_OStream(char const* identifier, std::ostream& os) :
    Pipeline(identifier, nullptr),
    os(os)
{
}

void
Pl_OStream::write(unsigned char const* buf, size_t len)
{
    os.write(reinterpret_cast<char const*>(buf), static_cast<std::streamsize>(len));
}

void
Pl_OStream::finish()
{
    os.flush();
}
