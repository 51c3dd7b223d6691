#include <bpdf/Pl_String.hh>

Pl_String::Pl_String(char const* identifier, Pipeline* next, std::string& s) :
    Pipeline(identifier, next),
    s(s)
{
}

void
Pl_String::write(unsigned char const* buf, size_t len)
{
    s.append(reinterpret_cast<char const*>(buf), len);
    if (next() && len) {
        next()->write(buf, len);
    }
}

void
Pl_String::finish()
{
    if (next()) {
        next()->finish();
    }
}
