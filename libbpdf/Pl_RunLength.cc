#include <bpdf/Pl_RunLength.hh>

#include <algorithm>
#include <stdexcept>
#include <string>

Pl_RunLength::Pl_RunLength(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_RunLength with nullptr as next");
    }
}

void
Pl_RunLength::write(unsigned char const* data, size_t len)
{
    size_t i = 0;
    while (i < len && !done) {
        if (count == 0) {
            unsigned char op = data[i++];
            if (op == 128) {
                done = true;
            } else {
                repeat = op > 128;
                count = repeat ? 257U - op : op + 1U;
            }
        } else if (repeat) {
            next()->writeString(std::string(count, static_cast<char>(data[i++])));
            count = 0;
        } else {
            auto n = std::min(static_cast<size_t>(count), len - i);
            next()->write(data + i, n);
            i += n;
            count -= static_cast<unsigned int>(n);
        }
    }
}

void
Pl_RunLength::finish()
{
    // Data cut off in the middle of a run keeps what was decoded.
    next()->finish();
}
