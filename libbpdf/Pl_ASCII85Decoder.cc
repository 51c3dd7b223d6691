#include <bpdf/Pl_ASCII85Decoder.hh>

#include <bpdf/BUtil.hh>

#include <stdexcept>

Pl_ASCII85Decoder::Pl_ASCII85Decoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_ASCII85Decoder with nullptr as next");
    }
}

void
Pl_ASCII85Decoder::write(unsigned char const* buf, size_t len)
{
    for (size_t i = 0; i < len && !done; ++i) {
        unsigned char ch = buf[i];
        if (saw_tilde) {
            if (ch != '>') {
                throw std::runtime_error(identifier + ": ~ not followed by > in ASCII85 data");
            }
            emitGroup();
            done = true;
        } else if (BUtil::is_space(static_cast<char>(ch))) {
            continue;
        } else if (ch == '~') {
            saw_tilde = true;
        } else if (ch == 'z') {
            if (digits != 0) {
                throw std::runtime_error(identifier + ": z inside an ASCII85 group");
            }
            next()->writeString(std::string(4, '\0'));
        } else if (ch >= '!' && ch <= 'u') {
            group = group * 85 + (ch - '!');
            if (++digits == 5) {
                emitGroup();
            }
        } else {
            throw std::runtime_error(identifier + ": invalid character in ASCII85 data");
        }
    }
}

// A final group of n digits is padded with 'u' and yields n - 1 bytes.
void
Pl_ASCII85Decoder::emitGroup()
{
    if (digits == 0) {
        return;
    }
    if (digits == 1) {
        throw std::runtime_error(identifier + ": ASCII85 data ends with a single digit");
    }
    int const produced = digits - 1;
    for (; digits < 5; ++digits) {
        group = group * 85 + ('u' - '!');
    }
    if (group > 0xffffffffULL) {
        throw std::runtime_error(identifier + ": ASCII85 group out of range");
    }
    unsigned char bytes[4];
    for (int i = 0; i < 4; ++i) {
        bytes[i] = static_cast<unsigned char>((group >> (24 - 8 * i)) & 0xff);
    }
    next()->write(bytes, static_cast<size_t>(produced));
    group = 0;
    digits = 0;
}

void
Pl_ASCII85Decoder::finish()
{
    emitGroup();
    next()->finish();
}
