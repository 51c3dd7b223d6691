#include <bpdf/Pl_ASCIIHexDecoder.hh>

#include <bpdf/BUtil.hh>

#include <stdexcept>

Pl_ASCIIHexDecoder::Pl_ASCIIHexDecoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_ASCIIHexDecoder with nullptr as next");
    }
}

void
Pl_ASCIIHexDecoder::write(unsigned char const* buf, size_t len)
{
    for (size_t i = 0; i < len && !done; ++i) {
        auto ch = static_cast<char>(buf[i]);
        if (BUtil::is_space(ch)) {
            continue;
        }
        if (ch == '>') {
            emitPending();
            done = true;
            continue;
        }
        if (!BUtil::is_hex_digit(ch)) {
            throw std::runtime_error(
                identifier + ": invalid character in hexadecimal data: " + std::string(1, ch));
        }
        int nibble = BUtil::hex_decode_char(ch);
        if (high_nibble < 0) {
            high_nibble = nibble;
        } else {
            auto byte = static_cast<unsigned char>((high_nibble << 4) | nibble);
            next()->write(&byte, 1);
            high_nibble = -1;
        }
    }
}

void
Pl_ASCIIHexDecoder::emitPending()
{
    if (high_nibble >= 0) {
        auto byte = static_cast<unsigned char>(high_nibble << 4);
        next()->write(&byte, 1);
        high_nibble = -1;
    }
}

void
Pl_ASCIIHexDecoder::finish()
{
    emitPending();
    next()->finish();
}
