#include <bpdf/Pl_RC4.hh>

#include <bpdf/BPDFCryptoProvider.hh>

#include <algorithm>
#include <stdexcept>

Pl_RC4::Pl_RC4(char const* identifier, Pipeline* next, std::string const& key) :
    Pipeline(identifier, next),
    crypto(BPDFCryptoProvider::getImpl())
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_RC4 with nullptr as next");
    }
    crypto->cipherStart(BPDFCryptoImpl::c_rc4, true, key, "");
}

void
Pl_RC4::write(unsigned char const* data, size_t len)
{
    static size_t constexpr piece_size = 65536;
    while (len > 0) {
        auto piece = std::min(len, piece_size);
        buf.resize(piece);
        auto* out = reinterpret_cast<unsigned char*>(buf.data());
        crypto->cipherUpdate(data, piece, out);
        next()->write(out, piece);
        data += piece;
        len -= piece;
    }
}

void
Pl_RC4::finish()
{
    next()->finish();
}

void
Pl_RC4::process(std::string const& key, std::string& data)
{
    auto crypto = BPDFCryptoProvider::getImpl();
    crypto->cipherStart(BPDFCryptoImpl::c_rc4, true, key, "");
    auto* p = reinterpret_cast<unsigned char*>(data.data());
    crypto->cipherUpdate(p, data.size(), p);
}
