#include <bpdf/Digest.hh>

#include <bpdf/BPDFCryptoProvider.hh>

Digest::Digest(BPDFCryptoImpl::hash_e hash) :
    hash(hash),
    crypto(BPDFCryptoProvider::getImpl())
{
}

Digest&
Digest::update(std::string_view data)
{
    if (!started) {
        crypto->hashStart(hash);
        started = true;
    }
    crypto->hashUpdate(reinterpret_cast<unsigned char const*>(data.data()), data.size());
    return *this;
}

std::string
Digest::finish()
{
    if (!started) {
        crypto->hashStart(hash);
    }
    started = false;
    return crypto->hashFinish();
}

std::string
Digest::compute(BPDFCryptoImpl::hash_e hash, std::string_view data)
{
    return Digest(hash).update(data).finish();
}
