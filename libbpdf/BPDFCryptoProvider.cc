#include <bpdf/BPDFCryptoProvider.hh>

#include <bpdf/BPDFCrypto_openssl.hh>

#include <mutex>

namespace
{
    std::mutex factory_mutex;
    std::function<std::shared_ptr<BPDFCryptoImpl>()> factory;
} // namespace

std::shared_ptr<BPDFCryptoImpl>
BPDFCryptoProvider::getImpl()
{
    std::function<std::shared_ptr<BPDFCryptoImpl>()> f;
    {
        std::lock_guard<std::mutex> lock(factory_mutex);
        f = factory;
    }
    if (f) {
        return f();
    }
    return std::make_shared<BPDFCrypto_openssl>();
}

void
BPDFCryptoProvider::setFactory(std::function<std::shared_ptr<BPDFCryptoImpl>()> f)
{
    std::lock_guard<std::mutex> lock(factory_mutex);
    factory = std::move(f);
}
