#ifndef DIGEST_HH
#define DIGEST_HH

#include <bpdf/BPDFCryptoImpl.hh>

#include <memory>
#include <string>
#include <string_view>

// Message digest computed with the installed crypto provider
class Digest
{
  public:
    static size_t constexpr md5_bytes = 16;

    explicit Digest(BPDFCryptoImpl::hash_e);

    Digest& update(std::string_view data);
    // Returns the raw digest. Further updates start a new digest of the same kind.
    std::string finish();

    static std::string compute(BPDFCryptoImpl::hash_e, std::string_view data);

  private:
    BPDFCryptoImpl::hash_e hash;
    std::shared_ptr<BPDFCryptoImpl> crypto;
    bool started{false};
};

#endif // DIGEST_HH
