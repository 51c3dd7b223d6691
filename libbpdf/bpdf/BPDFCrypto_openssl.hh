#ifndef BPDFCRYPTO_OPENSSL_HH
#define BPDFCRYPTO_OPENSSL_HH

#include <bpdf/BPDFCryptoImpl.hh>

#include <openssl/evp.h>

class BPDFCrypto_openssl: public BPDFCryptoImpl
{
  public:
    BPDFCrypto_openssl();
    ~BPDFCrypto_openssl() override;
    BPDFCrypto_openssl(BPDFCrypto_openssl const&) = delete;
    BPDFCrypto_openssl& operator=(BPDFCrypto_openssl const&) = delete;

    void provideRandomData(unsigned char* data, size_t len) override;

    void hashStart(hash_e) override;
    void hashUpdate(unsigned char const* data, size_t len) override;
    std::string hashFinish() override;

    void
    cipherStart(cipher_e, bool encrypt, std::string const& key, std::string const& iv) override;
    void cipherUpdate(unsigned char const* in, size_t len, unsigned char* out) override;

  private:
    EVP_MD_CTX* md_ctx;
    EVP_CIPHER_CTX* cipher_ctx;
};

#endif // BPDFCRYPTO_OPENSSL_HH
