#ifndef PL_RC4_HH
#define PL_RC4_HH

#include <bpdf/BPDFCryptoImpl.hh>
#include <bpdf/Pipeline.hh>

#include <memory>
#include <string>

// RC4 encryption and decryption, which are the same operation
class Pl_RC4 final: public Pipeline
{
  public:
    Pl_RC4(char const* identifier, Pipeline* next, std::string const& key);

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

    // Encrypt or decrypt data in place
    static void process(std::string const& key, std::string& data);

  private:
    std::shared_ptr<BPDFCryptoImpl> crypto;
    std::string buf;
};

#endif // PL_RC4_HH
