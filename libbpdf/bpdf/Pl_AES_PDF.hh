#ifndef PL_AES_PDF_HH
#define PL_AES_PDF_HH

#include <bpdf/Pipeline.hh>

#include <string>

// AES as used by the standard security handler: CBC mode with the 16-byte initialization vector
// stored in front of the encrypted data and PKCS#5 padding. Data is collected until finish().
class Pl_AES_PDF final: public Pipeline
{
  public:
    // key must be 16 or 32 bytes
    Pl_AES_PDF(char const* identifier, Pipeline* next, bool encrypt, std::string key);

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

    static std::string encrypt(std::string const& key, std::string const& data);
    static std::string decrypt(std::string const& key, std::string const& data);

    // CBC over whole blocks without padding. The IV is not stored with the data.
    static std::string
    cbc(bool encrypt, std::string const& key, std::string const& data, std::string const& iv);

    // Use a fixed initialization vector from now on so that encrypted output is reproducible
    static void useStaticIV();

  private:
    bool encrypting;
    std::string key;
    std::string data;
};

#endif // PL_AES_PDF_HH
