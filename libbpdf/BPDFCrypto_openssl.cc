#include <bpdf/BPDFCrypto_openssl.hh>

#include <algorithm>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/provider.h>
#include <openssl/rand.h>

namespace
{
    // Large buffers are passed to OpenSSL, which takes int lengths, in pieces of this size. It is
    // a multiple of the AES block size.
    size_t constexpr max_piece = 1U << 30;

    void
    check_openssl(int status, char const* operation)
    {
        if (status == 1) {
            return;
        }
        // Report the innermost error of OpenSSL's error queue.
        char buf[256] = "";
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        ERR_clear_error();
        throw std::runtime_error(std::string("OpenSSL error in ") + operation + ": " + buf);
    }

    // OpenSSL 3 only has RC4 in its legacy provider. It is loaded once, into a library context of
    // its own so the default context is unaffected.
    class LegacyRC4
    {
      public:
        LegacyRC4()
        {
            libctx = OSSL_LIB_CTX_new();
            if (libctx) {
                legacy = OSSL_PROVIDER_load(libctx, "legacy");
            }
            if (legacy) {
                rc4 = EVP_CIPHER_fetch(libctx, "RC4", nullptr);
            }
        }

        ~LegacyRC4()
        {
            EVP_CIPHER_free(rc4);
            if (legacy) {
                OSSL_PROVIDER_unload(legacy);
            }
            OSSL_LIB_CTX_free(libctx);
        }

        EVP_CIPHER const*
        get() const
        {
            if (!rc4) {
                throw std::runtime_error(
                    "RC4 is unavailable because OpenSSL's legacy provider could not be loaded");
            }
            return rc4;
        }

      private:
        OSSL_LIB_CTX* libctx{nullptr};
        OSSL_PROVIDER* legacy{nullptr};
        EVP_CIPHER* rc4{nullptr};
    };

    EVP_CIPHER const*
    rc4_cipher()
    {
        static LegacyRC4 loader;
        return loader.get();
    }

    EVP_MD const*
    message_digest(BPDFCryptoImpl::hash_e hash)
    {
        switch (hash) {
        case BPDFCryptoImpl::h_md5:
            return EVP_md5();
        case BPDFCryptoImpl::h_sha256:
            return EVP_sha256();
        case BPDFCryptoImpl::h_sha384:
            return EVP_sha384();
        case BPDFCryptoImpl::h_sha512:
            return EVP_sha512();
        }
        throw std::logic_error("unknown hash algorithm");
    }
} // namespace

BPDFCrypto_openssl::BPDFCrypto_openssl() :
    md_ctx(EVP_MD_CTX_new()),
    cipher_ctx(EVP_CIPHER_CTX_new())
{
    if (!(md_ctx && cipher_ctx)) {
        EVP_MD_CTX_free(md_ctx);
        EVP_CIPHER_CTX_free(cipher_ctx);
        throw std::runtime_error("unable to allocate OpenSSL contexts");
    }
}

BPDFCrypto_openssl::~BPDFCrypto_openssl()
{
    EVP_CIPHER_CTX_free(cipher_ctx);
    EVP_MD_CTX_free(md_ctx);
}

void
BPDFCrypto_openssl::provideRandomData(unsigned char* data, size_t len)
{
    while (len > 0) {
        auto piece = std::min(len, max_piece);
        check_openssl(RAND_bytes(data, static_cast<int>(piece)), "RAND_bytes");
        data += piece;
        len -= piece;
    }
}

void
BPDFCrypto_openssl::hashStart(hash_e hash)
{
    check_openssl(EVP_DigestInit_ex(md_ctx, message_digest(hash), nullptr), "digest init");
}

void
BPDFCrypto_openssl::hashUpdate(unsigned char const* data, size_t len)
{
    check_openssl(EVP_DigestUpdate(md_ctx, data, len), "digest update");
}

std::string
BPDFCrypto_openssl::hashFinish()
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    check_openssl(EVP_DigestFinal_ex(md_ctx, md, &len), "digest final");
    return {reinterpret_cast<char const*>(md), len};
}

void
BPDFCrypto_openssl::cipherStart(
    cipher_e cipher, bool encrypt, std::string const& key, std::string const& iv)
{
    EVP_CIPHER const* type = nullptr;
    unsigned char const* iv_data = nullptr;
    if (cipher == c_rc4) {
        if (key.empty() || key.size() > 256) {
            throw std::logic_error("RC4 key must be 1 to 256 bytes");
        }
        type = rc4_cipher();
    } else {
        if (key.size() == 16) {
            type = EVP_aes_128_cbc();
        } else if (key.size() == 32) {
            type = EVP_aes_256_cbc();
        } else {
            throw std::logic_error("AES key must be 16 or 32 bytes");
        }
        if (iv.size() != 16) {
            throw std::logic_error("AES initialization vector must be 16 bytes");
        }
        iv_data = reinterpret_cast<unsigned char const*>(iv.data());
    }

    int enc = encrypt ? 1 : 0;
    check_openssl(EVP_CIPHER_CTX_reset(cipher_ctx), "cipher reset");
    check_openssl(
        EVP_CipherInit_ex(cipher_ctx, type, nullptr, nullptr, nullptr, enc), "cipher init");
    if (cipher == c_rc4) {
        check_openssl(
            EVP_CIPHER_CTX_set_key_length(cipher_ctx, static_cast<int>(key.size())),
            "RC4 key length");
    }
    check_openssl(
        EVP_CipherInit_ex(
            cipher_ctx,
            nullptr,
            nullptr,
            reinterpret_cast<unsigned char const*>(key.data()),
            iv_data,
            enc),
        "cipher key");
    check_openssl(EVP_CIPHER_CTX_set_padding(cipher_ctx, 0), "cipher padding");
}

void
BPDFCrypto_openssl::cipherUpdate(unsigned char const* in, size_t len, unsigned char* out)
{
    while (len > 0) {
        auto piece = std::min(len, max_piece);
        int out_len = 0;
        check_openssl(
            EVP_CipherUpdate(cipher_ctx, out, &out_len, in, static_cast<int>(piece)),
            "cipher update");
        in += piece;
        out += piece;
        len -= piece;
    }
}
