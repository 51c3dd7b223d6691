#include <bpdf/Pl_AES_PDF.hh>

#include <bpdf/BPDFCryptoProvider.hh>
#include <bpdf/BUtil.hh>

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace
{
    size_t constexpr block_size = 16;
    std::atomic<bool> use_static_iv{false};

    void
    check_key(std::string const& key)
    {
        if (!(key.size() == 16 || key.size() == 32)) {
            throw std::runtime_error(
                "unsupported AES key length " + std::to_string(key.size()) + " bytes");
        }
    }
} // namespace

Pl_AES_PDF::Pl_AES_PDF(char const* identifier, Pipeline* next, bool encrypt, std::string key) :
    Pipeline(identifier, next),
    encrypting(encrypt),
    key(std::move(key))
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_AES_PDF with nullptr as next");
    }
    check_key(this->key);
}

void
Pl_AES_PDF::write(unsigned char const* buf, size_t len)
{
    data.append(reinterpret_cast<char const*>(buf), len);
}

void
Pl_AES_PDF::finish()
{
    std::string result = encrypting ? encrypt(key, data) : decrypt(key, data);
    data.clear();
    next()->writeString(result);
    next()->finish();
}

void
Pl_AES_PDF::useStaticIV()
{
    use_static_iv = true;
}

std::string
Pl_AES_PDF::cbc(
    bool encrypt, std::string const& key, std::string const& data, std::string const& iv)
{
    check_key(key);
    if (data.size() % block_size) {
        throw std::logic_error("AES input is not a whole number of blocks");
    }
    std::string result(data.size(), '\0');
    auto crypto = BPDFCryptoProvider::getImpl();
    crypto->cipherStart(BPDFCryptoImpl::c_aes_cbc, encrypt, key, iv);
    crypto->cipherUpdate(
        reinterpret_cast<unsigned char const*>(data.data()),
        data.size(),
        reinterpret_cast<unsigned char*>(result.data()));
    return result;
}

std::string
Pl_AES_PDF::encrypt(std::string const& key, std::string const& data)
{
    std::string iv(block_size, '\0');
    if (use_static_iv) {
        for (size_t i = 0; i < block_size; ++i) {
            iv[i] = static_cast<char>(14U * (1U + i));
        }
    } else {
        BUtil::initializeWithRandomBytes(reinterpret_cast<unsigned char*>(iv.data()), block_size);
    }
    // A whole block of padding is added when the data is already a multiple of the block size.
    auto pad = block_size - data.size() % block_size;
    std::string padded = data;
    padded.append(pad, static_cast<char>(pad));
    return iv + cbc(true, key, padded, iv);
}

std::string
Pl_AES_PDF::decrypt(std::string const& key, std::string const& data)
{
    if (data.size() <= block_size) {
        // Only an initialization vector, or not even that
        return {};
    }
    std::string body = data.substr(block_size);
    if (body.size() % block_size) {
        // Files exist whose encrypted data was not padded to a whole block. Pad with zeroes and
        // hope for the best.
        body.append(block_size - body.size() % block_size, '\0');
    }
    auto result = cbc(false, key, body, data.substr(0, block_size));
    auto pad = static_cast<unsigned char>(result.back());
    if (pad >= 1 && pad <= block_size &&
        std::all_of(result.end() - pad, result.end(), [pad](char c) {
            return static_cast<unsigned char>(c) == pad;
        })) {
        result.resize(result.size() - pad);
    }
    return result;
}
