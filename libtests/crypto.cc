#include <bpdf/assert_test.h>

#include <bpdf/BPDFCryptoProvider.hh>
#include <bpdf/BPDFCrypto_openssl.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/Digest.hh>
#include <bpdf/Pl_AES_PDF.hh>
#include <bpdf/Pl_RC4.hh>
#include <bpdf/Pl_String.hh>
#include <iostream>
#include <memory>
#include <stdexcept>

static void
test_digests()
{
    assert(
        BUtil::hex_encode(Digest::compute(BPDFCryptoImpl::h_md5, "abc")) ==
        "900150983cd24fb0d6963f7d28e17f72");
    assert(
        BUtil::hex_encode(Digest::compute(BPDFCryptoImpl::h_md5, "")) ==
        "d41d8cd98f00b204e9800998ecf8427e");

    Digest d(BPDFCryptoImpl::h_sha256);
    d.update("a").update("bc");
    assert(
        BUtil::hex_encode(d.finish()) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    // The same object starts over after finish.
    d.update("abc");
    assert(d.finish() == Digest::compute(BPDFCryptoImpl::h_sha256, "abc"));
    assert(Digest::compute(BPDFCryptoImpl::h_sha384, "abc").size() == 48);
    assert(Digest::compute(BPDFCryptoImpl::h_sha512, "abc").size() == 64);
}

static void
test_rc4()
{
    std::string data = "Plaintext";
    Pl_RC4::process("Key", data);
    assert(BUtil::hex_encode(data) == "bbf316e8d940af0ad3");
    Pl_RC4::process("Key", data);
    assert(data == "Plaintext");

    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_RC4 rc4("rc4", &s, "Key");
    rc4.writeString("Plain");
    rc4.writeString("text");
    rc4.finish();
    assert(BUtil::hex_encode(out) == "bbf316e8d940af0ad3");
}

static void
test_aes()
{
    // FIPS-197 appendix C.1; a single block with a zero IV is the bare cipher.
    std::string key = BUtil::hex_decode("000102030405060708090a0b0c0d0e0f");
    std::string block = BUtil::hex_decode("00112233445566778899aabbccddeeff");
    std::string zero_iv(16, '\0');
    auto encrypted = Pl_AES_PDF::cbc(true, key, block, zero_iv);
    assert(BUtil::hex_encode(encrypted) == "69c4e0d86a7b0430d8cdb78070b4c55a");
    assert(Pl_AES_PDF::cbc(false, key, encrypted, zero_iv) == block);

    // The security handler form writes a random IV in front of padded data.
    std::string text = "attack at dawn, or maybe a little later";
    auto with_iv = Pl_AES_PDF::encrypt(key, text);
    assert(with_iv.size() == 16 + 48);
    assert(Pl_AES_PDF::decrypt(key, with_iv) == text);
    assert(Pl_AES_PDF::encrypt(key, text) != with_iv);
    assert(Pl_AES_PDF::encrypt(key, block).size() == 16 + 32);
    assert(Pl_AES_PDF::decrypt(key, with_iv.substr(0, 16)).empty());

    std::string key256(32, '\x42');
    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_AES_PDF aes("aes", &s, false, key256);
    auto e256 = Pl_AES_PDF::encrypt(key256, text);
    aes.writeString(e256.substr(0, 20));
    aes.writeString(e256.substr(20));
    aes.finish();
    assert(out == text);

    bool thrown = false;
    try {
        Pl_AES_PDF::encrypt("short", text);
    } catch (std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    thrown = false;
    try {
        Pl_AES_PDF::cbc(true, key, "not a block", zero_iv);
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_provider()
{
    class CountingCrypto: public BPDFCrypto_openssl
    {
      public:
        CountingCrypto(int& starts) :
            starts(starts)
        {
        }
        void
        hashStart(hash_e hash) override
        {
            ++starts;
            BPDFCrypto_openssl::hashStart(hash);
        }

      private:
        int& starts;
    };

    int starts = 0;
    BPDFCryptoProvider::setFactory(
        [&starts]() { return std::make_shared<CountingCrypto>(starts); });
    auto md5 = Digest::compute(BPDFCryptoImpl::h_md5, "abc");
    BPDFCryptoProvider::setFactory(nullptr);
    assert(starts == 1);
    assert(md5 == Digest::compute(BPDFCryptoImpl::h_md5, "abc"));
    assert(starts == 1);
}

int
main()
{
    test_digests();
    test_rc4();
    test_aes();
    test_provider();
    std::cout << "crypto tests done" << std::endl;
    return 0;
}
