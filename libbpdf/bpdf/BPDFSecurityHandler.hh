#ifndef BPDFSECURITYHANDLER_HH
#define BPDFSECURITYHANDLER_HH

#include <bpdf/BPDFObjGen.hh>
#include <bpdf/BPDFObjectHandle.hh>

#include <map>
#include <memory>
#include <string>
#include <string_view>

// The standard security handler of ISO 32000-2 section 7.6.4. A handler is either read from the
// /Encrypt dictionary of an input file and unlocked with a password, or created from passwords
// for output. Revisions 2 through 4 (RC4 and AES-128) and 6 (AES-256) are supported.
class BPDFSecurityHandler
{
  public:
    enum cipher_e { c_identity, c_unknown, c_rc4, c_aes128, c_aes256 };

    // Interpret an /Encrypt dictionary. id1 is the first word of the trailer's /ID. Throws
    // BPDFExc naming filename if the dictionary is malformed or uses an unsupported handler.
    BPDFSecurityHandler(
        BPDFObjectHandle encrypt, std::string id1, std::string const& filename);

    // New parameters for R 3 (RC4), 4 (AES-128) or 6 (AES-256). Throws std::logic_error for any
    // other revision. The returned handler is unlocked for both passwords.
    static std::shared_ptr<BPDFSecurityHandler> create(
        int R, int P, std::string id1, std::string const& user, std::string const& owner);

    // Check password against both the owner and the user password and derive the file key.
    // Returns false if neither matches.
    bool unlock(std::string const& password);

    bool
    ownerUnlocked() const
    {
        return owner_unlocked;
    }
    bool
    userUnlocked() const
    {
        return user_unlocked;
    }
    // For R 6, whether /Perms decrypted to the expected value
    bool
    permissionsVerified() const
    {
        return perms_verified;
    }
    int
    getR() const
    {
        return R;
    }
    int
    getP() const
    {
        return P;
    }
    std::string const&
    getId1() const
    {
        return id1;
    }
    bool
    encryptsMetadata() const
    {
        return encrypt_metadata;
    }

    // Ciphers from /StrF and /StmF. BPDF replaces c_unknown after warning about it.
    cipher_e string_cipher{c_rc4};
    cipher_e stream_cipher{c_rc4};

    // The cipher for a stream with the given dictionary, taking a /Crypt filter into account
    cipher_e cipherForStream(BPDFObjectHandle stream_dict) const;

    // Encrypt or decrypt data belonging to object og. Throws std::runtime_error for data that
    // can't be decrypted.
    std::string apply(cipher_e, BPDFObjGen og, std::string const& data, bool encrypt) const;

    // The /Encrypt dictionary for these parameters
    std::string unparseDictionary() const;

  private:
    BPDFSecurityHandler() = default;

    cipher_e cipherNamed(BPDFObjectHandle name) const;
    std::string objectKey(BPDFObjGen og, bool aes) const;
    std::string fileKeyFromPadded(std::string const& padded_user) const;
    std::string userEntry(std::string const& file_key) const;
    std::string ownerKey(std::string const& owner) const;
    std::string hashR6(
        std::string const& password, std::string_view salt, std::string_view udata) const;
    std::string permsBlock() const;

    int V{0};
    int R{0};
    int key_bytes{16};
    int P{0};
    std::string O;
    std::string U;
    std::string OE;
    std::string UE;
    std::string perms;
    std::string id1;
    bool encrypt_metadata{true};
    std::map<std::string, cipher_e> crypt_filters;

    std::string file_key;
    bool owner_unlocked{false};
    bool user_unlocked{false};
    bool perms_verified{false};
};

#endif // BPDFSECURITYHANDLER_HH
