#include <bpdf/BPDFSecurityHandler.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/Digest.hh>
#include <bpdf/Pl_AES_PDF.hh>
#include <bpdf/Pl_RC4.hh>
#include <bpdf/Pl_String.hh>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace
{
    // Algorithm 2 step a pads passwords to 32 bytes with this string.
    std::string const password_pad(
        "\x28\xbf\x4e\x5e\x4e\x75\x8a\x41\x64\x00\x4e\x56\xff\xfa\x01\x08"
        "\x2e\x2e\x00\xb6\xd0\x68\x3e\x80\x2f\x0c\xa9\xfe\x64\x53\x69\x7a",
        32);

    std::string const zero_iv(16, '\0');

    std::string
    padded(std::string const& password)
    {
        auto result = password.substr(0, 32);
        return result + password_pad.substr(0, 32 - result.size());
    }

    // R 6 passwords are UTF-8 limited to 127 bytes. SASLprep is not applied.
    std::string
    limited(std::string const& password)
    {
        return password.substr(0, 127);
    }

    std::string
    random_bytes(size_t n)
    {
        std::string result(n, '\0');
        BUtil::initializeWithRandomBytes(reinterpret_cast<unsigned char*>(result.data()), n);
        return result;
    }

    std::string
    little_endian(int value)
    {
        auto v = static_cast<unsigned int>(value);
        std::string result;
        for (int i = 0; i < 4; ++i, v >>= 8) {
            result += static_cast<char>(v & 0xff);
        }
        return result;
    }

    // R 3 and later rehash the first n bytes of an MD5 digest fifty times.
    std::string
    md5_rounds(std::string digest, size_t n, int R)
    {
        if (R >= 3) {
            for (int i = 0; i < 50; ++i) {
                digest.resize(n);
                digest = Digest::compute(BPDFCryptoImpl::h_md5, digest);
            }
        }
        return digest.substr(0, n);
    }

    // R 3 and later run RC4 twenty times, xoring each key byte with the round number. Running
    // the rounds backwards undoes them.
    void
    rc4_rounds(std::string& data, std::string const& key, int R, bool backwards)
    {
        if (R < 3) {
            Pl_RC4::process(key, data);
            return;
        }
        for (int n = 0; n < 20; ++n) {
            int round = backwards ? 19 - n : n;
            std::string k = key;
            for (auto& ch: k) {
                ch = static_cast<char>(ch ^ round);
            }
            Pl_RC4::process(k, data);
        }
    }

    bool
    is_aes(BPDFSecurityHandler::cipher_e cipher)
    {
        return cipher == BPDFSecurityHandler::c_aes128 || cipher == BPDFSecurityHandler::c_aes256;
    }

    std::string
    hex_string(std::string const& s)
    {
        return "<" + BUtil::hex_encode(s) + ">";
    }
} // namespace

BPDFSecurityHandler::BPDFSecurityHandler(
    BPDFObjectHandle encrypt, std::string id1, std::string const& filename) :
    id1(std::move(id1))
{
    auto damaged = [&filename](std::string const& msg) {
        return BPDFExc(bpdf_e_damaged_pdf, filename, "encryption dictionary", 0, msg);
    };
    if (!encrypt.isDictionary()) {
        throw damaged("/Encrypt in trailer dictionary is not a dictionary");
    }
    if (!encrypt.getKey("Filter").isNameAndEquals("Standard")) {
        throw BPDFExc(
            bpdf_e_unsupported,
            filename,
            "encryption dictionary",
            0,
            "only the standard security handler is supported");
    }
    auto entry = [&encrypt](char const* key) { return encrypt.getKey(key); };
    if (!(entry("V").isInteger() && entry("R").isInteger() && entry("P").isInteger() &&
          entry("O").isString() && entry("U").isString())) {
        throw damaged("/V, /R, /P, /O or /U is missing or has the wrong type");
    }
    V = entry("V").getIntValueAsInt();
    R = entry("R").getIntValueAsInt();
    // Some writers store /P as an unsigned number.
    P = static_cast<int>(static_cast<unsigned int>(entry("P").getIntValue() & 0xffffffffLL));
    O = entry("O").getStringValue();
    U = entry("U").getStringValue();

    bool known_v = V == 1 || V == 2 || V == 4 || V == 5;
    if (!known_v || R < 2 || R > 6) {
        throw BPDFExc(
            bpdf_e_unsupported,
            filename,
            "encryption dictionary",
            0,
            "unsupported security handler revision (V " + std::to_string(V) + ", R " +
                std::to_string(R) + ")");
    }

    size_t ou_bytes = 32;
    if (V == 5) {
        if (!(entry("OE").isString() && entry("UE").isString() && entry("Perms").isString())) {
            throw damaged("/OE, /UE or /Perms is missing or has the wrong type");
        }
        OE = entry("OE").getStringValue();
        UE = entry("UE").getStringValue();
        perms = entry("Perms").getStringValue();
        OE.resize(std::max(OE.size(), size_t(32)), '\0');
        UE.resize(std::max(UE.size(), size_t(32)), '\0');
        perms.resize(std::max(perms.size(), size_t(16)), '\0');
        ou_bytes = 48;
    }
    O.resize(std::max(O.size(), ou_bytes), '\0');
    U.resize(std::max(U.size(), ou_bytes), '\0');
    if (V < 5 && (O.size() != 32 || U.size() != 32)) {
        throw damaged("/O and /U must be 32 bytes long");
    }

    if (V == 5) {
        key_bytes = 32;
    } else if (V == 1) {
        key_bytes = 5;
    } else if (V == 2 && entry("Length").isInteger()) {
        int bits = entry("Length").getIntValueAsInt();
        if (bits >= 40 && bits <= 128 && bits % 8 == 0) {
            key_bytes = bits / 8;
        }
    }

    if (V < 4) {
        return;
    }
    if (entry("EncryptMetadata").isBool()) {
        encrypt_metadata = entry("EncryptMetadata").getBoolValue();
    }
    for (auto const& [name, filter]: entry("CF").getDictAsMap()) {
        if (!filter.isDictionary()) {
            continue;
        }
        auto cfm = filter.getKey("CFM");
        cipher_e cipher = c_identity;
        if (cfm.isNameAndEquals("V2")) {
            cipher = c_rc4;
        } else if (cfm.isNameAndEquals("AESV2")) {
            cipher = c_aes128;
        } else if (cfm.isNameAndEquals("AESV3")) {
            cipher = c_aes256;
        } else if (cfm.isName() && !cfm.isNameAndEquals("None")) {
            // Reported only when something is encrypted with it
            cipher = c_unknown;
        }
        crypt_filters[name] = cipher;
    }
    string_cipher = cipherNamed(entry("StrF"));
    stream_cipher = cipherNamed(entry("StmF"));
}

std::shared_ptr<BPDFSecurityHandler>
BPDFSecurityHandler::create(
    int R, int P, std::string id1, std::string const& user, std::string const& owner)
{
    // Private constructor
    std::shared_ptr<BPDFSecurityHandler> h(new BPDFSecurityHandler());
    switch (R) {
    case 3:
        h->V = 2;
        h->string_cipher = c_rc4;
        break;
    case 4:
        h->V = 4;
        h->string_cipher = c_aes128;
        break;
    case 6:
        h->V = 5;
        h->key_bytes = 32;
        h->string_cipher = c_aes256;
        break;
    default:
        throw std::logic_error("BPDFSecurityHandler::create: R must be 3, 4 or 6");
    }
    h->R = R;
    h->stream_cipher = h->string_cipher;
    // Bits 1-2 must be clear. Bits 7-8 and 13-32 must be set.
    h->P = static_cast<int>((static_cast<unsigned int>(P) | 0xfffff0c0U) & ~3U);
    h->id1 = std::move(id1);
    h->owner_unlocked = true;
    h->user_unlocked = true;
    h->perms_verified = true;

    if (h->V < 5) {
        // Algorithm 3 computes /O before the file key, which depends on it.
        h->O = padded(user);
        rc4_rounds(h->O, h->ownerKey(owner.empty() ? user : owner), R, false);
        h->file_key = h->fileKeyFromPadded(padded(user));
        h->U = h->userEntry(h->file_key);
        return h;
    }

    // Algorithms 8, 9 and 10 of ISO 32000-2
    h->file_key = random_bytes(32);
    auto u_salts = random_bytes(16);
    h->U = h->hashR6(limited(user), u_salts.substr(0, 8), "") + u_salts;
    h->UE = Pl_AES_PDF::cbc(
        true, h->hashR6(limited(user), u_salts.substr(8), ""), h->file_key, zero_iv);
    auto o_salts = random_bytes(16);
    h->O = h->hashR6(limited(owner), o_salts.substr(0, 8), h->U) + o_salts;
    h->OE = Pl_AES_PDF::cbc(
        true, h->hashR6(limited(owner), o_salts.substr(8), h->U), h->file_key, zero_iv);
    h->perms = Pl_AES_PDF::cbc(true, h->file_key, h->permsBlock(), zero_iv);
    return h;
}

bool
BPDFSecurityHandler::unlock(std::string const& password)
{
    owner_unlocked = false;
    user_unlocked = false;
    perms_verified = false;
    file_key.clear();

    if (V < 5) {
        // For R 3 and later only the first 16 bytes of /U are significant.
        size_t significant = R >= 3 ? 16 : 32;
        auto matches_u = [this, significant](std::string const& key) {
            return U.compare(0, significant, userEntry(key), 0, significant) == 0;
        };

        auto user_key = fileKeyFromPadded(padded(password));
        user_unlocked = matches_u(user_key);

        // Algorithm 7: decrypting /O with the owner key recovers the padded user password.
        auto recovered = O.substr(0, 32);
        rc4_rounds(recovered, ownerKey(password), R, true);
        auto owner_key = fileKeyFromPadded(recovered);
        owner_unlocked = matches_u(owner_key);

        if (owner_unlocked) {
            file_key = owner_key;
        } else if (user_unlocked) {
            file_key = user_key;
        }
        return owner_unlocked || user_unlocked;
    }

    // Algorithms 11, 12 and 2.A of ISO 32000-2
    auto pw = limited(password);
    std::string_view u48 = std::string_view(U).substr(0, 48);
    owner_unlocked =
        hashR6(pw, std::string_view(O).substr(32, 8), u48) == std::string_view(O).substr(0, 32);
    user_unlocked =
        hashR6(pw, std::string_view(U).substr(32, 8), "") == std::string_view(U).substr(0, 32);
    if (owner_unlocked) {
        file_key = Pl_AES_PDF::cbc(
            false, hashR6(pw, std::string_view(O).substr(40, 8), u48), OE.substr(0, 32), zero_iv);
    } else if (user_unlocked) {
        file_key = Pl_AES_PDF::cbc(
            false, hashR6(pw, std::string_view(U).substr(40, 8), ""), UE.substr(0, 32), zero_iv);
    } else {
        return false;
    }
    auto decrypted = Pl_AES_PDF::cbc(false, file_key, perms.substr(0, 16), zero_iv);
    perms_verified = decrypted.compare(0, 12, permsBlock(), 0, 12) == 0;
    return true;
}

BPDFSecurityHandler::cipher_e
BPDFSecurityHandler::cipherNamed(BPDFObjectHandle name) const
{
    if (!name.isName()) {
        return c_identity;
    }
    auto it = crypt_filters.find(name.getName());
    if (it != crypt_filters.end()) {
        return it->second;
    }
    return name.getName() == "Identity" ? c_identity : c_unknown;
}

BPDFSecurityHandler::cipher_e
BPDFSecurityHandler::cipherForStream(BPDFObjectHandle stream_dict) const
{
    auto filter = stream_dict.getKey("Filter");
    auto parms = stream_dict.getKey("DecodeParms");
    if (filter.isNameAndEquals("Crypt") && parms.isDictionary()) {
        return cipherNamed(parms.getKey("Name"));
    }
    for (int i = 0; i < filter.getArrayNItems(); ++i) {
        auto p = parms.getArrayItem(i);
        if (filter.getArrayItem(i).isNameAndEquals("Crypt") && p.isDictionary()) {
            return cipherNamed(p.getKey("Name"));
        }
    }
    if (!encrypt_metadata && stream_dict.getKey("Type").isNameAndEquals("Metadata")) {
        return c_identity;
    }
    return stream_cipher;
}

std::string
BPDFSecurityHandler::apply(
    cipher_e cipher, BPDFObjGen og, std::string const& data, bool encrypt) const
{
    if (cipher == c_identity) {
        return data;
    }
    std::string result;
    Pl_String out("security handler output", nullptr, result);
    auto key = objectKey(og, is_aes(cipher));
    if (is_aes(cipher)) {
        Pl_AES_PDF aes("AES", &out, encrypt, key);
        aes.writeString(data);
        aes.finish();
    } else {
        Pl_RC4 rc4("RC4", &out, key);
        rc4.writeString(data);
        rc4.finish();
    }
    return result;
}

// Algorithm 1 of ISO 32000-2. R 6 uses the file key directly.
std::string
BPDFSecurityHandler::objectKey(BPDFObjGen og, bool aes) const
{
    if (V >= 5) {
        return file_key;
    }
    std::string seed = file_key + little_endian(og.getObj()).substr(0, 3) +
        little_endian(og.getGen()).substr(0, 2);
    if (aes) {
        seed += "sAlT";
    }
    auto n = std::min(file_key.size() + 5, size_t(16));
    return Digest::compute(BPDFCryptoImpl::h_md5, seed).substr(0, n);
}

// Algorithm 2. The password is used as given without conversion to PDFDocEncoding.
std::string
BPDFSecurityHandler::fileKeyFromPadded(std::string const& padded_user) const
{
    Digest md5(BPDFCryptoImpl::h_md5);
    md5.update(padded_user).update(std::string_view(O).substr(0, 32));
    md5.update(little_endian(P)).update(id1);
    if (R >= 4 && !encrypt_metadata) {
        md5.update("\xff\xff\xff\xff");
    }
    return md5_rounds(md5.finish(), static_cast<size_t>(key_bytes), R);
}

// Algorithms 4 and 5
std::string
BPDFSecurityHandler::userEntry(std::string const& key) const
{
    if (R < 3) {
        auto result = password_pad;
        Pl_RC4::process(key, result);
        return result;
    }
    auto result = Digest(BPDFCryptoImpl::h_md5).update(password_pad).update(id1).finish();
    rc4_rounds(result, key, R, false);
    // The last 16 bytes are arbitrary.
    return result + password_pad.substr(0, 16);
}

// Algorithm 3 steps a through d
std::string
BPDFSecurityHandler::ownerKey(std::string const& owner) const
{
    auto digest = Digest::compute(BPDFCryptoImpl::h_md5, padded(owner));
    return md5_rounds(digest, static_cast<size_t>(key_bytes), R);
}

// Algorithm 2.B of ISO 32000-2. R 5 used plain SHA-256.
std::string
BPDFSecurityHandler::hashR6(
    std::string const& password, std::string_view salt, std::string_view udata) const
{
    std::string input = password;
    input.append(salt).append(udata);
    std::string K = Digest::compute(BPDFCryptoImpl::h_sha256, input);
    if (R < 6) {
        return K;
    }

    for (int round = 1;; ++round) {
        std::string K1;
        std::string block = password + K;
        block.append(udata);
        for (int i = 0; i < 64; ++i) {
            K1 += block;
        }
        auto E = Pl_AES_PDF::cbc(true, K.substr(0, 16), K1, K.substr(16, 16));

        // The first 16 bytes of E as a big-endian number mod 3 equal the sum of the bytes mod 3.
        unsigned int sum = 0;
        for (size_t i = 0; i < 16; ++i) {
            sum += static_cast<unsigned char>(E[i]);
        }
        static BPDFCryptoImpl::hash_e const next_hash[] = {
            BPDFCryptoImpl::h_sha256, BPDFCryptoImpl::h_sha384, BPDFCryptoImpl::h_sha512};
        K = Digest::compute(next_hash[sum % 3], E);

        auto last = static_cast<unsigned char>(E.back());
        if (round >= 64 && last <= round - 32) {
            break;
        }
    }
    return K.substr(0, 32);
}

// Table 27 of ISO 32000-2: P, four 0xff bytes, T or F for /EncryptMetadata, "adb" and four
// random bytes
std::string
BPDFSecurityHandler::permsBlock() const
{
    return little_endian(P) + "\xff\xff\xff\xff" + (encrypt_metadata ? "T" : "F") + "adb" +
        random_bytes(4);
}

std::string
BPDFSecurityHandler::unparseDictionary() const
{
    std::string dict = "<<";
    if (V >= 4) {
        dict += " /CF << /StdCF << /AuthEvent /DocOpen /CFM ";
        dict += stream_cipher == c_aes256 ? "/AESV3"
            : stream_cipher == c_aes128   ? "/AESV2"
                                          : "/V2";
        dict += " /Length " + std::to_string(key_bytes) + " >> >>";
        if (!encrypt_metadata) {
            dict += " /EncryptMetadata false";
        }
    }
    dict += " /Filter /Standard /Length " + std::to_string(key_bytes * 8);
    dict += " /O " + hex_string(O);
    if (V >= 5) {
        dict += " /OE " + hex_string(OE);
    }
    dict += " /P " + std::to_string(P);
    if (V >= 5) {
        dict += " /Perms " + hex_string(perms);
    }
    dict += " /R " + std::to_string(R);
    if (V >= 4) {
        dict += " /StmF /StdCF /StrF /StdCF";
    }
    dict += " /U " + hex_string(U);
    if (V >= 5) {
        dict += " /UE " + hex_string(UE);
    }
    dict += " /V " + std::to_string(V) + " >>";
    return dict;
}
