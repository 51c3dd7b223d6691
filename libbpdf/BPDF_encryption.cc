// Methods of the BPDF class that connect documents to BPDFSecurityHandler

#include <bpdf/BPDF_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFSecurityHandler.hh>
#include <bpdf/BUtil.hh>
#include <bpdf/Digest.hh>

#include <functional>
#include <stdexcept>

void
BPDF::initializeEncryption()
{
    if (!m->trailer.hasKey("Encrypt")) {
        return;
    }

    std::string id1;
    auto id = m->trailer.getKey("ID");
    if (id.isArray() && id.getArrayNItems() == 2 && id.getArrayItem(0).isString()) {
        id1 = id.getArrayItem(0).getStringValue();
    } else {
        // Files with a broken /ID can often still be opened with an empty first word.
        warn(damagedPDF("trailer", "invalid /ID in trailer dictionary"));
    }

    auto handler =
        std::make_shared<BPDFSecurityHandler>(m->trailer.getKey("Encrypt"), id1, getFilename());
    if (!handler->unlock(m->provided_password)) {
        throw BPDFExc(bpdf_e_password, getFilename(), "", 0, "invalid password");
    }
    if (!handler->permissionsVerified()) {
        warn(damagedPDF("encryption dictionary", "/Perms does not match the other parameters"));
    }
    m->in_encp = handler;
    m->out_encp = handler;
}

// Replace a cipher the file names but doesn't define, warning once per kind of data.
static BPDFSecurityHandler::cipher_e
known_cipher(BPDFSecurityHandler::cipher_e& cipher, std::function<void()> const& warn)
{
    if (cipher == BPDFSecurityHandler::c_unknown) {
        warn();
        cipher = BPDFSecurityHandler::c_aes128;
    }
    return cipher;
}

void
BPDF::decryptString(std::string& str, BPDFObjGen og)
{
    auto& handler = m->in_encp;
    if (!handler || !og.isIndirect()) {
        return;
    }
    auto cipher = known_cipher(handler->string_cipher, [this]() {
        warn(damagedPDF(
            "encryption dictionary",
            "unknown crypt filter in /StrF; strings may be decrypted incorrectly"));
    });
    try {
        str = handler->apply(cipher, og, str, false);
    } catch (std::runtime_error& e) {
        throw damagedPDF(og.describe(), std::string("error decrypting string: ") + e.what());
    }
}

void
BPDF::decryptStream(std::string& data, BPDFObjGen og, BPDFObjectHandle stream_dict)
{
    auto& handler = m->in_encp;
    // Cross-reference streams are never encrypted.
    if (!handler || stream_dict.getKey("Type").isNameAndEquals("XRef")) {
        return;
    }
    auto cipher = handler->cipherForStream(stream_dict);
    if (cipher == BPDFSecurityHandler::c_unknown) {
        cipher = known_cipher(handler->stream_cipher, [this, og]() {
            warn(damagedPDF(
                og.describe(),
                "unknown crypt filter for stream; data may be decrypted incorrectly"));
        });
    }
    try {
        data = handler->apply(cipher, og, data, false);
    } catch (std::runtime_error& e) {
        throw damagedPDF(og.describe(), std::string("error decrypting stream: ") + e.what());
    }
}

bool
BPDF::isEncrypted() const
{
    return m->out_encp != nullptr;
}

bool
BPDF::isEncrypted(int& R, int& P) const
{
    if (!m->out_encp) {
        return false;
    }
    R = m->out_encp->getR();
    P = m->out_encp->getP();
    return true;
}

bool
BPDF::ownerPasswordMatched() const
{
    return m->in_encp && m->in_encp->ownerUnlocked();
}

bool
BPDF::userPasswordMatched() const
{
    return m->in_encp && m->in_encp->userUnlocked();
}

BPDFSecurityHandler const*
BPDF::getSecurityHandler() const
{
    return m->out_encp.get();
}

void
BPDF::setEncryption(
    std::string const& user_password, std::string const& owner_password, int R, int P)
{
    std::string id1;
    auto id = m->trailer.getKey("ID");
    if (id.isArray() && id.getArrayNItems() == 2 && id.getArrayItem(0).isString()) {
        id1 = id.getArrayItem(0).getStringValue();
    } else {
        unsigned char seed[16];
        BUtil::initializeWithRandomBytes(seed, sizeof(seed));
        Digest md5(BPDFCryptoImpl::h_md5);
        md5.update({reinterpret_cast<char*>(seed), sizeof(seed)}).update(getFilename());
        id1 = md5.finish();
        auto word = BPDFObjectHandle::newString(id1);
        m->trailer.replaceKey("ID", BPDFObjectHandle::newArray({word, word.shallowCopy()}));
    }

    m->out_encp = BPDFSecurityHandler::create(R, P, id1, user_password, owner_password);
    m->trailer.removeKey("Encrypt");
    requirePDFVersion(R == 3 ? "1.4" : (R == 4 ? "1.6" : "1.7"));
}

void
BPDF::removeEncryption()
{
    m->out_encp = nullptr;
    m->trailer.removeKey("Encrypt");
}
