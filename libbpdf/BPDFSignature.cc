#include <bpdf/BPDFSignature.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFWriter.hh>
#include <bpdf/BUtil.hh>

#include <memory>
#include <set>

#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif

namespace
{
    template <typename T, void (*F)(T*)>
    struct Deleter
    {
        void
        operator()(T* p) const
        {
            F(p);
        }
    };

    using BIO_ptr = std::unique_ptr<BIO, Deleter<BIO, BIO_free_all>>;
    using PKCS12_ptr = std::unique_ptr<PKCS12, Deleter<PKCS12, PKCS12_free>>;
    using PKCS7_ptr = std::unique_ptr<PKCS7, Deleter<PKCS7, PKCS7_free>>;
    using X509_ptr = std::unique_ptr<X509, Deleter<X509, X509_free>>;
    using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, Deleter<EVP_PKEY, EVP_PKEY_free>>;
    using X509_STORE_ptr = std::unique_ptr<X509_STORE, Deleter<X509_STORE, X509_STORE_free>>;

    void
    free_chain(STACK_OF(X509) * chain)
    {
        sk_X509_pop_free(chain, X509_free);
    }

    using X509_chain_ptr = std::unique_ptr<STACK_OF(X509), Deleter<STACK_OF(X509), free_chain>>;

    // Drain OpenSSL's error queue into a message
    std::string
    openssl_errors(std::string const& what)
    {
        std::string result = what;
        while (auto code = ERR_get_error()) {
            if (auto const* reason = ERR_reason_error_string(code)) {
                result += "; ";
                result += reason;
            }
        }
        return result;
    }

    [[noreturn]] void
    signature_error(std::string const& filename, std::string const& message)
    {
        throw BPDFExc(bpdf_e_signature, filename, "", 0, message);
    }

    BIO_ptr
    memory_bio(std::string const& data)
    {
        BIO_ptr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
        if (!bio) {
            throw std::runtime_error(openssl_errors("unable to create memory BIO"));
        }
        return bio;
    }

    // The signed content: the whole file except the /Contents string
    std::string
    signed_bytes(std::string const& data, size_t sign_start, size_t sign_end)
    {
        return data.substr(0, sign_start) + data.substr(sign_end);
    }

    std::string
    create_signature(
        std::string const& filename,
        BPDFSignature::SignOptions const& options,
        std::string const& content)
    {
        ERR_clear_error();
        auto p12_bio = memory_bio(options.pkcs12);
        PKCS12_ptr p12(d2i_PKCS12_bio(p12_bio.get(), nullptr));
        if (!p12) {
            signature_error(filename, openssl_errors("unable to read PKCS#12 data"));
        }
        EVP_PKEY* key_raw = nullptr;
        X509* cert_raw = nullptr;
        STACK_OF(X509)* chain_raw = nullptr;
        if (!PKCS12_parse(
                p12.get(), options.pkcs12_password.c_str(), &key_raw, &cert_raw, &chain_raw)) {
            signature_error(
                filename, openssl_errors("unable to parse PKCS#12 data; wrong password?"));
        }
        EVP_PKEY_ptr key(key_raw);
        X509_ptr cert(cert_raw);
        X509_chain_ptr chain(chain_raw);
        if (!key || !cert) {
            signature_error(filename, "PKCS#12 data must contain a private key and a certificate");
        }

        int flags = PKCS7_DETACHED | PKCS7_BINARY | PKCS7_NOSMIMECAP | PKCS7_PARTIAL;
        PKCS7_ptr p7(PKCS7_sign(nullptr, nullptr, nullptr, nullptr, flags));
        if (!p7 || !PKCS7_sign_add_signer(p7.get(), cert.get(), key.get(), EVP_sha256(), flags)) {
            signature_error(filename, openssl_errors("unable to set up PKCS#7 signature"));
        }
        for (int i = 0; chain && i < sk_X509_num(chain.get()); ++i) {
            if (!PKCS7_add_certificate(p7.get(), sk_X509_value(chain.get(), i))) {
                signature_error(filename, openssl_errors("unable to add certificate chain"));
            }
        }
        auto content_bio = memory_bio(content);
        if (!PKCS7_final(p7.get(), content_bio.get(), flags)) {
            signature_error(filename, openssl_errors("unable to compute PKCS#7 signature"));
        }

        unsigned char* der = nullptr;
        int len = i2d_PKCS7(p7.get(), &der);
        if (len < 0) {
            signature_error(filename, openssl_errors("unable to encode PKCS#7 signature"));
        }
        std::string result(reinterpret_cast<char*>(der), static_cast<size_t>(len));
        OPENSSL_free(der);
        return result;
    }

    // Return an error message, or an empty string if the signature is good
    std::string
    check_signature(std::string const& der, std::string const& content)
    {
        ERR_clear_error();
        auto const* p = reinterpret_cast<unsigned char const*>(der.data());
        PKCS7_ptr p7(d2i_PKCS7(nullptr, &p, static_cast<long>(der.size())));
        if (!p7) {
            return openssl_errors("signature is not valid PKCS#7 data");
        }
        if (!PKCS7_type_is_signed(p7.get())) {
            return "PKCS#7 data is not of type signed-data";
        }
        X509_STORE_ptr store(X509_STORE_new());
        auto content_bio = memory_bio(content);
        if (PKCS7_verify(
                p7.get(),
                nullptr,
                store.get(),
                content_bio.get(),
                nullptr,
                PKCS7_NOVERIFY | PKCS7_BINARY) != 1) {
            return openssl_errors("signature does not match the document");
        }
        return "";
    }

    std::string
    unique_field_name(BPDFObjectHandle fields)
    {
        std::set<std::string> names;
        for (auto const& field: fields.getArrayAsVector()) {
            if (field.getKey("T").isString()) {
                names.insert(field.getKey("T").getUTF8Value());
            }
        }
        for (int i = 1;; ++i) {
            auto candidate = "Signature" + std::to_string(i);
            if (!names.count(candidate)) {
                return candidate;
            }
        }
    }

    void
    find_signature_fields(
        BPDFObjectHandle field,
        std::string const& inherited_type,
        BPDFObjGen::set& seen,
        std::vector<BPDFObjectHandle>& result)
    {
        if (!field.isDictionary() || (field.isIndirect() && !seen.add(field.getObjGen()))) {
            return;
        }
        auto type = field.getKey("FT").isName() ? field.getKey("FT").getName() : inherited_type;
        auto kids = field.getKey("Kids");
        if (kids.isArray()) {
            for (auto const& kid: kids.getArrayAsVector()) {
                find_signature_fields(kid, type, seen, result);
            }
        }
        if (type == "Sig" && field.getKey("V").isDictionary()) {
            result.push_back(field);
        }
    }
} // namespace

std::string
BPDFSignature::sign(BPDF& pdf, SignOptions const& options)
{
    auto const& pages = pdf.getAllPages();
    if (pages.empty()) {
        throw BPDFExc(bpdf_e_pages, pdf.getFilename(), "", 0, "document has no pages to sign");
    }
    if (options.reservation == 0) {
        throw std::logic_error("BPDFSignature::sign called with no space reserved");
    }

    auto sig = pdf.makeIndirectObject(BPDFObjectHandle::newDictionary());
    sig.replaceKey("Type", BPDFObjectHandle::newName("Sig"));
    sig.replaceKey("Filter", BPDFObjectHandle::newName("Adobe.PPKLite"));
    sig.replaceKey("SubFilter", BPDFObjectHandle::newName("adbe.pkcs7.detached"));
    sig.replaceKey(
        "M",
        BPDFObjectHandle::newString(
            BUtil::bpdf_time_to_pdf_time(BUtil::get_current_bpdf_time())));
    if (!options.name.empty()) {
        sig.replaceKey("Name", BPDFObjectHandle::newUnicodeString(options.name));
    }
    if (!options.reason.empty()) {
        sig.replaceKey("Reason", BPDFObjectHandle::newUnicodeString(options.reason));
    }
    // Placeholders replaced by the writer
    auto zero = BPDFObjectHandle::newInteger(0);
    sig.replaceKey("ByteRange", BPDFObjectHandle::newArray({zero, zero, zero, zero}));
    sig.replaceKey("Contents", BPDFObjectHandle::newString(""));

    auto root = pdf.getRoot();
    auto acroform = root.getKey("AcroForm");
    if (!acroform.isDictionary()) {
        acroform = pdf.makeIndirectObject(BPDFObjectHandle::newDictionary());
        root.replaceKey("AcroForm", acroform);
    }
    auto fields = acroform.getKey("Fields");
    if (!fields.isArray()) {
        fields = BPDFObjectHandle::newArray();
        acroform.replaceKey("Fields", fields);
    }
    // SignaturesExist | AppendOnly
    acroform.replaceKey("SigFlags", BPDFObjectHandle::newInteger(3));

    auto page = pages.front();
    auto field = pdf.makeIndirectObject(BPDFObjectHandle::newDictionary());
    field.replaceKey("FT", BPDFObjectHandle::newName("Sig"));
    field.replaceKey("T", BPDFObjectHandle::newUnicodeString(unique_field_name(fields)));
    field.replaceKey("V", sig);
    field.replaceKey("Type", BPDFObjectHandle::newName("Annot"));
    field.replaceKey("Subtype", BPDFObjectHandle::newName("Widget"));
    // Print | Locked; the zero-sized rectangle makes the signature invisible.
    field.replaceKey("F", BPDFObjectHandle::newInteger(132));
    field.replaceKey("Rect", BPDFObjectHandle::newArray(BPDFObjectHandle::Rectangle(0, 0, 0, 0)));
    field.replaceKey("P", page);
    fields.appendItem(field);

    auto annots = page.getKey("Annots");
    if (!annots.isArray()) {
        annots = BPDFObjectHandle::newArray();
        page.replaceKey("Annots", annots);
    }
    annots.appendItem(field);
    pdf.requirePDFVersion("1.6");

    // Phase 1: lay out the file with placeholders.
    BPDFWriter w(pdf);
    w.setOutputMemory();
    w.setSignatureDictionary(sig, options.reservation);
    w.write();
    auto data = w.getOutputString();
    auto layout = w.getSignatureLayout();

    // Phase 2: fill in the byte ranges and the signature without moving anything.
    auto sign_start = static_cast<size_t>(layout.contents_offset);
    auto sign_end = sign_start + layout.contents_length;
    std::string ranges = "[0 " + std::to_string(sign_start) + " " + std::to_string(sign_end) +
        " " + std::to_string(data.size() - sign_end);
    if (ranges.size() + 1 > layout.byte_range_length) {
        signature_error(pdf.getFilename(), "not enough space reserved for /ByteRange");
    }
    ranges += std::string(layout.byte_range_length - ranges.size() - 1, ' ') + "]";
    data.replace(static_cast<size_t>(layout.byte_range_offset), ranges.size(), ranges);

    auto der =
        create_signature(pdf.getFilename(), options, signed_bytes(data, sign_start, sign_end));
    if (2 * der.size() > layout.contents_length - 2) {
        signature_error(
            pdf.getFilename(),
            "not enough space reserved for the signature: need " + std::to_string(der.size()) +
                " bytes, have " + std::to_string(options.reservation));
    }
    auto hex = BUtil::hex_encode(der);
    data.replace(sign_start + 1, hex.size(), hex);
    return data;
}

std::vector<BPDFSignature::Info>
BPDFSignature::verify(std::string const& data, std::string const& password)
{
    std::vector<Info> result;
    BPDF pdf;
    pdf.setSuppressWarnings(true);
    pdf.processMemoryFile("signed file", data, password.c_str());

    std::vector<BPDFObjectHandle> fields;
    BPDFObjGen::set seen;
    auto acroform = pdf.getRoot().getKey("AcroForm");
    for (auto const& field: acroform.getKey("Fields").getArrayAsVector()) {
        find_signature_fields(field, "", seen, fields);
    }

    for (auto const& field: fields) {
        Info info;
        auto sig = field.getKey("V");
        if (field.getKey("T").isString()) {
            info.field_name = field.getKey("T").getUTF8Value();
        }
        if (sig.getKey("Name").isString()) {
            info.signer_name = sig.getKey("Name").getUTF8Value();
        }
        if (sig.getKey("Reason").isString()) {
            info.reason = sig.getKey("Reason").getUTF8Value();
        }
        if (sig.getKey("M").isString()) {
            info.signing_time = sig.getKey("M").getUTF8Value();
        }
        result.push_back(info);
        auto& current = result.back();

        auto byte_range = sig.getKey("ByteRange");
        long long r[4] = {0, 0, 0, 0};
        bool ok = byte_range.isArray() && byte_range.getArrayNItems() == 4;
        for (int i = 0; ok && i < 4; ++i) {
            auto item = byte_range.getArrayItem(i);
            ok = item.isInteger() && item.getIntValue() >= 0;
            if (ok) {
                r[i] = item.getIntValue();
            }
        }
        if (!ok) {
            current.message = "/ByteRange is not an array of four non-negative integers";
            continue;
        }
        auto size = static_cast<long long>(data.size());
        if (!(r[0] == 0 && r[1] > 0 && r[2] > r[1] + 1 && r[2] + r[3] == size)) {
            current.message = "/ByteRange does not cover the whole file except the signature";
            continue;
        }
        auto sign_start = static_cast<size_t>(r[1]);
        auto sign_end = static_cast<size_t>(r[2]);
        if (data.at(sign_start) != '<' || data.at(sign_end - 1) != '>') {
            current.message = "the excluded byte range is not a hexadecimal string";
            continue;
        }
        auto hex = data.substr(sign_start + 1, sign_end - sign_start - 2);
        bool all_hex = true;
        for (char ch: hex) {
            all_hex = all_hex && BUtil::is_hex_digit(ch);
        }
        auto contents = sig.getKey("Contents");
        if (!all_hex || !contents.isString() ||
            BUtil::hex_decode(hex) != contents.getStringValue()) {
            current.message = "the excluded byte range is not the signature's /Contents";
            continue;
        }
        current.message =
            check_signature(contents.getStringValue(), signed_bytes(data, sign_start, sign_end));
        if (current.message.empty()) {
            current.status = s_valid;
        }
    }
    return result;
}

BPDFSignature::status_e
BPDFSignature::overallStatus(std::vector<Info> const& infos)
{
    if (infos.empty()) {
        return s_no_signature;
    }
    for (auto const& info: infos) {
        if (info.status != s_valid) {
            return s_invalid;
        }
    }
    return s_valid;
}

char const*
BPDFSignature::statusName(status_e status)
{
    switch (status) {
    case s_valid:
        return "Valid";
    case s_invalid:
        return "Invalid";
    case s_no_signature:
        return "NoSignature";
    }
    return "Invalid";
}
