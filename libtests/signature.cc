#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFSignature.hh>
#include <bpdf/BUtil.hh>

#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <iostream>

static char const* p12_file = "signature-test.p12";

// A PKCS#12 file with a fresh RSA key and a self-signed certificate
static std::string
make_pkcs12(char const* password)
{
    EVP_PKEY* key = EVP_RSA_gen(2048);
    assert(key);
    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert), 86400L);
    X509_set_pubkey(cert, key);
    X509_NAME* name = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(
        name, "CN", MBSTRING_ASC, reinterpret_cast<unsigned char const*>("bpdf test"), -1, -1, 0);
    X509_set_issuer_name(cert, name);
    assert(X509_sign(cert, key, EVP_sha256()) > 0);

    PKCS12* p12 = PKCS12_create(password, "bpdf test", key, cert, nullptr, 0, 0, 0, 0, 0);
    assert(p12);
    unsigned char* buf = nullptr;
    int len = i2d_PKCS12(p12, &buf);
    assert(len > 0);
    std::string result(reinterpret_cast<char*>(buf), static_cast<size_t>(len));
    OPENSSL_free(buf);
    PKCS12_free(p12);
    X509_free(cert);
    EVP_PKEY_free(key);
    return result;
}

static std::string
sign(std::string const& data, std::map<std::string, std::string> values)
{
    values["pkcs12"] = p12_file;
    return BPDFOperation::writeOutput(
        run_operation(bpdf_op_sign, {{"in.pdf", data}}, values).outputs.at(0));
}

static std::string
verify_report(std::string const& data)
{
    auto result = run_operation(bpdf_op_verify, {{"in.pdf", data}});
    assert(result.outputs.empty());
    assert(result.artifacts.size() == 1);
    assert(result.artifacts.at(0).suffix == ".txt");
    return result.artifacts.at(0).data;
}

static bpdf_error_code_e
sign_error(std::string const& data, std::map<std::string, std::string> const& values)
{
    try {
        sign(data, values);
    } catch (BPDFExc& e) {
        return e.getErrorCode();
    }
    return bpdf_e_success;
}

static void
test_sign_and_verify()
{
    auto plain = write_pdf(*make_sample_pdf(2));
    auto signed_data = sign(
        plain, {{"pkcs12-password", "secret"}, {"reason", "Approved"}, {"name", "Test Signer"}});

    auto infos = BPDFSignature::verify(signed_data);
    assert(infos.size() == 1);
    assert(infos.at(0).status == BPDFSignature::s_valid);
    assert(infos.at(0).message.empty());
    assert(infos.at(0).field_name == "Signature1");
    assert(infos.at(0).signer_name == "Test Signer");
    assert(infos.at(0).reason == "Approved");
    assert(infos.at(0).signing_time.substr(0, 2) == "D:");
    assert(BPDFSignature::overallStatus(infos) == BPDFSignature::s_valid);

    // Signing leaves the pages alone.
    assert(page_texts(*read_pdf(signed_data)) == page_texts(*read_pdf(plain)));

    auto report = verify_report(signed_data);
    assert(report.substr(0, 14) == "status: Valid\n");
    assert(report.find("signature Signature1: Valid\n") != std::string::npos);
    assert(report.find("  signer: Test Signer\n") != std::string::npos);
    assert(report.find("  reason: Approved\n") != std::string::npos);

    // Any change to a signed byte breaks the signature.
    auto tampered = signed_data;
    assert(tampered.substr(0, 7) == "%PDF-1.");
    tampered[7] = (tampered[7] == '7') ? '6' : '7';
    infos = BPDFSignature::verify(tampered);
    assert(infos.size() == 1);
    assert(infos.at(0).status == BPDFSignature::s_invalid);
    assert(!infos.at(0).message.empty());
    assert(verify_report(tampered).substr(0, 16) == "status: Invalid\n");

    // Appending data leaves part of the file outside the signed ranges.
    infos = BPDFSignature::verify(signed_data + "\n% trailing comment\n");
    assert(infos.at(0).status == BPDFSignature::s_invalid);

    infos = BPDFSignature::verify(plain);
    assert(infos.empty());
    assert(BPDFSignature::overallStatus(infos) == BPDFSignature::s_no_signature);
    assert(verify_report(plain) == "status: NoSignature\n");
}

static void
test_errors()
{
    auto plain = write_pdf(*make_sample_pdf(1));
    assert(sign_error(plain, {{"pkcs12-password", "wrong"}}) == bpdf_e_signature);
    assert(
        sign_error(plain, {{"pkcs12-password", "secret"}, {"reservation", "100"}}) ==
        bpdf_e_invalid_parameter);
    // Too small for an RSA-2048 signature with its certificate
    assert(
        sign_error(plain, {{"pkcs12-password", "secret"}, {"reservation", "256"}}) ==
        bpdf_e_signature);

    auto empty = BPDF::create();
    empty->emptyPDF();
    assert(sign_error(write_pdf(*empty), {{"pkcs12-password", "secret"}}) == bpdf_e_pages);

    try {
        run_operation(bpdf_op_sign, {{"in.pdf", plain}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_invalid_parameter);
    }
}

int
main()
{
    BUtil::write_string_to_file(p12_file, make_pkcs12("secret"));
    test_sign_and_verify();
    test_errors();
    BUtil::remove_file(p12_file);
    std::cout << "signature tests done" << std::endl;
    return 0;
}
