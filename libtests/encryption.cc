#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <iostream>

static std::string
encrypt(std::string const& data, std::map<std::string, std::string> const& values)
{
    return BPDFOperation::writeOutput(
        run_operation(bpdf_op_encrypt, {{"in.pdf", data}}, values).outputs.at(0));
}

static void
check_password_fails(std::string const& data, char const* password)
{
    try {
        read_pdf(data, password);
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_password);
    }
}

static void
test_algorithm(std::string const& algorithm, int expected_R)
{
    auto plain = write_pdf(*make_sample_pdf(2, "Secret title"));
    auto data = encrypt(
        plain,
        {{"user-password", "user"}, {"owner-password", "owner"}, {"algorithm", algorithm}});

    // Content streams must not survive in the clear.
    assert(data.find("(Page 1) Tj") == std::string::npos);
    assert(data.find("Secret title") == std::string::npos);

    auto as_user = read_pdf(data, "user");
    int R = 0;
    int P = 0;
    assert(as_user->isEncrypted(R, P));
    assert(R == expected_R);
    assert(as_user->userPasswordMatched());
    assert(!as_user->ownerPasswordMatched());
    assert(page_texts(*as_user) == std::vector<std::string>({"Page 1", "Page 2"}));
    assert(as_user->getInfo().getKey("Title").getUTF8Value() == "Secret title");

    auto as_owner = read_pdf(data, "owner");
    assert(as_owner->ownerPasswordMatched());
    assert(page_texts(*as_owner) == page_texts(*as_user));

    check_password_fails(data, "wrong");
    check_password_fails(data, nullptr);

    // Decrypting with either password gives an unencrypted file.
    BPDFEngineConfig config;
    config.password = "owner";
    auto decrypted = run_operation(bpdf_op_decrypt, {{"enc.pdf", data}}, {}, config);
    assert(decrypted.warnings.empty());
    auto clear = reread_output(decrypted);
    assert(!clear->isEncrypted());
    assert(page_texts(*clear) == std::vector<std::string>({"Page 1", "Page 2"}));

    auto with_param =
        run_operation(bpdf_op_decrypt, {{"enc.pdf", data}}, {{"password", "user"}});
    assert(!reread_output(with_param)->isEncrypted());
}

static void
test_permissions()
{
    auto plain = write_pdf(*make_sample_pdf(1));
    auto data = encrypt(
        plain,
        {{"owner-password", "owner"},
         {"allow-print", "false"},
         {"allow-modify", "no"},
         {"algorithm", "aes-128"}});

    // An empty user password opens the file without a password.
    auto pdf = read_pdf(data);
    int R = 0;
    int P = 0;
    assert(pdf->isEncrypted(R, P));
    assert((P & bpdf_perm_print) == 0);
    assert((P & bpdf_perm_print_high) == 0);
    assert((P & bpdf_perm_modify) == 0);
    assert((P & bpdf_perm_assemble) == 0);
    assert((P & bpdf_perm_copy) != 0);
    assert((P & bpdf_perm_accessibility) != 0);

    // The owner password defaults to the user password.
    auto same = encrypt(plain, {{"user-password", "pw"}});
    assert(read_pdf(same, "pw")->ownerPasswordMatched());
}

static void
test_errors()
{
    auto plain = write_pdf(*make_sample_pdf(1));
    try {
        run_operation(bpdf_op_encrypt, {{"in.pdf", plain}}, {{"algorithm", "des"}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_invalid_parameter);
    }

    auto data = encrypt(plain, {{"user-password", "user"}});
    try {
        run_operation(bpdf_op_decrypt, {{"enc.pdf", data}}, {{"password", "nope"}});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_password);
    }

    auto result = run_operation(bpdf_op_decrypt, {{"plain.pdf", plain}});
    assert(result.warnings.size() == 1);
    assert(result.warnings.at(0) == "plain.pdf: file is not encrypted");
}

int
main()
{
    test_algorithm("rc4-128", 3);
    test_algorithm("aes-128", 4);
    test_algorithm("aes-256", 6);
    test_permissions();
    test_errors();
    std::cout << "encryption tests done" << std::endl;
    return 0;
}
