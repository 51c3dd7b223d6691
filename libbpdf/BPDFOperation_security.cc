#include <bpdf/BPDFOperation_private.hh>

#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFSignature.hh>
#include <bpdf/BUtil.hh>

using namespace bpdf_op;

namespace
{
    class EncryptOperation: public BPDFOperation
    {
      public:
        EncryptOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_encrypt, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "encrypt with the standard security handler";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                param("user-password", pt_string, "", "password needed to open the file"),
                param(
                    "owner-password",
                    pt_string,
                    "",
                    "password that lifts restrictions; the user password if empty"),
                choice("algorithm", {"rc4-128", "aes-128", "aes-256"}, "aes-256", "cipher"),
                param("allow-print", pt_boolean, "true", "allow printing"),
                param("allow-copy", pt_boolean, "true", "allow copying text and graphics"),
                param("allow-modify", pt_boolean, "true", "allow changes to the document")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            auto const& algorithm = params.getString("algorithm");
            int R = (algorithm == "rc4-128") ? 3 : (algorithm == "aes-128") ? 4 : 6;

            unsigned int P = 0xfffffffc;
            if (!params.getBoolean("allow-print")) {
                P &= ~static_cast<unsigned int>(bpdf_perm_print | bpdf_perm_print_high);
            }
            if (!params.getBoolean("allow-copy")) {
                P &= ~static_cast<unsigned int>(bpdf_perm_copy);
            }
            if (!params.getBoolean("allow-modify")) {
                P &= ~static_cast<unsigned int>(
                    bpdf_perm_modify | bpdf_perm_annotate | bpdf_perm_fill_forms |
                    bpdf_perm_assemble);
            }

            auto const& user = params.getString("user-password");
            auto owner = params.getString("owner-password");
            if (owner.empty()) {
                owner = user;
            }
            input.pdf->setEncryption(user, owner, R, static_cast<int>(P));
            Result result;
            result.outputs.push_back({input.pdf});
            return result;
        }
    };

    class DecryptOperation: public BPDFOperation
    {
      public:
        DecryptOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_decrypt, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "remove encryption";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {param(
                "password", pt_string, "", "user or owner password; the engine password if empty")};
        }

        std::string
        getInputPassword(Parameters const& params) const override
        {
            if (params.has("password") && !params.getString("password").empty()) {
                return params.getString("password");
            }
            return config.password;
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const&) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            Result result;
            if (!input.pdf->isEncrypted()) {
                result.warnings.push_back(input.filename + ": file is not encrypted");
            }
            input.pdf->removeEncryption();
            result.outputs.push_back({input.pdf});
            return result;
        }
    };

    class SignOperation: public BPDFOperation
    {
      public:
        SignOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_sign, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "add a detached PKCS#7 signature";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {
                required("pkcs12", pt_path, "PKCS#12 file with the signing key and certificate"),
                param("pkcs12-password", pt_string, "", "password of the PKCS#12 file"),
                param("reason", pt_string, "", "reason for signing"),
                param("name", pt_string, "", "name of the signer"),
                param("reservation", pt_integer, "4096", "bytes reserved for the signature")};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            long long reservation = params.getInteger("reservation");
            if (reservation < 256 || reservation > 65536) {
                fail(
                    bpdf_e_invalid_parameter,
                    input.filename,
                    "reservation must be between 256 and 65536");
            }
            BPDFSignature::SignOptions options;
            options.pkcs12 = BUtil::read_file_into_string(params.getString("pkcs12").c_str());
            options.pkcs12_password =
                params.has("pkcs12-password") ? params.getString("pkcs12-password") : "";
            options.reason = params.has("reason") ? params.getString("reason") : "";
            options.name = params.has("name") ? params.getString("name") : "";
            options.reservation = static_cast<size_t>(reservation);

            Result result;
            BPDFOperation::Output out;
            out.data = BPDFSignature::sign(*input.pdf, options);
            result.outputs.push_back(out);
            return result;
        }
    };

    class VerifyOperation: public BPDFOperation
    {
      public:
        VerifyOperation(BPDFEngineConfig const& config) :
            BPDFOperation(bpdf_op_verify, config)
        {
        }

        std::string
        getDescription() const override
        {
            return "check signatures and write a report";
        }

        std::vector<ParameterSpec>
        getParameterSpecs() const override
        {
            return {};
        }

        Result
        apply(std::vector<Input>& inputs, Parameters const& params) override
        {
            checkInputCount(inputs.size());
            auto& input = inputs.front();
            auto infos = BPDFSignature::verify(input.data, getInputPassword(params));
            std::string report = std::string("status: ") +
                BPDFSignature::statusName(BPDFSignature::overallStatus(infos)) + "\n";
            for (auto const& info: infos) {
                report += "signature " + info.field_name + ": " +
                    BPDFSignature::statusName(info.status) + "\n";
                if (!info.message.empty()) {
                    report += "  problem: " + info.message + "\n";
                }
                if (!info.signer_name.empty()) {
                    report += "  signer: " + info.signer_name + "\n";
                }
                if (!info.reason.empty()) {
                    report += "  reason: " + info.reason + "\n";
                }
                if (!info.signing_time.empty()) {
                    report += "  time: " + info.signing_time + "\n";
                }
            }
            Result result;
            result.artifacts.push_back({".txt", report});
            return result;
        }
    };
} // namespace

std::unique_ptr<BPDFOperation>
bpdf_make_encrypt(BPDFEngineConfig const& config)
{
    return std::make_unique<EncryptOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_decrypt(BPDFEngineConfig const& config)
{
    return std::make_unique<DecryptOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_sign(BPDFEngineConfig const& config)
{
    return std::make_unique<SignOperation>(config);
}

std::unique_ptr<BPDFOperation>
bpdf_make_verify(BPDFEngineConfig const& config)
{
    return std::make_unique<VerifyOperation>(config);
}
