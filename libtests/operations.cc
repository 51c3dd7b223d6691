#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>

#include <iostream>
#include <set>

static bpdf_error_code_e
validate_error(bpdf_operation_e op, std::map<std::string, std::string> const& values)
{
    try {
        BPDFOperation::create(op, BPDFEngineConfig())->validate(values);
    } catch (BPDFExc& e) {
        return e.getErrorCode();
    }
    return bpdf_e_success;
}

static bool
contains(std::string const& haystack, std::string const& needle)
{
    return haystack.find(needle) != std::string::npos;
}

static void
test_operation_table()
{
    auto all = BPDFOperation::getAllOperations();
    assert(all.size() == 19);
    std::set<std::string> names;
    for (auto op: all) {
        std::string name = BPDFOperation::getOperationName(op);
        assert(names.insert(name).second);
        bpdf_operation_e parsed = bpdf_op_info;
        assert(BPDFOperation::parseOperationName(name, parsed));
        assert(parsed == op);

        auto operation = BPDFOperation::create(op, BPDFEngineConfig());
        assert(operation->getType() == op);
        assert(name == operation->getName());
        assert(!operation->getDescription().empty());
        std::set<std::string> params;
        for (auto const& spec: operation->getParameterSpecs()) {
            assert(params.insert(spec.name).second);
            assert(!spec.help.empty());
            if (spec.type == BPDFOperation::pt_choice) {
                assert(!spec.choices.empty());
            }
        }
    }
    bpdf_operation_e op = bpdf_op_merge;
    assert(!BPDFOperation::parseOperationName("concatenate", op));
    assert(op == bpdf_op_merge);
    assert(
        std::string(BPDFOperation::getOperationName(bpdf_op_extract_images)) == "extract-images");
}

static void
test_validate()
{
    auto rotate = BPDFOperation::create(bpdf_op_rotate, BPDFEngineConfig());
    auto params = rotate->validate({});
    assert(params.getInteger("angle") == 90);
    assert(params.getBoolean("relative"));
    assert(params.has("pages") && params.getString("pages").empty());
    params = rotate->validate({{"angle", "-270"}, {"relative", "off"}, {"pages", "r1"}});
    assert(params.getInteger("angle") == -270);
    assert(!params.getBoolean("relative"));

    // Optional parameters without a default are absent.
    auto sign = BPDFOperation::create(bpdf_op_sign, BPDFEngineConfig());
    params = sign->validate({{"pkcs12", "key.p12"}});
    assert(!params.has("reason"));
    assert(params.getInteger("reservation") == 4096);
    try {
        params.getString("reason");
        assert(false);
    } catch (std::logic_error&) {
    }

    auto watermark = BPDFOperation::create(bpdf_op_watermark, BPDFEngineConfig());
    params = watermark->validate({{"text", "X"}, {"opacity", "0.5"}});
    assert(params.getNumber("opacity") == 0.5);
    assert(params.getNumber("font-size") == 50.0);

    auto reorder = BPDFOperation::create(bpdf_op_reorder, BPDFEngineConfig());
    params = reorder->validate({{"order", "2,,1"}});
    assert(params.getList("order") == std::vector<std::string>({"2", "1"}));

    // The configured quality tier is the default.
    BPDFEngineConfig config;
    config.quality = BPDFEngineConfig::q_high;
    params = BPDFOperation::create(bpdf_op_compress, config)->validate({});
    assert(params.getString("quality") == "high");

    assert(validate_error(bpdf_op_rotate, {{"angel", "90"}}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_rotate, {{"angle", "ninety"}}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_rotate, {{"angle", "90.5"}}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_rotate, {{"relative", "maybe"}}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_rotate, {{"pages", "1-x"}}) == bpdf_e_invalid_range);
    assert(
        validate_error(bpdf_op_watermark, {{"text", "X"}, {"opacity", "lots"}}) ==
        bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_encrypt, {{"algorithm", "rc4-40"}}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_watermark, {}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_add_image, {{"image", ""}}) == bpdf_e_invalid_parameter);
    assert(validate_error(bpdf_op_verify, {{"password", "x"}}) == bpdf_e_invalid_parameter);
}

static void
test_input_counts()
{
    auto check = [](bpdf_operation_e op, size_t count) {
        try {
            BPDFOperation::create(op, BPDFEngineConfig())->checkInputCount(count);
        } catch (BPDFExc& e) {
            return e.getErrorCode();
        }
        return bpdf_e_success;
    };
    assert(check(bpdf_op_merge, 0) == bpdf_e_empty_input);
    assert(check(bpdf_op_rotate, 0) == bpdf_e_empty_input);
    assert(check(bpdf_op_merge, 1) == bpdf_e_success);
    assert(check(bpdf_op_merge, 50) == bpdf_e_success);
    assert(check(bpdf_op_rotate, 2) == bpdf_e_invalid_parameter);
    assert(check(bpdf_op_info, 2) == bpdf_e_success);
    assert(check(bpdf_op_info, 3) == bpdf_e_invalid_parameter);
}

static void
test_metadata()
{
    auto pdf = make_sample_pdf(1, "Old title");
    auto info = pdf->getInfo();
    info.replaceKey("Producer", BPDFObjectHandle::newString("some tool"));
    info.replaceKey("Creator", BPDFObjectHandle::newString("some app"));
    info.replaceKey("Subject", BPDFObjectHandle::newString("a subject"));
    auto data = write_pdf(*pdf);

    auto result = run_operation(
        bpdf_op_metadata,
        {{"in.pdf", data}},
        {{"set-Title", "Gr\xc3\xbc\xc3\x9f" "e \xe2\x98\x83"},
         {"set-Author", "Ann Author"},
         {"set-Subject", ""},
         {"remove", "Producer,/Creator,Missing"}});
    auto out = reread_output(result)->getInfo();
    assert(out.getKey("Title").getUTF8Value() == "Gr\xc3\xbc\xc3\x9f" "e \xe2\x98\x83");
    assert(out.getKey("Author").getUTF8Value() == "Ann Author");
    assert(!out.hasKey("Subject"));
    assert(!out.hasKey("Producer"));
    assert(!out.hasKey("Creator"));
    assert(out.getKey("ModDate").getUTF8Value().substr(0, 2) == "D:");

    result = run_operation(bpdf_op_metadata, {{"in.pdf", data}}, {{"update-mod-date", "false"}});
    out = reread_output(result)->getInfo();
    assert(!out.hasKey("ModDate"));
    assert(out.getKey("Title").getUTF8Value() == "Old title");

    // A document without an information dictionary gets one.
    auto bare = BPDF::create();
    bare->emptyPDF();
    result = run_operation(
        bpdf_op_metadata, {{"in.pdf", write_pdf(*bare)}}, {{"set-Keywords", "alpha, beta"}});
    assert(reread_output(result)->getInfo().getKey("Keywords").getUTF8Value() == "alpha, beta");

    assert(validate_error(bpdf_op_metadata, {{"set-Colour", "red"}}) == bpdf_e_invalid_parameter);
}

static void
test_repair()
{
    auto data = write_pdf(*make_sample_pdf(3));
    auto broken = data;
    auto pos = broken.rfind("startxref");
    broken = broken.substr(0, pos) + "startxref\n12\n%%EOF\n";

    // Reading normally recovers too, with warnings.
    auto damaged = read_pdf(broken);
    assert(damaged->wasReconstructed());

    auto result = run_operation(bpdf_op_repair, {{"broken.pdf", broken}});
    auto repaired_data = BPDFOperation::writeOutput(result.outputs.at(0));
    auto repaired = read_pdf(repaired_data);
    assert(!repaired->wasReconstructed());
    assert(repaired->getWarnings().empty());
    assert(page_texts(*repaired) == std::vector<std::string>({"Page 1", "Page 2", "Page 3"}));

    // A file that isn't damaged is still rebuilt from a scan.
    result = run_operation(bpdf_op_repair, {{"good.pdf", data}});
    assert(reread_output(result)->getAllPages().size() == 3);

    auto check_unrecoverable = [](std::string const& input) {
        try {
            run_operation(bpdf_op_repair, {{"bad.pdf", input}});
            assert(false);
        } catch (BPDFExc& e) {
            assert(e.getErrorCode() == bpdf_e_unrecoverable);
        }
    };
    check_unrecoverable("this is not a PDF file at all\n");
    auto empty = BPDF::create();
    empty->emptyPDF();
    check_unrecoverable(write_pdf(*empty));
}

static void
test_info()
{
    auto first = make_sample_pdf(2, "Report");
    BPDFPageObjectHelper(first->getAllPages().at(1)).rotatePage(90, false);
    auto first_data = write_pdf(*first);
    auto result = run_operation(bpdf_op_info, {{"report.pdf", first_data}});
    assert(result.outputs.empty());
    assert(result.artifacts.size() == 1);
    assert(result.artifacts.at(0).suffix == ".txt");
    auto report = result.artifacts.at(0).data;
    assert(report.substr(0, 17) == "file: report.pdf\n");
    assert(contains(report, "size: " + std::to_string(first_data.size()) + " bytes\n"));
    assert(contains(report, "version: 1.3\n"));
    assert(contains(report, "encrypted: no\n"));
    assert(contains(report, "pages: 2\n"));
    assert(contains(report, "info /Title: Report\n"));
    assert(contains(report, "signatures: none\n"));
    assert(contains(report, "page 1: 612 x 792, rotation 0\n"));
    assert(contains(report, "page 2: 612 x 792, rotation 90\n"));
    assert(contains(report, "valid: yes\n"));
    assert(!contains(report, "comparison:"));
    assert(result.warnings.empty());

    auto second_data = write_pdf(*make_sample_pdf(3, "Other"));
    result = run_operation(bpdf_op_info, {{"report.pdf", first_data}, {"other.pdf", second_data}});
    report = result.artifacts.at(0).data;
    assert(contains(report, "\nfile: other.pdf\n"));
    assert(contains(report, "comparison:\n"));
    assert(contains(report, "  page counts match: no\n"));
    assert(contains(report, "  /Title differs: Report | Other\n"));
    assert(contains(report, "  text identical: no\n"));

    result = run_operation(bpdf_op_info, {{"a.pdf", first_data}, {"b.pdf", first_data}});
    report = result.artifacts.at(0).data;
    assert(contains(report, "  page counts match: yes\n"));
    assert(!contains(report, "differs"));
    assert(contains(report, "  text identical: yes\n"));

    // Damage is reported as a problem rather than an error.
    auto broken = first_data.substr(0, first_data.rfind("startxref")) + "startxref\n1\n%%EOF\n";
    result = run_operation(bpdf_op_info, {{"broken.pdf", broken}});
    assert(contains(result.artifacts.at(0).data, "valid: no\n"));
    assert(!result.warnings.empty());

    auto empty = BPDF::create();
    empty->emptyPDF();
    result = run_operation(bpdf_op_info, {{"empty.pdf", write_pdf(*empty)}});
    assert(contains(result.artifacts.at(0).data, "  document has no pages\n"));
}

int
main()
{
    test_operation_table();
    test_validate();
    test_input_counts();
    test_metadata();
    test_repair();
    test_info();
    std::cout << "operation tests done" << std::endl;
    return 0;
}
