#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFBatchProcessor.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFLogger.hh>
#include <bpdf/BPDFUsage.hh>
#include <bpdf/BUtil.hh>

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace
{
    std::vector<std::string> created;

    void
    cleanup()
    {
        for (auto const& path: created) {
            if (BUtil::file_can_be_opened(path.c_str())) {
                BUtil::remove_file(path.c_str());
            }
        }
        created.clear();
    }

    std::string
    make_input(std::string const& name, int npages)
    {
        BUtil::write_string_to_file(name.c_str(), write_pdf(*make_sample_pdf(npages)));
        created.push_back(name);
        return name;
    }

    BPDFBatchJob
    job(bpdf_operation_e op,
        std::vector<std::string> const& inputs,
        std::map<std::string, std::string> const& parameters = {},
        std::string const& output = "")
    {
        BPDFBatchJob j;
        j.operation = op;
        j.inputs = inputs;
        j.parameters = parameters;
        j.output = output;
        return j;
    }

    void
    track(std::vector<BPDFBatchJob> const& jobs)
    {
        for (auto const& j: jobs) {
            created.insert(created.end(), j.outputs.begin(), j.outputs.end());
        }
    }
} // namespace

static void
test_isolation(BPDFEngineConfig const& config, std::ostringstream& err)
{
    std::vector<BPDFBatchJob> jobs;
    for (int i = 1; i <= 5; ++i) {
        auto name = "batch-in-" + std::to_string(i) + ".pdf";
        if (i != 3) {
            make_input(name, i);
        }
        jobs.push_back(job(bpdf_op_rotate, {name}));
    }
    BPDFBatchProcessor bp(config);
    auto results = bp.wait(bp.submit(jobs));
    track(results);
    assert(results.size() == 5);
    for (size_t i = 0; i < results.size(); ++i) {
        auto const& r = results.at(i);
        if (i == 2) {
            assert(r.status == bpdf_js_failed);
            assert(r.error_code == bpdf_e_system);
            assert(r.outputs.empty());
        } else {
            assert(r.status == bpdf_js_succeeded);
            assert(r.error_code == bpdf_e_success);
            assert(r.outputs == std::vector<std::string>({"./rotate_" + r.inputs.front()}));
            auto pdf = read_pdf(BUtil::read_file_into_string(r.outputs.front().c_str()));
            assert(pdf->getAllPages().size() == i + 1);
        }
    }
    assert(err.str().find("bpdf: rotate batch-in-3.pdf: ") != std::string::npos);
    assert(err.str().find("[IoFailure]") != std::string::npos);

    // Existing outputs are kept and new ones get a numbered name.
    auto again = bp.wait(bp.submit({jobs.at(0)}));
    track(again);
    assert(again.at(0).outputs == std::vector<std::string>({"./rotate_batch-in-1-1.pdf"}));

    auto overwrite_config = config;
    overwrite_config.overwrite = true;
    BPDFBatchProcessor overwriting(overwrite_config);
    again = overwriting.wait(overwriting.submit({jobs.at(0)}));
    assert(again.at(0).outputs == std::vector<std::string>({"./rotate_batch-in-1.pdf"}));
    cleanup();
}

static void
test_output_naming(BPDFEngineConfig const& config)
{
    auto in = make_input("batch-six.pdf", 6);
    BPDFBatchProcessor bp(config);
    auto results = bp.wait(bp.submit(
        {job(bpdf_op_split, {in}, {{"every", "3"}}, "batch-part.pdf"),
         job(bpdf_op_extract_text, {in}, {}, "batch-text.pdf"),
         job(bpdf_op_merge, {in, in}, {}, "batch-merged.pdf"),
         job(bpdf_op_info, {in})}));
    track(results);
    for (auto const& r: results) {
        assert(r.status == bpdf_js_succeeded);
    }
    assert(
        results.at(0).outputs ==
        std::vector<std::string>({"batch-part-1.pdf", "batch-part-2.pdf"}));
    assert(results.at(1).outputs == std::vector<std::string>({"batch-text.txt"}));
    assert(BUtil::read_file_into_string("batch-text.txt").substr(0, 7) == "Page 1\f");
    auto merged = read_pdf(BUtil::read_file_into_string("batch-merged.pdf"));
    assert(merged->getAllPages().size() == 12);
    assert(results.at(3).outputs == std::vector<std::string>({"./info_batch-six.txt"}));
    cleanup();
}

static void
test_validation(BPDFEngineConfig const& config)
{
    auto in = make_input("batch-valid.pdf", 2);
    BPDFBatchProcessor bp(config);
    auto handle = bp.submit(
        {job(bpdf_op_rotate, {in}, {{"angel", "90"}}),
         job(bpdf_op_merge, {}),
         job(bpdf_op_rotate, {in, in}),
         job(bpdf_op_rotate, {in}, {{"angle", "45"}}),
         job(bpdf_op_extract_text, {in}, {{"ocr", "true"}})});
    // Parameter errors are known as soon as the batch is submitted.
    auto early = bp.poll(handle);
    assert(early.at(0).status == bpdf_js_failed);
    assert(early.at(0).error_code == bpdf_e_invalid_parameter);
    assert(early.at(1).status == bpdf_js_failed);
    assert(early.at(1).error_code == bpdf_e_empty_input);
    assert(early.at(2).error_code == bpdf_e_invalid_parameter);

    auto results = bp.wait(handle);
    track(results);
    assert(results.at(3).status == bpdf_js_failed);
    assert(results.at(3).error_code == bpdf_e_invalid_angle);
    assert(results.at(4).status == bpdf_js_failed);
    assert(results.at(4).error_code == bpdf_e_ocr_unavailable);
    for (auto const& r: results) {
        assert(r.outputs.empty());
    }

    try {
        bp.poll(handle + 100);
        assert(false);
    } catch (std::logic_error&) {
    }
    cleanup();
}

static void
test_cancel(BPDFEngineConfig config)
{
    config.max_jobs = 1;
    auto in = make_input("batch-cancel.pdf", 20);
    std::vector<BPDFBatchJob> jobs;
    for (int i = 0; i < 30; ++i) {
        jobs.push_back(job(bpdf_op_compress, {in}, {}, "batch-cancel-out.pdf"));
    }
    BPDFBatchProcessor bp(config);
    auto handle = bp.submit(jobs);
    bp.cancel(handle);
    auto results = bp.wait(handle);
    track(results);
    int skipped = 0;
    for (auto const& r: results) {
        assert(r.status == bpdf_js_succeeded || r.status == bpdf_js_skipped);
        if (r.status == bpdf_js_skipped) {
            assert(r.outputs.empty());
            ++skipped;
        }
    }
    // At most one job can have started on the single worker before cancel.
    assert(skipped >= 29);
    cleanup();
}

static void
test_parse_jobs()
{
    auto jobs = BPDFBatchProcessor::parseJobs(
        "# comment line\n"
        "\n"
        "merge out.pdf a.pdf,b.pdf bookmarks=true\n"
        "  rotate\t-   scan.pdf angle=180 pages=1-3\r\n"
        "watermark - c.pdf text=DRAFT=1\n",
        "jobs.txt");
    assert(jobs.size() == 3);
    assert(jobs.at(0).operation == bpdf_op_merge);
    assert(jobs.at(0).output == "out.pdf");
    assert(jobs.at(0).inputs == std::vector<std::string>({"a.pdf", "b.pdf"}));
    assert(jobs.at(0).parameters.at("bookmarks") == "true");
    assert(jobs.at(1).operation == bpdf_op_rotate);
    assert(jobs.at(1).output.empty());
    assert(jobs.at(1).parameters.size() == 2);
    assert(jobs.at(1).parameters.at("pages") == "1-3");
    assert(jobs.at(2).parameters.at("text") == "DRAFT=1");

    for (auto const& bad:
         {"rotate out.pdf\n",
          "spin out.pdf in.pdf\n",
          "rotate - in.pdf angle\n",
          "rotate - in.pdf =9\n"}) {
        try {
            BPDFBatchProcessor::parseJobs(std::string("# first\n") + bad, "jobs.txt");
            assert(false);
        } catch (BPDFUsage& e) {
            assert(std::string(e.what()).substr(0, 11) == "jobs.txt:2:");
        }
    }
}

static void
test_run_job(BPDFEngineConfig const& config)
{
    auto in = make_input("batch-direct.pdf", 3);
    auto j = job(bpdf_op_reorder, {in}, {{"order", "3,2,1"}}, "batch-direct-out.pdf");
    BPDFBatchProcessor::runJob(j, config);
    track({j});
    assert(j.status == bpdf_js_succeeded);
    auto pdf = read_pdf(BUtil::read_file_into_string("batch-direct-out.pdf"));
    assert(page_texts(*pdf) == std::vector<std::string>({"Page 3", "Page 2", "Page 1"}));

    // No temporary files are left next to the output.
    j.parameters["order"] = "1,1,2";
    BPDFBatchProcessor::runJob(j, config);
    assert(j.status == bpdf_js_failed);
    assert(j.error_code == bpdf_e_invalid_permutation);
    assert(j.outputs.empty());
    assert(!BUtil::file_can_be_opened("batch-direct-out-1.pdf"));
    cleanup();
}

int
main()
{
    std::ostringstream out;
    std::ostringstream err;
    BPDFEngineConfig config;
    config.logger = BPDFLogger::create();
    config.logger->setOutputStreams(&out, &err);

    test_isolation(config, err);
    test_output_naming(config);
    test_validation(config);
    test_cancel(config);
    test_parse_jobs();
    test_run_job(config);
    std::cout << "batch tests done" << std::endl;
    return 0;
}
