// Copyright (c) 2024-2026 The bpdf authors
//
// This file is part of bpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BPDFBATCHPROCESSOR_HH
#define BPDFBATCHPROCESSOR_HH

#include <bpdf/Constants.h>
#include <bpdf/DLL.h>

#include <bpdf/BPDFEngineConfig.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

// One operation applied to one set of input files. The first group of fields is filled in by
// the caller; the rest is filled in by the batch processor and doesn't change after the job
// reaches a terminal status (succeeded, failed or skipped).
struct BPDFBatchJob
{
    std::vector<std::string> inputs;
    bpdf_operation_e operation{bpdf_op_info};
    std::map<std::string, std::string> parameters;
    // Path of the output file. If empty, <output_dir>/<operation>_<first input's name> is
    // used. Operations that produce several documents number them as <stem>-<n><extension>,
    // and artifacts are written to <stem><artifact suffix>.
    std::string output;

    bpdf_job_status_e status{bpdf_js_pending};
    // For failed jobs
    bpdf_error_code_e error_code{bpdf_e_success};
    std::string error;
    std::vector<std::string> warnings;
    // Files that were written
    std::vector<std::string> outputs;
};

// Runs batches of jobs on two pools of worker threads: jobs that need text recognition run on
// the OCR pool and all others on the structural pool, so slow recognition never holds up other
// work. Each job reads its own inputs and owns its documents. A job that fails is marked as
// failed and doesn't affect any other job.
//
// Output files appear atomically: data is written to a temporary file in the target directory,
// which is then renamed. Unless config.overwrite is set, an existing file is never replaced;
// name.pdf becomes name-1.pdf, name-2.pdf, and so on.
class BPDFBatchProcessor
{
  public:
    typedef unsigned long handle_t;

    BPDF_DLL
    BPDFBatchProcessor(BPDFEngineConfig const& config);
    // Waits for running jobs; pending jobs are skipped
    BPDF_DLL
    ~BPDFBatchProcessor();

    // Queue jobs and return a handle for them. Parameters are checked here, so jobs with invalid
    // parameters fail without any file being opened.
    BPDF_DLL
    handle_t submit(std::vector<BPDFBatchJob> const& jobs);
    // Return the current state of the batch's jobs in submission order. An unknown handle throws
    // std::logic_error.
    BPDF_DLL
    std::vector<BPDFBatchJob> poll(handle_t) const;
    // Block until every job of the batch is terminal and return them
    BPDF_DLL
    std::vector<BPDFBatchJob> wait(handle_t);
    // Skip the batch's jobs that haven't started. Running jobs finish normally.
    BPDF_DLL
    void cancel(handle_t);

    // Parse a batch file. Each line describes one job as
    //
    //   operation output input[,input...] [key=value...]
    //
    // with fields separated by white space. An output of "-" means the default output path.
    // Blank lines and lines starting with # are ignored. Syntax errors and unknown operations
    // throw BPDFUsage naming the line. Parameters are checked when the jobs are submitted.
    BPDF_DLL
    static std::vector<BPDFBatchJob>
    parseJobs(std::string const& text, std::string const& description);

    // Run a job on the calling thread. Used by the workers and usable without a processor.
    BPDF_DLL
    static void runJob(BPDFBatchJob& job, BPDFEngineConfig const& config);

  private:
    BPDFBatchProcessor(BPDFBatchProcessor const&) = delete;
    BPDFBatchProcessor& operator=(BPDFBatchProcessor const&) = delete;

    class Members;
    std::shared_ptr<Members> m;
};

#endif // BPDFBATCHPROCESSOR_HH
