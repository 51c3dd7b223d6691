#include <bpdf/BPDFBatchProcessor.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>
#include <bpdf/BPDFLogger.hh>
#include <bpdf/BPDFOperation.hh>
#include <bpdf/BPDFUsage.hh>
#include <bpdf/BUtil.hh>

#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace
{
    // Held while choosing a final output name and renaming onto it
    std::mutex output_lock;

    class TempFile
    {
      public:
        TempFile(std::string const& path) :
            path(path)
        {
        }
        ~TempFile()
        {
            if (!path.empty()) {
                std::remove(path.c_str());
            }
        }
        void
        release()
        {
            path.clear();
        }

      private:
        std::string path;
    };

    std::string
    free_name(std::string const& path)
    {
        if (!BUtil::file_can_be_opened(path.c_str())) {
            return path;
        }
        auto [stem, ext] = BUtil::split_extension(path);
        for (int n = 1;; ++n) {
            auto candidate = stem + "-" + std::to_string(n) + ext;
            if (!BUtil::file_can_be_opened(candidate.c_str())) {
                return candidate;
            }
        }
    }

    // Write data to a temporary file next to path and rename it into place. Returns the name
    // the file ended up with.
    std::string
    publish(std::string const& path, std::string const& data, bool overwrite)
    {
        unsigned char random[8];
        BUtil::initializeWithRandomBytes(random, sizeof(random));
        auto temp = BUtil::path_dirname(path) + "/." + BUtil::path_basename(path) + "." +
            BUtil::hex_encode(std::string(reinterpret_cast<char*>(random), sizeof(random))) +
            ".tmp";
        TempFile cleanup(temp);
        BUtil::write_string_to_file(temp.c_str(), data);

        std::lock_guard<std::mutex> guard(output_lock);
        auto target = overwrite ? path : free_name(path);
        BUtil::rename_file(temp.c_str(), target.c_str());
        cleanup.release();
        return target;
    }

    class JobRunner
    {
      public:
        JobRunner(BPDFBatchJob& job, BPDFEngineConfig const& config) :
            job(job),
            config(config),
            logger(config.getLogger())
        {
        }

        void run();

      private:
        void
        addWarning(std::string const& warning)
        {
            job.warnings.push_back(warning);
        }

        BPDFBatchJob& job;
        BPDFEngineConfig const& config;
        std::shared_ptr<BPDFLogger> logger;
    };
} // namespace

void
JobRunner::run()
{
    auto op = BPDFOperation::create(job.operation, config);
    auto params = op->validate(job.parameters);
    op->checkInputCount(job.inputs.size());

    std::vector<BPDFOperation::Input> inputs;
    for (auto const& path: job.inputs) {
        BPDFOperation::Input input;
        input.filename = path;
        input.data = BUtil::read_file_into_string(path.c_str());
        inputs.push_back(std::move(input));
    }
    for (auto& input: inputs) {
        op->openInput(input, params);
    }

    auto result = op->apply(inputs, params);
    for (auto const& w: result.warnings) {
        logger->warn("WARNING: " + job.inputs.front() + ": " + w + "\n");
        addWarning(w);
    }

    // Serialize everything before writing anything so that a failure leaves no partial output.
    std::vector<std::string> serialized;
    for (auto const& output: result.outputs) {
        serialized.push_back(BPDFOperation::writeOutput(output));
    }
    std::set<BPDF*> documents;
    for (auto const& input: inputs) {
        documents.insert(input.pdf.get());
    }
    for (auto const& output: result.outputs) {
        documents.insert(output.pdf.get());
    }
    documents.erase(nullptr);
    for (auto* pdf: documents) {
        for (auto const& w: pdf->getWarnings()) {
            addWarning(w.what());
        }
    }

    std::string base = job.output;
    if (base.empty()) {
        base = config.output_dir + "/" + op->getName() + "_" +
            BUtil::path_basename(job.inputs.front());
    }
    auto [stem, ext] = BUtil::split_extension(base);
    if (serialized.size() == 1) {
        job.outputs.push_back(publish(base, serialized.front(), config.overwrite));
    } else {
        for (size_t i = 0; i < serialized.size(); ++i) {
            auto path = stem + "-" + std::to_string(i + 1) + ext;
            job.outputs.push_back(publish(path, serialized.at(i), config.overwrite));
        }
    }
    for (auto const& artifact: result.artifacts) {
        job.outputs.push_back(publish(stem + artifact.suffix, artifact.data, config.overwrite));
    }
}

std::vector<BPDFBatchJob>
BPDFBatchProcessor::parseJobs(std::string const& text, std::string const& description)
{
    std::vector<BPDFBatchJob> result;
    int lineno = 0;
    for (auto const& line: BUtil::split_string(text, '\n')) {
        ++lineno;
        std::vector<std::string> fields;
        std::string field;
        for (char ch: line + " ") {
            if (ch == ' ' || ch == '\t' || ch == '\r') {
                if (!field.empty()) {
                    fields.push_back(field);
                    field.clear();
                }
            } else {
                field += ch;
            }
        }
        if (fields.empty() || fields.front().at(0) == '#') {
            continue;
        }
        auto where = description + ":" + std::to_string(lineno) + ": ";
        if (fields.size() < 3) {
            throw BPDFUsage(where + "expected operation, output and inputs");
        }
        BPDFBatchJob job;
        if (!BPDFOperation::parseOperationName(fields.at(0), job.operation)) {
            throw BPDFUsage(where + "unknown operation " + fields.at(0));
        }
        if (fields.at(1) != "-") {
            job.output = fields.at(1);
        }
        for (auto const& input: BUtil::split_string(fields.at(2), ',')) {
            if (!input.empty()) {
                job.inputs.push_back(input);
            }
        }
        for (size_t i = 3; i < fields.size(); ++i) {
            auto eq = fields.at(i).find('=');
            if (eq == std::string::npos || eq == 0) {
                throw BPDFUsage(where + "expected key=value, found " + fields.at(i));
            }
            job.parameters[fields.at(i).substr(0, eq)] = fields.at(i).substr(eq + 1);
        }
        result.push_back(job);
    }
    return result;
}

void
BPDFBatchProcessor::runJob(BPDFBatchJob& job, BPDFEngineConfig const& config)
{
    auto logger = config.getLogger();
    job.status = bpdf_js_running;
    job.error_code = bpdf_e_success;
    job.error.clear();
    job.warnings.clear();
    job.outputs.clear();

    std::string label = BPDFOperation::getOperationName(job.operation);
    if (!job.inputs.empty()) {
        label += " " + job.inputs.front();
    }
    logger->verbose("bpdf: " + label + ": started\n");
    try {
        JobRunner(job, config).run();
        job.status = bpdf_js_succeeded;
    } catch (BPDFExc& e) {
        job.status = bpdf_js_failed;
        job.error_code = e.getErrorCode();
        job.error = e.what();
    } catch (std::exception& e) {
        job.status = bpdf_js_failed;
        job.error_code = bpdf_e_internal;
        job.error = e.what();
    }
    if (job.status == bpdf_js_failed) {
        logger->error(
            "bpdf: " + label + ": " + job.error + " [" + BPDFExc::kindName(job.error_code) +
            "]\n");
    } else {
        for (auto const& output: job.outputs) {
            logger->verbose("bpdf: " + label + ": wrote " + output + "\n");
        }
    }
}

class BPDFBatchProcessor::Members
{
  public:
    struct Batch
    {
        std::vector<BPDFBatchJob> jobs;
        size_t remaining{0};
    };

    struct Task
    {
        handle_t handle;
        size_t index;
    };

    Members(BPDFEngineConfig const& config) :
        config(config)
    {
    }

    void worker(std::deque<Task>& queue);
    Batch& getBatch(handle_t handle);
    void skipPending(std::deque<Task>& queue);

    BPDFEngineConfig config;
    std::mutex lock;
    std::condition_variable work_ready;
    std::condition_variable job_done;
    std::deque<Task> structural_queue;
    std::deque<Task> ocr_queue;
    std::map<handle_t, Batch> batches;
    handle_t next_handle{1};
    bool stopping{false};
    std::vector<std::thread> threads;
};

BPDFBatchProcessor::Members::Batch&
BPDFBatchProcessor::Members::getBatch(handle_t handle)
{
    auto it = batches.find(handle);
    if (it == batches.end()) {
        throw std::logic_error("BPDFBatchProcessor: unknown batch handle");
    }
    return it->second;
}

void
BPDFBatchProcessor::Members::worker(std::deque<Task>& queue)
{
    std::unique_lock<std::mutex> guard(lock);
    while (true) {
        work_ready.wait(guard, [&] { return stopping || !queue.empty(); });
        if (queue.empty()) {
            return;
        }
        auto task = queue.front();
        queue.pop_front();
        auto& job = getBatch(task.handle).jobs.at(task.index);
        // Cancelled jobs are skipped but stay in the queue.
        if (job.status != bpdf_js_pending) {
            continue;
        }
        job.status = bpdf_js_running;
        BPDFBatchJob work = job;
        guard.unlock();
        runJob(work, config);
        guard.lock();
        auto& batch = getBatch(task.handle);
        batch.jobs.at(task.index) = std::move(work);
        --batch.remaining;
        job_done.notify_all();
    }
}

void
BPDFBatchProcessor::Members::skipPending(std::deque<Task>& queue)
{
    for (auto const& task: queue) {
        auto& batch = getBatch(task.handle);
        auto& job = batch.jobs.at(task.index);
        if (job.status == bpdf_js_pending) {
            job.status = bpdf_js_skipped;
            --batch.remaining;
        }
    }
    queue.clear();
}

BPDFBatchProcessor::BPDFBatchProcessor(BPDFEngineConfig const& config) :
    m(std::make_shared<Members>(config))
{
    int hardware = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    int structural = (config.max_jobs <= 0) ? hardware : std::min(config.max_jobs, hardware);
    int ocr = std::max(1, config.max_ocr_jobs);
    auto* members = m.get();
    for (int i = 0; i < structural; ++i) {
        m->threads.emplace_back([members] { members->worker(members->structural_queue); });
    }
    for (int i = 0; i < ocr; ++i) {
        m->threads.emplace_back([members] { members->worker(members->ocr_queue); });
    }
}

BPDFBatchProcessor::~BPDFBatchProcessor()
{
    {
        std::lock_guard<std::mutex> guard(m->lock);
        m->stopping = true;
        m->skipPending(m->structural_queue);
        m->skipPending(m->ocr_queue);
    }
    m->work_ready.notify_all();
    for (auto& thread: m->threads) {
        thread.join();
    }
}

BPDFBatchProcessor::handle_t
BPDFBatchProcessor::submit(std::vector<BPDFBatchJob> const& jobs)
{
    Members::Batch batch;
    batch.jobs = jobs;
    std::vector<size_t> structural;
    std::vector<size_t> ocr;
    for (size_t i = 0; i < batch.jobs.size(); ++i) {
        auto& job = batch.jobs.at(i);
        job.status = bpdf_js_pending;
        job.error_code = bpdf_e_success;
        job.error.clear();
        job.warnings.clear();
        job.outputs.clear();
        try {
            auto op = BPDFOperation::create(job.operation, m->config);
            auto params = op->validate(job.parameters);
            op->checkInputCount(job.inputs.size());
            (op->usesOCR(params) ? ocr : structural).push_back(i);
        } catch (BPDFExc& e) {
            job.status = bpdf_js_failed;
            job.error_code = e.getErrorCode();
            job.error = e.what();
            m->config.getLogger()->error(std::string("bpdf: ") + e.what() + "\n");
        }
    }
    batch.remaining = structural.size() + ocr.size();

    handle_t handle = 0;
    {
        std::lock_guard<std::mutex> guard(m->lock);
        if (m->stopping) {
            throw std::logic_error("BPDFBatchProcessor::submit called during destruction");
        }
        handle = m->next_handle++;
        m->batches[handle] = std::move(batch);
        for (auto i: structural) {
            m->structural_queue.push_back({handle, i});
        }
        for (auto i: ocr) {
            m->ocr_queue.push_back({handle, i});
        }
    }
    m->work_ready.notify_all();
    return handle;
}

std::vector<BPDFBatchJob>
BPDFBatchProcessor::poll(handle_t handle) const
{
    std::lock_guard<std::mutex> guard(m->lock);
    return m->getBatch(handle).jobs;
}

std::vector<BPDFBatchJob>
BPDFBatchProcessor::wait(handle_t handle)
{
    std::unique_lock<std::mutex> guard(m->lock);
    m->getBatch(handle);
    m->job_done.wait(guard, [&] { return m->getBatch(handle).remaining == 0; });
    return m->getBatch(handle).jobs;
}

void
BPDFBatchProcessor::cancel(handle_t handle)
{
    std::lock_guard<std::mutex> guard(m->lock);
    auto& batch = m->getBatch(handle);
    for (auto& job: batch.jobs) {
        if (job.status == bpdf_js_pending) {
            job.status = bpdf_js_skipped;
            --batch.remaining;
        }
    }
    m->job_done.notify_all();
}
