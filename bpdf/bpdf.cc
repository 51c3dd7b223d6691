#include <bpdf/BPDFArgParser.hh>
#include <bpdf/BPDFBatchProcessor.hh>
#include <bpdf/BPDFEngineConfig.hh>
#include <bpdf/BPDFLogger.hh>
#include <bpdf/BPDFOperation.hh>
#include <bpdf/BPDFUsage.hh>
#include <bpdf/BUtil.hh>

#ifdef BPDF_WITH_TESSERACT
# include <bpdf/BPDFTesseractRecognizer.hh>
#endif

#include <cstdlib>
#include <iostream>

static std::string whoami;

static void
usageExit(std::string const& msg)
{
    std::cerr << std::endl
              << whoami << ": " << msg << std::endl
              << std::endl
              << "For help:" << std::endl
              << "  " << whoami << " --help" << std::endl
              << std::endl;
    exit(bpdf_exit_error);
}

namespace
{
    class ArgParser
    {
      public:
        ArgParser(BPDFArgParser& ap, BPDFEngineConfig& config, std::vector<BPDFBatchJob>& jobs);
        void parseOptions();

      private:
        void initOptionTables();

        void argPositional(std::string const&);
        void argOp(std::string const&);
        void argParam(std::string const&);
        void argOutput(std::string const&);
        void argBatch(std::string const&);
        void argJobs(std::string const&);
        void argOcrJobs(std::string const&);
        void argOutputDir(std::string const&);
        void argQuality(std::string const&);
        void argOcrLanguage(std::string const&);
        void argOcrDpi(std::string const&);
        void argTessdata(std::string const&);
        void argPassword(std::string const&);
        void argOverwrite();
        void argVerbose();
        void argListOperations();
        void argVersion();
        void finalCheck();

        int toInt(std::string const& option, std::string const& value);

        BPDFArgParser& ap;
        BPDFEngineConfig& config;
        std::vector<BPDFBatchJob>& jobs;
        BPDFBatchJob single;
        bool have_op{false};
        bool have_batch{false};
        std::string tessdata;
    };
} // namespace

ArgParser::ArgParser(
    BPDFArgParser& ap, BPDFEngineConfig& config, std::vector<BPDFBatchJob>& jobs) :
    ap(ap),
    config(config),
    jobs(jobs)
{
    initOptionTables();
}

void
ArgParser::initOptionTables()
{
    ap.selectHelpOptionTable();
    ap.addBare("version", BPDFArgParser::bindBare(&ArgParser::argVersion, this));
    ap.addBare("list-operations", BPDFArgParser::bindBare(&ArgParser::argListOperations, this));

    ap.selectMainOptionTable();
    ap.addPositional(BPDFArgParser::bindParam(&ArgParser::argPositional, this));
    ap.addParameter("op", BPDFArgParser::bindParam(&ArgParser::argOp, this), "operation");
    ap.addParameter("param", BPDFArgParser::bindParam(&ArgParser::argParam, this), "key=value");
    ap.addParameter("output", BPDFArgParser::bindParam(&ArgParser::argOutput, this), "file");
    ap.addParameter("batch", BPDFArgParser::bindParam(&ArgParser::argBatch, this), "file");
    ap.addParameter("jobs", BPDFArgParser::bindParam(&ArgParser::argJobs, this), "n");
    ap.addParameter("ocr-jobs", BPDFArgParser::bindParam(&ArgParser::argOcrJobs, this), "n");
    ap.addParameter(
        "output-dir", BPDFArgParser::bindParam(&ArgParser::argOutputDir, this), "directory");
    ap.addChoices(
        "quality",
        BPDFArgParser::bindParam(&ArgParser::argQuality, this),
        {"low", "medium", "high"});
    ap.addParameter(
        "ocr-language", BPDFArgParser::bindParam(&ArgParser::argOcrLanguage, this), "language");
    ap.addParameter("ocr-dpi", BPDFArgParser::bindParam(&ArgParser::argOcrDpi, this), "dpi");
    ap.addParameter(
        "tessdata", BPDFArgParser::bindParam(&ArgParser::argTessdata, this), "directory");
    ap.addParameter(
        "password", BPDFArgParser::bindParam(&ArgParser::argPassword, this), "password");
    ap.addBare("overwrite", BPDFArgParser::bindBare(&ArgParser::argOverwrite, this));
    ap.addBare("verbose", BPDFArgParser::bindBare(&ArgParser::argVerbose, this));
    ap.addFinalCheck(BPDFArgParser::bindBare(&ArgParser::finalCheck, this));

    ap.addHelpSynopsis(
        "Usage: " + ap.getProgname() +
        " --op=operation [--param=key=value ...] [--output=file] input ...\n"
        "       " + ap.getProgname() + " --batch=file\n"
        "\n"
        "Apply an operation to PDF files, or run every job listed in a batch file. Each line of\n"
        "a batch file is \"operation output input[,input...] [key=value...]\"; use - as the\n"
        "output for the default name.\n");
    ap.addOptionHelp("--op=operation", "operation to run; see --list-operations");
    ap.addOptionHelp("--param=key=value", "operation parameter; may be repeated");
    ap.addOptionHelp("--output=file", "output file instead of <output-dir>/<op>_<input>");
    ap.addOptionHelp("--batch=file", "read jobs from file");
    ap.addOptionHelp("--jobs=n", "number of jobs to run at once");
    ap.addOptionHelp("--ocr-jobs=n", "number of text recognition jobs to run at once");
    ap.addOptionHelp("--output-dir=directory", "directory for outputs with default names");
    ap.addOptionHelp("--quality=low|medium|high", "default quality for compress");
    ap.addOptionHelp("--ocr-language=language", "recognition language, eng by default");
    ap.addOptionHelp("--ocr-dpi=dpi", "recognition resolution, 300 by default");
    ap.addOptionHelp("--tessdata=directory", "location of tesseract's language data");
    ap.addOptionHelp("--password=password", "password for encrypted inputs");
    ap.addOptionHelp("--overwrite", "replace existing outputs instead of renaming");
    ap.addOptionHelp("--verbose", "report progress");
    ap.addOptionHelp("--list-operations", "list operations and their parameters");
    ap.addOptionHelp("--version", "show version");
    ap.addHelpFooter(
        "Exit status is 0 if every job succeeded, 3 if every job succeeded but there were\n"
        "warnings, and 2 if any job failed.\n");
}

void
ArgParser::parseOptions()
{
    ap.parseArgs();
}

int
ArgParser::toInt(std::string const& option, std::string const& value)
{
    if (!BUtil::is_long_long(value.c_str())) {
        ap.usage("--" + option + " requires a number");
    }
    return static_cast<int>(BUtil::string_to_ll(value.c_str()));
}

void
ArgParser::argPositional(std::string const& arg)
{
    single.inputs.push_back(arg);
}

void
ArgParser::argOp(std::string const& arg)
{
    if (!BPDFOperation::parseOperationName(arg, single.operation)) {
        ap.usage("unknown operation " + arg + "; run " + whoami + " --list-operations");
    }
    have_op = true;
}

void
ArgParser::argParam(std::string const& arg)
{
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        ap.usage("--param must be given as --param=key=value");
    }
    single.parameters[arg.substr(0, eq)] = arg.substr(eq + 1);
}

void
ArgParser::argOutput(std::string const& arg)
{
    single.output = arg;
}

void
ArgParser::argBatch(std::string const& arg)
{
    auto parsed = BPDFBatchProcessor::parseJobs(BUtil::read_file_into_string(arg.c_str()), arg);
    jobs.insert(jobs.end(), parsed.begin(), parsed.end());
    have_batch = true;
}

void
ArgParser::argJobs(std::string const& arg)
{
    config.max_jobs = toInt("jobs", arg);
}

void
ArgParser::argOcrJobs(std::string const& arg)
{
    config.max_ocr_jobs = toInt("ocr-jobs", arg);
}

void
ArgParser::argOutputDir(std::string const& arg)
{
    config.output_dir = arg;
}

void
ArgParser::argQuality(std::string const& arg)
{
    BPDFEngineConfig::parseQuality(arg, config.quality);
}

void
ArgParser::argOcrLanguage(std::string const& arg)
{
    config.ocr_language = arg;
}

void
ArgParser::argOcrDpi(std::string const& arg)
{
    config.ocr_dpi = toInt("ocr-dpi", arg);
}

void
ArgParser::argTessdata(std::string const& arg)
{
    tessdata = arg;
}

void
ArgParser::argPassword(std::string const& arg)
{
    config.password = arg;
}

void
ArgParser::argOverwrite()
{
    config.overwrite = true;
}

void
ArgParser::argVerbose()
{
    config.getLogger()->setVerbose(true);
}

void
ArgParser::argListOperations()
{
    auto logger = BPDFLogger::defaultLogger();
    BPDFEngineConfig defaults;
    for (auto op: BPDFOperation::getAllOperations()) {
        auto operation = BPDFOperation::create(op, defaults);
        logger->info(
            std::string(operation->getName()) + ": " + operation->getDescription() + "\n");
        for (auto const& spec: operation->getParameterSpecs()) {
            std::string line = "    " + spec.name;
            if (spec.required) {
                line += " (required)";
            } else if (!spec.default_value.empty()) {
                line += " (default " + spec.default_value + ")";
            }
            logger->info(line + ": " + spec.help + "\n");
        }
    }
}

void
ArgParser::argVersion()
{
    BPDFLogger::defaultLogger()->info(ap.getProgname() + " version " + BPDF_VERSION + "\n");
}

void
ArgParser::finalCheck()
{
    if (have_op) {
        jobs.push_back(single);
    } else if (!single.inputs.empty() || !single.output.empty() || !single.parameters.empty()) {
        ap.usage("--op is required with inputs, --output and --param");
    }
    if (!(have_op || have_batch)) {
        ap.usage("either --op or --batch must be given");
    }
#ifdef BPDF_WITH_TESSERACT
    config.recognizer = std::make_shared<BPDFTesseractRecognizer>(tessdata);
#else
    if (!tessdata.empty()) {
        ap.usage("--tessdata was given but " + whoami + " was built without tesseract");
    }
#endif
}

static int
realmain(int argc, char* argv[])
{
    whoami = BUtil::getWhoami(argv[0]);

    BPDFEngineConfig config;
    config.logger = BPDFLogger::defaultLogger();
    std::vector<BPDFBatchJob> jobs;
    try {
        BPDFArgParser ap(argc, argv);
        ArgParser parser(ap, config, jobs);
        parser.parseOptions();
    } catch (BPDFUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        return bpdf_exit_error;
    }

    bool any_failed = false;
    bool any_warnings = false;
    {
        BPDFBatchProcessor processor(config);
        auto results = processor.wait(processor.submit(jobs));
        for (auto const& job: results) {
            if (job.status != bpdf_js_succeeded) {
                any_failed = true;
            } else if (!job.warnings.empty()) {
                any_warnings = true;
            }
        }
    }
    if (any_failed) {
        return bpdf_exit_error;
    }
    return any_warnings ? bpdf_exit_warning : bpdf_exit_success;
}

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}
