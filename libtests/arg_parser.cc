#include <bpdf/assert_test.h>

#include <bpdf/BPDFArgParser.hh>
#include <bpdf/BPDFUsage.hh>
#include <bpdf/BUtil.hh>

#include <iostream>

namespace
{
    class ArgParser
    {
      public:
        ArgParser(std::vector<char const*> const& args) :
            ap(static_cast<int>(args.size()), args.data())
        {
            initOptions();
        }

        void
        parseArgs()
        {
            ap.parseArgs();
        }

        BPDFArgParser ap;
        std::vector<std::string> events;
        bool checked{false};

      private:
        void
        initOptions()
        {
            auto p = [this](void (ArgParser::*f)(std::string const&)) {
                return BPDFArgParser::bindParam(f, this);
            };
            ap.addBare("verbose", [this]() { events.emplace_back("verbose"); });
            ap.addParameter("jobs", p(&ArgParser::handleJobs), "n");
            ap.addChoices("quality", p(&ArgParser::handleQuality), {"low", "medium", "high"});
            ap.addPositional(p(&ArgParser::handlePositional));
            ap.addFinalCheck([this]() { checked = true; });
            ap.addHelpSynopsis("Usage: tool [options] file...\n");
            ap.addOptionHelp("--verbose", "say more");
            ap.addOptionHelp("--jobs=n", "run n jobs at once");
            ap.addHelpFooter("See the manual.\n");
        }

        void
        handleJobs(std::string const& n)
        {
            events.push_back("jobs=" + n);
        }

        void
        handleQuality(std::string const& q)
        {
            events.push_back("quality=" + q);
        }

        void
        handlePositional(std::string const& arg)
        {
            events.push_back("file " + arg);
        }
    };

    std::string
    usage_error(std::vector<char const*> const& args)
    {
        ArgParser p(args);
        try {
            p.parseArgs();
        } catch (BPDFUsage& e) {
            assert(!p.checked);
            return e.what();
        }
        assert(false);
        return "";
    }
} // namespace

static void
test_parse()
{
    ArgParser p({"/usr/bin/lt-tool", "-verbose", "--jobs=4", "a.pdf", "--quality=low", "b.pdf"});
    p.parseArgs();
    assert(p.checked);
    assert(p.ap.getProgname() == "tool");
    assert(
        p.events ==
        std::vector<std::string>({"verbose", "jobs=4", "file a.pdf", "quality=low", "file b.pdf"}));

    // A lone "-" is a positional argument.
    ArgParser dash({"tool", "-"});
    dash.parseArgs();
    assert(dash.events == std::vector<std::string>({"file -"}));
}

static void
test_arg_file()
{
    BUtil::write_string_to_file("arg-parser-args.txt", "--jobs=2\r\n\nc.pdf\n");
    ArgParser p({"tool", "@arg-parser-args.txt", "d.pdf", "@missing-args.txt"});
    p.parseArgs();
    BUtil::remove_file("arg-parser-args.txt");
    assert(
        p.events ==
        std::vector<std::string>({"jobs=2", "file c.pdf", "file d.pdf", "file @missing-args.txt"}));
}

static void
test_errors()
{
    assert(usage_error({"tool", "--potato"}) == "unrecognized argument --potato");
    assert(usage_error({"tool", "--jobs"}) == "--jobs must be given as --jobs=n");
    assert(
        usage_error({"tool", "--quality=best"}) ==
        "--quality must be given as --quality={high,low,medium}");
    assert(
        usage_error({"tool", "--verbose=yes"}) ==
        "--verbose does not take a parameter, but \"yes\" was given");
    assert(usage_error({"tool", "a.pdf", "--help"}) == "unrecognized argument --help");
}

static void
test_help()
{
    ArgParser p({"tool"});
    assert(
        p.ap.getHelp() ==
        "Usage: tool [options] file...\n"
        "\n"
        "Options:\n"
        "  --verbose  say more\n"
        "  --jobs=n   run n jobs at once\n"
        "\n"
        "See the manual.\n");
}

int
main()
{
    test_parse();
    test_arg_file();
    test_errors();
    test_help();
    std::cout << "arg parser tests done" << std::endl;
    return 0;
}
