#include <bpdf/assert_test.h>

#include <bpdf/BPDFLogger.hh>
#include <bpdf/Pl_String.hh>

#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static void
test_routing()
{
    auto l = BPDFLogger::create();

    std::string errors;
    l->route(BPDFLogger::ch_error, std::make_shared<Pl_String>("errors", nullptr, errors));
    l->warn("warn follows error\n");
    l->error("error too\n");
    assert(errors == "warn follows error\nerror too\n");

    std::string warnings;
    l->route(BPDFLogger::ch_warn, std::make_shared<Pl_String>("warnings", nullptr, warnings));
    l->warn(std::string("warning now separate\n"));
    l->error(std::string("new error\n"));
    assert(warnings == "warning now separate\n");
    assert(errors == "warn follows error\nerror too\nnew error\n");

    l->route(BPDFLogger::ch_warn, BPDFLogger::discard());
    l->warn("dropped\n");
    assert(warnings == "warning now separate\n");

    l->route(BPDFLogger::ch_warn, nullptr);
    l->warn("back with errors\n");
    assert(errors == "warn follows error\nerror too\nnew error\nback with errors\n");
}

static void
test_defaults()
{
    auto l = BPDFLogger::create();
    assert(l->destination(BPDFLogger::ch_info) == l->standardOutput());
    assert(l->destination(BPDFLogger::ch_error) == l->standardError());
    assert(l->destination(BPDFLogger::ch_warn) == l->standardError());

    std::string info;
    l->route(BPDFLogger::ch_info, std::make_shared<Pl_String>("info", nullptr, info));
    assert(l->destination(BPDFLogger::ch_info) != l->standardOutput());
    l->route(BPDFLogger::ch_info, nullptr);
    assert(l->destination(BPDFLogger::ch_info) == l->standardOutput());
    assert(BPDFLogger::defaultLogger() == BPDFLogger::defaultLogger());
}

static void
test_verbose()
{
    auto l = BPDFLogger::create();
    std::string info;
    l->route(BPDFLogger::ch_info, std::make_shared<Pl_String>("info", nullptr, info));
    l->verbose("hidden\n");
    assert(info.empty());
    assert(!l->isVerbose());
    l->setVerbose(true);
    l->verbose("shown\n");
    l->info("plain\n");
    assert(info == "shown\nplain\n");
}

static void
test_streams()
{
    auto l = BPDFLogger::create();
    std::ostringstream out;
    std::ostringstream err;
    l->setOutputStreams(&out, &err);
    l->info("to out\n");
    l->warn("to err\n");
    l->error("also err\n");
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\nalso err\n");

    l->setOutputStreams(&std::cout, nullptr);
    assert(l->destination(BPDFLogger::ch_info) == l->standardOutput());
    assert(l->destination(BPDFLogger::ch_warn) == l->standardError());
}

static void
test_threads()
{
    // Lines written from several threads are never split.
    auto l = BPDFLogger::create();
    std::string info;
    l->route(BPDFLogger::ch_info, std::make_shared<Pl_String>("info", nullptr, info));
    std::string const line = "0123456789abcdefghijklmnopqrstuvwxyz\n";
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&l, &line]() {
            for (int j = 0; j < 250; ++j) {
                l->info(line);
            }
        });
    }
    for (auto& t: threads) {
        t.join();
    }
    assert(info.size() == 1000 * line.size());
    for (size_t pos = 0; pos < info.size(); pos += line.size()) {
        assert(info.compare(pos, line.size(), line) == 0);
    }
}

int
main()
{
    test_routing();
    test_defaults();
    test_verbose();
    test_streams();
    test_threads();
    std::cout << "logger tests done" << std::endl;
    return 0;
}
