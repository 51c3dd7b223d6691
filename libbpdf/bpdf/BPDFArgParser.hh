#ifndef BPDFARGPARSER_HH
#define BPDFARGPARSER_HH

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

// Command-line parser for the bpdf tool. Options may be written as -opt or --opt, and parameters
// are always attached with =, as in --op=merge. An argument of the form @file is replaced by the
// lines of file, one argument per line, if file can be opened. Help options are only recognized
// as the sole argument.
class BPDFArgParser
{
  public:
    typedef std::function<void()> bare_arg_handler_t;
    typedef std::function<void(std::string const&)> param_arg_handler_t;

    BPDFArgParser(int argc, char const* const argv[]);

    // Errors throw BPDFUsage. Calls exit(0) after a help option has run.
    void parseArgs();

    // The last path element of the program executable
    std::string const& getProgname() const;

    // Registration goes to the main table unless the help table is selected. Help options are
    // bare options that are only recognized as the sole argument.
    void selectMainOptionTable();
    void selectHelpOptionTable();

    void addPositional(param_arg_handler_t);
    void addBare(std::string const& name, bare_arg_handler_t);
    void addParameter(std::string const& name, param_arg_handler_t, char const* parameter_name);
    void addChoices(
        std::string const& name, param_arg_handler_t, std::vector<std::string> const& choices);
    // Runs after every argument has been handled
    void addFinalCheck(bare_arg_handler_t);

    // --help prints the synopsis, the documented options in order, then the footer.
    void addHelpSynopsis(std::string const&);
    void addOptionHelp(std::string const& option_name, std::string const& text);
    void addHelpFooter(std::string const&);
    std::string getHelp() const;

    template <class T>
    static bare_arg_handler_t
    bindBare(void (T::*f)(), T* o)
    {
        return [f, o]() { (o->*f)(); };
    }
    template <class T>
    static param_arg_handler_t
    bindParam(void (T::*f)(std::string const&), T* o)
    {
        return [f, o](std::string const& value) { (o->*f)(value); };
    }

    [[noreturn]] void usage(std::string const& message);

  private:
    struct Option
    {
        char const* parameter_name{nullptr};
        std::set<std::string> choices;
        bare_arg_handler_t on_bare;
        param_arg_handler_t on_value;
    };
    typedef std::map<std::string, Option> option_table_t;

    Option& define(std::string const& name);
    void expandArgFiles();
    void dispatch(std::string const& arg, bool& help_ran);
    void checkValue(std::string const& name, Option const&, std::string const* value);

    std::vector<std::string> args;
    std::string progname;
    option_table_t main_options;
    option_table_t help_options;
    option_table_t* current{&main_options};
    bare_arg_handler_t final_check;
    std::string synopsis;
    std::vector<std::pair<std::string, std::string>> option_help;
    std::string footer;
};

#endif // BPDFARGPARSER_HH
