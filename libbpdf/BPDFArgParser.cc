#include <bpdf/BPDFArgParser.hh>

#include <bpdf/BPDFLogger.hh>
#include <bpdf/BPDFUsage.hh>
#include <bpdf/BUtil.hh>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

BPDFArgParser::BPDFArgParser(int argc, char const* const argv[]) :
    args(argv, argv + argc)
{
    progname = args.empty() ? std::string("bpdf") : BUtil::getWhoami(args.front());
    selectHelpOptionTable();
    addBare("help", [this]() { BPDFLogger::defaultLogger()->info(getHelp()); });
    selectMainOptionTable();
}

void
BPDFArgParser::selectMainOptionTable()
{
    current = &main_options;
}

void
BPDFArgParser::selectHelpOptionTable()
{
    current = &help_options;
}

BPDFArgParser::Option&
BPDFArgParser::define(std::string const& name)
{
    auto [it, inserted] = current->try_emplace(name);
    if (!inserted) {
        throw std::logic_error("BPDFArgParser: option " + name + " defined twice");
    }
    return it->second;
}

void
BPDFArgParser::addPositional(param_arg_handler_t handler)
{
    define("").on_value = std::move(handler);
}

void
BPDFArgParser::addBare(std::string const& name, bare_arg_handler_t handler)
{
    define(name).on_bare = std::move(handler);
}

void
BPDFArgParser::addParameter(
    std::string const& name, param_arg_handler_t handler, char const* parameter_name)
{
    auto& option = define(name);
    option.parameter_name = parameter_name;
    option.on_value = std::move(handler);
}

void
BPDFArgParser::addChoices(
    std::string const& name, param_arg_handler_t handler, std::vector<std::string> const& choices)
{
    auto& option = define(name);
    option.choices.insert(choices.begin(), choices.end());
    option.on_value = std::move(handler);
}

void
BPDFArgParser::addFinalCheck(bare_arg_handler_t handler)
{
    final_check = std::move(handler);
}

void
BPDFArgParser::addHelpSynopsis(std::string const& text)
{
    synopsis = text;
}

void
BPDFArgParser::addOptionHelp(std::string const& option_name, std::string const& text)
{
    option_help.emplace_back(option_name, text);
}

void
BPDFArgParser::addHelpFooter(std::string const& text)
{
    footer = text;
}

std::string
BPDFArgParser::getHelp() const
{
    size_t width = 0;
    for (auto const& entry: option_help) {
        width = std::max(width, entry.first.size());
    }
    std::string help = synopsis;
    if (!option_help.empty()) {
        help += "\nOptions:\n";
    }
    for (auto const& [name, text]: option_help) {
        help += "  " + name;
        help.append(width + 2 - name.size(), ' ');
        help += text + "\n";
    }
    if (!footer.empty()) {
        help += "\n" + footer;
    }
    return help;
}

std::string const&
BPDFArgParser::getProgname() const
{
    return progname;
}

void
BPDFArgParser::usage(std::string const& message)
{
    throw BPDFUsage(message);
}

void
BPDFArgParser::expandArgFiles()
{
    std::vector<std::string> expanded;
    for (size_t i = 0; i < args.size(); ++i) {
        auto const& arg = args[i];
        char const* path = arg.c_str() + 1;
        if (i == 0 || arg.size() < 2 || arg[0] != '@' || !BUtil::file_can_be_opened(path)) {
            expanded.push_back(arg);
            continue;
        }
        for (auto line: BUtil::split_string(BUtil::read_file_into_string(path), '\n')) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                expanded.push_back(line);
            }
        }
    }
    args = expanded;
}

void
BPDFArgParser::checkValue(std::string const& name, Option const& option, std::string const* value)
{
    if (option.on_bare) {
        if (value) {
            usage("--" + name + " does not take a parameter, but \"" + *value + "\" was given");
        }
        return;
    }
    if (value && (option.choices.empty() || option.choices.count(*value))) {
        return;
    }
    std::string form;
    if (option.choices.empty()) {
        form = option.parameter_name ? option.parameter_name : "value";
    } else {
        for (auto const& choice: option.choices) {
            form += (form.empty() ? "{" : ",") + choice;
        }
        form += "}";
    }
    usage("--" + name + " must be given as --" + name + "=" + form);
}

void
BPDFArgParser::dispatch(std::string const& arg, bool& help_ran)
{
    if (arg.size() < 2 || arg[0] != '-') {
        auto positional = current->find("");
        if (positional == current->end()) {
            usage("unrecognized argument " + arg);
        }
        positional->second.on_value(arg);
        return;
    }

    std::string name = arg.substr(arg.compare(0, 2, "--") == 0 ? 2 : 1);
    std::string value;
    bool has_value = false;
    // An = in the first position is part of the name so "--=x" is not an empty option.
    auto eq = name.find('=', 1);
    if (!name.empty() && eq != std::string::npos) {
        value = name.substr(eq + 1);
        name.erase(eq);
        has_value = true;
    }

    option_table_t* table = current;
    if (args.size() == 2 && help_options.count(name)) {
        table = &help_options;
        help_ran = true;
    }
    auto found = (name.empty() || name[0] == '-') ? table->end() : table->find(name);
    if (found == table->end()) {
        usage("unrecognized argument " + arg);
    }
    auto const& option = found->second;
    checkValue(name, option, has_value ? &value : nullptr);
    if (option.on_bare) {
        option.on_bare();
    } else {
        option.on_value(value);
    }
}

void
BPDFArgParser::parseArgs()
{
    selectMainOptionTable();
    expandArgFiles();
    for (size_t i = 1; i < args.size(); ++i) {
        bool help_ran = false;
        dispatch(args[i], help_ran);
        if (help_ran) {
            exit(0);
        }
    }
    if (final_check) {
        final_check();
    }
}
