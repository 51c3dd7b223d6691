#include <bpdf/BPDFLogger.hh>

#include <bpdf/Pl_Discard.hh>
#include <bpdf/Pl_OStream.hh>

#include <iostream>

BPDFLogger::BPDFLogger() :
    std_out(std::make_shared<Pl_OStream>("standard output", std::cout)),
    std_err(std::make_shared<Pl_OStream>("standard error", std::cerr))
{
}

std::shared_ptr<BPDFLogger>
BPDFLogger::create()
{
    return std::shared_ptr<BPDFLogger>(new BPDFLogger());
}

std::shared_ptr<BPDFLogger>
BPDFLogger::defaultLogger()
{
    static auto const logger = create();
    return logger;
}

std::shared_ptr<Pipeline>
BPDFLogger::discard()
{
    static auto const sink = std::make_shared<Pl_Discard>();
    return sink;
}

std::shared_ptr<Pipeline>
BPDFLogger::resolve(channel_e channel) const
{
    if (routes[channel]) {
        return routes[channel];
    }
    switch (channel) {
    case ch_info:
        return std_out;
    case ch_warn:
        return routes[ch_error] ? routes[ch_error] : std_err;
    case ch_error:
        break;
    }
    return std_err;
}

void
BPDFLogger::emit(channel_e channel, std::string_view text)
{
    std::lock_guard<std::mutex> guard(lock);
    resolve(channel)->writeString(text);
}

void
BPDFLogger::info(std::string_view text)
{
    emit(ch_info, text);
}

void
BPDFLogger::warn(std::string_view text)
{
    emit(ch_warn, text);
}

void
BPDFLogger::error(std::string_view text)
{
    emit(ch_error, text);
}

void
BPDFLogger::verbose(std::string_view text)
{
    if (isVerbose()) {
        emit(ch_info, text);
    }
}

void
BPDFLogger::setVerbose(bool value)
{
    std::lock_guard<std::mutex> guard(lock);
    verbose_output = value;
}

bool
BPDFLogger::isVerbose() const
{
    std::lock_guard<std::mutex> guard(lock);
    return verbose_output;
}

void
BPDFLogger::route(channel_e channel, std::shared_ptr<Pipeline> p)
{
    std::lock_guard<std::mutex> guard(lock);
    routes[channel] = std::move(p);
}

std::shared_ptr<Pipeline>
BPDFLogger::destination(channel_e channel) const
{
    std::lock_guard<std::mutex> guard(lock);
    return resolve(channel);
}

void
BPDFLogger::setOutputStreams(std::ostream* out, std::ostream* err)
{
    std::shared_ptr<Pipeline> info_p;
    std::shared_ptr<Pipeline> error_p;
    if (out && out != &std::cout) {
        info_p = std::make_shared<Pl_OStream>("output", *out);
    }
    if (err && err != &std::cerr) {
        error_p = std::make_shared<Pl_OStream>("error output", *err);
    }
    std::lock_guard<std::mutex> guard(lock);
    routes[ch_info] = info_p;
    routes[ch_warn] = nullptr;
    routes[ch_error] = error_p;
}

std::shared_ptr<Pipeline>
BPDFLogger::standardOutput() const
{
    return std_out;
}

std::shared_ptr<Pipeline>
BPDFLogger::standardError() const
{
    return std_err;
}
