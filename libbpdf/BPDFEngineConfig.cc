#include <bpdf/BPDFEngineConfig.hh>

#include <bpdf/BPDFLogger.hh>

char const*
BPDFEngineConfig::qualityName(quality_e quality)
{
    switch (quality) {
    case q_low:
        return "low";
    case q_medium:
        return "medium";
    case q_high:
        return "high";
    }
    return "medium";
}

bool
BPDFEngineConfig::parseQuality(std::string const& name, quality_e& quality)
{
    if (name == "low") {
        quality = q_low;
    } else if (name == "medium") {
        quality = q_medium;
    } else if (name == "high") {
        quality = q_high;
    } else {
        return false;
    }
    return true;
}

std::shared_ptr<BPDFLogger>
BPDFEngineConfig::getLogger() const
{
    return logger ? logger : BPDFLogger::defaultLogger();
}
