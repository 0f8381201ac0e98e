// Converter.cpp – parse → expand → write.

#include "EpicsArchiveConfig/Converter.hpp"
#include "EpicsArchiveConfig/ChannelExpander.hpp"
#include "EpicsArchiveConfig/DbParser.hpp"

#include <string>
#include <utility>

namespace archcfg {

std::filesystem::path outputPathFor(const std::filesystem::path& input) {
    std::string       s      = input.string();
    const std::string suffix = kInputSuffix;
    if (s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
        s.erase(s.size() - suffix.size());
    return std::filesystem::path(s + kOutputSuffix);
}

ConversionSummary convertFile(const std::filesystem::path& input,
                              const EngineConfigOptions& opts) {
    ParsedDatabase db       = parseDatabaseFile(input);
    const auto     channels = expandChannels(db.records);

    ConversionSummary summary;
    summary.input              = input;
    summary.output             = outputPathFor(input);
    summary.records            = db.records.size();
    summary.channels           = channels.size();
    summary.skipped_attributes = db.skippedAttributes();
    summary.diagnostics        = std::move(db.diagnostics);

    writeEngineConfig(summary.output, channels, opts);
    return summary;
}

} // namespace archcfg
