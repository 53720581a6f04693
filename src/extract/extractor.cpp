#include "extract/extractor.hpp"
#include "common/errors.hpp"
#include "extract/obo_extractor.hpp"
#include "extract/tabular_extractors.hpp"
#include <iostream>

namespace kbg {

nlohmann::json ExtractionStatistics::to_json() const {
    nlohmann::json j;
    j["records_read"] = records_read;
    j["records_accepted"] = records_accepted;
    j["records_filtered"] = records_filtered;
    j["records_obsolete"] = records_obsolete;
    j["records_skipped"] = records_skipped;
    return j;
}

void SourceExtractor::warn_skipped(const std::string& message) const {
    if (verbose_) {
        std::cerr << "Warning: skipping record: " << message << "\n";
    }
}

std::unique_ptr<SourceExtractor> ExtractorFactory::create(
    const SourceProfile& profile,
    const SourceFiles& files
) {
    switch (profile.format) {
        case SourceFormat::Obo:
            return std::make_unique<OboExtractor>(profile, files);
        case SourceFormat::Tsv:
            return std::make_unique<CtdTsvExtractor>(profile, files);
        case SourceFormat::Csv:
            return std::make_unique<TaxonomyCsvExtractor>(profile, files);
        case SourceFormat::GeneInfo:
            return std::make_unique<GeneInfoExtractor>(profile, files);
        case SourceFormat::Txt:
            return std::make_unique<TextExtractor>(profile, files);
    }
    throw UnknownFormatError(profile.kb, source_format_to_string(profile.format));
}

} // namespace kbg
