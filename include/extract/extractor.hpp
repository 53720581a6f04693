#pragma once

#include "config/source_profile.hpp"
#include "model/records.hpp"
#include <memory>
#include <string>
#include <utility>

namespace kbg {

/**
 * @brief Input files for one extraction
 */
struct SourceFiles {
    std::string primary;    ///< Ontology, TSV, CSV or gene_info file
    std::string terms;      ///< Plain-text terms (txt format)
    std::string edges;      ///< Plain-text edges (txt format)
};

/**
 * @brief Abstract base class for source extractors
 *
 * Each format turns its raw file(s) into concept records and edges; the
 * knowledge-base builder takes it from there. Source-specific behaviour is
 * driven by the SourceProfile.
 */
class SourceExtractor {
public:
    SourceExtractor(SourceProfile profile, SourceFiles files)
        : profile_(std::move(profile)), files_(std::move(files)) {}

    virtual ~SourceExtractor() = default;

    /**
     * @brief Read the source and produce concepts and edges
     * @throws MissingFileError, MalformedRecordError
     */
    virtual ExtractionResult extract() = 0;

    /**
     * @brief Format tag handled by this extractor
     */
    virtual std::string get_format_name() const = 0;

    void set_verbose(bool verbose) { verbose_ = verbose; }

    const SourceProfile& profile() const { return profile_; }
    const SourceFiles& files() const { return files_; }

protected:
    SourceProfile profile_;
    SourceFiles files_;
    bool verbose_ = false;

    /**
     * @brief Report a skipped record on stderr when verbose
     */
    void warn_skipped(const std::string& message) const;
};

/**
 * @brief Factory selecting the extractor for a profile's format
 */
class ExtractorFactory {
public:
    static std::unique_ptr<SourceExtractor> create(
        const SourceProfile& profile,
        const SourceFiles& files
    );
};

} // namespace kbg
