#pragma once

#include "extract/extractor.hpp"
#include <string>
#include <vector>

namespace kbg {

/**
 * @brief Extractor for CTD hierarchical TSV exports (chemicals, anatomy, diseases)
 *
 * Skips the profile's header block; every following row yields name, id,
 * a parent list and a synonym list from fixed columns. Rows narrower than the
 * column layout abort the run.
 */
class CtdTsvExtractor : public SourceExtractor {
public:
    using SourceExtractor::SourceExtractor;

    ExtractionResult extract() override;

    std::string get_format_name() const override { return "tsv"; }
};

/**
 * @brief Extractor for the NCBI Taxonomy CSV registry
 *
 * Keeps rows whose class URI contains the profile's source marker and whose
 * rank matches the target rank. Identifiers are the URI stem after the
 * marker, prefixed with the local prefix; the parent column is converted the
 * same way. Short rows are skipped with a warning.
 */
class TaxonomyCsvExtractor : public SourceExtractor {
public:
    using SourceExtractor::SourceExtractor;

    ExtractionResult extract() override;

    std::string get_format_name() const override { return "csv"; }

    /**
     * @brief Local identifier for a class URI, or empty if the marker is absent
     */
    std::string local_id(const std::string& uri) const;
};

/**
 * @brief Extractor for NCBI gene_info registries
 *
 * Builds names and synonyms only. The registry carries no hierarchy, so the
 * profile's placeholder edge is emitted to keep the edge list non-empty.
 */
class GeneInfoExtractor : public SourceExtractor {
public:
    using SourceExtractor::SourceExtractor;

    ExtractionResult extract() override;

    std::string get_format_name() const override { return "gene_info"; }
};

/**
 * @brief Extractor for plain-text term and edge files
 *
 * terms: id<TAB>name[<TAB>synonym;synonym;...]
 * edges: child<TAB>parent
 * Blank lines are skipped in both files.
 */
class TextExtractor : public SourceExtractor {
public:
    using SourceExtractor::SourceExtractor;

    ExtractionResult extract() override;

    std::string get_format_name() const override { return "txt"; }

    void read_terms(const std::string& path, ExtractionResult& result) const;
    void read_edges(const std::string& path, ExtractionResult& result) const;
};

} // namespace kbg
