#pragma once

#include "extract/extractor.hpp"
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace kbg {

/**
 * @brief One stanza of an OBO file with its tag values in file order
 */
struct OboStanza {
    std::string type;                                      // "Term", "Typedef", ...
    size_t line = 0;                                       // Line of the [Type] header
    std::map<std::string, std::vector<std::string>> tags;

    /**
     * @brief First value of a tag, or empty if absent
     */
    std::string first(const std::string& tag) const;

    const std::vector<std::string>& values(const std::string& tag) const;

    bool has(const std::string& tag) const { return tags.count(tag) > 0; }
};

/**
 * @brief Streams stanzas out of an OBO 1.2/1.4 flat file
 *
 * The header frame before the first stanza is skipped, as are comment lines.
 * Trailing "! comments" are left in place; callers strip them per tag.
 */
class OboReader {
public:
    explicit OboReader(const std::string& path);

    /**
     * @brief Read the next stanza
     * @return false at end of file
     */
    bool next(OboStanza& stanza);

private:
    std::string path_;
    std::ifstream stream_;
    size_t line_ = 0;
    std::string pending_header_;
    size_t pending_line_ = 0;
};

/**
 * @brief Extractor for hierarchical ontologies (GO, ChEBI, HP, DO, MEDIC, ...)
 *
 * Rules applied per [Term] stanza:
 * - accepted only with a name and, when the profile sets one, the target namespace
 * - is_obsolete: true emits a retraction instead of a concept
 * - every is_a becomes an edge (id, parent); one is_a sets the single-parent shortcut
 * - alt_id values resolve to the stanza id
 * - synonym text is the first double-quoted string
 * - optionally "relationship: derived_from X" emits (X, id)
 * - optionally xrefs with a prefix feed the external alias map
 */
class OboExtractor : public SourceExtractor {
public:
    using SourceExtractor::SourceExtractor;

    ExtractionResult extract() override;

    std::string get_format_name() const override { return "obo"; }

    /**
     * @brief Convert one stanza into a concept record
     * @return false if the stanza is filtered out
     * @throws MalformedRecordError when a required field is missing
     */
    bool convert_stanza(const OboStanza& stanza, ConceptRecord& record,
                        ExtractionStatistics& stats) const;

    /**
     * @brief Text between the first pair of unescaped double quotes
     */
    static std::string parse_synonym(const std::string& value);

    /**
     * @brief Identifier part of an is_a / alt_id / xref value
     *
     * Drops trailing comments, {qualifiers} and quoted descriptions.
     */
    static std::string parse_identifier(const std::string& value);
};

} // namespace kbg
