#include "extract/tabular_extractors.hpp"
#include "common/errors.hpp"
#include "extract/text_utils.hpp"

namespace kbg {

namespace {

bool is_blank_record(const std::vector<std::string>& fields) {
    return fields.size() == 1 && fields.front().empty();
}

void require_width(const DelimitedReader& reader, const std::vector<std::string>& fields,
                   size_t width) {
    if (fields.size() < width) {
        throw MalformedRecordError(
            reader.path(), reader.line_number(),
            "expected at least " + std::to_string(width) + " columns, found " +
            std::to_string(fields.size()));
    }
}

}  // namespace

// ============================================================================
// CtdTsvExtractor
// ============================================================================

ExtractionResult CtdTsvExtractor::extract() {
    ExtractionResult result;
    result.kb = profile_.kb;

    const ColumnLayout& cols = profile_.columns;
    const size_t width = cols.required_width(SourceFormat::Tsv);

    DelimitedReader reader(files_.primary, '\t');
    std::vector<std::string> fields;

    while (reader.next(fields)) {
        if (reader.record_number() <= profile_.header_rows) continue;
        if (is_blank_record(fields)) continue;

        ++result.stats.records_read;
        require_width(reader, fields, width);

        ConceptRecord record;
        record.name = fields[cols.name];
        record.id = fields[cols.id];
        if (record.id.empty()) {
            throw MalformedRecordError(reader.path(), reader.line_number(), "empty identifier");
        }
        record.parents = split_values(fields[cols.parents], profile_.parent_separator);
        record.synonyms = split_values(fields[cols.synonyms], profile_.synonym_separator);

        ++result.stats.records_accepted;
        result.concepts.push_back(std::move(record));
    }

    return result;
}

// ============================================================================
// TaxonomyCsvExtractor
// ============================================================================

std::string TaxonomyCsvExtractor::local_id(const std::string& uri) const {
    const std::string& marker = profile_.source_uri_marker;
    size_t pos = uri.find(marker);
    if (pos == std::string::npos) {
        return "";
    }
    size_t start = pos + marker.size();
    size_t end = uri.find(marker, start);
    std::string stem = uri.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (stem.empty()) {
        return "";
    }
    return profile_.id_prefix + stem;
}

ExtractionResult TaxonomyCsvExtractor::extract() {
    ExtractionResult result;
    result.kb = profile_.kb;

    const ColumnLayout& cols = profile_.columns;
    const size_t width = cols.required_width(SourceFormat::Csv);

    DelimitedReader reader(files_.primary, ',');
    std::vector<std::string> fields;

    while (reader.next(fields)) {
        if (reader.record_number() <= profile_.header_rows) continue;
        if (is_blank_record(fields)) continue;

        ++result.stats.records_read;

        if (cols.id >= fields.size() ||
            fields[cols.id].find(profile_.source_uri_marker) == std::string::npos) {
            ++result.stats.records_filtered;
            continue;
        }

        try {
            require_width(reader, fields, width);
        } catch (const MalformedRecordError& e) {
            ++result.stats.records_skipped;
            warn_skipped(e.what());
            continue;
        }

        if (fields[cols.rank] != profile_.target_rank) {
            ++result.stats.records_filtered;
            continue;
        }

        ConceptRecord record;
        record.name = fields[cols.name];
        record.id = local_id(fields[cols.id]);
        if (record.id.empty()) {
            ++result.stats.records_skipped;
            warn_skipped(reader.path() + ":" + std::to_string(reader.line_number()) +
                         ": class URI has no identifier: " + fields[cols.id]);
            continue;
        }

        const std::string& parent_uri = fields[cols.parents];
        if (!parent_uri.empty()) {
            std::string parent_id = local_id(parent_uri);
            if (parent_id.empty()) {
                ++result.stats.records_skipped;
                warn_skipped(reader.path() + ":" + std::to_string(reader.line_number()) +
                             ": parent URI outside the registry: " + parent_uri);
                continue;
            }
            record.parents.push_back(parent_id);
        }

        record.synonyms = split_values(fields[cols.synonyms], profile_.synonym_separator);

        ++result.stats.records_accepted;
        result.concepts.push_back(std::move(record));
    }

    return result;
}

// ============================================================================
// GeneInfoExtractor
// ============================================================================

ExtractionResult GeneInfoExtractor::extract() {
    ExtractionResult result;
    result.kb = profile_.kb;

    const ColumnLayout& cols = profile_.columns;
    const size_t width = cols.required_width(SourceFormat::GeneInfo);

    DelimitedReader reader(files_.primary, '\t');
    std::vector<std::string> fields;

    while (reader.next(fields)) {
        if (reader.record_number() <= profile_.header_rows) continue;
        if (is_blank_record(fields)) continue;

        ++result.stats.records_read;
        require_width(reader, fields, width);

        ConceptRecord record;
        record.name = fields[cols.name];
        record.id = profile_.id_prefix + fields[cols.id];

        const std::string& description = fields[cols.description];
        if (!description.empty() && description != profile_.missing_value) {
            record.synonyms.push_back(description);
        }
        for (auto& synonym : split_values(fields[cols.synonyms], profile_.synonym_separator,
                                          profile_.missing_value)) {
            record.synonyms.push_back(std::move(synonym));
        }

        ++result.stats.records_accepted;
        result.concepts.push_back(std::move(record));
    }

    if (profile_.placeholder_edge) {
        result.edges.push_back({profile_.placeholder_edge->first,
                                profile_.placeholder_edge->second});
    }

    return result;
}

// ============================================================================
// TextExtractor
// ============================================================================

void TextExtractor::read_terms(const std::string& path, ExtractionResult& result) const {
    std::ifstream file = open_input(path);
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        chomp(line);
        if (line.empty()) continue;

        ++result.stats.records_read;
        auto fields = split(line, '\t');
        if (fields.size() < 2) {
            throw MalformedRecordError(path, line_number, "expected id<TAB>name");
        }

        ConceptRecord record;
        record.id = fields[0];
        record.name = fields[1];
        if (fields.size() == 3) {
            record.synonyms = split_values(fields[2], profile_.synonym_separator);
        }

        ++result.stats.records_accepted;
        result.concepts.push_back(std::move(record));
    }
}

void TextExtractor::read_edges(const std::string& path, ExtractionResult& result) const {
    std::ifstream file = open_input(path);
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        chomp(line);
        if (line.empty()) continue;

        auto fields = split(line, '\t');
        if (fields.size() < 2) {
            throw MalformedRecordError(path, line_number, "expected child<TAB>parent");
        }
        result.edges.push_back({fields[0], fields[1]});
    }
}

ExtractionResult TextExtractor::extract() {
    ExtractionResult result;
    result.kb = profile_.kb;

    read_terms(files_.terms, result);
    read_edges(files_.edges, result);

    return result;
}

} // namespace kbg
