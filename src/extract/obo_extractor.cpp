#include "extract/obo_extractor.hpp"
#include "common/errors.hpp"
#include "extract/text_utils.hpp"

namespace kbg {

namespace {

const std::vector<std::string> kNoValues;

const char* const kDerivedFrom = "derived_from ";

bool parse_stanza_header(const std::string& line, std::string& type) {
    if (line.size() < 3 || line.front() != '[' || line.back() != ']') {
        return false;
    }
    type = line.substr(1, line.size() - 2);
    return true;
}

}  // namespace

// ============================================================================
// OboStanza
// ============================================================================

std::string OboStanza::first(const std::string& tag) const {
    auto it = tags.find(tag);
    if (it == tags.end() || it->second.empty()) {
        return "";
    }
    return it->second.front();
}

const std::vector<std::string>& OboStanza::values(const std::string& tag) const {
    auto it = tags.find(tag);
    return it != tags.end() ? it->second : kNoValues;
}

// ============================================================================
// OboReader
// ============================================================================

OboReader::OboReader(const std::string& path)
    : path_(path), stream_(open_input(path)) {}

bool OboReader::next(OboStanza& stanza) {
    stanza = OboStanza{};

    std::string line;

    // Skip the header frame up to the first stanza
    while (pending_header_.empty()) {
        if (!std::getline(stream_, line)) {
            return false;
        }
        ++line_;
        chomp(line);
        std::string type;
        if (parse_stanza_header(trim(line), type)) {
            pending_header_ = type;
            pending_line_ = line_;
        }
    }

    stanza.type = pending_header_;
    stanza.line = pending_line_;
    pending_header_.clear();

    while (std::getline(stream_, line)) {
        ++line_;
        chomp(line);
        std::string trimmed = trim(line);

        if (trimmed.empty() || trimmed.front() == '!') {
            continue;
        }

        std::string type;
        if (parse_stanza_header(trimmed, type)) {
            pending_header_ = type;
            pending_line_ = line_;
            break;
        }

        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string tag = trim(trimmed.substr(0, colon));
        std::string value = trim(trimmed.substr(colon + 1));
        stanza.tags[tag].push_back(value);
    }

    return true;
}

// ============================================================================
// OboExtractor
// ============================================================================

std::string OboExtractor::parse_synonym(const std::string& value) {
    size_t open = value.find('"');
    if (open == std::string::npos) {
        return "";
    }

    std::string text;
    for (size_t i = open + 1; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\\' && i + 1 < value.size()) {
            text += value[++i];
        } else if (c == '"') {
            return text;
        } else {
            text += c;
        }
    }
    // Unterminated quote
    return "";
}

std::string OboExtractor::parse_identifier(const std::string& value) {
    std::string stripped = strip_obo_comment(value);
    size_t end = stripped.find_first_of(" \t{\"");
    return stripped.substr(0, end);
}

bool OboExtractor::convert_stanza(
    const OboStanza& stanza,
    ConceptRecord& record,
    ExtractionStatistics& stats
) const {
    const std::string& path = files_.primary;

    std::string id = parse_identifier(stanza.first("id"));
    if (id.empty()) {
        throw MalformedRecordError(path, stanza.line, "[Term] stanza without id");
    }

    std::string name = strip_obo_trailing(stanza.first("name"));
    if (name.empty()) {
        throw MalformedRecordError(path, stanza.line, "term " + id + " has no name");
    }

    if (profile_.target_namespace &&
        strip_obo_trailing(stanza.first("namespace")) != *profile_.target_namespace) {
        ++stats.records_filtered;
        return false;
    }

    record = ConceptRecord{};
    record.id = id;
    record.name = name;

    if (trim(stanza.first("is_obsolete")) == "true") {
        record.obsolete = true;
        ++stats.records_obsolete;
        return true;
    }

    for (const auto& value : stanza.values("alt_id")) {
        std::string alt_id = parse_identifier(value);
        if (!alt_id.empty()) {
            record.alt_ids.push_back(alt_id);
        }
    }

    for (const auto& value : stanza.values("is_a")) {
        std::string parent = parse_identifier(value);
        if (parent.empty()) {
            throw MalformedRecordError(path, stanza.line, "term " + id + " has an empty is_a");
        }
        record.parents.push_back(parent);
    }

    if (profile_.derived_from_edges) {
        for (const auto& value : stanza.values("relationship")) {
            std::string relation = strip_obo_comment(value);
            if (!starts_with(relation, kDerivedFrom)) continue;
            std::string origin = parse_identifier(relation.substr(std::string(kDerivedFrom).size()));
            if (!origin.empty()) {
                record.extra_edges.push_back({origin, id});
            }
        }
    }

    for (const auto& value : stanza.values("synonym")) {
        std::string synonym = parse_synonym(value);
        if (synonym.empty()) {
            throw MalformedRecordError(path, stanza.line,
                                       "term " + id + " has an unquoted synonym: " + value);
        }
        record.synonyms.push_back(synonym);
    }

    if (profile_.xref_alias_prefix) {
        const std::string& prefix = *profile_.xref_alias_prefix;
        for (const auto& value : stanza.values("xref")) {
            std::string xref = parse_identifier(value);
            if (starts_with(xref, prefix) && xref.size() > prefix.size()) {
                record.aliases.push_back(xref.substr(prefix.size()));
            }
        }
    }

    ++stats.records_accepted;
    return true;
}

ExtractionResult OboExtractor::extract() {
    ExtractionResult result;
    result.kb = profile_.kb;

    OboReader reader(files_.primary);
    OboStanza stanza;

    while (reader.next(stanza)) {
        if (stanza.type != "Term") {
            continue;
        }
        ++result.stats.records_read;

        ConceptRecord record;
        try {
            if (!convert_stanza(stanza, record, result.stats)) {
                continue;
            }
        } catch (const MalformedRecordError& e) {
            ++result.stats.records_skipped;
            warn_skipped(e.what());
            continue;
        }

        result.concepts.push_back(std::move(record));
    }

    return result;
}

} // namespace kbg
