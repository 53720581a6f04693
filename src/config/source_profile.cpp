#include "config/source_profile.hpp"
#include "common/errors.hpp"
#include <algorithm>

namespace kbg {

namespace {

SourceProfile obo_profile(const std::string& kb, const std::string& file_name) {
    SourceProfile profile;
    profile.kb = kb;
    profile.format = SourceFormat::Obo;
    profile.file_name = file_name;
    return profile;
}

SourceProfile ctd_profile(const std::string& kb, const std::string& file_name,
                          const RootConcept& root) {
    SourceProfile profile;
    profile.kb = kb;
    profile.format = SourceFormat::Tsv;
    profile.file_name = kb + "/" + file_name;
    profile.header_rows = 29;
    profile.columns.name = 0;
    profile.columns.id = 1;
    profile.columns.parents = 4;
    profile.columns.synonyms = 7;
    profile.root = root;
    profile.always_inject_root = true;
    return profile;
}

std::string optional_string(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : std::string();
}

char separator_from_json(const nlohmann::json& j, const char* key, char fallback) {
    std::string value = optional_string(j, key);
    return value.empty() ? fallback : value.front();
}

}  // namespace

// ============================================================================
// SourceFormat
// ============================================================================

std::string source_format_to_string(SourceFormat format) {
    switch (format) {
        case SourceFormat::Obo: return "obo";
        case SourceFormat::Tsv: return "tsv";
        case SourceFormat::Csv: return "csv";
        case SourceFormat::GeneInfo: return "gene_info";
        case SourceFormat::Txt: return "txt";
    }
    return "unknown";
}

std::optional<SourceFormat> source_format_from_string(const std::string& tag) {
    if (tag == "obo") return SourceFormat::Obo;
    if (tag == "tsv") return SourceFormat::Tsv;
    if (tag == "csv") return SourceFormat::Csv;
    if (tag == "gene_info") return SourceFormat::GeneInfo;
    if (tag == "txt") return SourceFormat::Txt;
    return std::nullopt;
}

// ============================================================================
// ColumnLayout
// ============================================================================

size_t ColumnLayout::required_width(SourceFormat format) const {
    switch (format) {
        case SourceFormat::Tsv:
            return std::max({name, id, parents, synonyms}) + 1;
        case SourceFormat::Csv:
            return std::max({id, name, synonyms, parents, rank}) + 1;
        case SourceFormat::GeneInfo:
            return std::max({id, name, synonyms, description}) + 1;
        case SourceFormat::Txt:
            return 2;
        case SourceFormat::Obo:
            return 0;
    }
    return 0;
}

// ============================================================================
// SourceProfile
// ============================================================================

nlohmann::json SourceProfile::to_json() const {
    nlohmann::json j;
    j["kb"] = kb;
    j["format"] = source_format_to_string(format);
    j["file_name"] = file_name;

    if (target_namespace) j["target_namespace"] = *target_namespace;
    j["derived_from_edges"] = derived_from_edges;
    if (xref_alias_prefix) j["xref_alias_prefix"] = *xref_alias_prefix;

    if (root) {
        j["root"] = {{"id", root->id}, {"name", root->name}};
    }
    j["always_inject_root"] = always_inject_root;
    j["bridging_children"] = bridging_children;

    j["header_rows"] = header_rows;
    j["columns"] = {
        {"id", columns.id},
        {"name", columns.name},
        {"parents", columns.parents},
        {"synonyms", columns.synonyms},
        {"rank", columns.rank},
        {"description", columns.description}
    };
    j["parent_separator"] = std::string(1, parent_separator);
    j["synonym_separator"] = std::string(1, synonym_separator);
    j["source_uri_marker"] = source_uri_marker;
    j["target_rank"] = target_rank;
    j["id_prefix"] = id_prefix;
    j["missing_value"] = missing_value;

    if (placeholder_edge) {
        j["placeholder_edge"] = {placeholder_edge->first, placeholder_edge->second};
    }

    return j;
}

SourceProfile SourceProfile::from_json(const nlohmann::json& j) {
    SourceProfile profile;
    profile.kb = j.at("kb").get<std::string>();

    std::string tag = j.at("format").get<std::string>();
    auto format = source_format_from_string(tag);
    if (!format) {
        throw UnknownFormatError(profile.kb, tag);
    }
    profile.format = *format;
    if (profile.format == SourceFormat::Txt) {
        profile.synonym_separator = ';';
    }
    profile.file_name = optional_string(j, "file_name");

    if (j.contains("target_namespace")) {
        profile.target_namespace = j["target_namespace"].get<std::string>();
    }
    profile.derived_from_edges = j.value("derived_from_edges", false);
    if (j.contains("xref_alias_prefix")) {
        profile.xref_alias_prefix = j["xref_alias_prefix"].get<std::string>();
    }

    if (j.contains("root")) {
        profile.root = RootConcept{
            j["root"].at("id").get<std::string>(),
            j["root"].at("name").get<std::string>()
        };
    }
    profile.always_inject_root = j.value("always_inject_root", false);
    if (j.contains("bridging_children")) {
        profile.bridging_children = j["bridging_children"].get<std::vector<std::string>>();
    }

    profile.header_rows = j.value("header_rows", static_cast<size_t>(0));
    if (j.contains("columns")) {
        const auto& c = j["columns"];
        profile.columns.id = c.value("id", profile.columns.id);
        profile.columns.name = c.value("name", profile.columns.name);
        profile.columns.parents = c.value("parents", profile.columns.parents);
        profile.columns.synonyms = c.value("synonyms", profile.columns.synonyms);
        profile.columns.rank = c.value("rank", profile.columns.rank);
        profile.columns.description = c.value("description", profile.columns.description);
    }
    profile.parent_separator = separator_from_json(j, "parent_separator", profile.parent_separator);
    profile.synonym_separator = separator_from_json(j, "synonym_separator", profile.synonym_separator);
    profile.source_uri_marker = optional_string(j, "source_uri_marker");
    profile.target_rank = optional_string(j, "target_rank");
    profile.id_prefix = optional_string(j, "id_prefix");
    if (j.contains("missing_value")) {
        profile.missing_value = j["missing_value"].get<std::string>();
    }

    if (j.contains("placeholder_edge")) {
        auto pair = j["placeholder_edge"].get<std::vector<std::string>>();
        if (pair.size() == 2) {
            profile.placeholder_edge = std::make_pair(pair[0], pair[1]);
        }
    }

    return profile;
}

// ============================================================================
// SourceProfileRegistry
// ============================================================================

SourceProfileRegistry SourceProfileRegistry::defaults() {
    SourceProfileRegistry registry;

    // Gene Ontology is one file; each sub-ontology keeps its own namespace
    SourceProfile go_bp = obo_profile("go_bp", "go-basic.obo");
    go_bp.target_namespace = "biological_process";
    go_bp.root = RootConcept{"GO:0008150", "biological_process"};
    registry.add(go_bp);

    SourceProfile go_cc = obo_profile("go_cc", "go-basic.obo");
    go_cc.target_namespace = "cellular_component";
    go_cc.root = RootConcept{"GO:0005575", "cellular_component"};
    registry.add(go_cc);

    // ChEBI has several top-level branches with no common ancestor
    SourceProfile chebi = obo_profile("chebi", "chebi.obo");
    chebi.root = RootConcept{"CHEBI:00", "root"};
    chebi.bridging_children = {
        "CHEBI:24431",  // chemical entity
        "CHEBI:50906",  // role
        "CHEBI:36342",  // subatomic particle
        "CHEBI:33232"   // application
    };
    registry.add(chebi);

    SourceProfile hp = obo_profile("hp", "hp.obo");
    hp.root = RootConcept{"HP:0000001", "All"};
    hp.xref_alias_prefix = "UMLS:";
    registry.add(hp);

    SourceProfile medic_obo = obo_profile("medic", "CTD_diseases.obo");
    medic_obo.root = RootConcept{"MESH:C", "Diseases"};
    registry.add(medic_obo);

    SourceProfile doid = obo_profile("do", "doid.obo");
    doid.root = RootConcept{"DOID:4", "disease"};
    registry.add(doid);

    SourceProfile cellosaurus = obo_profile("cellosaurus", "cellosaurus.obo");
    cellosaurus.derived_from_edges = true;
    registry.add(cellosaurus);

    registry.add(obo_profile("cl", "cl-basic.obo"));
    registry.add(obo_profile("uberon", "uberon-basic.obo"));

    // CTD exports
    registry.add(ctd_profile("ctd_chem", "CTD_chemicals.tsv", {"MESH:D", "Chemicals"}));
    registry.add(ctd_profile("ctd_anat", "CTD_anatomy.tsv", {"MESH:A", "Anatomy"}));
    registry.add(ctd_profile("medic", "CTD_diseases.tsv", {"MESH:C", "Diseases"}));

    // NCBI Taxonomy (BioPortal CSV export), species only
    SourceProfile taxon;
    taxon.kb = "ncbi_taxon";
    taxon.format = SourceFormat::Csv;
    taxon.file_name = "NCBITAXON.csv";
    taxon.header_rows = 1;
    taxon.columns.id = 0;
    taxon.columns.name = 1;
    taxon.columns.synonyms = 2;
    taxon.columns.parents = 7;
    taxon.columns.rank = 9;
    taxon.source_uri_marker = "NCBITAXON/";
    taxon.target_rank = "species";
    taxon.id_prefix = "NCBITaxon_";
    registry.add(taxon);

    // NCBI Gene
    SourceProfile gene;
    gene.kb = "ncbi_gene";
    gene.format = SourceFormat::GeneInfo;
    gene.file_name = "ncbi_gene/All_Data.gene_info";
    gene.header_rows = 7;
    gene.columns.id = 1;
    gene.columns.name = 2;
    gene.columns.synonyms = 4;
    gene.columns.description = 8;
    gene.synonym_separator = '/';
    gene.id_prefix = "NCBIGene_";
    gene.placeholder_edge = std::make_pair(std::string("NCBIGene1"), std::string("NCBIGene2"));
    registry.add(gene);

    return registry;
}

void SourceProfileRegistry::add(const SourceProfile& profile) {
    profiles_[{profile.kb, profile.format}] = profile;
}

std::optional<SourceProfile> SourceProfileRegistry::find(
    const std::string& kb,
    SourceFormat format
) const {
    auto it = profiles_.find({kb, format});
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

SourceProfile SourceProfileRegistry::resolve(
    const std::string& kb,
    const std::string& format_tag
) const {
    auto format = source_format_from_string(format_tag);
    if (format) {
        if (auto profile = find(kb, *format)) {
            return *profile;
        }
    }

    // Registry sources are selected by kb tag for anything but obo or tsv
    if (!format || (*format != SourceFormat::Obo && *format != SourceFormat::Tsv)) {
        for (SourceFormat keyed : {SourceFormat::Csv, SourceFormat::GeneInfo}) {
            if (auto profile = find(kb, keyed)) {
                return *profile;
            }
        }
    }

    if (!format) {
        throw UnknownFormatError(kb, format_tag);
    }

    if (*format == SourceFormat::Obo || *format == SourceFormat::Txt) {
        SourceProfile generic;
        generic.kb = kb;
        generic.format = *format;
        generic.synonym_separator = ';';
        return generic;
    }

    throw UnknownFormatError(kb, format_tag);
}

std::vector<SourceProfile> SourceProfileRegistry::all() const {
    std::vector<SourceProfile> result;
    result.reserve(profiles_.size());
    for (const auto& [key, profile] : profiles_) {
        result.push_back(profile);
    }
    return result;
}

} // namespace kbg
