#include "config/ingest_config.hpp"
#include "common/errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kbg {

IngestConfig IngestConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw MissingFileError(path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    IngestConfig config;

    if (j.contains("data_dir")) config.data_dir = j["data_dir"].get<std::string>();
    if (j.contains("edgelist_dir")) config.edgelist_dir = j["edgelist_dir"].get<std::string>();

    if (j.contains("kb_file")) config.kb_file = j["kb_file"].get<std::string>();
    if (j.contains("terms_file")) config.terms_file = j["terms_file"].get<std::string>();
    if (j.contains("edges_file")) config.edges_file = j["edges_file"].get<std::string>();

    if (j.contains("num_threads")) config.num_threads = j["num_threads"].get<int>();
    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    if (j.contains("write_statistics")) config.write_statistics = j["write_statistics"].get<bool>();

    if (j.contains("sources")) {
        for (const auto& source : j["sources"]) {
            config.sources.push_back(SourceProfile::from_json(source));
        }
    }

    return config;
}

void IngestConfig::to_json_file(const std::string& path) const {
    json j;

    j["data_dir"] = data_dir;
    j["edgelist_dir"] = edgelist_dir;

    if (!kb_file.empty()) j["kb_file"] = kb_file;
    if (!terms_file.empty()) j["terms_file"] = terms_file;
    if (!edges_file.empty()) j["edges_file"] = edges_file;

    j["num_threads"] = num_threads;
    j["verbose"] = verbose;
    j["write_statistics"] = write_statistics;

    json sources_json = json::array();
    for (const auto& source : sources) {
        sources_json.push_back(source.to_json());
    }
    j["sources"] = sources_json;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

IngestConfig IngestConfig::from_environment() {
    IngestConfig config;
    config.apply_environment();
    return config;
}

void IngestConfig::apply_environment() {
    const char* env_data_dir = std::getenv("KBG_DATA_DIR");
    if (env_data_dir) data_dir = env_data_dir;

    const char* env_edgelist_dir = std::getenv("KBG_EDGELIST_DIR");
    if (env_edgelist_dir) edgelist_dir = env_edgelist_dir;

    const char* env_threads = std::getenv("KBG_THREADS");
    if (env_threads) {
        try {
            num_threads = std::stoi(env_threads);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("KBG_THREADS is not a number: ") + env_threads);
        }
    }

    const char* env_verbose = std::getenv("KBG_VERBOSE");
    if (env_verbose) {
        std::string value = env_verbose;
        verbose = !(value == "0" || value == "false" || value == "no");
    }
}

bool IngestConfig::validate(std::string& error_message) const {
    if (data_dir.empty()) {
        error_message = "Data directory must not be empty";
        return false;
    }

    if (edgelist_dir.empty()) {
        error_message = "Edge-list directory must not be empty";
        return false;
    }

    if (num_threads < 1) {
        error_message = "Number of threads must be at least 1";
        return false;
    }

    return true;
}

SourceProfileRegistry IngestConfig::make_registry() const {
    SourceProfileRegistry registry = SourceProfileRegistry::defaults();
    for (const auto& source : sources) {
        registry.add(source);
    }
    return registry;
}

IngestConfig load_config_with_fallback(const std::string& config_path) {
    IngestConfig config;
    if (!config_path.empty()) {
        config = IngestConfig::from_json_file(config_path);
    }
    config.apply_environment();
    return config;
}

} // namespace kbg
