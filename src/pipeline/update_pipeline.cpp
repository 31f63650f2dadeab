#include "pipeline/update_pipeline.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace isum {

using json = nlohmann::json;

// ============================================================================
// UpdateConfig
// ============================================================================

UpdateConfig UpdateConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    UpdateConfig config;

    // Inputs
    if (j.contains("dataset_path")) config.dataset_path = j["dataset_path"].get<std::string>();
    if (j.contains("update_path")) config.update_path = j["update_path"].get<std::string>();
    if (j.contains("summary_path")) config.summary_path = j["summary_path"].get<std::string>();

    // Outputs
    if (j.contains("output_path")) config.output_path = j["output_path"].get<std::string>();
    if (j.contains("statistics_path")) config.statistics_path = j["statistics_path"].get<std::string>();

    // Processing
    if (j.contains("apply_additions")) config.apply_additions = j["apply_additions"].get<bool>();
    if (j.contains("validate_result")) config.validate_result = j["validate_result"].get<bool>();
    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();

    return config;
}

void UpdateConfig::to_json_file(const std::string& path) const {
    json j;

    j["dataset_path"] = dataset_path;
    j["update_path"] = update_path;
    j["summary_path"] = summary_path;

    j["output_path"] = output_path;
    j["statistics_path"] = statistics_path;

    j["apply_additions"] = apply_additions;
    j["validate_result"] = validate_result;
    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

UpdateConfig UpdateConfig::from_environment() {
    UpdateConfig config;

    const char* dataset = std::getenv("ISUM_DATASET");
    if (dataset) config.dataset_path = dataset;

    const char* updates = std::getenv("ISUM_UPDATES");
    if (updates) config.update_path = updates;

    const char* summary = std::getenv("ISUM_SUMMARY");
    if (summary) config.summary_path = summary;

    const char* output = std::getenv("ISUM_OUTPUT");
    if (output) config.output_path = output;

    const char* verbose = std::getenv("ISUM_VERBOSE");
    if (verbose) {
        std::string value = verbose;
        config.verbose = !(value == "0" || value == "false" || value == "no");
    }

    return config;
}

bool UpdateConfig::validate(std::string& error_message) const {
    if (dataset_path.empty()) {
        error_message = "Dataset path is required";
        return false;
    }

    if (output_path.empty()) {
        error_message = "Output path is required";
        return false;
    }

    if (!statistics_path.empty() && statistics_path == output_path) {
        error_message = "Statistics path must differ from the output path";
        return false;
    }

    return true;
}

// ============================================================================
// UpdateStatistics
// ============================================================================

void UpdateStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Update Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Input:\n";
    std::cout << "  Base facts: " << base_triples << "\n";
    std::cout << "  Dictionary terms: " << dictionary_terms << "\n\n";

    deletion.print_summary();
    std::cout << "\n";
    insertion.print_summary();
    std::cout << "\n";

    std::cout << "Before:\n";
    std::cout << "  Nodes: " << before.num_nodes << ", supernodes: " << before.num_supernodes
              << ", top-level: " << before.num_top_level << "\n";
    std::cout << "After:\n";
    std::cout << "  Nodes: " << after.num_nodes << ", supernodes: " << after.num_supernodes
              << ", top-level: " << after.num_top_level << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Loading: " << load_time_seconds << " seconds\n";
    std::cout << "  Maintenance: " << maintenance_time_seconds << " seconds\n";
    std::cout << "  Total: " << total_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json UpdateStatistics::to_json() const {
    json j;
    j["base_triples"] = base_triples;
    j["dictionary_terms"] = dictionary_terms;
    j["deletion"] = deletion.to_json();
    j["insertion"] = insertion.to_json();
    j["before"] = before.to_json();
    j["after"] = after.to_json();
    j["load_time_seconds"] = load_time_seconds;
    j["maintenance_time_seconds"] = maintenance_time_seconds;
    j["total_time_seconds"] = total_time_seconds;
    return j;
}

// ============================================================================
// UpdatePipeline
// ============================================================================

UpdatePipeline::UpdatePipeline(const UpdateConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

UpdateStatistics UpdatePipeline::run() {
    UpdateStatistics stats;
    auto start = std::chrono::high_resolution_clock::now();

    if (config_.verbose) {
        std::cout << "Loading dataset from: " << config_.dataset_path << "\n";
    }
    std::vector<Triple> base = read_fact_file(config_.dataset_path, dictionary_);
    stats.base_triples = base.size();

    if (config_.summary_path.empty()) {
        if (config_.verbose) {
            std::cout << "No summary configured, starting from an unclustered graph\n";
        }
        graph_ = SummaryGraph::from_triples(base);
    } else {
        if (config_.verbose) {
            std::cout << "Loading summary from: " << config_.summary_path << "\n";
        }
        graph_ = SummaryGraph::load_from_json(config_.summary_path);
    }

    // Terms first seen in the update file must not reuse supernode ids
    if (!graph_.empty()) {
        dictionary_.reserve_through(graph_.max_id());
    }

    UpdateSet updates;
    if (!config_.update_path.empty()) {
        if (config_.verbose) {
            std::cout << "Loading updates from: " << config_.update_path << "\n";
        }
        updates = read_update_file(config_.update_path, dictionary_);
    }
    stats.dictionary_terms = dictionary_.size();

    cliques_.build(graph_);
    stats.before = graph_.compute_statistics();

    auto loaded = std::chrono::high_resolution_clock::now();
    stats.load_time_seconds = std::chrono::duration<double>(loaded - start).count();

    if (config_.verbose) {
        std::cout << "Applying " << updates.deletions.size() << " deletions";
        if (config_.apply_additions) {
            std::cout << " and " << updates.additions.size() << " additions";
        }
        std::cout << "\n";
    }

    DeletionMaintainer deletion(graph_, cliques_);
    deletion.set_verbose(config_.verbose);
    deletion.apply(updates.deletions);
    stats.deletion = deletion.statistics();

    if (config_.apply_additions) {
        InsertionMaintainer insertion(graph_, cliques_);
        insertion.set_verbose(config_.verbose);
        insertion.apply(updates.additions);
        stats.insertion = insertion.statistics();
    }

    auto maintained = std::chrono::high_resolution_clock::now();
    stats.maintenance_time_seconds = std::chrono::duration<double>(maintained - loaded).count();

    if (config_.validate_result) {
        check_invariants();
    }
    stats.after = graph_.compute_statistics();

    if (config_.verbose) {
        std::cout << "Saving summary to: " << config_.output_path << "\n";
    }
    graph_.save_to_json(config_.output_path);

    auto end = std::chrono::high_resolution_clock::now();
    stats.total_time_seconds = std::chrono::duration<double>(end - start).count();

    if (!config_.statistics_path.empty()) {
        std::ofstream file(config_.statistics_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + config_.statistics_path);
        }
        file << stats.to_json().dump(2);
    }

    return stats;
}

void UpdatePipeline::check_invariants() const {
    std::string error;
    if (!graph_.validate(error)) {
        throw std::logic_error("Summary graph invariants broken after update: " + error);
    }
    if (!cliques_.validate(error)) {
        throw std::logic_error("Clique index out of sync after update: " + error);
    }
}

} // namespace isum
