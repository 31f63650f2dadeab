#pragma once

#include "graph/summary_graph.hpp"
#include "index/clique_index.hpp"
#include "parser/dictionary.hpp"
#include "parser/triple_reader.hpp"
#include "update/deletion.hpp"
#include "update/insertion.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace isum {

// ============================================================================
// Update Configuration
// ============================================================================

/**
 * @brief Configuration for one incremental update run
 */
struct UpdateConfig {
    // Inputs
    std::string dataset_path;               ///< Base fact file
    std::string update_path;                ///< Update file with +/- lines
    std::string summary_path;               ///< Snapshot to update; empty = flat summary of the dataset

    // Outputs
    std::string output_path = "summary.json";   ///< Updated snapshot
    std::string statistics_path;            ///< Optional JSON statistics report

    // Processing
    bool apply_additions = true;            ///< Also register added facts
    bool validate_result = true;            ///< Check graph and clique invariants after the run
    bool verbose = true;                    ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     */
    static UpdateConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     */
    static UpdateConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Update Statistics
// ============================================================================

struct UpdateStatistics {
    size_t base_triples = 0;
    size_t dictionary_terms = 0;
    DeletionStatistics deletion;
    InsertionStatistics insertion;
    SummaryStatistics before;
    SummaryStatistics after;

    double load_time_seconds = 0.0;
    double maintenance_time_seconds = 0.0;
    double total_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// UpdatePipeline
// ============================================================================

/**
 * @brief Applies an update file to a summary snapshot
 *
 * Reads the dataset into a dictionary, encodes the updates, loads (or
 * builds) the summary graph, bootstraps the clique index, runs deletions
 * before additions and writes the new snapshot.
 */
class UpdatePipeline {
public:
    explicit UpdatePipeline(const UpdateConfig& config);

    /**
     * @brief Run the whole update and write the configured outputs
     * @throws std::runtime_error on I/O or parse errors
     * @throws ConsistencyError if the snapshot and updates disagree
     */
    UpdateStatistics run();

    const SummaryGraph& graph() const { return graph_; }
    const CliqueIndex& cliques() const { return cliques_; }
    const Dictionary& dictionary() const { return dictionary_; }

private:
    UpdateConfig config_;
    Dictionary dictionary_;
    SummaryGraph graph_;
    CliqueIndex cliques_;

    void check_invariants() const;
};

} // namespace isum
