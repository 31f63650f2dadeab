#pragma once

#include "graph/summary_graph.hpp"
#include "index/clique_index.hpp"
#include "update/maintenance_transaction.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace isum {

struct InsertionStatistics {
    size_t triples_processed = 0;
    size_t nodes_created = 0;
    size_t edges_added = 0;
    size_t duplicates = 0;
    size_t fingerprints_extended = 0;
    size_t relocations = 0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

/**
 * @brief Registers added facts in a SummaryGraph and keeps cliques in step
 *
 * Unseen endpoints become plain nodes with their own cliques. Known
 * endpoints gain the edge; a singleton clique picks up a new predicate and
 * an entity in a shared clique that no longer matches it moves to the
 * clique of its new fingerprint. Clusters are never merged here.
 */
class InsertionMaintainer {
public:
    InsertionMaintainer(SummaryGraph& graph, CliqueIndex& cliques);

    void set_verbose(bool verbose) { verbose_ = verbose; }

    void apply(const std::vector<Triple>& additions);
    void apply(const Triple& triple);

    const InsertionStatistics& statistics() const { return stats_; }

private:
    SummaryGraph& graph_;
    CliqueIndex& cliques_;
    MaintenanceTransaction transaction_;
    InsertionStatistics stats_;
    bool verbose_ = false;

    void process_endpoint(const Triple& triple, bool is_subject);
};

} // namespace isum
