#include "cli/cli.hpp"
#include "graph/summary_graph.hpp"
#include "index/clique_index.hpp"
#include "parser/dictionary.hpp"
#include "parser/triple_reader.hpp"
#include "pipeline/update_pipeline.hpp"
#include <fstream>
#include <iostream>

using namespace isum;

// ============== Commands ==============

int cmd_init(const ParsedOptions& args) {
    std::string input_path = args.get("input");
    std::string output_path = args.get("output");

    std::cout << "Reading facts from: " << input_path << "\n";
    Dictionary dict;
    std::vector<Triple> triples = read_fact_file(input_path, dict);

    SummaryGraph graph = SummaryGraph::from_triples(triples);
    graph.save_to_json(output_path);
    std::cout << "Saved flat summary (" << graph.num_nodes() << " nodes, "
              << triples.size() << " facts) to: " << output_path << "\n";

    if (args.has("dictionary")) {
        std::string dict_path = args.get("dictionary");
        dict.save_to_json(dict_path);
        std::cout << "Saved dictionary (" << dict.size() << " terms) to: " << dict_path << "\n";
    }

    return 0;
}

int cmd_merge(const ParsedOptions& args) {
    std::string input_path = args.get("input");
    std::string output_path = args.has("output") ? args.get("output") : input_path;
    std::vector<NodeId> members = args.id_list("members");

    if (members.empty()) {
        std::cerr << "Error: --members must list at least one id\n";
        return 1;
    }

    SummaryGraph graph = SummaryGraph::load_from_json(input_path);
    NodeId into = args.has("into") ? args.id("into") : graph.next_free_id();
    if (graph.is_predicate(into)) {
        std::cerr << "Error: supernode id " << into << " is already used as a predicate\n";
        return 1;
    }

    graph.new_snode(members, into);

    std::string error;
    if (!graph.validate(error)) {
        std::cerr << "Error: merge produced an invalid summary: " << error << "\n";
        return 1;
    }

    graph.save_to_json(output_path);
    std::cout << "Merged " << members.size() << " ids into supernode " << into
              << " (" << graph.supernode_len(into) << " members)\n";
    std::cout << "Saved summary to: " << output_path << "\n";
    return 0;
}

int cmd_update(const ParsedOptions& args) {
    UpdateConfig config;
    if (args.has("config")) {
        config = UpdateConfig::from_json_file(args.get("config"));
    } else {
        config = UpdateConfig::from_environment();
    }

    // Explicit flags win over the config file and the environment
    if (args.has("dataset")) config.dataset_path = args.get("dataset");
    if (args.has("updates")) config.update_path = args.get("updates");
    if (args.has("summary")) config.summary_path = args.get("summary");
    if (args.has("output")) config.output_path = args.get("output");
    if (args.has("stats")) config.statistics_path = args.get("stats");
    if (args.flag("deletions-only")) config.apply_additions = false;
    if (args.flag("quiet")) config.verbose = false;

    UpdatePipeline pipeline(config);
    UpdateStatistics stats = pipeline.run();
    stats.print_summary();
    return 0;
}

int cmd_validate(const ParsedOptions& args) {
    std::string input_path = args.get("input");

    std::cout << "Loading summary from: " << input_path << "\n";
    SummaryGraph graph = SummaryGraph::load_from_json(input_path);

    CliqueIndex cliques;
    cliques.build(graph);

    std::string error;
    if (!cliques.validate(error)) {
        std::cerr << "Clique index check failed: " << error << "\n";
        return 1;
    }

    std::cout << "Summary is valid: " << graph.num_nodes() << " nodes, "
              << graph.num_supernodes() << " supernodes, "
              << cliques.num_cliques(CliqueRole::Source) << " source cliques, "
              << cliques.num_cliques(CliqueRole::Target) << " target cliques\n";
    return 0;
}

int cmd_stats(const ParsedOptions& args) {
    std::string input_path = args.get("input");

    std::cout << "Loading summary from: " << input_path << "\n";
    SummaryGraph graph = SummaryGraph::load_from_json(input_path);
    graph.compute_statistics().print_summary();

    CliqueIndex cliques;
    cliques.build(graph);
    cliques.print_summary();

    if (args.has("cliques")) {
        std::string cliques_path = args.get("cliques");
        std::ofstream file(cliques_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + cliques_path);
        }
        file << cliques.to_json().dump(2);
        std::cout << "Saved cliques to: " << cliques_path << "\n";
    }

    return 0;
}

int cmd_dict(const ParsedOptions& args) {
    std::string input_path = args.get("input");
    std::string output_path = args.get("output");

    Dictionary dict;
    std::vector<Triple> triples = read_fact_file(input_path, dict);
    if (args.has("updates")) {
        read_update_file(args.get("updates"), dict);
    }

    dict.save_to_json(output_path);
    std::cout << "Encoded " << triples.size() << " facts with " << dict.size()
              << " terms\n";
    std::cout << "Saved dictionary to: " << output_path << "\n";
    return 0;
}

// ============== Main ==============

int main(int argc, char** argv) {
    CommandLine cli;

    // isum init
    cli.add({
        "init",
        "Build an unclustered summary snapshot from a fact file",
        {
            {"input", 'i', "Input fact file (N-Triples)", "", true, false},
            {"output", 'o', "Output summary JSON file", "summary.json", false, false},
            {"dictionary", 'd', "Also write the term dictionary to this path", "", false, false}
        },
        cmd_init
    });

    // isum merge
    cli.add({
        "merge",
        "Merge nodes and supernodes of a snapshot into one supernode",
        {
            {"input", 'i', "Input summary JSON file", "", true, false},
            {"members", 'm', "Comma-separated node or supernode ids", "", true, false},
            {"into", 'n', "Supernode id (fresh, or one of the merged supernodes; default: next free id)", "", false, false},
            {"output", 'o', "Output summary JSON file (default: overwrite input)", "", false, false}
        },
        cmd_merge
    });

    // isum update
    cli.add({
        "update",
        "Apply an update file to a summary and maintain its cliques",
        {
            {"config", 'c', "Update config JSON file (default: ISUM_* environment)", "", false, false},
            {"dataset", 'd', "Base fact file", "", false, false},
            {"updates", 'u', "Update file with +/- lines", "", false, false},
            {"summary", 's', "Summary snapshot to update (default: flat summary of the dataset)", "", false, false},
            {"output", 'o', "Output summary JSON file", "", false, false},
            {"stats", 't', "Write run statistics JSON to this path", "", false, false},
            {"deletions-only", 'x', "Skip additions", "", false, true},
            {"quiet", 'q', "Only print the final summary", "", false, true}
        },
        cmd_update
    });

    // isum validate
    cli.add({
        "validate",
        "Check the invariants of a summary snapshot",
        {
            {"input", 'i', "Input summary JSON file", "", true, false}
        },
        cmd_validate
    });

    // isum stats
    cli.add({
        "stats",
        "Show summary and clique statistics",
        {
            {"input", 'i', "Input summary JSON file", "", true, false},
            {"cliques", 'c', "Write the bootstrapped cliques to this JSON file", "", false, false}
        },
        cmd_stats
    });

    // isum dict
    cli.add({
        "dict",
        "Export the term dictionary of a fact file",
        {
            {"input", 'i', "Input fact file (N-Triples)", "", true, false},
            {"updates", 'u', "Also encode the terms of an update file", "", false, false},
            {"output", 'o', "Output dictionary JSON file", "dictionary.json", false, false}
        },
        cmd_dict
    });

    return cli.run(argc, argv);
}
