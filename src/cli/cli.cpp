#include "cli/cli.hpp"
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#ifndef ISUM_VERSION
#define ISUM_VERSION "unknown"
#endif

namespace isum {

// ==========================================
// Id Parsing
// ==========================================

NodeId parse_id(const std::string& text) {
    if (text.empty() || text.size() > 10) {
        throw std::runtime_error("Invalid id: '" + text + "'");
    }

    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::runtime_error("Invalid id: '" + text + "'");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<NodeId>::max()) {
        throw std::runtime_error("Id out of range: " + text);
    }
    return static_cast<NodeId>(value);
}

std::vector<NodeId> parse_id_list(const std::string& text) {
    std::vector<NodeId> ids;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            ids.push_back(parse_id(item));
        }
    }
    return ids;
}

// ==========================================
// ParsedOptions
// ==========================================

void ParsedOptions::set(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

const std::string& ParsedOptions::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::runtime_error("Option --" + name + " is not set");
    }
    return it->second;
}

NodeId ParsedOptions::id(const std::string& name) const {
    return parse_id(get(name));
}

std::vector<NodeId> ParsedOptions::id_list(const std::string& name) const {
    return parse_id_list(get(name));
}

// ==========================================
// Parsing
// ==========================================

ParsedOptions parse_options(const Command& command, const std::vector<std::string>& args) {
    ParsedOptions parsed;

    auto lookup = [&command](const std::string& word) -> const OptionSpec* {
        for (const auto& option : command.options) {
            if (word == "--" + option.name) return &option;
            if (option.short_name != '\0' && word.size() == 2 && word[0] == '-' &&
                word[1] == option.short_name) {
                return &option;
            }
        }
        return nullptr;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        std::string word = args[i];
        std::string inline_value;
        bool has_inline = false;

        if (word.rfind("--", 0) == 0) {
            size_t eq = word.find('=');
            if (eq != std::string::npos) {
                inline_value = word.substr(eq + 1);
                word = word.substr(0, eq);
                has_inline = true;
            }
        } else if (word.empty() || word[0] != '-') {
            throw std::runtime_error(command.name + " takes no positional arguments, got: '" +
                                     word + "'");
        }

        const OptionSpec* option = lookup(word);
        if (!option) {
            throw std::runtime_error("Unknown option for " + command.name + ": " + word);
        }
        if (parsed.has(option->name)) {
            throw std::runtime_error("Option --" + option->name + " given twice");
        }

        if (option->flag) {
            if (has_inline) {
                throw std::runtime_error("Flag --" + option->name + " takes no value");
            }
            parsed.set(option->name, "");
        } else if (has_inline) {
            parsed.set(option->name, inline_value);
        } else {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Option " + word + " requires a value");
            }
            parsed.set(option->name, args[++i]);
        }
    }

    for (const auto& option : command.options) {
        if (parsed.has(option.name)) continue;
        if (option.required) {
            throw std::runtime_error("Missing required option: --" + option.name);
        }
        if (!option.default_value.empty()) {
            parsed.set(option.name, option.default_value);
        }
    }

    return parsed;
}

// ==========================================
// Help
// ==========================================

void Command::print_help(std::ostream& out) const {
    out << "Usage: isum " << name;
    for (const auto& option : options) {
        if (option.required) out << " --" << option.name << " <value>";
    }
    out << " [options]\n\n" << description << "\n\nOptions:\n";

    for (const auto& option : options) {
        out << "  --" << option.name;
        if (option.short_name != '\0') out << ", -" << option.short_name;
        if (!option.flag) out << " <value>";
        out << "\n      " << option.description;
        if (!option.default_value.empty()) out << " (default: " << option.default_value << ")";
        if (option.required) out << " [required]";
        out << "\n";
    }
}

void CommandLine::print_usage(std::ostream& out) const {
    out << "isum " << ISUM_VERSION << " - incremental maintenance of supernode summaries\n\n";
    out << "Usage: isum <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& command : commands_) {
        out << "  " << command.name;
        for (size_t i = command.name.size(); i < 12; ++i) out << ' ';
        out << command.description << "\n";
    }
    out << "\nSummaries are JSON snapshots with 'supernodes' and 'nodes' arrays.\n";
    out << "Node, predicate and supernode ids share one unsigned 32-bit space.\n";
    out << "'update' without --config reads ISUM_DATASET, ISUM_UPDATES, ISUM_SUMMARY,\n";
    out << "ISUM_OUTPUT and ISUM_VERBOSE.\n\n";
    out << "Run 'isum <command> --help' for the options of a command.\n";
}

// ==========================================
// Dispatch
// ==========================================

void CommandLine::add(Command command) {
    if (find(command.name)) {
        throw std::logic_error("Command registered twice: " + command.name);
    }
    commands_.push_back(std::move(command));
}

const Command* CommandLine::find(const std::string& name) const {
    for (const auto& command : commands_) {
        if (command.name == name) return &command;
    }
    return nullptr;
}

int CommandLine::run(int argc, char** argv) const {
    if (argc < 2) {
        print_usage(std::cerr);
        return 1;
    }

    std::string name = argv[1];
    if (name == "--help" || name == "-h" || name == "help") {
        print_usage(std::cout);
        return 0;
    }
    if (name == "--version" || name == "-v") {
        std::cout << "isum " << ISUM_VERSION << "\n";
        return 0;
    }

    const Command* command = find(name);
    if (!command) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'isum --help' for the list of commands.\n";
        return 1;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            command->print_help(std::cout);
            return 0;
        }
    }

    ParsedOptions options;
    try {
        options = parse_options(*command, args);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        command->print_help(std::cerr);
        return 1;
    }

    try {
        return command->handler(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace isum
