#pragma once

#include "graph/triple.hpp"
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace isum {

/**
 * @brief One `--name <value>` (or `--name` for flags) accepted by a command
 */
struct OptionSpec {
    std::string name;
    char short_name = '\0';
    std::string description;
    std::string default_value;
    bool required = false;
    bool flag = false;
};

/**
 * @brief Option values of one invocation, after defaults are applied
 *
 * Lookups of options the command never declared, or that are unset without
 * a default, throw std::runtime_error naming the option.
 */
class ParsedOptions {
public:
    void set(const std::string& name, std::string value);

    bool has(const std::string& name) const { return values_.count(name) > 0; }
    const std::string& get(const std::string& name) const;
    bool flag(const std::string& name) const { return has(name); }

    NodeId id(const std::string& name) const;
    std::vector<NodeId> id_list(const std::string& name) const;

private:
    std::map<std::string, std::string> values_;
};

struct Command {
    std::string name;
    std::string description;
    std::vector<OptionSpec> options;
    std::function<int(const ParsedOptions&)> handler;

    void print_help(std::ostream& out) const;
};

/**
 * @brief Decimal node id, rejecting signs, garbage and values above 2^32-1
 */
NodeId parse_id(const std::string& text);

/**
 * @brief Comma-separated ids; empty items are skipped
 */
std::vector<NodeId> parse_id_list(const std::string& text);

/**
 * @brief Match `args` (everything after the command name) against `command`
 *
 * Accepts `--name value`, `--name=value` and `-s value`. Stray positional
 * words, unknown options, repeated options and missing required options
 * all throw std::runtime_error.
 */
ParsedOptions parse_options(const Command& command, const std::vector<std::string>& args);

/**
 * @brief Dispatcher for the `isum` subcommands
 */
class CommandLine {
public:
    void add(Command command);

    /**
     * @brief Parse argv, run the selected handler and return its exit code
     *
     * Errors thrown by the handler are printed to stderr and mapped to 1.
     */
    int run(int argc, char** argv) const;

    void print_usage(std::ostream& out) const;

private:
    const Command* find(const std::string& name) const;

    std::vector<Command> commands_;
};

} // namespace isum
