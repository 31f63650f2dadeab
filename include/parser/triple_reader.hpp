#pragma once

#include "graph/triple.hpp"
#include "parser/dictionary.hpp"
#include <optional>
#include <string>
#include <vector>

namespace isum {

/**
 * @brief One textual fact before dictionary encoding
 */
struct Statement {
    std::string subject;
    std::string predicate;
    std::string object;
};

/**
 * @brief Facts added and removed by an update file
 */
struct UpdateSet {
    std::vector<Triple> additions;
    std::vector<Triple> deletions;

    bool empty() const { return additions.empty() && deletions.empty(); }
};

/**
 * @brief Read all lines of a text file
 * @throws std::runtime_error if the file cannot be opened
 */
std::vector<std::string> read_lines(const std::string& path);

/**
 * @brief Parse one N-Triples style line `<s> <p> <o> .`
 *
 * Terms are IRIs in angle brackets, blank nodes, bare tokens or quoted
 * literals (with optional language tag or datatype). The final dot may be
 * omitted.
 *
 * @return std::nullopt for blank lines and `#` comments
 * @throws std::runtime_error for malformed lines
 */
std::optional<Statement> parse_statement(const std::string& line);

/**
 * @brief Encode fact lines, assigning dictionary ids to unseen terms
 * @param source Name used in error messages
 */
std::vector<Triple> parse_fact_lines(const std::vector<std::string>& lines,
                                     Dictionary& dict,
                                     const std::string& source = "<input>");

/**
 * @brief Encode update lines: `+ <statement>` adds, `- <statement>` removes
 */
UpdateSet parse_update_lines(const std::vector<std::string>& lines,
                             Dictionary& dict,
                             const std::string& source = "<input>");

std::vector<Triple> read_fact_file(const std::string& path, Dictionary& dict);
UpdateSet read_update_file(const std::string& path, Dictionary& dict);

} // namespace isum
