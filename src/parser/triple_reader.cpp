#include "parser/triple_reader.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace isum {

namespace {

void skip_spaces(const std::string& line, size_t& pos) {
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
}

// Reads one term starting at `pos` and leaves `pos` just past it
std::string read_term(const std::string& line, size_t& pos) {
    size_t start = pos;
    char first = line[pos];

    if (first == '<') {
        size_t end = line.find('>', pos + 1);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated IRI");
        }
        pos = end + 1;
        return line.substr(start, pos - start);
    }

    if (first == '"') {
        ++pos;
        bool closed = false;
        while (pos < line.size()) {
            if (line[pos] == '\\') {
                pos += 2;
                continue;
            }
            if (line[pos] == '"') {
                closed = true;
                ++pos;
                break;
            }
            ++pos;
        }
        if (!closed) {
            throw std::runtime_error("Unterminated literal");
        }
        // Language tag or datatype
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        return line.substr(start, pos - start);
    }

    while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    return line.substr(start, pos - start);
}

// True if only the closing dot (and maybe a comment) is left
bool at_terminator(const std::string& line, size_t pos) {
    if (line[pos] != '.') {
        return false;
    }
    ++pos;
    skip_spaces(line, pos);
    return pos >= line.size() || line[pos] == '#';
}

std::string location(const std::string& source, size_t line_number) {
    return source + ":" + std::to_string(line_number);
}

Triple encode(const Statement& statement, Dictionary& dict) {
    NodeId sub = dict.get_or_insert(statement.subject);
    NodeId pred = dict.get_or_insert(statement.predicate);
    NodeId obj = dict.get_or_insert(statement.object);
    return Triple(sub, pred, obj);
}

} // namespace

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::optional<Statement> parse_statement(const std::string& line) {
    size_t pos = 0;
    skip_spaces(line, pos);
    if (pos >= line.size() || line[pos] == '#') {
        return std::nullopt;
    }

    std::string terms[3];
    for (int i = 0; i < 3; ++i) {
        skip_spaces(line, pos);
        if (pos >= line.size() || at_terminator(line, pos)) {
            throw std::runtime_error("Expected 3 terms, found " + std::to_string(i));
        }
        terms[i] = read_term(line, pos);
    }

    skip_spaces(line, pos);
    if (pos < line.size() && line[pos] == '.') {
        ++pos;
        skip_spaces(line, pos);
    }
    if (pos < line.size() && line[pos] != '#') {
        throw std::runtime_error("Unexpected text after object: " + line.substr(pos));
    }

    return Statement{terms[0], terms[1], terms[2]};
}

std::vector<Triple> parse_fact_lines(const std::vector<std::string>& lines,
                                     Dictionary& dict,
                                     const std::string& source) {
    std::vector<Triple> triples;
    triples.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        std::optional<Statement> statement;
        try {
            statement = parse_statement(lines[i]);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(location(source, i + 1) + ": " + e.what());
        }
        if (statement) {
            triples.push_back(encode(*statement, dict));
        }
    }

    return triples;
}

UpdateSet parse_update_lines(const std::vector<std::string>& lines,
                             Dictionary& dict,
                             const std::string& source) {
    UpdateSet updates;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        size_t pos = 0;
        skip_spaces(line, pos);
        if (pos >= line.size() || line[pos] == '#') {
            continue;
        }

        char op = line[pos];
        if (op != '+' && op != '-') {
            throw std::runtime_error(location(source, i + 1) +
                                     ": Update line must start with '+' or '-'");
        }

        std::optional<Statement> statement;
        try {
            statement = parse_statement(line.substr(pos + 1));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(location(source, i + 1) + ": " + e.what());
        }
        if (!statement) {
            throw std::runtime_error(location(source, i + 1) + ": Missing statement after '" +
                                     std::string(1, op) + "'");
        }

        Triple triple = encode(*statement, dict);
        if (op == '+') {
            updates.additions.push_back(triple);
        } else {
            updates.deletions.push_back(triple);
        }
    }

    return updates;
}

std::vector<Triple> read_fact_file(const std::string& path, Dictionary& dict) {
    return parse_fact_lines(read_lines(path), dict, path);
}

UpdateSet read_update_file(const std::string& path, Dictionary& dict) {
    return parse_update_lines(read_lines(path), dict, path);
}

} // namespace isum
