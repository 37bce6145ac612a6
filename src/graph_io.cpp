#include "vcsa/graph_io.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vcsa {
namespace {

bool is_separator(char c) {
    return c == ',' || std::isspace(static_cast<unsigned char>(c));
}

std::string line_error(int line_no, const std::string& what) {
    return "line " + std::to_string(line_no) + ": " + what;
}

}  // namespace

std::vector<std::string> split_edge_list_tokens(std::string_view line) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_separator(line[i])) {
            ++i;
        }
        const size_t b = i;
        while (i < line.size() && !is_separator(line[i])) {
            ++i;
        }
        if (i > b) {
            out.emplace_back(line.substr(b, i - b));
        }
    }
    return out;
}

Graph read_edge_list(std::istream& in, const ReadGraphOptions& opt) {
    Graph g;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        const auto tokens = split_edge_list_tokens(line);
        if (tokens.empty()) {
            continue;
        }
        if (tokens[0][0] == '#' || tokens[0][0] == '%') {
            continue;
        }

        if (tokens.size() == 1) {
            g.add_vertex(tokens[0]);
            continue;
        }

        const std::string& a = tokens[0];
        const std::string& b = tokens[1];
        if (a == b && !opt.allow_self_loops) {
            throw std::runtime_error(line_error(line_no, "self-loop on " + a));
        }
        if (!g.add_edge(a, b) && !opt.allow_duplicates) {
            throw std::runtime_error(line_error(line_no, "duplicate edge " + a + " " + b));
        }
    }

    if (in.bad()) {
        throw std::runtime_error("read_edge_list: stream error after line " + std::to_string(line_no));
    }
    return g;
}

Graph read_edge_list_file(const std::string& path, const ReadGraphOptions& opt) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open graph file: " + path);
    }
    try {
        return read_edge_list(f, opt);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

bool is_writable_label(const std::string& label) {
    if (label.empty() || label[0] == '#' || label[0] == '%') {
        return false;
    }
    for (char c : label) {
        if (is_separator(c)) {
            return false;
        }
    }
    return true;
}

void write_edge_list(const Graph& graph, std::ostream& out) {
    for (VertexId v = 0; v < graph.vertex_count(); ++v) {
        if (!is_writable_label(graph.label(v))) {
            throw std::runtime_error("write_edge_list: label of vertex " + std::to_string(v) +
                                     " cannot be stored in an edge list: '" + graph.label(v) + "'");
        }
    }

    // Every vertex is declared first so ids come back in the same order.
    out << "# vertices " << graph.vertex_count() << " edges " << graph.edge_count() << "\n";
    for (VertexId v = 0; v < graph.vertex_count(); ++v) {
        out << graph.label(v) << "\n";
    }
    for (const auto& e : graph.edges()) {
        out << graph.label(e.u) << " " << graph.label(e.v) << "\n";
    }
}

}  // namespace vcsa
