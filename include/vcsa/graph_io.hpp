#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "vcsa/graph.hpp"

namespace vcsa {

// Edge-list text format, one record per line:
//   u v [extra columns ignored]   edge between labels u and v
//   u                             isolated vertex
// Tokens are separated by whitespace and/or commas. Blank lines and lines
// starting with '#' or '%' are skipped.
struct ReadGraphOptions {
    bool allow_self_loops = true;
    bool allow_duplicates = true;  // when false, a repeated edge is an error instead of being dropped
};

std::vector<std::string> split_edge_list_tokens(std::string_view line);

Graph read_edge_list(std::istream& in, const ReadGraphOptions& opt = {});
Graph read_edge_list_file(const std::string& path, const ReadGraphOptions& opt = {});

// True when `label` survives a write/read cycle: non-empty, no separator and
// no leading comment marker.
bool is_writable_label(const std::string& label);

// Writes one declaration line per vertex in id order, then the edges, so
// read_edge_list() rebuilds the same ids. Throws std::runtime_error (before
// writing anything) if a label is not writable.
void write_edge_list(const Graph& graph, std::ostream& out);

}  // namespace vcsa
