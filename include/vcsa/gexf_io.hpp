#pragma once

#include <string>
#include <string_view>

#include "vcsa/graph.hpp"
#include "vcsa/graph_io.hpp"

namespace vcsa {

// GEXF (Gephi) graph documents, as published for the yeast, eurosis, codeminer
// and cpan-authors datasets.
//
// Reads <gexf><graph><nodes><node id=.../> and <edges><edge source=... target=.../>.
// Node ids become vertex labels in document order; edges naming undeclared ids
// add those vertices. Directed graphs are read as undirected, so a reciprocal
// pair is one edge (reported as a duplicate when opt.allow_duplicates is false).
// Attributes, labels, weights and nested (hierarchical) nodes are ignored.
// Errors throw std::runtime_error carrying the XML line number.
Graph read_gexf(std::string_view xml, const ReadGraphOptions& opt = {});
Graph read_gexf_file(const std::string& path, const ReadGraphOptions& opt = {});

// True when `path` has a ".gexf" extension (any case).
bool is_gexf_path(const std::string& path);

// read_gexf_file() for GEXF paths, read_edge_list_file() otherwise.
Graph read_graph_file(const std::string& path, const ReadGraphOptions& opt = {});

}  // namespace vcsa
