#include "vcsa/gexf_io.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace vcsa {
namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

constexpr int kParseFlags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

bool is_element(const xmlNode* n, const char* name) {
    return n->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char*>(n->name), name) == 0;
}

const xmlNode* first_child(const xmlNode* parent, const char* name) {
    for (const xmlNode* c = parent->children; c != nullptr; c = c->next) {
        if (is_element(c, name)) {
            return c;
        }
    }
    return nullptr;
}

std::string node_error(const xmlNode* n, const std::string& what) {
    return "line " + std::to_string(xmlGetLineNo(n)) + ": " + what;
}

std::optional<std::string> attribute(const xmlNode* n, const char* name) {
    xmlChar* v = xmlGetProp(n, reinterpret_cast<const xmlChar*>(name));
    if (v == nullptr) {
        return std::nullopt;
    }
    std::string out(reinterpret_cast<const char*>(v));
    xmlFree(v);
    return out;
}

std::string required_attribute(const xmlNode* n, const char* name) {
    auto v = attribute(n, name);
    if (!v) {
        throw std::runtime_error(node_error(n, "<" + std::string(reinterpret_cast<const char*>(n->name)) +
                                                   "> without '" + name + "' attribute"));
    }
    return *v;
}

std::string last_xml_error() {
    const xmlError* err = xmlGetLastError();
    if (err == nullptr || err->message == nullptr) {
        return "malformed XML";
    }
    std::string msg = err->message;
    while (!msg.empty() && std::isspace(static_cast<unsigned char>(msg.back()))) {
        msg.pop_back();
    }
    return "line " + std::to_string(err->line) + ": " + msg;
}

Graph graph_from_document(const xmlDoc* doc, const ReadGraphOptions& opt) {
    const xmlNode* root = xmlDocGetRootElement(doc);
    if (root == nullptr || !is_element(root, "gexf")) {
        throw std::runtime_error("not a GEXF document (root element must be <gexf>)");
    }
    const xmlNode* graph = first_child(root, "graph");
    if (graph == nullptr) {
        throw std::runtime_error(node_error(root, "<gexf> without <graph>"));
    }

    Graph g;
    for (const xmlNode* sec = graph->children; sec != nullptr; sec = sec->next) {
        if (!is_element(sec, "nodes")) {
            continue;
        }
        for (const xmlNode* n = sec->children; n != nullptr; n = n->next) {
            if (is_element(n, "node")) {
                g.add_vertex(required_attribute(n, "id"));
            }
        }
    }

    for (const xmlNode* sec = graph->children; sec != nullptr; sec = sec->next) {
        if (!is_element(sec, "edges")) {
            continue;
        }
        for (const xmlNode* e = sec->children; e != nullptr; e = e->next) {
            if (!is_element(e, "edge")) {
                continue;
            }
            const std::string a = required_attribute(e, "source");
            const std::string b = required_attribute(e, "target");
            if (a == b && !opt.allow_self_loops) {
                throw std::runtime_error(node_error(e, "self-loop on " + a));
            }
            if (!g.add_edge(a, b) && !opt.allow_duplicates) {
                throw std::runtime_error(node_error(e, "duplicate edge " + a + " " + b));
            }
        }
    }
    return g;
}

}  // namespace

Graph read_gexf(std::string_view xml, const ReadGraphOptions& opt) {
    if (xml.size() > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("read_gexf: document too large");
    }
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "graph.gexf", nullptr, kParseFlags),
                  &xmlFreeDoc);
    if (!doc) {
        throw std::runtime_error(last_xml_error());
    }
    return graph_from_document(doc.get(), opt);
}

Graph read_gexf_file(const std::string& path, const ReadGraphOptions& opt) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("failed to open graph file: " + path);
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    if (f.bad()) {
        throw std::runtime_error("failed to read graph file: " + path);
    }
    try {
        return read_gexf(buf.str(), opt);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

bool is_gexf_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".gexf";
}

Graph read_graph_file(const std::string& path, const ReadGraphOptions& opt) {
    if (is_gexf_path(path)) {
        return read_gexf_file(path, opt);
    }
    return read_edge_list_file(path, opt);
}

}  // namespace vcsa
