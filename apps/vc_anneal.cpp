#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/cli_parse.hpp"
#include "vcsa/graph.hpp"
#include "vcsa/gexf_io.hpp"
#include "vcsa/graph_io.hpp"
#include "vcsa/logging.hpp"
#include "vcsa/multi_start.hpp"
#include "vcsa/vertex_cover_search.hpp"

namespace {

struct GraphInput {
    std::string name;
    std::string path;
};

struct Args {
    std::vector<GraphInput> graphs;
    std::optional<int> max_node;
    std::unordered_map<std::string, int> max_node_for;

    std::string preset = "improved";  // improved | baseline

    // Explicit overrides; unset fields keep the preset's value.
    std::optional<double> initial_temp;
    std::optional<double> cooling_rate;
    std::optional<int> max_iteration;
    bool early_stop_set = false;
    std::optional<int> early_stop;
    std::optional<std::string> move_policy;   // degree | uniform
    std::optional<std::string> cooling_law;   // geometric | decay
    std::optional<std::string> delta_ref;     // best | current
    bool count_rejections = false;
    std::string evaluator = "incremental";    // incremental | full

    std::uint64_t seed = 1;
    double time_limit = 0.0;
    int runs = 1;
    int threads = 0;
    int log_every = 0;

    std::string format = "table";  // table | json
    bool print_cover = false;
    std::string out_json;

    bool self_loops = true;
};

vcsa::MovePolicy parse_move_policy(const std::string& s) {
    if (s == "degree") {
        return vcsa::MovePolicy::kDegreeBiased;
    }
    if (s == "uniform") {
        return vcsa::MovePolicy::kUniform;
    }
    throw std::runtime_error("invalid --move-policy (use degree|uniform)");
}

vcsa::CoolingLaw parse_cooling_law(const std::string& s) {
    if (s == "geometric") {
        return vcsa::CoolingLaw::kGeometric;
    }
    if (s == "decay") {
        return vcsa::CoolingLaw::kGeometricDecay;
    }
    throw std::runtime_error("invalid --cooling-law (use geometric|decay)");
}

vcsa::DeltaReference parse_delta_ref(const std::string& s) {
    if (s == "best") {
        return vcsa::DeltaReference::kBest;
    }
    if (s == "current") {
        return vcsa::DeltaReference::kCurrent;
    }
    throw std::runtime_error("invalid --delta-ref (use best|current)");
}

vcsa::EvaluatorMode parse_evaluator(const std::string& s) {
    if (s == "incremental") {
        return vcsa::EvaluatorMode::kIncremental;
    }
    if (s == "full") {
        return vcsa::EvaluatorMode::kFullRecount;
    }
    throw std::runtime_error("invalid --evaluator (use incremental|full)");
}

GraphInput parse_graph_input(const std::string& s) {
    if (s.find('=') != std::string::npos) {
        auto [name, path] = split_name_value(s);
        return GraphInput{name, path};
    }
    return GraphInput{std::filesystem::path(s).stem().string(), s};
}

void print_usage() {
    std::cout
        << "Usage: vc_anneal --graph [name=]path [--graph ...] [--max-node K] [--max-node-for name=K]\n"
        << "                 [--preset improved|baseline] [--initial-temp T] [--cooling-rate r]\n"
        << "                 [--max-iteration N] [--early-stop N|off]\n"
        << "                 [--move-policy degree|uniform] [--cooling-law geometric|decay]\n"
        << "                 [--delta-ref best|current] [--count-rejections] [--evaluator incremental|full]\n"
        << "                 [--seed S] [--time-limit secs] [--runs R] [--threads T] [--log-every N]\n"
        << "                 [--no-self-loops] [--format table|json] [--print-cover] [--out-json path]\n"
        << "Graph files ending in .gexf are read as GEXF, anything else as an edge list.\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) { return require_arg(i, argc, argv, flag); };

        if (a == "--graph") {
            args.graphs.push_back(parse_graph_input(need("--graph")));
        } else if (a == "--max-node") {
            args.max_node = parse_int(need("--max-node"));
        } else if (a == "--max-node-for") {
            auto [name, value] = split_name_value(need("--max-node-for"));
            args.max_node_for[name] = parse_int(value);
        } else if (a == "--preset") {
            args.preset = need("--preset");
        } else if (a == "--initial-temp") {
            args.initial_temp = parse_double(need("--initial-temp"));
        } else if (a == "--cooling-rate") {
            args.cooling_rate = parse_double(need("--cooling-rate"));
        } else if (a == "--max-iteration") {
            args.max_iteration = parse_int(need("--max-iteration"));
        } else if (a == "--early-stop") {
            args.early_stop_set = true;
            args.early_stop = parse_optional_int(need("--early-stop"));
        } else if (a == "--move-policy") {
            args.move_policy = need("--move-policy");
        } else if (a == "--cooling-law") {
            args.cooling_law = need("--cooling-law");
        } else if (a == "--delta-ref") {
            args.delta_ref = need("--delta-ref");
        } else if (a == "--count-rejections") {
            args.count_rejections = true;
        } else if (a == "--evaluator") {
            args.evaluator = need("--evaluator");
        } else if (a == "--seed") {
            args.seed = parse_u64(need("--seed"));
        } else if (a == "--time-limit") {
            args.time_limit = parse_double(need("--time-limit"));
        } else if (a == "--runs") {
            args.runs = parse_int(need("--runs"));
        } else if (a == "--threads") {
            args.threads = parse_int(need("--threads"));
        } else if (a == "--log-every") {
            args.log_every = parse_int(need("--log-every"));
        } else if (a == "--no-self-loops") {
            args.self_loops = false;
        } else if (a == "--format") {
            args.format = need("--format");
        } else if (a == "--print-cover") {
            args.print_cover = true;
        } else if (a == "--out-json") {
            args.out_json = need("--out-json");
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    return args;
}

vcsa::SearchOptions build_options(const Args& args, int max_node) {
    vcsa::SearchOptions opt;
    if (args.preset == "improved") {
        opt = vcsa::improved_search_options(max_node);
    } else if (args.preset == "baseline") {
        opt = vcsa::baseline_search_options(max_node);
    } else {
        throw std::runtime_error("invalid --preset (use improved|baseline)");
    }

    if (args.initial_temp) {
        opt.initial_temp = *args.initial_temp;
    }
    if (args.cooling_rate) {
        opt.cooling_rate = *args.cooling_rate;
    }
    if (args.max_iteration) {
        opt.max_iteration = *args.max_iteration;
    }
    if (args.early_stop_set) {
        opt.early_stop = args.early_stop;
    }
    if (args.move_policy) {
        opt.move_policy = parse_move_policy(*args.move_policy);
    }
    if (args.cooling_law) {
        opt.cooling_law = parse_cooling_law(*args.cooling_law);
    }
    if (args.delta_ref) {
        opt.delta_reference = parse_delta_ref(*args.delta_ref);
    }
    opt.count_rejections = args.count_rejections;
    opt.evaluator = parse_evaluator(args.evaluator);
    opt.seed = args.seed;
    opt.time_limit_sec = args.time_limit;
    opt.log_every = args.log_every;
    return opt;
}

struct GraphOut {
    std::string name;
    int vertices = 0;
    int edges = 0;
    int max_node = 0;
    int best_run = 0;
    int runs = 1;
    vcsa::SearchResult res;
    std::vector<std::string> cover;
    double runtime = 0.0;
};

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (static_cast<unsigned char>(c) < 0x20) {
            std::ostringstream oss;
            oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
            out += oss.str();
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string render_json(const std::vector<GraphOut>& outs) {
    std::ostringstream out;
    out << std::setprecision(17);
    out << "{\n";
    out << "  \"graphs\": [\n";
    for (size_t i = 0; i < outs.size(); ++i) {
        const auto& g = outs[i];
        const auto& r = g.res;
        out << "    {\"name\": \"" << json_escape(g.name) << "\", \"vertices\": " << g.vertices
            << ", \"edges\": " << g.edges << ", \"max_node\": " << g.max_node << ", \"covered_edges\": "
            << r.best_covered << ", \"initial_covered\": " << r.initial_covered << ", \"runtime_s\": " << g.runtime
            << ", \"runs\": " << g.runs << ", \"best_run\": " << g.best_run << ", \"stop\": \""
            << vcsa::stop_reason_name(r.stop_reason) << "\", \"counters\": {\"iterations\": " << r.iterations
            << ", \"proposed\": " << r.proposed << ", \"accepted\": " << r.accepted << ", \"improved\": "
            << r.improved << ", \"no_move\": " << r.no_move << "}, \"cover\": [";
        for (size_t k = 0; k < g.cover.size(); ++k) {
            if (k > 0) {
                out << ", ";
            }
            out << "\"" << json_escape(g.cover[k]) << "\"";
        }
        out << "]}";
        if (i + 1 != outs.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << "  ]\n";
    out << "}\n";
    return out.str();
}

std::string render_table(const std::vector<GraphOut>& outs, bool print_cover) {
    std::ostringstream out;
    for (const auto& g : outs) {
        out << "Graph: " << g.name << "\n";
        out << "Vertices: " << g.vertices << "  Edges: " << g.edges << "  Max_Node: " << g.max_node << "\n";
        out << "Covered Edges: " << g.res.best_covered << " Edges\n";
        out << "Runtime: " << g.runtime << " seconds\n";
        if (print_cover) {
            out << "Vertex Cover:";
            for (const auto& l : g.cover) {
                out << " " << l;
            }
            out << "\n";
        }
        out << "\n";
    }
    return out.str();
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        if (args.graphs.empty()) {
            throw std::runtime_error("at least one --graph is required");
        }
        if (args.runs <= 0) {
            throw std::runtime_error("--runs must be > 0");
        }
        if (args.format != "table" && args.format != "json") {
            throw std::runtime_error("invalid --format (use table|json)");
        }

        vcsa::ReadGraphOptions read_opt;
        read_opt.allow_self_loops = args.self_loops;

        std::vector<GraphOut> outs;
        for (const auto& input : args.graphs) {
            std::optional<int> max_node = args.max_node;
            auto it = args.max_node_for.find(input.name);
            if (it != args.max_node_for.end()) {
                max_node = it->second;
            }
            if (!max_node) {
                std::lock_guard<std::mutex> lk(vcsa::log_mutex());
                std::cerr << "[vc_anneal] skipping " << input.name << ": no Max_Node given\n";
                continue;
            }

            const vcsa::Graph graph = vcsa::read_graph_file(input.path, read_opt);
            const vcsa::SearchOptions opt = build_options(args, *max_node);

            if (args.log_every > 0) {
                std::lock_guard<std::mutex> lk(vcsa::log_mutex());
                std::cerr << "[vc_anneal] " << input.name << ": vertices=" << graph.vertex_count()
                          << " edges=" << graph.edge_count() << " max_node=" << *max_node << " runs=" << args.runs
                          << "\n";
            }

            const auto t_start = std::chrono::steady_clock::now();
            vcsa::MultiStartOptions ms;
            ms.runs = args.runs;
            ms.threads = args.threads;
            const vcsa::MultiStartResult msr = vcsa::multi_start_search(graph, opt, ms);
            const auto t_end = std::chrono::steady_clock::now();

            GraphOut g;
            g.name = input.name;
            g.vertices = graph.vertex_count();
            g.edges = graph.edge_count();
            g.max_node = *max_node;
            g.best_run = msr.best_run;
            g.runs = args.runs;
            g.res = msr.best;
            g.cover = vcsa::cover_labels(graph, msr.best.best_members);
            g.runtime = std::chrono::duration_cast<std::chrono::duration<double>>(t_end - t_start).count();
            outs.push_back(std::move(g));
        }

        const std::string json = render_json(outs);
        if (args.format == "json") {
            std::cout << json;
        } else {
            std::cout << render_table(outs, args.print_cover);
        }

        if (!args.out_json.empty()) {
            std::ofstream f(args.out_json);
            if (!f) {
                throw std::runtime_error("failed to open --out-json file: " + args.out_json);
            }
            f << json;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
