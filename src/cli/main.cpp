// =============================================================================
// clam CLI - build cluster trees and run nearest-neighbor searches
// =============================================================================
//
// Usage:
//   clam [global options] <command> [options]
//
// Commands:
//   build       Build a tree and print its statistics
//   knn         k-nearest-neighbor search
//   range       Range search
//   bench       Compare search algorithms on one tree
//   metrics     List available metrics
//   version     Show version information
//
// Examples:
//   clam build -d points.npy --tree-csv tree.csv
//   clam knn -d points.csv -q queries.csv -k 10 --algorithm best-first
//   clam range -d words.txt --type string -m levenshtein -r 2
//   clam -t 8 bench -d points.npy -k 10 --tolerance 0.1
//
// =============================================================================

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "clam/cakes.hpp"
#include "clam/config.hpp"
#include "clam/error.hpp"
#include "clam/io/dataset_loader.hpp"
#include "clam/logging.hpp"
#include "clam/metrics.hpp"
#include "clam/thread_config.hpp"
#include "clam/util/timer.hpp"

// Forward declarations for command modules
namespace clam::cli {
    int cmd_build(int argc, char* argv[]);
    int cmd_knn(int argc, char* argv[]);
    int cmd_range(int argc, char* argv[]);
    int cmd_bench(int argc, char* argv[]);
    int cmd_metrics(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define CLAM_VERSION_MAJOR 0
#define CLAM_VERSION_MINOR 3
#define CLAM_VERSION_PATCH 0
#define CLAM_VERSION_STRING "0.3.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"build",   "Build a tree and print its statistics", clam::cli::cmd_build},
    {"knn",     "k-nearest-neighbor search", clam::cli::cmd_knn},
    {"range",   "Range search", clam::cli::cmd_range},
    {"bench",   "Compare search algorithms on one tree", clam::cli::cmd_bench},
    {"metrics", "List available metrics", clam::cli::cmd_metrics},
    {"version", "Show version information", clam::cli::cmd_version},
    {"help",    "Show this help message", clam::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    size_t threads = 0;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

// Per-command options; unset values fall back to the configuration
struct CommandOptions {
    std::string data;
    std::string queries;
    std::string type = "dense";
    std::string metric;
    std::string algorithm;
    std::string tree_csv;
    size_t k = 10;
    size_t num_queries = 10;
    std::optional<double> radius;
    std::optional<double> tolerance;
    std::optional<size_t> min_cardinality;
    std::optional<double> min_radius;
    std::optional<size_t> max_depth;
};

namespace {

size_t parse_size(const std::string& option, const std::string& value) {
    try {
        size_t consumed = 0;
        const unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || value.find('-') != std::string::npos) {
            throw std::invalid_argument(value);
        }
        return static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        throw clam::InvalidArgumentError("Expected a non-negative integer for " + option + ", got '" + value + "'");
    }
}

double parse_double(const std::string& option, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw clam::InvalidArgumentError("Expected a number for " + option + ", got '" + value + "'");
    }
}

CommandOptions parse_command_options(int argc, char* argv[]) {
    CommandOptions options;

    for (int i = 0; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw clam::InvalidArgumentError("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-d" || arg == "--data") {
            options.data = value();
        } else if (arg == "-q" || arg == "--queries") {
            options.queries = value();
        } else if (arg == "--type") {
            options.type = value();
        } else if (arg == "-m" || arg == "--metric") {
            options.metric = value();
        } else if (arg == "-a" || arg == "--algorithm") {
            options.algorithm = value();
        } else if (arg == "-k") {
            options.k = parse_size(arg, value());
        } else if (arg == "-n" || arg == "--num-queries") {
            options.num_queries = parse_size(arg, value());
        } else if (arg == "-r" || arg == "--radius") {
            options.radius = parse_double(arg, value());
        } else if (arg == "--tolerance") {
            options.tolerance = parse_double(arg, value());
        } else if (arg == "--min-cardinality") {
            options.min_cardinality = parse_size(arg, value());
        } else if (arg == "--min-radius") {
            options.min_radius = parse_double(arg, value());
        } else if (arg == "--max-depth") {
            options.max_depth = parse_size(arg, value());
        } else if (arg == "--tree-csv") {
            options.tree_csv = value();
        } else {
            throw clam::InvalidArgumentError("Unknown option: " + arg, "", "Run 'clam help' for usage");
        }
    }

    if (options.type != "dense" && options.type != "string") {
        throw clam::InvalidArgumentError("Unknown dataset type: " + options.type, "", "Use dense or string");
    }
    if (options.metric.empty()) {
        options.metric = options.type == "dense" ? "euclidean" : "levenshtein";
    }
    return options;
}

clam::BuildConfig build_config_for(const CommandOptions& options) {
    clam::BuildConfig config = clam::BuildConfig::from_config(clam::Config::getInstance());
    if (options.min_cardinality) config.min_cardinality = *options.min_cardinality;
    if (options.min_radius) config.min_radius = *options.min_radius;
    if (options.max_depth) config.max_depth = *options.max_depth;
    return config;
}

double tolerance_for(const CommandOptions& options) {
    if (options.tolerance) return *options.tolerance;
    return clam::SearchConfig::from_config(clam::Config::getInstance()).tolerance;
}

// Dataset, metric and query loading per instance type
template<typename T>
struct Inputs;

template<>
struct Inputs<clam::DenseVector> {
    static std::shared_ptr<const clam::Dataset<clam::DenseVector>> dataset(const std::string& path) {
        return clam::io::load_dense_dataset(path);
    }
    static std::shared_ptr<const clam::Metric<clam::DenseVector>> metric(const std::string& name) {
        return clam::make_dense_metric(name);
    }
    static std::vector<clam::DenseVector> queries(const std::string& path) {
        return clam::io::load_dense(path);
    }
};

template<>
struct Inputs<std::string> {
    static std::shared_ptr<const clam::Dataset<std::string>> dataset(const std::string& path) {
        return clam::io::load_string_dataset(path);
    }
    static std::shared_ptr<const clam::Metric<std::string>> metric(const std::string& name) {
        return clam::make_string_metric(name);
    }
    static std::vector<std::string> queries(const std::string& path) {
        return clam::io::load_strings(path);
    }
};

template<typename T>
clam::Cakes<T> build_index(const CommandOptions& options) {
    if (options.data.empty()) {
        throw clam::InvalidArgumentError("No dataset given", "", "Pass --data <file>");
    }

    auto dataset = Inputs<T>::dataset(options.data);
    auto metric = Inputs<T>::metric(options.metric);
    if (dataset->empty()) {
        throw clam::EmptyDatasetError("Dataset file has no instances", options.data);
    }

    return clam::Cakes<T>::build(dataset, metric, build_config_for(options),
                                 clam::CacheConfig::from_config(clam::Config::getInstance()),
                                 g_options.threads);
}

// Queries from --queries, or the first --num-queries dataset items
template<typename T>
std::vector<T> load_queries(const CommandOptions& options, const clam::Cakes<T>& index) {
    if (!options.queries.empty()) {
        return Inputs<T>::queries(options.queries);
    }
    std::vector<T> queries;
    const auto& dataset = index.space().dataset();
    const size_t count = std::min(options.num_queries, dataset.cardinality());
    for (size_t i = 0; i < count; ++i) {
        queries.push_back(dataset.instance(i));
    }
    return queries;
}

void print_outcomes(const std::vector<clam::QueryOutcome>& outcomes) {
    std::cout << "query\trank\tindex\tdistance\n";
    for (size_t q = 0; q < outcomes.size(); ++q) {
        const auto& outcome = outcomes[q];
        if (!outcome.ok()) {
            std::cerr << "query " << q << ": " << outcome.message << "\n";
            continue;
        }
        if (q == 0 && !g_options.quiet) {
            std::cerr << "search: " << outcome.result->algorithm << " ("
                      << clam::search_mode_name(outcome.result->mode) << ")\n";
        }
        const auto& hits = outcome.result->hits;
        for (size_t rank = 0; rank < hits.size(); ++rank) {
            std::cout << q << '\t' << rank << '\t' << hits[rank].index << '\t'
                      << std::setprecision(9) << hits[rank].distance << '\n';
        }
    }
}

int exit_code_for(const std::vector<clam::QueryOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) return 3;
    }
    return 0;
}

// =============================================================================
// Typed command bodies
// =============================================================================

template<typename T>
int run_build(const CommandOptions& options) {
    auto index = build_index<T>(options);
    const clam::TreeStats& stats = index.tree().stats();

    std::cout << "cardinality\t" << stats.cardinality << "\n";
    std::cout << "metric\t" << index.space().metric_name() << "\n";
    std::cout << "clusters\t" << stats.num_clusters << "\n";
    std::cout << "leaves\t" << stats.num_leaves << "\n";
    std::cout << "height\t" << stats.height << "\n";
    std::cout << "root_radius\t" << stats.root_radius << "\n";
    std::cout << "leaf_cardinality_min\t" << stats.min_leaf_cardinality << "\n";
    std::cout << "leaf_cardinality_max\t" << stats.max_leaf_cardinality << "\n";
    std::cout << "leaf_cardinality_mean\t" << stats.mean_leaf_cardinality << "\n";
    std::cout << "build_seconds\t" << stats.build_seconds << "\n";
    std::cout << "build_distance_calls\t" << stats.build_distance_calls << "\n";

    if (!options.tree_csv.empty()) {
        std::ofstream out(options.tree_csv);
        if (!out) {
            throw clam::IOError("Cannot write tree CSV", options.tree_csv, "",
                                clam::ErrorCode::IO_FAILURE);
        }
        index.tree().write_csv(out);
        if (!g_options.quiet) {
            std::cerr << "Wrote " << stats.num_clusters << " clusters to " << options.tree_csv << "\n";
        }
    }
    return 0;
}

template<typename T>
int run_knn(const CommandOptions& options) {
    auto index = build_index<T>(options);
    const std::vector<T> queries = load_queries(options, index);

    const double tolerance = tolerance_for(options);
    if (options.algorithm == "approximate" || (options.algorithm.empty() && tolerance > 0.0)) {
        auto outcomes = index.batch_approximate_knn(queries, options.k, tolerance);
        print_outcomes(outcomes);
        return exit_code_for(outcomes);
    }

    clam::KnnAlgorithm algorithm = clam::KnnAlgorithm::DepthFirst;
    if (!options.algorithm.empty()) {
        auto parsed = clam::parse_knn_algorithm(options.algorithm);
        if (!parsed) {
            throw clam::InvalidArgumentError("Unknown k-NN algorithm: " + options.algorithm, "",
                                             "Use depth-first, best-first, repeated-rnn, linear or approximate");
        }
        algorithm = *parsed;
    }

    auto outcomes = index.batch_knn(queries, options.k, algorithm);
    print_outcomes(outcomes);
    return exit_code_for(outcomes);
}

template<typename T>
int run_range(const CommandOptions& options) {
    if (!options.radius) {
        throw clam::InvalidArgumentError("No radius given", "", "Pass --radius <r>");
    }

    clam::RangeAlgorithm algorithm = clam::RangeAlgorithm::Clustered;
    if (!options.algorithm.empty()) {
        auto parsed = clam::parse_range_algorithm(options.algorithm);
        if (!parsed) {
            throw clam::InvalidArgumentError("Unknown range algorithm: " + options.algorithm, "",
                                             "Use clustered or linear");
        }
        algorithm = *parsed;
    }

    auto index = build_index<T>(options);
    const std::vector<T> queries = load_queries(options, index);

    auto outcomes = index.batch_range(queries, *options.radius, algorithm);
    print_outcomes(outcomes);
    return exit_code_for(outcomes);
}

// Fraction of the true k nearest found by an approximate answer
double recall(const std::vector<clam::Hit>& truth, const std::vector<clam::Hit>& found) {
    if (truth.empty()) return 1.0;
    size_t matched = 0;
    for (const auto& hit : found) {
        for (const auto& expected : truth) {
            if (hit.index == expected.index) {
                ++matched;
                break;
            }
        }
    }
    return static_cast<double>(matched) / static_cast<double>(truth.size());
}

template<typename T>
int run_bench(const CommandOptions& options) {
    auto index = build_index<T>(options);
    const std::vector<T> queries = load_queries(options, index);
    const size_t k = std::min(options.k, index.cardinality());

    std::cout << "build\t" << index.tree().stats().build_seconds << " s\t"
              << index.tree().num_clusters() << " clusters\n";
    std::cout << "algorithm\tqueries_per_second\tmean_distance_calls\trecall\n";

    std::vector<std::vector<clam::Hit>> truth;

    auto report = [&](const std::string& name, const std::vector<clam::QueryOutcome>& outcomes,
                      double seconds, bool measure_recall) {
        const clam::BatchSummary summary = clam::BatchRunner::summarize(outcomes);
        double recall_sum = 0.0;
        for (size_t q = 0; q < outcomes.size(); ++q) {
            if (measure_recall && outcomes[q].ok()) {
                recall_sum += recall(truth[q], outcomes[q].result->hits);
            }
        }
        const double qps = seconds > 0.0 ? static_cast<double>(outcomes.size()) / seconds : 0.0;
        const double mean_calls = outcomes.empty()
            ? 0.0 : static_cast<double>(summary.distance_calls) / static_cast<double>(outcomes.size());
        std::cout << name << '\t' << qps << '\t' << mean_calls << '\t';
        if (measure_recall && !outcomes.empty()) {
            std::cout << recall_sum / static_cast<double>(outcomes.size());
        } else {
            std::cout << "1";
        }
        std::cout << '\n';
        return summary.failures;
    };

    size_t failures = 0;
    for (clam::KnnAlgorithm algorithm : clam::all_knn_algorithms()) {
        clam::Timer timer;
        std::vector<clam::QueryOutcome> outcomes;
        {
            clam::ScopedTimer scoped(timer);
            outcomes = index.batch_knn(queries, k, algorithm);
        }

        if (algorithm == clam::KnnAlgorithm::Linear) {
            for (const auto& outcome : outcomes) {
                truth.push_back(outcome.ok() ? outcome.result->hits : std::vector<clam::Hit>());
            }
        }
        failures += report(clam::knn_algorithm_name(algorithm), outcomes, timer.elapsed_seconds(), false);
    }

    double tolerance = tolerance_for(options);
    if (tolerance <= 0.0) tolerance = 0.1;

    clam::Timer timer;
    std::vector<clam::QueryOutcome> approximate;
    {
        clam::ScopedTimer scoped(timer);
        approximate = index.batch_approximate_knn(queries, k, tolerance);
    }
    failures += report("approximate(" + std::to_string(tolerance) + ")", approximate,
                       timer.elapsed_seconds(), true);

    return failures == 0 ? 0 : 3;
}

template<template<typename> class Body>
int dispatch_by_type(int argc, char* argv[]) {
    const CommandOptions options = parse_command_options(argc, argv);
    if (options.type == "string") {
        return Body<std::string>::run(options);
    }
    return Body<clam::DenseVector>::run(options);
}

template<typename T> struct BuildBody { static int run(const CommandOptions& o) { return run_build<T>(o); } };
template<typename T> struct KnnBody   { static int run(const CommandOptions& o) { return run_knn<T>(o); } };
template<typename T> struct RangeBody { static int run(const CommandOptions& o) { return run_range<T>(o); } };
template<typename T> struct BenchBody { static int run(const CommandOptions& o) { return run_bench<T>(o); } };

} // namespace

// =============================================================================
// Commands
// =============================================================================

namespace clam::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "clam - nearest-neighbor search in metric spaces\n";
    std::cout << "Version " << CLAM_VERSION_STRING << "\n\n";
    std::cout << "Usage: clam [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -t, --threads <n>         Worker threads (default: hardware concurrency)\n";
    std::cout << "  -c, --config <file>       Configuration file (key = value)\n";
    std::cout << "  -v, --verbose             Debug logging\n";
    std::cout << "      --quiet               Errors only\n";
    std::cout << "\nCommand Options:\n";
    std::cout << "  -d, --data <file>         Dataset (.csv, .tsv, .npy, or text for strings)\n";
    std::cout << "  -q, --queries <file>      Query file (default: first --num-queries items)\n";
    std::cout << "  -n, --num-queries <n>     Dataset items used as queries (default: 10)\n";
    std::cout << "      --type <dense|string> Instance type (default: dense)\n";
    std::cout << "  -m, --metric <name>       Metric (default: euclidean / levenshtein)\n";
    std::cout << "  -a, --algorithm <name>    depth-first, best-first, repeated-rnn, linear,\n";
    std::cout << "                            approximate; clustered or linear for range\n";
    std::cout << "  -k <n>                    Neighbors per query (default: 10)\n";
    std::cout << "  -r, --radius <r>          Range search radius\n";
    std::cout << "      --tolerance <eps>     Approximate search tolerance\n";
    std::cout << "      --min-cardinality <n> Leaf cardinality threshold\n";
    std::cout << "      --min-radius <r>      Leaf radius threshold\n";
    std::cout << "      --max-depth <n>       Maximum tree depth (0 = unlimited)\n";
    std::cout << "      --tree-csv <file>     Write the tree as CSV (build)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  CLAM_LOG_LEVEL, CLAM_MAX_THREADS, CLAM_MIN_CARDINALITY, CLAM_TOLERANCE, ...\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "clam " << CLAM_VERSION_STRING << "\n";
    std::cout << "Threads: " << clam::ThreadConfig::instance().get_thread_count()
              << " (hardware " << clam::ThreadConfig::instance().get_hardware_concurrency() << ")\n";
    return 0;
}

int cmd_metrics([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "dense:";
    for (const auto& name : clam::dense_metric_names()) std::cout << ' ' << name;
    std::cout << "\nstring:";
    for (const auto& name : clam::string_metric_names()) std::cout << ' ' << name;
    std::cout << "\n";
    return 0;
}

int cmd_build(int argc, char* argv[]) {
    return dispatch_by_type<BuildBody>(argc, argv);
}

int cmd_knn(int argc, char* argv[]) {
    return dispatch_by_type<KnnBody>(argc, argv);
}

int cmd_range(int argc, char* argv[]) {
    return dispatch_by_type<RangeBody>(argc, argv);
}

int cmd_bench(int argc, char* argv[]) {
    return dispatch_by_type<BenchBody>(argc, argv);
}

}  // namespace clam::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            g_options.threads = parse_size(arg, argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        parse_global_options(argc, argv);

        if (argc < 1) {
            clam::cli::cmd_help(0, nullptr);
            return 1;
        }

        if (!clam::init_config(g_options.config_file)) {
            std::cerr << "Invalid configuration\n";
            return 1;
        }
        if (g_options.verbose) {
            clam::set_log_level(clam::LogLevel::DEBUG);
            clam::Config::getInstance().print();
        }
        if (g_options.quiet) clam::set_log_level(clam::LogLevel::ERROR);

        if (g_options.threads == 0) {
            g_options.threads = clam::Config::getInstance().get<size_t>("perf.max_threads", 0);
        }
        if (g_options.threads > 0) {
            clam::ThreadConfig::instance().set_thread_count_override(g_options.threads);
        }

        const char* cmd_name = argv[0];
        ++argv;
        --argc;

        // Find and execute command
        for (const Command* cmd = g_commands; cmd->name; ++cmd) {
            if (strcmp(cmd->name, cmd_name) == 0) {
                return cmd->handler(argc, argv);
            }
        }

        std::cerr << "Unknown command: " << cmd_name << "\n";
        std::cerr << "Run 'clam help' for usage.\n";
        return 1;
    } catch (const clam::ClamException& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
