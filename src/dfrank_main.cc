#include "cli.hh"
#include "errors.hh"
#include "graph_io.hh"
#include "pagerank.hh"
#include <CLI/CLI.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>

namespace {
using namespace dfrank;

std::unique_ptr<ExecutionEngine> MakeEngine(size_t num_threads) {
  if (num_threads <= 1) {
    return std::make_unique<SequentialEngine>();
  }
  return std::make_unique<ThreadedEngine>(num_threads);
}

void PrintTopVertices(const ResultGraph &result, size_t n) {
  std::cout << "Top " << n << " vertices:\n";
  for (const auto &[id, weight] : result.TopVertices(n)) {
    std::cout << "Vertex " << std::setw(8) << id << ": " << std::fixed
              << std::setprecision(6) << weight << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  // Main program setup
  CLI::App app{"dfrank - PageRank over vertex and edge tables"};
  FixedOptions fixed_opts;
  ConvergeOptions converge_opts;

  auto subcmds = CreateCli(app, fixed_opts, converge_opts);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const bool is_fixed = subcmds.fixed->parsed();
  const CommonOptions &active_opts =
      is_fixed ? static_cast<const CommonOptions &>(fixed_opts)
               : static_cast<const CommonOptions &>(converge_opts);

  SetupLogging(active_opts);

  try {
    PageRankConfig::Builder builder = MakeConfigBuilder(active_opts);
    RunControl control;
    if (is_fixed) {
      builder.FixedIterations(fixed_opts.num_iterations);
    } else {
      builder.UntilConvergence(converge_opts.tolerance)
          .SetMaxSupersteps(converge_opts.max_supersteps);
      if (converge_opts.time_budget_ms > 0) {
        control.time_budget =
            std::chrono::milliseconds(converge_opts.time_budget_ms);
      }
    }
    PageRankConfig config = builder.Build();

    const char delimiter = active_opts.delimiter[0];
    std::optional<std::string> vertex_file;
    if (!active_opts.vertex_file.empty()) {
      vertex_file = active_opts.vertex_file;
    }
    Graph graph = LoadGraph(vertex_file, active_opts.edge_file, delimiter);

    auto engine = MakeEngine(active_opts.num_threads);
    PageRankResult result =
        RunPageRank(graph, config, *engine, std::move(control));

    std::stringstream ss;
    ss << result.stats;
    std::cout << ss.str() << "\n\n";
    PrintTopVertices(result.graph, active_opts.top);

    if (!active_opts.out_vertex_file.empty()) {
      WriteVertexTable(active_opts.out_vertex_file, result.graph, delimiter);
      spdlog::info("Wrote vertex weights to {}", active_opts.out_vertex_file);
    }
    if (!active_opts.out_edge_file.empty()) {
      WriteEdgeTable(active_opts.out_edge_file, result.graph, delimiter);
      spdlog::info("Wrote edge weights to {}", active_opts.out_edge_file);
    }
  } catch (const PageRankError &e) {
    spdlog::error("PageRank failed: {}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  spdlog::info("PageRank complete");
  return 0;
}
