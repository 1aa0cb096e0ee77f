#ifndef __DFRANK_PAGERANK_HH__
#define __DFRANK_PAGERANK_HH__

#include "execution_engine.hh"
#include "graph.hh"
#include "iteration_controller.hh"
#include "pagerank_config.hh"
#include "result_projector.hh"
#include <optional>

namespace dfrank {

struct PageRankResult {
  ResultGraph graph;
  RunStats stats;
};

// Runs PageRank on `graph` and projects the final ranks. Nothing is returned
// if the run throws.
//
// Note this is the unnormalized PageRank: a vertex without in-links ends with
// rank resetProb, and the mass of dangling vertices is not redistributed.
PageRankResult RunPageRank(const Graph &graph, const PageRankConfig &config,
                           ExecutionEngine &engine, RunControl control = {});

// Builds the configuration at run time, so a builder with no mode selected
// fails here with MissingConfigurationError.
PageRankResult RunPageRank(const Graph &graph,
                           const PageRankConfig::Builder &builder,
                           ExecutionEngine &engine, RunControl control = {});

// Fixed number of iterations on the calling thread.
PageRankResult
RunFixedIterations(const Graph &graph, int num_iterations,
                   double reset_probability =
                       PageRankConfig::kDefaultResetProbability,
                   std::optional<VertexId> source_id = std::nullopt);

// Dynamic PageRank until `tolerance` on the calling thread.
PageRankResult
RunToConvergence(const Graph &graph, double tolerance,
                 double reset_probability =
                     PageRankConfig::kDefaultResetProbability,
                 std::optional<VertexId> source_id = std::nullopt);

} // namespace dfrank
#endif
