#include "pagerank.hh"

namespace dfrank {

PageRankResult RunPageRank(const Graph &graph, const PageRankConfig &config,
                           ExecutionEngine &engine, RunControl control) {
  IterationController controller(graph, config, engine, std::move(control));
  std::vector<double> ranks = controller.Run();

  PageRankResult result;
  result.graph = ResultProjector(graph).Project(ranks);
  result.stats = controller.GetLastRunStats();
  return result;
}

PageRankResult RunPageRank(const Graph &graph,
                           const PageRankConfig::Builder &builder,
                           ExecutionEngine &engine, RunControl control) {
  return RunPageRank(graph, builder.Build(), engine, std::move(control));
}

PageRankResult RunFixedIterations(const Graph &graph, int num_iterations,
                                  double reset_probability,
                                  std::optional<VertexId> source_id) {
  SequentialEngine engine;
  PageRankConfig config(FixedIterations{num_iterations}, reset_probability,
                        source_id);
  return RunPageRank(graph, config, engine);
}

PageRankResult RunToConvergence(const Graph &graph, double tolerance,
                                double reset_probability,
                                std::optional<VertexId> source_id) {
  SequentialEngine engine;
  PageRankConfig config(UntilConvergence{tolerance}, reset_probability,
                        source_id);
  return RunPageRank(graph, config, engine);
}

} // namespace dfrank
