#include "result_projector.hh"
#include "errors.hh"
#include <algorithm>

namespace dfrank {

std::vector<VertexWeight> ResultGraph::TopVertices(size_t n) const {
  std::vector<VertexWeight> ranked(vertices);

  // Sort by weight
  std::partial_sort(ranked.begin(),
                    ranked.begin() +
                        static_cast<long>(std::min(n, ranked.size())),
                    ranked.end(), [](const auto &a, const auto &b) {
                      if (a.weight != b.weight) {
                        return a.weight > b.weight;
                      }
                      return a.id < b.id;
                    });

  ranked.resize(std::min(n, ranked.size()));
  return ranked;
}

ResultGraph ResultProjector::Project(const std::vector<double> &ranks) const {
  if (ranks.size() != graph_.NumVertices()) {
    throw InvalidArgumentError("Rank vector size does not match vertex count");
  }

  ResultGraph result;
  result.vertices.reserve(graph_.NumVertices());
  for (size_t v = 0; v < graph_.NumVertices(); ++v) {
    result.vertices.push_back({graph_.IdAt(v), ranks[v]});
  }

  result.edges.reserve(graph_.NumEdges());
  for (size_t e = 0; e < graph_.NumEdges(); ++e) {
    const Edge &edge = graph_.Edges()[e];
    const size_t src = graph_.EdgeIndices(e).first;
    // Sources of edges always have out-degree >= 1
    const double flow =
        ranks[src] / static_cast<double>(graph_.OutDegree(src));
    result.edges.push_back({edge.src, edge.dst, flow});
  }
  return result;
}

} // namespace dfrank
