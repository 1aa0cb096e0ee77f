#include "random_web_graph.hh"

#include <vector>

namespace dfrank {

Graph RandomWebGraph::Generate(size_t num_vertices, double edge_probability) {
  std::uniform_real_distribution<> dist(0.0, 1.0);

  std::vector<VertexId> vertices;
  vertices.reserve(num_vertices);
  for (size_t i = 0; i < num_vertices; ++i) {
    vertices.push_back(static_cast<VertexId>(i));
  }

  // Create random edges, no self links
  std::vector<Edge> edges;
  for (VertexId src : vertices) {
    for (VertexId dst : vertices) {
      if (src != dst && dist(rng_) < edge_probability) {
        edges.push_back({src, dst});
      }
    }
  }

  return Graph(std::move(vertices), std::move(edges));
}

} // namespace dfrank
