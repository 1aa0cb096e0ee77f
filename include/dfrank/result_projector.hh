#ifndef __DFRANK_RESULT_PROJECTOR_HH__
#define __DFRANK_RESULT_PROJECTOR_HH__

#include "graph.hh"
#include <string>
#include <utility>
#include <vector>

namespace dfrank {

// Name of the result column on both the vertex and the edge table.
inline const std::string kWeightColumn = "weight";

struct VertexWeight {
  VertexId id;
  double weight; // final rank
};

struct EdgeWeight {
  VertexId src;
  VertexId dst;
  double weight; // rank(src) / outDegree(src)
};

// Output graph. Only identifiers and the weight column survive; vertices are
// in ascending id order, edges in input order.
struct ResultGraph {
  std::vector<VertexWeight> vertices;
  std::vector<EdgeWeight> edges;

  // Highest-weight vertices first, ties broken by ascending id.
  std::vector<VertexWeight> TopVertices(size_t n) const;
};

class ResultProjector {
public:
  explicit ResultProjector(const Graph &graph) : graph_(graph) {}

  // `ranks` is indexed by dense vertex index.
  ResultGraph Project(const std::vector<double> &ranks) const;

private:
  const Graph &graph_;
};

} // namespace dfrank
#endif
