#ifndef __DFRANK_GRAPH_HH__
#define __DFRANK_GRAPH_HH__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dfrank {

// Vertex identifiers are fixed system-wide.
using VertexId = int64_t;

struct Edge {
  VertexId src;
  VertexId dst;

  bool operator==(const Edge &other) const {
    return src == other.src && dst == other.dst;
  }
};

// Half-open range of dense vertex indices.
struct VertexRange {
  size_t begin;
  size_t end;

  size_t size() const { return end - begin; }
};

// Lightweight view over a slice of an adjacency array.
class NeighborSpan {
public:
  NeighborSpan(const size_t *first, const size_t *last)
      : first_(first), last_(last) {}

  const size_t *begin() const { return first_; }
  const size_t *end() const { return last_; }
  size_t size() const { return static_cast<size_t>(last_ - first_); }
  bool empty() const { return first_ == last_; }

private:
  const size_t *first_;
  const size_t *last_;
};

/**
 * @brief Immutable directed graph topology
 *
 * @details Vertices are kept in ascending id order and addressed by a dense
 * index in [0, NumVertices()). Out- and in-adjacency are stored in compressed
 * form, so a vertex's neighbours are a contiguous slice. Ranks are not stored
 * here; callers keep them in vectors indexed by the dense index.
 */
class Graph {
public:
  // Throws InvalidGraphError on a repeated vertex id or on an edge whose
  // endpoint is not in `vertices`.
  Graph(std::vector<VertexId> vertices, std::vector<Edge> edges);

  // Vertex set is the set of edge endpoints.
  static Graph FromEdges(std::vector<Edge> edges);

  size_t NumVertices() const { return ids_.size(); }
  size_t NumEdges() const { return edges_.size(); }

  VertexId IdAt(size_t index) const { return ids_[index]; }
  const std::vector<VertexId> &Ids() const { return ids_; }
  std::optional<size_t> IndexOf(VertexId id) const;
  bool Contains(VertexId id) const { return index_.count(id) != 0; }

  size_t OutDegree(size_t index) const {
    return out_offsets_[index + 1] - out_offsets_[index];
  }
  size_t InDegree(size_t index) const {
    return in_offsets_[index + 1] - in_offsets_[index];
  }
  bool IsDangling(size_t index) const { return OutDegree(index) == 0; }

  NeighborSpan OutNeighbors(size_t index) const {
    return {out_targets_.data() + out_offsets_[index],
            out_targets_.data() + out_offsets_[index + 1]};
  }
  NeighborSpan InNeighbors(size_t index) const {
    return {in_sources_.data() + in_offsets_[index],
            in_sources_.data() + in_offsets_[index + 1]};
  }

  // Edges in input order.
  const std::vector<Edge> &Edges() const { return edges_; }

  // Dense-index endpoints of Edges()[i].
  std::pair<size_t, size_t> EdgeIndices(size_t edge) const {
    return edge_endpoints_[edge];
  }

  // Partition `part` of `num_parts` contiguous, near-equal vertex ranges.
  VertexRange Partition(size_t part, size_t num_parts) const;

private:
  void BuildAdjacency();

  std::vector<VertexId> ids_;
  std::unordered_map<VertexId, size_t> index_;
  std::vector<Edge> edges_;
  std::vector<std::pair<size_t, size_t>> edge_endpoints_;

  std::vector<size_t> out_offsets_;
  std::vector<size_t> out_targets_;
  std::vector<size_t> in_offsets_;
  std::vector<size_t> in_sources_;
};

} // namespace dfrank
#endif
