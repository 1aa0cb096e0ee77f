#include "graph.hh"
#include "errors.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <string>

namespace dfrank {

Graph::Graph(std::vector<VertexId> vertices, std::vector<Edge> edges)
    : ids_(std::move(vertices)), edges_(std::move(edges)) {
  std::sort(ids_.begin(), ids_.end());
  if (auto dup = std::adjacent_find(ids_.begin(), ids_.end());
      dup != ids_.end()) {
    throw InvalidGraphError("Duplicate vertex id " + std::to_string(*dup));
  }

  index_.reserve(ids_.size());
  for (size_t i = 0; i < ids_.size(); ++i) {
    index_.emplace(ids_[i], i);
  }

  // Validate every endpoint before building anything else
  edge_endpoints_.reserve(edges_.size());
  for (const auto &edge : edges_) {
    auto src = index_.find(edge.src);
    auto dst = index_.find(edge.dst);
    if (src == index_.end() || dst == index_.end()) {
      VertexId missing = src == index_.end() ? edge.src : edge.dst;
      throw InvalidGraphError("Edge (" + std::to_string(edge.src) + ", " +
                              std::to_string(edge.dst) +
                              ") references unknown vertex " +
                              std::to_string(missing));
    }
    edge_endpoints_.emplace_back(src->second, dst->second);
  }

  BuildAdjacency();
  spdlog::debug("Built graph with {} vertices and {} edges", ids_.size(),
                edges_.size());
}

Graph Graph::FromEdges(std::vector<Edge> edges) {
  std::vector<VertexId> vertices;
  vertices.reserve(edges.size() * 2);
  for (const auto &edge : edges) {
    vertices.push_back(edge.src);
    vertices.push_back(edge.dst);
  }
  std::sort(vertices.begin(), vertices.end());
  vertices.erase(std::unique(vertices.begin(), vertices.end()),
                 vertices.end());
  return Graph(std::move(vertices), std::move(edges));
}

std::optional<size_t> Graph::IndexOf(VertexId id) const {
  if (auto it = index_.find(id); it != index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void Graph::BuildAdjacency() {
  const size_t n = ids_.size();
  out_offsets_.assign(n + 1, 0);
  in_offsets_.assign(n + 1, 0);

  for (const auto &[src, dst] : edge_endpoints_) {
    out_offsets_[src + 1]++;
    in_offsets_[dst + 1]++;
  }
  for (size_t i = 0; i < n; ++i) {
    out_offsets_[i + 1] += out_offsets_[i];
    in_offsets_[i + 1] += in_offsets_[i];
  }

  out_targets_.resize(edge_endpoints_.size());
  in_sources_.resize(edge_endpoints_.size());
  std::vector<size_t> out_fill(out_offsets_.begin(), out_offsets_.end() - 1);
  std::vector<size_t> in_fill(in_offsets_.begin(), in_offsets_.end() - 1);
  for (const auto &[src, dst] : edge_endpoints_) {
    out_targets_[out_fill[src]++] = dst;
    in_sources_[in_fill[dst]++] = src;
  }
}

VertexRange Graph::Partition(size_t part, size_t num_parts) const {
  const size_t n = ids_.size();
  if (num_parts == 0 || part >= num_parts) {
    return {n, n};
  }
  const size_t base = n / num_parts;
  const size_t extra = n % num_parts;
  // The first `extra` partitions get one more vertex
  size_t begin = part * base + std::min(part, extra);
  size_t end = begin + base + (part < extra ? 1 : 0);
  return {begin, end};
}

} // namespace dfrank
