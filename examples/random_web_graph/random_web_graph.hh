#ifndef RANDOM_WEB_GRAPH_H_
#define RANDOM_WEB_GRAPH_H_

#include "dfrank/graph.hh"
#include <random>

namespace dfrank {

class RandomWebGraph {
public:
  explicit RandomWebGraph(std::mt19937_64 &rng) : rng_(rng) {}

  // Prevent copying and assignment
  RandomWebGraph(const RandomWebGraph &) = delete;
  RandomWebGraph &operator=(const RandomWebGraph &) = delete;

  // Create a random web graph with ids 0..num_vertices-1
  Graph Generate(size_t num_vertices, double edge_probability);

private:
  std::mt19937_64 &rng_; // reference to external RNG
};

} // namespace dfrank

#endif // RANDOM_WEB_GRAPH_H_
