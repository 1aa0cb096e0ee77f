#ifndef __DFRANK_MESSAGE_ROUTER_HH__
#define __DFRANK_MESSAGE_ROUTER_HH__

#include "execution_engine.hh"
#include "graph.hh"
#include <cstdint>
#include <vector>

namespace dfrank {

// Aggregated inbound messages of one superstep, indexed by dense vertex index.
struct Contributions {
  std::vector<double> sums;
  uint64_t messages_sent{0};
};

/**
 * @brief Routes per-edge contributions to destination vertices
 *
 * @details For each sending vertex v with value r and out-degree d > 0, one
 * message of r / d is sent along every out-edge. Messages addressed to the
 * same vertex are summed. Dangling vertices send nothing and their value is
 * dropped.
 *
 * Destinations are split into the engine's partitions and each destination
 * sums its messages along its in-edges, in in-edge order. Results therefore
 * do not depend on the partition count, and no buffer beyond the output
 * vector is allocated. The router keeps no state between calls.
 */
class MessageRouter {
public:
  MessageRouter(const Graph &graph, ExecutionEngine &engine);

  // Every vertex sends.
  Contributions Route(const std::vector<double> &values) const;

  // Only vertices whose `senders` flag is non-zero send.
  Contributions Route(const std::vector<double> &values,
                      const std::vector<uint8_t> &senders) const;

private:
  Contributions RouteImpl(const std::vector<double> &values,
                          const std::vector<uint8_t> *senders) const;

  const Graph &graph_;
  ExecutionEngine &engine_;
};

} // namespace dfrank
#endif
