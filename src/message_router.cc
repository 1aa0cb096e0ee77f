#include "message_router.hh"
#include "errors.hh"
#include <algorithm>

namespace dfrank {

MessageRouter::MessageRouter(const Graph &graph, ExecutionEngine &engine)
    : graph_(graph), engine_(engine) {}

Contributions MessageRouter::Route(const std::vector<double> &values) const {
  return RouteImpl(values, nullptr);
}

Contributions MessageRouter::Route(const std::vector<double> &values,
                                   const std::vector<uint8_t> &senders) const {
  if (senders.size() != graph_.NumVertices()) {
    throw InvalidArgumentError("Sender mask size does not match vertex count");
  }
  return RouteImpl(values, &senders);
}

Contributions
MessageRouter::RouteImpl(const std::vector<double> &values,
                         const std::vector<uint8_t> *senders) const {
  const size_t n = graph_.NumVertices();
  if (values.size() != n) {
    throw InvalidArgumentError("Value vector size does not match vertex count");
  }

  const size_t num_parts =
      std::max<size_t>(1, std::min(engine_.Parallelism(), n));

  // Each partition gathers the messages addressed to its own destinations,
  // so no two workers write the same slot
  Contributions result;
  result.sums.assign(n, 0.0);
  std::vector<uint64_t> received(num_parts, 0);

  engine_.ParallelFor(num_parts, [&](size_t part) {
    const VertexRange range = graph_.Partition(part, num_parts);
    for (size_t v = range.begin; v < range.end; ++v) {
      double sum = 0.0;
      for (size_t src : graph_.InNeighbors(v)) {
        if (senders != nullptr && !(*senders)[src]) {
          continue;
        }
        sum += values[src] / static_cast<double>(graph_.OutDegree(src));
        received[part]++;
      }
      result.sums[v] = sum;
    }
  });

  for (uint64_t count : received) {
    result.messages_sent += count;
  }
  return result;
}

} // namespace dfrank
