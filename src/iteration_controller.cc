#include "iteration_controller.hh"
#include "errors.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace dfrank {

namespace {
// Per-partition reduction of one superstep's vertex updates
struct PartitionUpdate {
  double max_delta{0.0};
  size_t active{0};
  double pending{0.0}; // sum of |delta| left in the partition
};

SuperstepStats MergeUpdates(const std::vector<PartitionUpdate> &updates) {
  SuperstepStats stats;
  for (const auto &update : updates) {
    stats.max_delta = std::max(stats.max_delta, update.max_delta);
    stats.active_vertices += update.active;
  }
  return stats;
}
} // namespace

std::ostream &operator<<(std::ostream &os, const RunStats &stats) {
  os << "Run Statistics:\n"
     << "  Mode:                    "
     << (stats.until_convergence ? "until convergence" : "fixed iterations")
     << (stats.mode_conflict ? " (both modes set)" : "") << "\n"
     << "  Converged:               " << (stats.converged ? "yes" : "no")
     << "\n"
     << "  Supersteps:              " << stats.supersteps << "\n"
     << "  Messages sent:           " << stats.messages_sent << "\n"
     << "  Final max delta:         " << std::scientific
     << std::setprecision(3) << stats.final_max_delta << std::defaultfloat
     << "\n"
     << "  Run time:                " << stats.run_time_ms << " ms";
  return os;
}

IterationController::IterationController(const Graph &graph,
                                         const PageRankConfig &config,
                                         ExecutionEngine &engine,
                                         RunControl control)
    : graph_(graph), config_(config), engine_(engine), router_(graph, engine),
      control_(std::move(control)) {
  if (const auto &source = config_.source_id(); source.has_value()) {
    source_index_ = graph_.IndexOf(*source);
    if (!source_index_) {
      throw InvalidArgumentError(
          fmt::format("Source vertex {} is not in the graph", *source));
    }
  }
}

size_t IterationController::NumPartitions() const {
  return std::max<size_t>(
      1, std::min(engine_.Parallelism(), graph_.NumVertices()));
}

double IterationController::ResetTerm(size_t index) const {
  if (source_index_) {
    return index == *source_index_ ? config_.reset_probability() : 0.0;
  }
  return config_.reset_probability();
}

std::vector<double> IterationController::InitialRanks() const {
  if (source_index_) {
    std::vector<double> ranks(graph_.NumVertices(), 0.0);
    ranks[*source_index_] = 1.0;
    return ranks;
  }
  return std::vector<double>(graph_.NumVertices(), 1.0);
}

std::vector<double> IterationController::Run() {
  last_run_stats_ = RunStats();
  last_run_stats_.until_convergence = config_.IsUntilConvergence();
  last_run_stats_.mode_conflict = config_.mode_conflict();

  spdlog::info("Running PageRank ({}) on {} vertices, {} edges",
               config_.Describe(), graph_.NumVertices(), graph_.NumEdges());

  auto start_time = std::chrono::steady_clock::now();
  std::vector<double> ranks;
  if (const auto *fixed = std::get_if<FixedIterations>(&config_.mode())) {
    ranks = RunFixed(fixed->num_iterations);
  } else {
    ranks = RunUntilConvergence(
        std::get<UntilConvergence>(config_.mode()).tolerance);
  }
  auto end_time = std::chrono::steady_clock::now();
  last_run_stats_.run_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(end_time -
                                                            start_time)
          .count();

  std::stringstream ss;
  ss << last_run_stats_;
  spdlog::info(ss.str());
  return ranks;
}

void IterationController::FinishSuperstep(
    const SuperstepStats &stats, std::chrono::steady_clock::time_point start) {
  last_run_stats_.supersteps = stats.superstep;
  last_run_stats_.messages_sent += stats.messages_sent;
  last_run_stats_.final_max_delta = stats.max_delta;

  spdlog::debug("Superstep {}: max delta {}, {} active, {} messages",
                stats.superstep, stats.max_delta, stats.active_vertices,
                stats.messages_sent);

  if (control_.time_budget &&
      std::chrono::steady_clock::now() - start > *control_.time_budget) {
    throw CancelledError(fmt::format(
        "Time budget of {} ms exhausted after superstep {}",
        control_.time_budget->count(), stats.superstep));
  }
  if (control_.observer && !control_.observer(stats)) {
    throw CancelledError(
        fmt::format("Run cancelled after superstep {}", stats.superstep));
  }
}

std::vector<double> IterationController::RunFixed(int num_iterations) {
  const size_t n = graph_.NumVertices();
  const size_t num_parts = NumPartitions();
  const double damping = 1.0 - config_.reset_probability();
  auto start = std::chrono::steady_clock::now();

  std::vector<double> ranks = InitialRanks();
  for (int iter = 0; iter < num_iterations; ++iter) {
    Contributions in = router_.Route(ranks);

    std::vector<double> next(n);
    std::vector<PartitionUpdate> updates(num_parts);
    engine_.ParallelFor(num_parts, [&](size_t part) {
      const VertexRange range = graph_.Partition(part, num_parts);
      PartitionUpdate &update = updates[part];
      for (size_t v = range.begin; v < range.end; ++v) {
        next[v] = ResetTerm(v) + damping * in.sums[v];
        update.max_delta =
            std::max(update.max_delta, std::abs(next[v] - ranks[v]));
      }
      update.active = range.size();
    });
    ranks = std::move(next);

    SuperstepStats stats = MergeUpdates(updates);
    stats.superstep = static_cast<size_t>(iter) + 1;
    stats.messages_sent = in.messages_sent;
    FinishSuperstep(stats, start);
  }

  last_run_stats_.converged = false;
  return ranks;
}

std::vector<double> IterationController::RunUntilConvergence(double tolerance) {
  const size_t n = graph_.NumVertices();
  const size_t num_parts = NumPartitions();
  const double damping = 1.0 - config_.reset_probability();
  auto start = std::chrono::steady_clock::now();

  std::vector<double> ranks = InitialRanks();

  // Full sweep: pending delta is what a fixed-mode superstep would change
  Contributions initial = router_.Route(ranks);
  last_run_stats_.messages_sent += initial.messages_sent;
  std::vector<double> delta(n);
  engine_.ParallelFor(num_parts, [&](size_t part) {
    const VertexRange range = graph_.Partition(part, num_parts);
    for (size_t v = range.begin; v < range.end; ++v) {
      delta[v] = ResetTerm(v) + damping * initial.sums[v] - ranks[v];
    }
  });

  // Ranks are within ||delta||_1 / resetProb of the fixed point, since the
  // contribution operator never increases the L1 norm
  const double halt_residual = tolerance * config_.reset_probability();

  std::vector<uint8_t> active(n, 0);
  for (size_t superstep = 1;; ++superstep) {
    std::vector<PartitionUpdate> updates(num_parts);
    engine_.ParallelFor(num_parts, [&](size_t part) {
      const VertexRange range = graph_.Partition(part, num_parts);
      PartitionUpdate &update = updates[part];
      for (size_t v = range.begin; v < range.end; ++v) {
        const double magnitude = std::abs(delta[v]);
        update.pending += magnitude;
        active[v] = magnitude > tolerance ? 1 : 0;
        if (active[v]) {
          update.max_delta = std::max(update.max_delta, magnitude);
          update.active++;
        }
      }
    });

    SuperstepStats stats = MergeUpdates(updates);
    double pending = 0.0;
    for (const auto &update : updates) {
      pending += update.pending;
    }
    if (pending <= halt_residual) {
      double largest = 0.0;
      for (double d : delta) {
        largest = std::max(largest, std::abs(d));
      }
      last_run_stats_.final_max_delta = largest;
      last_run_stats_.converged = true;
      break;
    }
    if (stats.active_vertices == 0) {
      // Every residual is below tol but together they are not; flush them all
      updates.assign(num_parts, PartitionUpdate());
      engine_.ParallelFor(num_parts, [&](size_t part) {
        const VertexRange range = graph_.Partition(part, num_parts);
        PartitionUpdate &update = updates[part];
        for (size_t v = range.begin; v < range.end; ++v) {
          const double magnitude = std::abs(delta[v]);
          active[v] = magnitude > 0.0 ? 1 : 0;
          if (active[v]) {
            update.max_delta = std::max(update.max_delta, magnitude);
            update.active++;
          }
        }
      });
      stats = MergeUpdates(updates);
      spdlog::debug("Superstep {}: flushing {} residuals below tolerance",
                    superstep, stats.active_vertices);
    }
    if (superstep > config_.max_supersteps()) {
      throw ConvergenceError(fmt::format(
          "No convergence to tolerance {} within {} supersteps ({} vertices "
          "still active, pending residual {})",
          tolerance, config_.max_supersteps(), stats.active_vertices,
          pending));
    }

    // Active senders push their scaled delta; the router divides by degree
    std::vector<double> outgoing(n, 0.0);
    std::vector<double> next_ranks(n);
    engine_.ParallelFor(num_parts, [&](size_t part) {
      const VertexRange range = graph_.Partition(part, num_parts);
      for (size_t v = range.begin; v < range.end; ++v) {
        if (active[v]) {
          next_ranks[v] = ranks[v] + delta[v];
          outgoing[v] = damping * delta[v];
        } else {
          next_ranks[v] = ranks[v];
        }
      }
    });
    Contributions in = router_.Route(outgoing, active);

    std::vector<double> next_delta(n);
    engine_.ParallelFor(num_parts, [&](size_t part) {
      const VertexRange range = graph_.Partition(part, num_parts);
      for (size_t v = range.begin; v < range.end; ++v) {
        next_delta[v] = (active[v] ? 0.0 : delta[v]) + in.sums[v];
      }
    });
    ranks = std::move(next_ranks);
    delta = std::move(next_delta);

    stats.superstep = superstep;
    stats.messages_sent = in.messages_sent;
    FinishSuperstep(stats, start);
  }

  return ranks;
}

} // namespace dfrank
