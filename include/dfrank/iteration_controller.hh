#ifndef __DFRANK_ITERATION_CONTROLLER_HH__
#define __DFRANK_ITERATION_CONTROLLER_HH__

#include "execution_engine.hh"
#include "graph.hh"
#include "message_router.hh"
#include "pagerank_config.hh"
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <vector>

namespace dfrank {

// Statistics of one completed superstep
struct SuperstepStats {
  size_t superstep{0}; // 1-based
  double max_delta{0.0};
  size_t active_vertices{0};
  uint64_t messages_sent{0};
};

// Statistics of the most recent run
struct RunStats {
  bool until_convergence{false};
  bool mode_conflict{false};
  bool converged{false};
  size_t supersteps{0};
  uint64_t messages_sent{0};
  double final_max_delta{0.0};
  int64_t run_time_ms{0};
  friend std::ostream &operator<<(std::ostream &os, const RunStats &stats);
};

// Between-superstep checks. The observer returning false, or the time budget
// running out, stops the run with CancelledError.
struct RunControl {
  std::function<bool(const SuperstepStats &)> observer;
  std::optional<std::chrono::milliseconds> time_budget{std::nullopt};
};

/**
 * @brief Orchestrates PageRank supersteps
 *
 * @details Fixed mode runs exactly the configured number of supersteps, each
 * replacing every rank with reset(v) + (1 - resetProb) * (incoming sum).
 *
 * Convergence mode starts from the same initial ranks, computes one full
 * sweep and keeps the difference to the current rank as a pending delta per
 * vertex. In each following superstep only vertices whose pending delta
 * exceeds the tolerance absorb it and send (1 - resetProb) * delta / d along
 * their out-edges; the rest keep accumulating. The run ends once the summed
 * pending |delta| is at most tolerance * resetProb, which puts every rank
 * within tolerance of the fixed point. When no single delta exceeds the
 * tolerance but the sum is still too large, every non-zero delta is pushed in
 * that superstep. Fails with ConvergenceError after max_supersteps().
 *
 * Rank and delta vectors are replaced as a whole each superstep; senders only
 * ever read the previous generation.
 */
class IterationController {
public:
  // Throws InvalidArgumentError if the configured source is not a vertex.
  IterationController(const Graph &graph, const PageRankConfig &config,
                      ExecutionEngine &engine, RunControl control = {});

  // Non-copyable
  IterationController(const IterationController &) = delete;
  IterationController &operator=(const IterationController &) = delete;

  // Runs to completion and returns final ranks indexed by dense vertex index.
  std::vector<double> Run();

  const RunStats &GetLastRunStats() const { return last_run_stats_; }

private:
  std::vector<double> RunFixed(int num_iterations);
  std::vector<double> RunUntilConvergence(double tolerance);

  std::vector<double> InitialRanks() const;
  double ResetTerm(size_t index) const;
  size_t NumPartitions() const;

  void FinishSuperstep(const SuperstepStats &stats,
                       std::chrono::steady_clock::time_point start);

  const Graph &graph_;
  const PageRankConfig config_;
  ExecutionEngine &engine_;
  MessageRouter router_;
  RunControl control_;
  std::optional<size_t> source_index_;

  RunStats last_run_stats_;
};

} // namespace dfrank
#endif
