#ifndef __DFRANK_PAGERANK_CONFIG_HH__
#define __DFRANK_PAGERANK_CONFIG_HH__

#include "errors.hh"
#include "graph.hh"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace dfrank {

// Run exactly `num_iterations` supersteps.
struct FixedIterations {
  int num_iterations;
};

// Run until no vertex rank changes by more than `tolerance`.
struct UntilConvergence {
  double tolerance;
};

using RunMode = std::variant<FixedIterations, UntilConvergence>;

/**
 * @brief Immutable, validated PageRank run configuration
 *
 * @details Holds exactly one run mode, the random reset probability and an
 * optional personalization source. The constructor validates every field and
 * throws InvalidArgumentError on out-of-range values. Use Builder for
 * step-by-step construction.
 */
class PageRankConfig {
public:
  static constexpr double kDefaultResetProbability = 0.15;
  static constexpr size_t kDefaultMaxSupersteps = 10000;

  class Builder;

  explicit PageRankConfig(RunMode mode,
                          double reset_probability = kDefaultResetProbability,
                          std::optional<VertexId> source_id = std::nullopt,
                          size_t max_supersteps = kDefaultMaxSupersteps);

  const RunMode &mode() const { return mode_; }
  bool IsFixedIterations() const {
    return std::holds_alternative<FixedIterations>(mode_);
  }
  bool IsUntilConvergence() const {
    return std::holds_alternative<UntilConvergence>(mode_);
  }

  double reset_probability() const { return reset_probability_; }
  const std::optional<VertexId> &source_id() const { return source_id_; }
  bool IsPersonalized() const { return source_id_.has_value(); }

  // Safety cap on convergence-mode supersteps.
  size_t max_supersteps() const { return max_supersteps_; }

  // True when the builder had both modes set and picked convergence.
  bool mode_conflict() const { return mode_conflict_; }

  std::string Describe() const;

private:
  RunMode mode_;
  double reset_probability_;
  std::optional<VertexId> source_id_;
  size_t max_supersteps_;
  bool mode_conflict_{false};
};

// Fluent construction of a PageRankConfig. When both FixedIterations and
// UntilConvergence are set, Build() selects convergence mode, logs a warning
// and flags the config with mode_conflict().
class PageRankConfig::Builder {
public:
  Builder &SetResetProbability(double p);
  Builder &FixedIterations(int num_iterations);
  Builder &UntilConvergence(double tolerance);
  Builder &SetMaxSupersteps(size_t max_supersteps);

  // Source ids must be integral; values not representable as a VertexId
  // raise TypeMismatchError.
  template <typename T> Builder &SetSourceId(T id) {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                  "Source ids must be integral vertex ids");
    if constexpr (std::is_unsigned_v<T>) {
      if (static_cast<uint64_t>(id) >
          static_cast<uint64_t>(std::numeric_limits<VertexId>::max())) {
        throw TypeMismatchError("Source id " + std::to_string(id) +
                                " does not fit the vertex id type");
      }
    }
    source_id_ = static_cast<VertexId>(id);
    return *this;
  }

  // Parses a textual id, as given on a command line.
  Builder &ParseSourceId(const std::string &text);

  Builder &ClearSourceId();

  // Throws MissingConfigurationError if no mode was set, InvalidArgumentError
  // on out-of-range values.
  PageRankConfig Build() const;

private:
  double reset_probability_{kDefaultResetProbability};
  std::optional<int> num_iterations_;
  std::optional<double> tolerance_;
  std::optional<VertexId> source_id_;
  size_t max_supersteps_{kDefaultMaxSupersteps};
};

} // namespace dfrank
#endif
