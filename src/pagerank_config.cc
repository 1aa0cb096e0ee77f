#include "pagerank_config.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"
#include <cmath>
#include <stdexcept>

namespace dfrank {

PageRankConfig::PageRankConfig(RunMode mode, double reset_probability,
                               std::optional<VertexId> source_id,
                               size_t max_supersteps)
    : mode_(mode), reset_probability_(reset_probability),
      source_id_(source_id), max_supersteps_(max_supersteps) {
  if (std::isnan(reset_probability_) || reset_probability_ <= 0.0 ||
      reset_probability_ >= 1.0) {
    throw InvalidArgumentError(
        fmt::format("Reset probability must be in (0, 1); found {}",
                    reset_probability_));
  }
  if (const auto *fixed = std::get_if<FixedIterations>(&mode_)) {
    if (fixed->num_iterations <= 0) {
      throw InvalidArgumentError(
          fmt::format("Number of iterations must be positive; found {}",
                      fixed->num_iterations));
    }
  } else {
    const double tol = std::get<UntilConvergence>(mode_).tolerance;
    if (std::isnan(tol) || tol <= 0.0) {
      throw InvalidArgumentError(
          fmt::format("Tolerance must be positive; found {}", tol));
    }
  }
  if (max_supersteps_ == 0) {
    throw InvalidArgumentError("Superstep cap must be positive");
  }
}

std::string PageRankConfig::Describe() const {
  std::string mode;
  if (const auto *fixed = std::get_if<FixedIterations>(&mode_)) {
    mode = fmt::format("fixed iterations={}", fixed->num_iterations);
  } else {
    mode = fmt::format("until convergence tol={} cap={}",
                       std::get<UntilConvergence>(mode_).tolerance,
                       max_supersteps_);
  }
  if (source_id_) {
    return fmt::format("{}, reset={}, source={}", mode, reset_probability_,
                       *source_id_);
  }
  return fmt::format("{}, reset={}", mode, reset_probability_);
}

PageRankConfig::Builder &
PageRankConfig::Builder::SetResetProbability(double p) {
  reset_probability_ = p;
  return *this;
}

PageRankConfig::Builder &
PageRankConfig::Builder::FixedIterations(int num_iterations) {
  num_iterations_ = num_iterations;
  return *this;
}

PageRankConfig::Builder &
PageRankConfig::Builder::UntilConvergence(double tolerance) {
  tolerance_ = tolerance;
  return *this;
}

PageRankConfig::Builder &
PageRankConfig::Builder::SetMaxSupersteps(size_t max_supersteps) {
  max_supersteps_ = max_supersteps;
  return *this;
}

PageRankConfig::Builder &
PageRankConfig::Builder::ParseSourceId(const std::string &text) {
  size_t consumed = 0;
  VertexId id;
  try {
    id = std::stoll(text, &consumed);
  } catch (const std::exception &) {
    throw TypeMismatchError("Source id '" + text +
                            "' is not a 64-bit integer vertex id");
  }
  if (consumed != text.size()) {
    throw TypeMismatchError("Source id '" + text +
                            "' is not a 64-bit integer vertex id");
  }
  source_id_ = id;
  return *this;
}

PageRankConfig::Builder &PageRankConfig::Builder::ClearSourceId() {
  source_id_.reset();
  return *this;
}

PageRankConfig PageRankConfig::Builder::Build() const {
  if (!tolerance_ && !num_iterations_) {
    throw MissingConfigurationError(
        "Either FixedIterations or UntilConvergence must be set");
  }

  if (tolerance_) {
    PageRankConfig config(dfrank::UntilConvergence{*tolerance_},
                          reset_probability_, source_id_, max_supersteps_);
    if (num_iterations_) {
      spdlog::warn("Both FixedIterations({}) and UntilConvergence({}) set; "
                   "running until convergence",
                   *num_iterations_, *tolerance_);
      config.mode_conflict_ = true;
    }
    return config;
  }

  return PageRankConfig(dfrank::FixedIterations{*num_iterations_},
                        reset_probability_, source_id_, max_supersteps_);
}

} // namespace dfrank
