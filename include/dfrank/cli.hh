#ifndef __DFRANK_CLI_HH__
#define __DFRANK_CLI_HH__
#include "CLI/App.hpp"
#include "pagerank_config.hh"
#include "spdlog/common.h"
#include <cstddef>
#include <string>

namespace dfrank {

struct CommonOptions {
  bool verbose{false};
  size_t num_threads{1};
  std::string log_file;
  std::string vertex_file;
  std::string edge_file;
  std::string out_vertex_file;
  std::string out_edge_file;
  std::string delimiter{","};
  double reset_probability{PageRankConfig::kDefaultResetProbability};
  std::string source_id;
  size_t top{10};
  spdlog::level::level_enum log_level{spdlog::level::info};
};

struct FixedOptions : CommonOptions {
  int num_iterations{0};
};

struct ConvergeOptions : CommonOptions {
  double tolerance{0.0};
  size_t max_supersteps{PageRankConfig::kDefaultMaxSupersteps};
  unsigned time_budget_ms{0}; // 0 disables the budget
};

struct CliSubcommands {
  CLI::App *fixed;
  CLI::App *converge;
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
CliSubcommands CreateCli(CLI::App &app, FixedOptions &fixed_opts,
                         ConvergeOptions &converge_opts);
void SetupLogging(const CommonOptions &options);

// Config builder from parsed options; throws TypeMismatchError if the
// source id is not an integer.
PageRankConfig::Builder MakeConfigBuilder(const CommonOptions &options);

} // namespace dfrank
#endif
