#include "cli.hh"
#include "CLI/CLI.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace dfrank {
void SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink is always enabled
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);

    // Console sink only if verbose mode is enabled
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger =
        std::make_shared<spdlog::logger>("dfrank", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Starting dfrank on edges {}", options.edge_file);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_flag("-v,--verbose", options.verbose,
                "Enable verbose console output");
  app->add_option("-l,--log-file", options.log_file, "Log file path")
      ->default_val("dfrank.log");
  app->add_option("--threads", options.num_threads, "Number of worker threads")
      ->default_val(1)
      ->check(CLI::Range(1, 256));

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));

  app->add_option("-e,--edges", options.edge_file,
                  "Edge table (src,dst[,attr...])")
      ->required()
      ->check(CLI::ExistingFile);
  app->add_option("--vertices", options.vertex_file,
                  "Vertex table (id[,attr...]); derived from edges if absent")
      ->check(CLI::ExistingFile);
  app->add_option("--out-vertices", options.out_vertex_file,
                  "Write the id,weight table here");
  app->add_option("--out-edges", options.out_edge_file,
                  "Write the src,dst,weight table here");
  app->add_option("--delimiter", options.delimiter, "Column delimiter")
      ->default_val(",")
      ->check(
          [](const std::string &d) {
            return d.size() == 1 ? std::string()
                                 : std::string("Delimiter must be one char");
          },
          "SINGLE_CHAR");

  app->add_option("--reset-prob", options.reset_probability,
                  "Random reset probability (0.0-1.0, exclusive)")
      ->default_val(PageRankConfig::kDefaultResetProbability)
      ->check(CLI::Range(0.0, 1.0));
  app->add_option("--source", options.source_id,
                  "Source vertex id for personalized PageRank");
  app->add_option("--top", options.top, "Number of top vertices to print")
      ->default_val(10);
}

CliSubcommands CreateCli(CLI::App &app, FixedOptions &fixed_opts,
                         ConvergeOptions &converge_opts) {
  // Main program setup
  app.require_subcommand(1, 1);

  auto fixed =
      app.add_subcommand("fixed", "Run a fixed number of PageRank iterations");
  auto converge = app.add_subcommand(
      "converge", "Run dynamic PageRank until ranks change less than tol");

  AddCommonOptions(fixed, fixed_opts);
  fixed
      ->add_option("-n,--iterations", fixed_opts.num_iterations,
                   "Number of iterations")
      ->required()
      ->check(CLI::PositiveNumber);

  AddCommonOptions(converge, converge_opts);
  converge
      ->add_option("-t,--tolerance", converge_opts.tolerance,
                   "Convergence tolerance")
      ->required()
      ->check(CLI::PositiveNumber);
  converge
      ->add_option("--max-supersteps", converge_opts.max_supersteps,
                   "Fail if not converged after this many supersteps")
      ->default_val(PageRankConfig::kDefaultMaxSupersteps)
      ->check(CLI::PositiveNumber);
  converge
      ->add_option("--time-budget", converge_opts.time_budget_ms,
                   "Cancel the run after this many milliseconds (0 for none)")
      ->default_val(0);

  return CliSubcommands{fixed, converge};
}

PageRankConfig::Builder MakeConfigBuilder(const CommonOptions &options) {
  PageRankConfig::Builder builder;
  builder.SetResetProbability(options.reset_probability);
  if (!options.source_id.empty()) {
    builder.ParseSourceId(options.source_id);
  }
  return builder;
}

} // namespace dfrank
