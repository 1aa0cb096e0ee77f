#include "dfrank/pagerank.hh"
#include "random_web_graph.hh"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>

void print_usage(const char *program_name) {
  std::cerr << "Usage: " << program_name << " <random_seed>\n";
  std::cerr << "  random_seed: Unsigned integer for RNG initialization\n";
}

void print_top(const dfrank::ResultGraph &result, size_t n) {
  for (const auto &[id, weight] : result.TopVertices(n)) {
    std::cout << "Page " << std::setw(4) << id << ": " << std::fixed
              << std::setprecision(6) << weight << "\n";
  }
}

int main(int argc, char *argv[]) {
  using namespace dfrank;

  if (argc != 2) {
    print_usage(argv[0]);
    return 1;
  }

  // Parse random seed
  uint64_t seed;
  try {
    seed = std::stoull(argv[1]);
  } catch (const std::exception &) {
    std::cerr << "Error: Invalid random seed\n";
    print_usage(argv[0]);
    return 1;
  }

  // Create a reasonably sized graph
  constexpr size_t NUM_PAGES = 5000;
  constexpr double EDGE_PROBABILITY =
      0.01; // 1% chance of edge between any two pages
  std::mt19937_64 rng(seed);

  Graph graph = RandomWebGraph(rng).Generate(NUM_PAGES, EDGE_PROBABILITY);
  ThreadedEngine engine(std::max(1u, std::thread::hardware_concurrency()));

  try {
    auto start_time = std::chrono::steady_clock::now();
    PageRankResult fixed = RunPageRank(
        graph, PageRankConfig(FixedIterations{20}), engine);
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        end_time - start_time)
                        .count();

    std::cout << "Fixed-iteration PageRank Results:\n";
    std::cout << "Iterations: " << fixed.stats.supersteps << "\n";
    std::cout << "Time: " << duration << "ms\n\n";
    std::cout << "Top 10 pages:\n";
    print_top(fixed.graph, 10);

    PageRankResult dynamic = RunPageRank(
        graph, PageRankConfig(UntilConvergence{1e-10}), engine);
    std::cout << "\nDynamic PageRank Results:\n";
    std::cout << "Supersteps to converge: " << dynamic.stats.supersteps
              << "\n";
    std::cout << "Messages sent: " << dynamic.stats.messages_sent << " (fixed: "
              << fixed.stats.messages_sent << ")\n\n";
    std::cout << "Top 10 pages:\n";
    print_top(dynamic.graph, 10);
  } catch (const PageRankError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
