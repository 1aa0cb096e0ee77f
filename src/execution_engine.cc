#include "execution_engine.hh"
#include "errors.hh"
#include <algorithm>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace dfrank {

void SequentialEngine::ParallelFor(size_t num_partitions,
                                   const PartitionFn &fn) {
  for (size_t part = 0; part < num_partitions; ++part) {
    fn(part);
  }
}

ThreadedEngine::ThreadedEngine(size_t num_threads) : num_threads_(num_threads) {
  if (num_threads == 0) {
    throw InvalidArgumentError("Invalid number of threads (0)");
  }
}

void ThreadedEngine::ParallelFor(size_t num_partitions,
                                 const PartitionFn &fn) {
  if (num_partitions == 0) {
    return;
  }
  if (num_partitions == 1 || num_threads_ == 1) {
    for (size_t part = 0; part < num_partitions; ++part) {
      fn(part);
    }
    return;
  }

  const size_t workers = std::min(num_threads_, num_partitions);

  // Divide partitions among threads
  std::vector<std::vector<size_t>> thread_parts(workers);
  for (size_t part = 0; part < num_partitions; ++part) {
    thread_parts[part % workers].push_back(part);
  }

  // First failure per thread, rethrown after the barrier
  std::vector<std::exception_ptr> thread_errors(workers);

  std::vector<std::thread> threads;
  threads.reserve(workers);
  try {
    for (size_t thread_id = 0; thread_id < workers; ++thread_id) {
      threads.push_back(
          LaunchWorker([thread_id, &thread_parts, &thread_errors, &fn]() {
            try {
              for (size_t part : thread_parts[thread_id]) {
                fn(part);
              }
            } catch (...) {
              thread_errors[thread_id] = std::current_exception();
            }
          }));
    }
  } catch (...) {
    // Workers already running still reference this frame
    for (auto &thread : threads) {
      thread.join();
    }
    throw;
  }

  // Wait for all threads
  for (auto &thread : threads) {
    thread.join();
  }

  for (const auto &error : thread_errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

std::thread ThreadedEngine::LaunchWorker(std::function<void()> work) {
  return std::thread(std::move(work));
}

} // namespace dfrank
