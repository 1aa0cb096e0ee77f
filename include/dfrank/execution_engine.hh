#ifndef __DFRANK_EXECUTION_ENGINE_HH__
#define __DFRANK_EXECUTION_ENGINE_HH__

#include <cstddef>
#include <functional>
#include <thread>

namespace dfrank {

// Executes one function per partition. ParallelFor returns only once every
// partition has finished, so each call acts as a superstep barrier.
class ExecutionEngine {
public:
  using PartitionFn = std::function<void(size_t partition)>;

  virtual ~ExecutionEngine() = default;

  // Number of partitions callers should split their data into.
  virtual size_t Parallelism() const = 0;

  virtual void ParallelFor(size_t num_partitions, const PartitionFn &fn) = 0;
};

// Runs partitions one after another on the calling thread.
class SequentialEngine : public ExecutionEngine {
public:
  size_t Parallelism() const override { return 1; }
  void ParallelFor(size_t num_partitions, const PartitionFn &fn) override;
};

// Runs partitions on worker threads, distributing them round-robin.
class ThreadedEngine : public ExecutionEngine {
public:
  explicit ThreadedEngine(size_t num_threads);

  size_t Parallelism() const override { return num_threads_; }
  void ParallelFor(size_t num_partitions, const PartitionFn &fn) override;

protected:
  // Starts one worker. Throws std::system_error if no thread can be created;
  // ParallelFor then joins the workers already running before rethrowing.
  virtual std::thread LaunchWorker(std::function<void()> work);

private:
  size_t num_threads_;
};

} // namespace dfrank
#endif
