#ifndef __DFRANK_ERRORS_HH__
#define __DFRANK_ERRORS_HH__

#include <stdexcept>
#include <string>

namespace dfrank {

// Base of every error raised by a PageRank run. A run that throws returns no
// result graph.
class PageRankError : public std::runtime_error {
public:
  explicit PageRankError(const std::string &what) : std::runtime_error(what) {}
};

// An edge references an unknown vertex, or a vertex id is repeated.
class InvalidGraphError : public PageRankError {
public:
  explicit InvalidGraphError(const std::string &what) : PageRankError(what) {}
};

// Non-positive iteration count or tolerance, reset probability outside (0,1),
// unknown source vertex.
class InvalidArgumentError : public PageRankError {
public:
  explicit InvalidArgumentError(const std::string &what)
      : PageRankError(what) {}
};

// Neither fixed iterations nor a convergence tolerance was selected.
class MissingConfigurationError : public PageRankError {
public:
  explicit MissingConfigurationError(const std::string &what)
      : PageRankError(what) {}
};

// Source id cannot be represented as a VertexId.
class TypeMismatchError : public PageRankError {
public:
  explicit TypeMismatchError(const std::string &what) : PageRankError(what) {}
};

// Convergence mode exhausted its superstep cap.
class ConvergenceError : public PageRankError {
public:
  explicit ConvergenceError(const std::string &what) : PageRankError(what) {}
};

// Run stopped between supersteps by its observer or time budget.
class CancelledError : public PageRankError {
public:
  explicit CancelledError(const std::string &what) : PageRankError(what) {}
};

// A vertex or edge table could not be opened or written.
class TableIoError : public PageRankError {
public:
  explicit TableIoError(const std::string &what) : PageRankError(what) {}
};

} // namespace dfrank
#endif
